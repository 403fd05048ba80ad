#include <gtest/gtest.h>
#include "strand.hh"

#include <cstdint>
#include <sstream>
#include <string>
#include <vector>

using namespace strand;

namespace {

  const char* const DOCUMENT = R"(
id: 321
author:
  name: John Doe
  email: null
items:
  - id: 10
    price: 2.5
  - id: 20
    price: 4
published: true
)";

  std::string text_of( const node& out, const std::string& key ) {
    return out.at( key ).get_value< std::string >();
  }

} // namespace

TEST(FieldSpec, ParsesKeysIndicesAndType) {
  FieldSpec spec = FieldSpec::parse( "items[1].id:int" );
  EXPECT_EQ( spec.label(), "items[1].id" );
  EXPECT_EQ( spec.path(), ( Path{ "items", 1, "id" } ) );
  EXPECT_EQ( spec.type(), FieldSpec::Type::Integer );
  EXPECT_FALSE( spec.is_optional() );
}

TEST(FieldSpec, OptionalMarkerAndDefaultType) {
  FieldSpec weight = FieldSpec::parse( "weight:float?" );
  EXPECT_TRUE( weight.is_optional() );
  EXPECT_EQ( weight.type(), FieldSpec::Type::Float );
  EXPECT_EQ( weight.label(), "weight" );

  FieldSpec meta = FieldSpec::parse( "meta?" );
  EXPECT_TRUE( meta.is_optional() );
  EXPECT_EQ( meta.type(), FieldSpec::Type::Any );

  FieldSpec grid = FieldSpec::parse( "[0][2]:bool" );
  EXPECT_EQ( grid.path(), ( Path{ 0, 2 } ) );
  EXPECT_EQ( grid.type(), FieldSpec::Type::Boolean );

  EXPECT_EQ( FieldSpec::parse( "a.b:string" ).type(), FieldSpec::Type::String );
}

/**
 * Malformed specs are rejected with std::invalid_argument
 */
TEST(FieldSpec, RejectsMalformedText) {
  for ( const char* text : { "", ":int", "a..b", "a.", "a[x]", "a[1", "a[1]b",
    "a.[0]", "a:number", "?" } )
  {
    EXPECT_THROW( FieldSpec::parse( text ), std::invalid_argument ) << text;
  }
}

/**
 * Two specs for the same field would write the same output key
 */
TEST(Extractor, RejectsDuplicateLabels) {
  EXPECT_THROW( Extractor::from_args( { "id:int", "id?" } ),
    std::invalid_argument );
  EXPECT_THROW( Extractor::from_args( { "items[0].id", "author.name",
    "items[0].id:string" } ), std::invalid_argument );
  EXPECT_NO_THROW( Extractor::from_args( { "items[0].id", "items[1].id" } ) );
}

TEST(Extractor, CollectsRequestedFields) {
  Extractor extractor = Extractor::from_args( { "author.name:string",
    "id:int", "items[1].price:float", "published:bool", "items[0]" } );
  ASSERT_EQ( extractor.specs().size(), 5u );

  Result< node > r = extractor.extract_text( DOCUMENT );
  ASSERT_TRUE( r ) << r.error().to_string();
  const node& out = r.value();

  EXPECT_TRUE( out.is_mapping() );
  EXPECT_EQ( out.size(), 5u );
  EXPECT_EQ( text_of( out, "author.name" ), "John Doe" );
  EXPECT_EQ( out.at( std::string("id") ).get_value< std::int64_t >(), 321 );
  EXPECT_DOUBLE_EQ(
    out.at( std::string("items[1].price") ).get_value< double >(), 4.0 );
  EXPECT_TRUE( out.at( std::string("published") ).get_value< bool >() );
  EXPECT_TRUE( out.at( std::string("items[0]") ).is_mapping() );
}

/**
 * Optional fields that are absent or null come out as null
 */
TEST(Extractor, OptionalFieldsBecomeNull) {
  Extractor extractor = Extractor::from_args( { "author.email:string?",
    "author.phone?", "id:int?" } );

  Result< node > r = extractor.extract_text( DOCUMENT );
  ASSERT_TRUE( r ) << r.error().to_string();
  EXPECT_TRUE( r.value().at( std::string("author.email") ).is_null() );
  EXPECT_TRUE( r.value().at( std::string("author.phone") ).is_null() );
  EXPECT_EQ( r.value().at( std::string("id") ).get_value< std::int64_t >(),
    321 );
}

TEST(Extractor, MissingRequiredField) {
  Extractor extractor = Extractor::from_args( { "id:int",
    "author.phone:string" } );

  Result< node > r = extractor.extract_text( DOCUMENT );
  ASSERT_FALSE( r );
  EXPECT_EQ( r.error().kind(), ErrorKind::MissingField );
  EXPECT_EQ( r.error().to_string(),
    "root.author.phone: missing field 'phone'" );
}

TEST(Extractor, TypeMismatchAndNullField) {
  Result< node > mismatch = Extractor::from_args( { "items[0].id:string" } )
    .extract_text( DOCUMENT );
  ASSERT_FALSE( mismatch );
  EXPECT_EQ( mismatch.error().to_string(),
    "root.items[0].id: expected a string, got integer" );

  Result< node > null = Extractor::from_args( { "author.email:string" } )
    .extract_text( DOCUMENT );
  ASSERT_FALSE( null );
  EXPECT_EQ( null.error().kind(), ErrorKind::NullField );
  EXPECT_EQ( null.error().path(), ( Path{ "author", "email" } ) );
}

/**
 * Optional intermediate segments are still required
 */
TEST(Extractor, OptionalDoesNotCoverMissingParent) {
  Result< node > r = Extractor::from_args( { "editor.name:string?" } )
    .extract_text( DOCUMENT );
  ASSERT_FALSE( r );
  EXPECT_EQ( r.error().kind(), ErrorKind::MissingField );
  EXPECT_EQ( r.error().path(), ( Path{ "editor" } ) );
}

TEST(Extractor, ReadsFromStream) {
  std::istringstream in( "{\"id\": 321, \"author\": {\"name\": \"John Doe\"}}" );
  Result< node > r = Extractor::from_args( { "author.name:string" } )
    .extract( in );
  ASSERT_TRUE( r );
  EXPECT_EQ( text_of( r.value(), "author.name" ), "John Doe" );
}

TEST(Extractor, ParseFailure) {
  Result< node > r = Extractor::from_args( { "id" } )
    .extract_text( "id: \"unterminated\n" );
  ASSERT_FALSE( r );
  EXPECT_EQ( r.error().kind(), ErrorKind::ParseFailure );
}

/**
 * Any number of specs fold into one chain
 */
TEST(Extractor, ManySpecs) {
  constexpr int N = 30;
  std::ostringstream yaml;
  std::vector< std::string > args;
  for ( int i = 0; i < N; ++i ) {
    yaml << "f" << i << ":\n  v: " << i * 2 << "\n";
    args.push_back( "f" + std::to_string( i ) + ".v:int" );
  }

  Result< node > r = Extractor::from_args( args ).extract_text( yaml.str() );
  ASSERT_TRUE( r ) << r.error().to_string();
  EXPECT_EQ( r.value().size(), static_cast< std::size_t >( N ) );
  EXPECT_EQ( r.value().at( std::string("f29.v") ).get_value< std::int64_t >(),
    58 );
}

/**
 * The extractor's decoder is an ordinary Decoder and composes like one
 */
TEST(Extractor, DecoderComposes) {
  const node doc = node::deserialize( DOCUMENT );
  Decoder< std::size_t > count = Extractor::from_args( { "id:int",
    "author.name:string" } ).decoder().map(
      []( const node& out ) { return static_cast< std::size_t >( out.size() ); } );
  EXPECT_EQ( count.decode( doc ).value(), 2u );
}
