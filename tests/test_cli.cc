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
)";

  // Exit status plus everything written to stdout and stderr
  struct Outcome {
    int status;
    std::string out;
    std::string err;
  };

  Outcome run( const std::vector< std::string >& args,
    const std::string& input = DOCUMENT )
  {
    std::istringstream in( input );
    std::ostringstream out, err;
    const int status = run_cli( args, in, out, err );
    return Outcome{ status, out.str(), err.str() };
  }

} // namespace

/**
 * Requested fields are written to stdout as a mapping
 */
TEST(Cli, PrintsExtractedFields) {
  Outcome o = run( { "author.name:string", "id:int", "author.email?" } );
  EXPECT_EQ( o.status, 0 ) << o.err;
  EXPECT_TRUE( o.err.empty() );

  const node printed = node::deserialize( o.out );
  EXPECT_EQ( printed.at( std::string("author.name") ).get_value< std::string >(),
    "John Doe" );
  EXPECT_EQ( printed.at( std::string("id") ).get_value< std::int64_t >(), 321 );
  EXPECT_TRUE( printed.at( std::string("author.email") ).is_null() );
}

TEST(Cli, DecodeFailureExitsWithOne) {
  Outcome o = run( { "id:int", "author.phone:string" } );
  EXPECT_EQ( o.status, 1 );
  EXPECT_TRUE( o.out.empty() );
  EXPECT_EQ( o.err,
    "[strand] error: root.author.phone: missing field 'phone'\n" );
}

TEST(Cli, ParseFailureExitsWithOne) {
  Outcome o = run( { "id" }, "id: \"unterminated\n" );
  EXPECT_EQ( o.status, 1 );
  EXPECT_EQ( o.err.rfind( "[strand] error: ", 0 ), 0u ) << o.err;
}

/**
 * Malformed or duplicate specs are usage errors, not decode failures
 */
TEST(Cli, BadSpecExitsWithTwo) {
  for ( const std::vector< std::string >& args :
    { std::vector< std::string >{ "a[x]" },
      std::vector< std::string >{ "id:number" },
      std::vector< std::string >{ "id:int", "id?" } } )
  {
    Outcome o = run( args );
    EXPECT_EQ( o.status, 2 ) << args.front();
    EXPECT_TRUE( o.out.empty() );
    EXPECT_EQ( o.err.rfind( "[strand] usage error: ", 0 ), 0u ) << o.err;
    EXPECT_NE( o.err.find( "Usage: strand SPEC..." ), std::string::npos );
  }
}

TEST(Cli, NoArgumentsExitsWithTwo) {
  Outcome o = run( {} );
  EXPECT_EQ( o.status, 2 );
  EXPECT_TRUE( o.out.empty() );
  EXPECT_EQ( o.err.rfind( "Usage: strand SPEC...", 0 ), 0u );
}

TEST(Cli, HelpGoesToStdout) {
  for ( const char* flag : { "-h", "--help" } ) {
    Outcome o = run( { flag } );
    EXPECT_EQ( o.status, 0 ) << flag;
    EXPECT_TRUE( o.err.empty() );
    EXPECT_EQ( o.out.rfind( "Usage: strand SPEC...", 0 ), 0u );
  }
}
