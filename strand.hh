// ┏━┓╺┳╸┏━┓┏━┓┏┓╻╺┳┓
// ┗━┓ ┃ ┣┳┛┣━┫┃┗┫ ┃┃
// ┗━┛ ╹ ╹┗╸╹ ╹╹ ╹╺┻┛
//  Structured Tree Reading And Named Decoding
//  version 0.1.0 | MIT License
//  Copyright (C) 2026 by the STRAND developers
#pragma once

// Standard library includes
#include <charconv>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <initializer_list>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

// fkYAML single-header library
// https://github.com/fktn-k/fkYAML
#include <fkYAML/node.hpp>

namespace strand {

  // Tree value consumed by every decoder. The choice of fkyaml::ordered_map
  // preserves the lexical order of mapping keys in the input
  using node = fkyaml::basic_node<
    std::vector, // sequence container
    fkyaml::ordered_map, // mapping container
    bool,
    std::int64_t,
    double,
    std::string,
    fkyaml::node_value_converter
  >;

namespace internal {

  // Constants used when rendering paths and reading field specs. This block
  // provides a single location for easy editing.
  inline constexpr char PATH_DELIMITER = '.';
  inline constexpr char OPEN_INDEX = '[';
  inline constexpr char CLOSE_INDEX = ']';
  inline constexpr char TYPE_SEPARATOR = ':';
  inline constexpr char OPTIONAL_MARKER = '?';

  inline const std::string DOC_ROOT = "root";

  inline const std::string TYPE_STRING = "string";
  inline const std::string TYPE_INTEGER = "int";
  inline const std::string TYPE_FLOAT = "float";
  inline const std::string TYPE_BOOLEAN = "bool";
  inline const std::string TYPE_ANY = "any";

} // namespace strand::internal

  // One step of a field path: a mapping key or a sequence index
  class PathSegment {
  public:
    enum class Kind { Key, Index };

    // Implicit on purpose so that paths read { "items", 0, "id" }
    PathSegment( const char* key );
    PathSegment( std::string key );
    template < typename I, typename = std::enable_if_t<
      std::is_integral_v< I > && !std::is_same_v< I, bool > > >
    PathSegment( I index );

    inline bool is_key() const { return kind_ == Kind::Key; }
    inline bool is_index() const { return kind_ == Kind::Index; }
    inline const std::string& key() const { return key_; }
    inline std::size_t index() const { return index_; }

    bool operator==( const PathSegment& other ) const;
    inline bool operator!=( const PathSegment& other ) const {
      return !( *this == other );
    }

  private:
    Kind kind_;
    std::string key_;
    std::size_t index_ = 0;
  };

  using Path = std::vector< PathSegment >;

  // Render a path as "root.author.name" or "root.items[2].id"
  std::string format_path( const Path& path );

  // Failure taxonomy for decoding
  enum class ErrorKind {
    MissingField, // required field, path segment or element absent
    NullField, // required value present but explicitly null
    TypeMismatch, // value has the wrong shape for its decoder
    ValidationFailure, // explicit fail() after successful extraction
    ParseFailure // raw text could not be parsed into a tree value
  };

  const char* kind_name( ErrorKind kind );

  // Immutable description of a decoding failure. The path runs from the
  // decoding root to the failure point. Errors produced by one_of() also keep
  // the error of every alternative that was tried.
  class DecodeError {
  public:
    DecodeError( ErrorKind kind, std::string message, Path path = {},
      std::vector< DecodeError > alternatives = {} );

    inline ErrorKind kind() const { return kind_; }
    inline const Path& path() const { return path_; }
    inline const std::string& message() const { return message_; }
    inline const std::vector< DecodeError >& alternatives() const {
      return alternatives_;
    }

    // Copies of this error located one (or several) steps deeper, i.e., with
    // the given segment(s) prepended to the path
    DecodeError prefixed( const PathSegment& segment ) const;
    DecodeError prefixed( const Path& prefix ) const;

    // "root.a.b: message", followed by one indented line per alternative
    std::string to_string() const;

    bool operator==( const DecodeError& other ) const;
    inline bool operator!=( const DecodeError& other ) const {
      return !( *this == other );
    }

  private:
    void append_to( std::ostringstream& oss, int depth ) const;

    ErrorKind kind_;
    std::string message_;
    Path path_;
    std::vector< DecodeError > alternatives_;
  };

  std::ostream& operator<<( std::ostream& os, const PathSegment& segment );
  std::ostream& operator<<( std::ostream& os, const DecodeError& error );

  // Raised only at the boundary, when a caller asks a failed Result for its
  // value
  class DecodeException : public std::runtime_error {
  public:
    inline explicit DecodeException( DecodeError error )
      : std::runtime_error( error.to_string() ), error_( std::move(error) ) {}

    inline const DecodeError& error() const noexcept { return error_; }

  private:
    DecodeError error_;
  };

  // Outcome of a decoder: either a value of type T or a DecodeError
  template < typename T >
  class Result {
  public:
    using value_type = T;

    static Result ok( T value ) {
      Result r;
      r.value_.emplace( std::move(value) );
      return r;
    }

    static Result fail( DecodeError error ) {
      Result r;
      r.error_.emplace( std::move(error) );
      return r;
    }

    inline bool has_value() const { return value_.has_value(); }
    inline explicit operator bool() const { return has_value(); }

    // Throws DecodeException if this result holds an error
    const T& value() const {
      if ( !value_ ) throw DecodeException( *error_ );
      return *value_;
    }

    T value_or( T fallback ) const {
      if ( value_ ) return *value_;
      return fallback;
    }

    // Throws std::logic_error if this result holds a value
    const DecodeError& error() const {
      if ( !error_ ) {
        throw std::logic_error( "strand::Result holds a value, not an error" );
      }
      return *error_;
    }

  private:
    Result() = default;

    std::optional< T > value_;
    std::optional< DecodeError > error_;
  };

  template < typename T > class Decoder;

namespace internal {

  template < typename D >
  struct is_decoder : std::false_type {};

  template < typename T >
  struct is_decoder< Decoder< T > > : std::true_type {};

} // namespace strand::internal

  // A pure, reusable computation from a tree value to a Result<T>. Decoders
  // hold no state between calls, so one instance may be applied to any number
  // of inputs (from any number of threads).
  template < typename T >
  class Decoder {
  public:
    using value_type = T;
    using function_type = std::function< Result< T >( const node& ) >;

    inline explicit Decoder( function_type fn ) : fn_( std::move(fn) ) {}

    inline Result< T > decode( const node& input ) const {
      return fn_( input );
    }

    // Sequential composition. On success, the decoder returned by k(value) is
    // run against the same input this decoder saw. On failure, k is never
    // called and the error is returned unchanged.
    template < typename F >
    auto and_then( F k ) const {
      using Next = std::decay_t< std::invoke_result_t< const F&, const T& > >;
      static_assert( internal::is_decoder< Next >::value,
        "a continuation must return a strand::Decoder" );
      using U = typename Next::value_type;

      const function_type first = fn_;
      return Decoder< U >( [first, k]( const node& input ) -> Result< U > {
        Result< T > bound = first( input );
        if ( !bound ) return Result< U >::fail( bound.error() );
        return k( bound.value() ).decode( input );
      } );
    }

    template < typename F >
    auto map( F f ) const {
      using U = std::decay_t< std::invoke_result_t< const F&, const T& > >;

      const function_type inner = fn_;
      return Decoder< U >( [inner, f]( const node& input ) -> Result< U > {
        Result< T > r = inner( input );
        if ( !r ) return Result< U >::fail( r.error() );
        return Result< U >::ok( f(r.value()) );
      } );
    }

  private:
    function_type fn_;
  };

  // Ignores its input and always yields the given value
  template < typename T >
  inline Decoder< std::decay_t< T > > succeed( T&& value ) {
    using V = std::decay_t< T >;
    V held = std::forward< T >( value );
    return Decoder< V >( [held]( const node& ) {
      return Result< V >::ok( held );
    } );
  }

  // Ignores its input and always fails (ValidationFailure) at the current path
  template < typename T >
  inline Decoder< T > fail( const std::string& message ) {
    return Decoder< T >( [message]( const node& ) {
      return Result< T >::fail(
        DecodeError( ErrorKind::ValidationFailure, message )
      );
    } );
  }

  template < typename T, typename F >
  inline auto and_then( const Decoder< T >& d, F k ) {
    return d.and_then( std::move(k) );
  }

  template < typename T, typename F >
  inline auto map( const Decoder< T >& d, F f ) {
    return d.map( std::move(f) );
  }

namespace internal {

  // Append a numerical index to the end of a base path string
  inline std::string seq_indexed( const std::string& base, std::size_t idx ) {
    return base + OPEN_INDEX + std::to_string( idx ) + CLOSE_INDEX;
  }

  // Helpers for conversions to/from the node type

  template < typename T >
  inline T to_native_checked( const node& n ) {
    T out;
    fkyaml::node_value_converter< T >::from_node( n, out );
    return out;
  }

  template < typename T >
  inline node make_node_from( const T& value ) {
    node n;
    fkyaml::node_value_converter< T >::to_node( n, value );
    return n;
  }

  inline std::string to_string_any( const node& n ) {
    if ( n.is_string() ) return to_native_checked< std::string >( n );
    if ( n.is_integer() ) return std::to_string(
      to_native_checked< std::int64_t >( n )
    );
    if ( n.is_boolean() ) return n.get_value< bool >() ? "true" : "false";
    if ( n.is_float_number() ) {
      // Shortest text that reads back as the same double
      char buf[ 32 ];
      const auto res = std::to_chars( buf, buf + sizeof( buf ),
        to_native_checked< double >( n ) );
      return std::string( buf, res.ptr );
    }

    // We did not match any of the scalar types, so fall back to serialization
    return node::serialize( n );
  }

  // Short name of a node's shape for error messages
  inline std::string shape_of( const node& n ) {
    if ( n.is_null() ) return "null";
    if ( n.is_boolean() ) return "boolean";
    if ( n.is_integer() ) return "integer";
    if ( n.is_float_number() ) return "float";
    if ( n.is_string() ) return "string";
    if ( n.is_sequence() ) return "sequence";
    if ( n.is_mapping() ) return "mapping";
    return "unknown";
  }

  inline DecodeError type_mismatch( const std::string& expected,
    const node& got )
  {
    return DecodeError( ErrorKind::TypeMismatch,
      "expected " + expected + ", got " + shape_of( got ) );
  }

  // An error raised directly on an explicit null value means a required
  // value was null rather than of the wrong type
  inline DecodeError null_aware( const DecodeError& error, const node& value ) {
    if ( !value.is_null() || !error.path().empty()
      || error.kind() != ErrorKind::TypeMismatch ) return error;
    return DecodeError( ErrorKind::NullField,
      "required value is null (" + error.message() + ")", {},
      error.alternatives() );
  }

  // Look up one path segment inside a container. On success `out` points at
  // the child; on failure the returned error is located at the segment.
  inline std::optional< DecodeError > lookup( const node& container,
    const PathSegment& segment, const node*& out )
  {
    if ( segment.is_key() ) {
      const std::string& key = segment.key();
      if ( !container.is_mapping() ) {
        return type_mismatch( "a mapping holding field '" + key + "'",
          container ).prefixed( segment );
      }
      if ( !container.contains(key) ) {
        return DecodeError( ErrorKind::MissingField,
          "missing field '" + key + "'", { segment } );
      }
      out = &container.at( key );
      return std::nullopt;
    }

    const std::size_t idx = segment.index();
    if ( !container.is_sequence() ) {
      return type_mismatch( "a sequence holding element "
        + seq_indexed( "", idx ), container ).prefixed( segment );
    }
    if ( idx >= container.size() ) {
      std::ostringstream oss;
      oss << "missing element " << seq_indexed( "", idx )
        << " (sequence has " << container.size() << " elements)";
      return DecodeError( ErrorKind::MissingField, oss.str(), { segment } );
    }
    out = &container.at( idx );
    return std::nullopt;
  }

  // Walk the first `depth` segments of a path. The error path on failure is
  // truncated to the traversed segments plus the failing one.
  struct Traversal {
    const node* target = nullptr;
    std::optional< DecodeError > error;
  };

  inline Traversal traverse( const node& root, const Path& path,
    std::size_t depth )
  {
    Traversal walk;
    walk.target = &root;
    for ( std::size_t i = 0; i < depth; ++i ) {
      const node* child = nullptr;
      std::optional< DecodeError > err = lookup( *walk.target, path[i], child );
      if ( err ) {
        walk.error = err->prefixed( Path(path.begin(), path.begin() + i) );
        walk.target = nullptr;
        return walk;
      }
      walk.target = child;
    }
    return walk;
  }

} // namespace strand::internal

  // Primitive value decoders

  inline Decoder< std::string > string() {
    return Decoder< std::string >( []( const node& n ) {
      if ( !n.is_string() ) {
        return Result< std::string >::fail(
          internal::type_mismatch( "a string", n )
        );
      }
      return Result< std::string >::ok(
        internal::to_native_checked< std::string >( n )
      );
    } );
  }

  // Accepts integers, and floats holding an integral value in range
  inline Decoder< std::int64_t > integer() {
    return Decoder< std::int64_t >( []( const node& n ) {
      using R = Result< std::int64_t >;
      if ( n.is_integer() ) {
        return R::ok( internal::to_native_checked< std::int64_t >(n) );
      }
      if ( n.is_float_number() ) {
        const double d = internal::to_native_checked< double >( n );
        // 2^63 is exactly representable; anything below it fits
        constexpr double LIMIT = 9223372036854775808.0;
        if ( std::isfinite(d) && std::trunc(d) == d && d >= -LIMIT
          && d < LIMIT )
        {
          return R::ok( static_cast< std::int64_t >(d) );
        }
        std::ostringstream oss;
        oss << "expected an integer, got float " << d;
        return R::fail( DecodeError(ErrorKind::TypeMismatch, oss.str()) );
      }
      return R::fail( internal::type_mismatch("an integer", n) );
    } );
  }

  // Accepts floats and integers
  inline Decoder< double > number() {
    return Decoder< double >( []( const node& n ) {
      if ( n.is_float_number() ) {
        return Result< double >::ok( internal::to_native_checked< double >(n) );
      }
      if ( n.is_integer() ) {
        return Result< double >::ok( static_cast< double >(
          internal::to_native_checked< std::int64_t >(n) ) );
      }
      return Result< double >::fail( internal::type_mismatch("a number", n) );
    } );
  }

  inline Decoder< bool > boolean() {
    return Decoder< bool >( []( const node& n ) {
      if ( !n.is_boolean() ) {
        return Result< bool >::fail( internal::type_mismatch("a boolean", n) );
      }
      return Result< bool >::ok( n.get_value< bool >() );
    } );
  }

  // The raw tree value, copied
  inline Decoder< node > value() {
    return Decoder< node >( []( const node& n ) {
      return Result< node >::ok( n );
    } );
  }

  // Succeeds with `fallback` when the value is null, fails otherwise
  template < typename T >
  inline Decoder< std::decay_t< T > > null_as( T&& fallback ) {
    using V = std::decay_t< T >;
    V held = std::forward< T >( fallback );
    return Decoder< V >( [held]( const node& n ) {
      if ( !n.is_null() ) {
        return Result< V >::fail( internal::type_mismatch("null", n) );
      }
      return Result< V >::ok( held );
    } );
  }

  // Null decodes to std::nullopt, anything else goes through `d`
  template < typename T >
  inline Decoder< std::optional< T > > nullable( const Decoder< T >& d ) {
    using R = Result< std::optional< T > >;
    return Decoder< std::optional< T > >( [d]( const node& n ) -> R {
      if ( n.is_null() ) return R::ok( std::nullopt );
      Result< T > r = d.decode( n );
      if ( !r ) return R::fail( r.error() );
      return R::ok( std::optional< T >(r.value()) );
    } );
  }

  template < typename T >
  inline Decoder< std::vector< T > > list( const Decoder< T >& d ) {
    using R = Result< std::vector< T > >;
    return Decoder< std::vector< T > >( [d]( const node& n ) -> R {
      if ( !n.is_sequence() ) {
        return R::fail( internal::type_mismatch("a sequence", n) );
      }
      std::vector< T > out;
      out.reserve( n.size() );
      for ( std::size_t i = 0; i < n.size(); ++i ) {
        Result< T > r = d.decode( n.at(i) );
        if ( !r ) return R::fail( r.error().prefixed(PathSegment(i)) );
        out.push_back( r.value() );
      }
      return R::ok( std::move(out) );
    } );
  }

  // Mapping entries in input order. Non-string keys are rendered as text.
  template < typename T >
  inline Decoder< std::vector< std::pair< std::string, T > > >
    key_value_pairs( const Decoder< T >& d )
  {
    using Pairs = std::vector< std::pair< std::string, T > >;
    using R = Result< Pairs >;
    return Decoder< Pairs >( [d]( const node& n ) -> R {
      if ( !n.is_mapping() ) {
        return R::fail( internal::type_mismatch("a mapping", n) );
      }
      Pairs out;
      for ( const auto& [mk, mv] : n.map_items() ) {
        const std::string key = internal::to_string_any( mk );
        Result< T > r = d.decode( mv );
        if ( !r ) return R::fail( r.error().prefixed(PathSegment(key)) );
        out.emplace_back( key, r.value() );
      }
      return R::ok( std::move(out) );
    } );
  }

  template < typename T >
  inline Decoder< std::map< std::string, T > > dict( const Decoder< T >& d ) {
    return key_value_pairs( d ).map(
      []( const std::vector< std::pair< std::string, T > >& pairs ) {
        return std::map< std::string, T >( pairs.begin(), pairs.end() );
      }
    );
  }

  // First alternative that succeeds wins. If none does, the error records
  // the failure of every alternative in order.
  template < typename T >
  inline Decoder< T > one_of( std::vector< Decoder< T > > alternatives ) {
    return Decoder< T >( [alternatives]( const node& n ) -> Result< T > {
      std::vector< DecodeError > errors;
      errors.reserve( alternatives.size() );
      for ( const auto& alt : alternatives ) {
        Result< T > r = alt.decode( n );
        if ( r ) return r;
        errors.push_back( r.error() );
      }
      std::ostringstream oss;
      oss << "none of " << alternatives.size() << " alternatives matched";
      return Result< T >::fail( DecodeError(ErrorKind::TypeMismatch,
        oss.str(), {}, std::move(errors)) );
    } );
  }

  template < typename T >
  inline Decoder< T > one_of( std::initializer_list< Decoder< T > > alts ) {
    return one_of( std::vector< Decoder< T > >(alts) );
  }

  // Defers building a decoder until it runs; needed for recursive structures
  template < typename F >
  inline auto lazy( F thunk ) {
    using D = std::decay_t< std::invoke_result_t< F& > >;
    static_assert( internal::is_decoder< D >::value,
      "lazy() needs a function returning a strand::Decoder" );
    using T = typename D::value_type;
    return D( [thunk]( const node& n ) -> Result< T > {
      return thunk().decode( n );
    } );
  }

  // Field and path access

  // Decode the value reached by walking `path` from the input. An empty path
  // decodes the input itself.
  template < typename T >
  inline Decoder< T > at( Path path, const Decoder< T >& d ) {
    return Decoder< T >( [path, d]( const node& input ) -> Result< T > {
      internal::Traversal walk = internal::traverse( input, path,
        path.size() );
      if ( walk.error ) return Result< T >::fail( *walk.error );

      Result< T > r = d.decode( *walk.target );
      if ( r ) return r;
      return Result< T >::fail(
        internal::null_aware( r.error(), *walk.target ).prefixed( path )
      );
    } );
  }

  template < typename T >
  inline Decoder< T > field( const std::string& name, const Decoder< T >& d ) {
    return at( Path{ PathSegment(name) }, d );
  }

  template < typename T >
  inline Decoder< T > element( std::size_t idx, const Decoder< T >& d ) {
    return at( Path{ PathSegment(idx) }, d );
  }

  // Like at(), but absence or null at the final segment yields std::nullopt.
  // Missing or null intermediate segments remain hard failures. A value that
  // is present and non-null must still satisfy `d`.
  template < typename T >
  inline Decoder< std::optional< T > > optional_path( Path path,
    const Decoder< T >& d )
  {
    using R = Result< std::optional< T > >;
    return Decoder< std::optional< T > >( [path, d]( const node& input ) -> R {
      const node* target = &input;

      if ( !path.empty() ) {
        internal::Traversal walk = internal::traverse( input, path,
          path.size() - 1 );
        if ( walk.error ) return R::fail( *walk.error );

        const node* child = nullptr;
        std::optional< DecodeError > err = internal::lookup( *walk.target,
          path.back(), child );
        if ( err ) {
          if ( err->kind() == ErrorKind::MissingField ) {
            return R::ok( std::nullopt );
          }
          return R::fail( err->prefixed(
            Path(path.begin(), path.end() - 1) ) );
        }
        target = child;
      }

      if ( target->is_null() ) return R::ok( std::nullopt );

      Result< T > r = d.decode( *target );
      if ( !r ) return R::fail( r.error().prefixed(path) );
      return R::ok( std::optional< T >(r.value()) );
    } );
  }

  template < typename T >
  inline Decoder< std::optional< T > > optional_field( const std::string& name,
    const Decoder< T >& d )
  {
    return optional_path( Path{ PathSegment(name) }, d );
  }

  // Three-way view of a field, for callers that must tell a missing field
  // from an explicit null (e.g., partial updates)
  enum class Presence { Absent, Null, Present };

  inline Decoder< Presence > field_presence( const std::string& name ) {
    return Decoder< Presence >( [name]( const node& input ) {
      using R = Result< Presence >;
      if ( !input.is_mapping() ) {
        return R::fail( internal::type_mismatch( "a mapping holding field '"
          + name + "'", input ).prefixed(PathSegment(name)) );
      }
      if ( !input.contains(name) ) return R::ok( Presence::Absent );
      if ( input.at(name).is_null() ) return R::ok( Presence::Null );
      return R::ok( Presence::Present );
    } );
  }

  // Continuation-passing field combinators. Each decodes one field of the
  // current input and hands the decoded value to `k`, whose decoder then runs
  // against the same input so that sibling fields stay reachable.

  template < typename T, typename F >
  inline auto required( const std::string& name, const Decoder< T >& d, F k ) {
    return field( name, d ).and_then( std::move(k) );
  }

  // `k` receives std::optional<T>: empty when the field is absent or null
  template < typename T, typename F >
  inline auto optional( const std::string& name, const Decoder< T >& d, F k ) {
    return optional_field( name, d ).and_then( std::move(k) );
  }

  template < typename T, typename F >
  inline auto required_at( const Path& path, const Decoder< T >& d, F k ) {
    return at( path, d ).and_then( std::move(k) );
  }

  template < typename T, typename F >
  inline auto optional_at( const Path& path, const Decoder< T >& d, F k ) {
    return optional_path( path, d ).and_then( std::move(k) );
  }

  // Running decoders

  template < typename T >
  inline Result< T > decode_value( const Decoder< T >& d, const node& input ) {
    return d.decode( input );
  }

  // Parse YAML/JSON text with fkYAML, then decode. Text that does not parse
  // is reported as a ParseFailure error.
  template < typename T >
  inline Result< T > decode_string( const Decoder< T >& d,
    const std::string& text )
  {
    node doc;
    try {
      doc = node::deserialize( text );
    }
    catch ( const fkyaml::exception& ex ) {
      return Result< T >::fail( DecodeError(ErrorKind::ParseFailure,
        std::string("invalid input: ") + ex.what()) );
    }
    return d.decode( doc );
  }

  // Throws DecodeException on failure
  template < typename T >
  inline T decode_or_throw( const Decoder< T >& d, const node& input ) {
    return d.decode( input ).value();
  }

  // One "path:type" field request, e.g., "author.name:string",
  // "items[0].id:int" or "weight:float?" (trailing '?' marks it optional).
  // The type may be omitted, in which case any value is accepted.
  class FieldSpec {
  public:
    enum class Type { String, Integer, Float, Boolean, Any };

    // Throws std::invalid_argument for malformed text
    static FieldSpec parse( const std::string& text );

    inline const std::string& label() const { return label_; }
    inline const Path& path() const { return path_; }
    inline Type type() const { return type_; }
    inline bool is_optional() const { return optional_; }

  private:
    FieldSpec() = default;

    std::string label_;
    Path path_;
    Type type_ = Type::Any;
    bool optional_ = false;
  };

  // Decodes a list of FieldSpecs from a document into a mapping keyed by
  // each spec's label. The requests are folded into a single continuation
  // chain built at runtime, so any number of fields can be combined.
  class Extractor {
  public:
    // Throws std::invalid_argument when two specs share a label, since
    // both would write the same output key
    explicit Extractor( std::vector< FieldSpec > specs );

    // Parse every argument as a FieldSpec
    static Extractor from_args( const std::vector< std::string >& args );

    inline const std::vector< FieldSpec >& specs() const { return *specs_; }

    Decoder< node > decoder() const;

    Result< node > extract( const node& doc ) const;
    Result< node > extract( std::istream& in ) const;
    Result< node > extract_text( const std::string& text ) const;

  private:
    std::shared_ptr< const std::vector< FieldSpec > > specs_;
  };

  // Command line driver: extract the fields named by `args` from the
  // document on `in`. Returns the process exit status: 0 on success,
  // 1 when decoding fails, 2 for usage errors.
  int run_cli( const std::vector< std::string >& args, std::istream& in,
    std::ostream& out, std::ostream& err );

namespace internal {

  // Divide a spec path by PATH_DELIMITER instances
  inline std::vector< std::string > split_segments( const std::string& tok ) {
    std::vector< std::string > segs;
    size_t start = 0;
    while ( true ) {
      size_t pos = tok.find( PATH_DELIMITER, start );
      if ( pos == std::string::npos ) {
        segs.push_back( tok.substr(start) );
        break;
      }
      segs.push_back( tok.substr(start, pos - start) );
      start = pos + 1;
    }
    return segs;
  }

  // "items[0][1]" -> "items", 0, 1
  inline void parse_spec_segment( const std::string& text, Path& out ) {
    const std::size_t open = text.find( OPEN_INDEX );
    const std::string name = text.substr( 0, open );

    // Only the first segment may start with an index ("[0].id")
    if ( name.empty() && (open != 0 || !out.empty()) ) {
      throw std::invalid_argument( "empty key in field path" );
    }
    if ( !name.empty() ) out.emplace_back( name );
    if ( open == std::string::npos ) return;

    std::size_t pos = open;
    while ( pos < text.size() ) {
      if ( text[pos] != OPEN_INDEX ) {
        throw std::invalid_argument( "unexpected '" + text.substr(pos)
          + "' after index in '" + text + "'" );
      }
      const std::size_t close = text.find( CLOSE_INDEX, pos );
      if ( close == std::string::npos ) {
        throw std::invalid_argument( "unterminated index in '" + text + "'" );
      }
      const std::string digits = text.substr( pos + 1, close - pos - 1 );
      if ( digits.empty() || digits.size() > 18
        || digits.find_first_not_of("0123456789") != std::string::npos )
      {
        throw std::invalid_argument( "index must be a non-negative integer"
          " in '" + text + "'" );
      }
      out.emplace_back( static_cast< std::size_t >( std::stoull(digits) ) );
      pos = close + 1;
    }
  }

  inline FieldSpec::Type parse_spec_type( const std::string& name ) {
    if ( name == TYPE_STRING ) return FieldSpec::Type::String;
    if ( name == TYPE_INTEGER ) return FieldSpec::Type::Integer;
    if ( name == TYPE_FLOAT ) return FieldSpec::Type::Float;
    if ( name == TYPE_BOOLEAN ) return FieldSpec::Type::Boolean;
    if ( name == TYPE_ANY ) return FieldSpec::Type::Any;
    std::ostringstream oss;
    oss << "unknown field type '" << name << "' (expected one of "
      << TYPE_STRING << ", " << TYPE_INTEGER << ", " << TYPE_FLOAT << ", "
      << TYPE_BOOLEAN << ", " << TYPE_ANY << ")";
    throw std::invalid_argument( oss.str() );
  }

  // Type-checking decoder for a FieldSpec that hands back a node
  inline Decoder< node > typed_value( FieldSpec::Type type ) {
    switch ( type ) {
      case FieldSpec::Type::String:
        return string().map( make_node_from< std::string > );
      case FieldSpec::Type::Integer:
        return integer().map( make_node_from< std::int64_t > );
      case FieldSpec::Type::Float:
        return number().map( make_node_from< double > );
      case FieldSpec::Type::Boolean:
        return boolean().map( make_node_from< bool > );
      case FieldSpec::Type::Any:
        break;
    }
    return value();
  }

  // Decoder for specs[i..]; `acc` holds the fields bound so far
  inline Decoder< node > extract_chain(
    std::shared_ptr< const std::vector< FieldSpec > > specs, std::size_t i,
    node acc )
  {
    if ( i == specs->size() ) return succeed( acc );

    const FieldSpec& spec = ( *specs )[ i ];
    const std::string label = spec.label();

    if ( spec.is_optional() ) {
      return optional_at( spec.path(), typed_value( spec.type() ),
        [specs, i, acc, label]( const std::optional< node >& v ) {
          node next = acc;
          next[ label ] = v ? *v : node();
          return extract_chain( specs, i + 1, next );
        } );
    }

    return required_at( spec.path(), typed_value( spec.type() ),
      [specs, i, acc, label]( const node& v ) {
        node next = acc;
        next[ label ] = v;
        return extract_chain( specs, i + 1, next );
      } );
  }

} // namespace strand::internal

} // namespace strand

// PathSegment member function definitions
inline strand::PathSegment::PathSegment( const char* key )
  : kind_( Kind::Key ), key_(), index_( 0 )
{
  if ( key == nullptr ) {
    throw std::invalid_argument( "path key must not be null" );
  }
  key_ = key;
}

inline strand::PathSegment::PathSegment( std::string key )
  : kind_( Kind::Key ), key_( std::move(key) ), index_( 0 ) {}

template < typename I, typename >
inline strand::PathSegment::PathSegment( I index )
  : kind_( Kind::Index ), key_(), index_( 0 )
{
  if constexpr ( std::is_signed_v< I > ) {
    if ( index < 0 ) {
      throw std::invalid_argument( "path index must be non-negative (got "
        + std::to_string( index ) + ")" );
    }
  }
  index_ = static_cast< std::size_t >( index );
}

inline bool strand::PathSegment::operator==( const PathSegment& other ) const
{
  if ( kind_ != other.kind_ ) return false;
  return is_key() ? key_ == other.key_ : index_ == other.index_;
}

// Compose "root.a.b[0].c" from a path
inline std::string strand::format_path( const Path& path ) {
  std::string s = internal::DOC_ROOT;
  for ( const auto& seg : path ) {
    if ( seg.is_index() ) s = internal::seq_indexed( s, seg.index() );
    else s += internal::PATH_DELIMITER + seg.key();
  }
  return s;
}

inline const char* strand::kind_name( ErrorKind kind ) {
  switch ( kind ) {
    case ErrorKind::MissingField: return "missing field";
    case ErrorKind::NullField: return "null field";
    case ErrorKind::TypeMismatch: return "type mismatch";
    case ErrorKind::ValidationFailure: return "validation failure";
    case ErrorKind::ParseFailure: return "parse failure";
  }
  return "unknown";
}

// DecodeError member function definitions
inline strand::DecodeError::DecodeError( ErrorKind kind, std::string message,
  Path path, std::vector< DecodeError > alternatives )
  : kind_( kind ), message_( std::move(message) ), path_( std::move(path) ),
    alternatives_( std::move(alternatives) ) {}

inline strand::DecodeError strand::DecodeError::prefixed(
  const PathSegment& segment ) const
{
  return prefixed( Path{ segment } );
}

// Alternatives are located relative to the same input as this error, so they
// move down together with it
inline strand::DecodeError strand::DecodeError::prefixed(
  const Path& prefix ) const
{
  if ( prefix.empty() ) return *this;

  Path p = prefix;
  p.insert( p.end(), path_.begin(), path_.end() );

  std::vector< DecodeError > alts;
  alts.reserve( alternatives_.size() );
  for ( const auto& alt : alternatives_ ) alts.push_back( alt.prefixed(prefix) );

  return DecodeError( kind_, message_, std::move(p), std::move(alts) );
}

inline std::string strand::DecodeError::to_string() const {
  std::ostringstream oss;
  append_to( oss, 0 );
  return oss.str();
}

inline void strand::DecodeError::append_to( std::ostringstream& oss,
  int depth ) const
{
  oss << format_path( path_ ) << ": " << message_;
  for ( std::size_t i = 0; i < alternatives_.size(); ++i ) {
    oss << '\n' << std::string( 2 * (depth + 1), ' ' ) << '(' << ( i + 1 )
      << ") ";
    alternatives_[ i ].append_to( oss, depth + 1 );
  }
}

inline bool strand::DecodeError::operator==( const DecodeError& other ) const
{
  return kind_ == other.kind_ && message_ == other.message_
    && path_ == other.path_ && alternatives_ == other.alternatives_;
}

inline std::ostream& strand::operator<<( std::ostream& os,
  const PathSegment& segment )
{
  if ( segment.is_index() ) return os << internal::seq_indexed( "",
    segment.index() );
  return os << segment.key();
}

inline std::ostream& strand::operator<<( std::ostream& os,
  const DecodeError& error )
{
  return os << '[' << kind_name( error.kind() ) << "] " << error.to_string();
}

// FieldSpec member function definitions
inline strand::FieldSpec strand::FieldSpec::parse( const std::string& text )
{
  FieldSpec spec;
  std::string body = text;

  if ( !body.empty() && body.back() == internal::OPTIONAL_MARKER ) {
    spec.optional_ = true;
    body.pop_back();
  }

  const std::size_t colon = body.rfind( internal::TYPE_SEPARATOR );
  if ( colon != std::string::npos ) {
    spec.type_ = internal::parse_spec_type( body.substr(colon + 1) );
    body = body.substr( 0, colon );
  }

  if ( body.empty() ) {
    throw std::invalid_argument( "field spec '" + text + "' has no path" );
  }

  try {
    for ( const auto& seg : internal::split_segments(body) ) {
      internal::parse_spec_segment( seg, spec.path_ );
    }
  }
  catch ( const std::invalid_argument& ex ) {
    throw std::invalid_argument( "field spec '" + text + "': " + ex.what() );
  }

  spec.label_ = body;
  return spec;
}

// Extractor member function definitions
inline strand::Extractor::Extractor( std::vector< FieldSpec > specs )
  : specs_()
{
  std::set< std::string > labels;
  for ( const auto& spec : specs ) {
    if ( !labels.insert( spec.label() ).second ) {
      throw std::invalid_argument( "field '" + spec.label()
        + "' is requested more than once" );
    }
  }
  specs_ = std::make_shared< const std::vector< FieldSpec > >(
    std::move(specs) );
}

inline strand::Extractor strand::Extractor::from_args(
  const std::vector< std::string >& args )
{
  std::vector< FieldSpec > specs;
  specs.reserve( args.size() );
  for ( const auto& arg : args ) specs.push_back( FieldSpec::parse(arg) );
  return Extractor( std::move(specs) );
}

inline strand::Decoder< strand::node > strand::Extractor::decoder() const {
  return internal::extract_chain( specs_, 0, node::mapping() );
}

inline strand::Result< strand::node > strand::Extractor::extract(
  const node& doc ) const
{
  return this->decoder().decode( doc );
}

// Read from an input stream until end-of-file, then extract from the
// resulting text
inline strand::Result< strand::node > strand::Extractor::extract(
  std::istream& in ) const
{
  std::ostringstream ss;
  ss << in.rdbuf();
  return this->extract_text( ss.str() );
}

inline strand::Result< strand::node > strand::Extractor::extract_text(
  const std::string& text ) const
{
  return decode_string( this->decoder(), text );
}

namespace strand::internal {

  inline void print_usage( std::ostream& os ) {
    os << "Usage: strand SPEC...\n"
      << "  Reads a YAML/JSON document from stdin and prints the requested"
      << " fields.\n"
      << "  SPEC is PATH[:TYPE][?], e.g. author.name:string, items[0].id:int"
      << " or weight:float?\n"
      << "  TYPE is one of string, int, float, bool, any (default any).\n"
      << "  A trailing '?' makes the field optional (absent or null -> null).\n";
  }

} // namespace strand::internal

inline int strand::run_cli( const std::vector< std::string >& args,
  std::istream& in, std::ostream& out, std::ostream& err )
{
  if ( args.empty() ) {
    internal::print_usage( err );
    return 2;
  }
  if ( args.front() == "-h" || args.front() == "--help" ) {
    internal::print_usage( out );
    return 0;
  }

  try {
    const Extractor extractor = Extractor::from_args( args );
    const Result< node > extracted = extractor.extract( in );
    if ( !extracted ) {
      err << "[strand] error: " << extracted.error().to_string() << "\n";
      return 1;
    }
    out << node::serialize( extracted.value() );
    return 0;
  } catch ( const std::invalid_argument& ex ) {
    err << "[strand] usage error: " << ex.what() << "\n";
    internal::print_usage( err );
    return 2;
  } catch ( const std::exception& ex ) {
    err << "[strand] error: " << ex.what() << "\n";
    return 1;
  }
}
