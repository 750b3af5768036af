//  stanza
//  Context-escaping text template engine
//  version 0.1.0 | MIT License
#pragma once

// Standard library includes
#include <algorithm>
#include <cctype>
#include <functional>
#include <map>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include "stanza/errors.hh"
#include "stanza/escape.hh"
#include "stanza/value.hh"

namespace stanza {

  // A helper sees nothing but its already-resolved arguments. Undefined
  // arguments arrive as null.
  using helper_args = std::vector< ordered_node >;
  using helper_fn = std::function< ordered_node( const helper_args& ) >;

  // Named pure functions callable from substitutions and conditions. A
  // registry is filled once, then handed to an Engine, which only reads it.
  class HelperRegistry {
  public:
    HelperRegistry() = default;

    // Registry pre-populated with the built-in helpers
    static HelperRegistry with_builtins();

    // Adds (or replaces) a helper
    void register_helper( const std::string& name, helper_fn fn );

    bool contains( const std::string& name ) const {
      return helpers_.count( name ) > 0;
    }

    ordered_node invoke( const std::string& name,
      const helper_args& args ) const;

    std::vector< std::string > names() const;

  private:
    std::map< std::string, helper_fn > helpers_;
  };

namespace internal {

  inline void require_arity( const std::string& helper,
    const helper_args& args, size_t min, size_t max )
  {
    if ( args.size() >= min && args.size() <= max ) return;
    std::ostringstream oss;
    oss << "expected ";
    if ( min == max ) oss << min;
    else oss << min << " to " << max;
    oss << " argument" << ( max == 1 ? "" : "s" ) << ", got " << args.size();
    throw HelperContractError( helper, oss.str() );
  }

  inline const char* kind_name( const ordered_node& n ) {
    if ( n.is_null() ) return "null";
    if ( n.is_boolean() ) return "boolean";
    if ( n.is_integer() || n.is_float_number() ) return "number";
    if ( n.is_string() ) return "string";
    if ( n.is_sequence() ) return "list";
    return "map";
  }

  // Three-way ordering of two numbers or two strings
  inline int compare_ordered( const std::string& helper,
    const ordered_node& a, const ordered_node& b )
  {
    if ( is_number(a) && is_number(b) ) {
      const double x = as_double( a ), y = as_double( b );
      return ( x < y ) ? -1 : ( (y < x) ? 1 : 0 );
    }
    if ( a.is_string() && b.is_string() ) {
      return to_native_checked< std::string >( a ).compare(
        to_native_checked< std::string >( b ) );
    }
    throw HelperContractError( helper, std::string( "cannot order " )
      + kind_name( a ) + " against " + kind_name( b ) );
  }

  // Wraps a string -> string transform; null passes through untouched
  template < typename F >
  inline helper_fn string_transform( const std::string& helper, F f ) {
    return [helper, f]( const helper_args& args ) -> ordered_node {
      require_arity( helper, args, 1, 1 );
      const ordered_node& v = args[ 0 ];
      if ( v.is_null() ) return ordered_node();
      if ( !v.is_string() ) {
        throw HelperContractError( helper, std::string( "expected a string, got " )
          + kind_name( v ) );
      }
      return make_string( f(to_native_checked< std::string >(v)) );
    };
  }

  // Wraps a context escaper; any scalar is stringified first
  inline helper_fn escaping_helper( const std::string& helper,
    Context context )
  {
    return [helper, context]( const helper_args& args ) -> ordered_node {
      require_arity( helper, args, 1, 1 );
      return make_string( escape(to_string_any(args[0]), context) );
    };
  }

  inline helper_fn comparison_helper( const std::string& helper,
    std::function< bool( int ) > accept )
  {
    return [helper, accept]( const helper_args& args ) -> ordered_node {
      require_arity( helper, args, 2, 2 );
      return make_bool( accept(compare_ordered(helper, args[0], args[1])) );
    };
  }

  inline std::string to_lower( std::string s ) {
    std::transform( s.begin(), s.end(), s.begin(),
      []( unsigned char c ) { return std::tolower( c ); } );
    return s;
  }

  inline std::string to_upper( std::string s ) {
    std::transform( s.begin(), s.end(), s.begin(),
      []( unsigned char c ) { return std::toupper( c ); } );
    return s;
  }

} // namespace stanza::internal

} // namespace stanza

// HelperRegistry member function definitions

inline void stanza::HelperRegistry::register_helper( const std::string& name,
  helper_fn fn )
{
  if ( name.empty() ) {
    throw Error( "Helper names must not be empty" );
  }
  if ( !fn ) {
    throw Error( "Helper '" + name + "' has no function" );
  }
  helpers_[ name ] = std::move( fn );
}

inline stanza::ordered_node stanza::HelperRegistry::invoke(
  const std::string& name, const helper_args& args ) const
{
  auto it = helpers_.find( name );
  if ( it == helpers_.end() ) throw UnknownHelperError( name );
  return it->second( args );
}

inline std::vector< std::string > stanza::HelperRegistry::names() const {
  std::vector< std::string > out;
  out.reserve( helpers_.size() );
  for ( const auto& kv : helpers_ ) out.push_back( kv.first );
  return out;
}

inline stanza::HelperRegistry stanza::HelperRegistry::with_builtins() {
  using namespace internal;

  HelperRegistry r;

  // Comparison
  auto equals = []( const helper_args& args ) -> ordered_node {
    require_arity( "equals", args, 2, 2 );
    return make_bool( values_equal(args[0], args[1]) );
  };
  auto not_equals = []( const helper_args& args ) -> ordered_node {
    require_arity( "not-equals", args, 2, 2 );
    return make_bool( !values_equal(args[0], args[1]) );
  };
  r.register_helper( "equals", equals );
  r.register_helper( "not-equals", not_equals );
  r.register_helper( "less-than", comparison_helper( "less-than",
    []( int c ) { return c < 0; } ) );
  r.register_helper( "greater-than", comparison_helper( "greater-than",
    []( int c ) { return c > 0; } ) );
  r.register_helper( "less-or-equal", comparison_helper( "less-or-equal",
    []( int c ) { return c <= 0; } ) );
  r.register_helper( "greater-or-equal", comparison_helper( "greater-or-equal",
    []( int c ) { return c >= 0; } ) );

  // Logic
  r.register_helper( "and", []( const helper_args& args ) -> ordered_node {
    for ( const auto& a : args ) {
      if ( !is_truthy(a) ) return make_bool( false );
    }
    return make_bool( true );
  } );
  r.register_helper( "or", []( const helper_args& args ) -> ordered_node {
    for ( const auto& a : args ) {
      if ( is_truthy(a) ) return make_bool( true );
    }
    return make_bool( false );
  } );
  r.register_helper( "not", []( const helper_args& args ) -> ordered_node {
    require_arity( "not", args, 1, 1 );
    return make_bool( !is_truthy(args[0]) );
  } );

  // Collection
  r.register_helper( "includes", []( const helper_args& args ) -> ordered_node {
    require_arity( "includes", args, 2, 2 );
    const ordered_node& list = args[ 0 ];
    if ( list.is_null() ) return make_bool( false );
    if ( !list.is_sequence() ) {
      throw HelperContractError( "includes",
        std::string( "expected a list, got " ) + kind_name( list ) );
    }
    for ( size_t i = 0; i < list.size(); ++i ) {
      if ( values_equal(list.at(i), args[1]) ) return make_bool( true );
    }
    return make_bool( false );
  } );
  r.register_helper( "join", []( const helper_args& args ) -> ordered_node {
    require_arity( "join", args, 1, 2 );
    const ordered_node& list = args[ 0 ];
    if ( list.is_null() ) return ordered_node();
    if ( !list.is_sequence() ) {
      throw HelperContractError( "join",
        std::string( "expected a list, got " ) + kind_name( list ) );
    }
    const std::string sep = ( args.size() == 2 && !args[1].is_null() )
      ? to_string_any( args[1] ) : std::string( ", " );
    std::string out;
    for ( size_t i = 0; i < list.size(); ++i ) {
      if ( i ) out += sep;
      out += to_string_any( list.at(i) );
    }
    return make_string( out );
  } );

  // String case
  r.register_helper( "capitalize", string_transform( "capitalize",
    []( std::string s ) {
      if ( !s.empty() ) {
        s[ 0 ] = static_cast< char >(
          std::toupper( static_cast< unsigned char >( s[0] ) ) );
      }
      return s;
    } ) );
  r.register_helper( "lowercase", string_transform( "lowercase",
    []( const std::string& s ) { return to_lower( s ); } ) );
  r.register_helper( "uppercase", string_transform( "uppercase",
    []( const std::string& s ) { return to_upper( s ); } ) );

  // Default
  r.register_helper( "default", []( const helper_args& args ) -> ordered_node {
    require_arity( "default", args, 2, 2 );
    return is_truthy( args[0] ) ? args[ 0 ] : args[ 1 ];
  } );

  // Escaping
  r.register_helper( "escape-markup",
    escaping_helper( "escape-markup", Context::Markup ) );
  r.register_helper( "escape-script",
    escaping_helper( "escape-script", Context::Script ) );
  r.register_helper( "escape-shell",
    escaping_helper( "escape-shell", Context::Shell ) );
  r.register_helper( "escape-structured-literal",
    escaping_helper( "escape-structured-literal", Context::StructuredLiteral ) );
  r.register_helper( "escape-for", []( const helper_args& args ) -> ordered_node {
    require_arity( "escape-for", args, 2, 2 );
    if ( !args[0].is_string() ) {
      throw HelperContractError( "escape-for",
        std::string( "context must be a string, got " ) + kind_name( args[0] ) );
    }
    const Context c = parse_context( to_native_checked< std::string >(args[0]) );
    return make_string( escape(to_string_any(args[1]), c) );
  } );

  // Short names accepted by existing templates
  r.register_helper( "eq", equals );
  r.register_helper( "ne", not_equals );
  r.register_helper( "lt", comparison_helper( "lt",
    []( int c ) { return c < 0; } ) );
  r.register_helper( "gt", comparison_helper( "gt",
    []( int c ) { return c > 0; } ) );
  r.register_helper( "lte", comparison_helper( "lte",
    []( int c ) { return c <= 0; } ) );
  r.register_helper( "gte", comparison_helper( "gte",
    []( int c ) { return c >= 0; } ) );
  r.register_helper( "escapeHtml",
    escaping_helper( "escapeHtml", Context::Markup ) );
  r.register_helper( "escapeJs",
    escaping_helper( "escapeJs", Context::Script ) );
  r.register_helper( "escapeShell",
    escaping_helper( "escapeShell", Context::Shell ) );
  r.register_helper( "escapeJson",
    escaping_helper( "escapeJson", Context::StructuredLiteral ) );
  r.register_helper( "safeString", []( const helper_args& args ) -> ordered_node {
    require_arity( "safeString", args, 1, 2 );
    Context c = Context::Markup;
    if ( args.size() == 2 ) {
      if ( !args[1].is_string() ) {
        throw HelperContractError( "safeString",
          std::string( "context must be a string, got " ) + kind_name( args[1] ) );
      }
      c = parse_context( to_native_checked< std::string >(args[1]) );
    }
    return make_string( escape(to_string_any(args[0]), c) );
  } );

  return r;
}
