//  stanza
//  Context-escaping text template engine
//  version 0.1.0 | MIT License
#pragma once

// Standard library includes
#include <cmath>
#include <cstdint>
#include <optional>
#include <regex>
#include <stdexcept>
#include <string>
#include <vector>

// fkYAML single-header library
// https://github.com/fktn-k/fkYAML
#include "fkYAML/node.hpp"

// {fmt} formatting library (shortest round-trip float output)
#include <fmt/format.h>

namespace stanza {

  // Specialized version of the fkYAML basic_node template used for every
  // binding value. The choice of fkyaml::ordered_map preserves the lexical
  // order of mappings supplied by the caller (or parsed from YAML)
  using ordered_node = fkyaml::basic_node<
    std::vector, // sequence container
    fkyaml::ordered_map, // mapping container
    bool,
    std::int64_t,
    double,
    std::string,
    fkyaml::node_value_converter
  >;

  // Result of a lookup. std::nullopt is the "undefined" marker and is
  // distinct from a present null value
  using maybe_node = std::optional< ordered_node >;

namespace internal {

  inline constexpr char PATH_DELIMITER = '.';

  // Helpers for conversions to/from the ordered_node type

  template < typename T >
  inline T to_native_checked( const ordered_node& n ) {
    T out;
    fkyaml::node_value_converter< T >::from_node( n, out );
    return out;
  }

  template < typename T >
  inline ordered_node make_node_from( const T& value ) {
    ordered_node n;
    fkyaml::node_value_converter< T >::to_node( n, value );
    return n;
  }

  inline ordered_node make_string( const std::string& s ) {
    return make_node_from( s );
  }

  inline ordered_node make_bool( bool b ) {
    return make_node_from( b );
  }

  inline ordered_node make_int( std::int64_t i ) {
    return make_node_from( i );
  }

  inline ordered_node make_float( double d ) {
    return make_node_from( d );
  }

  inline bool is_number( const ordered_node& n ) {
    return n.is_integer() || n.is_float_number();
  }

  inline double as_double( const ordered_node& n ) {
    if ( n.is_integer() ) {
      return static_cast< double >( to_native_checked< std::int64_t >(n) );
    }
    return to_native_checked< double >( n );
  }

  // Divide a dotted path string by PATH_DELIMITER instances
  inline std::vector< std::string > split_segments( const std::string& path ) {
    std::vector< std::string > segs;
    size_t start = 0;
    while ( true ) {
      size_t pos = path.find( PATH_DELIMITER, start );
      if ( pos == std::string::npos ) {
        segs.push_back( path.substr(start) );
        break;
      }
      segs.push_back( path.substr(start, pos - start) );
      start = pos + 1;
    }
    return segs;
  }

  // Floats print in the shortest form that round-trips, so 1.5 renders as
  // "1.5" and 3.0 as "3"
  inline std::string format_float( double d ) {
    if ( std::isnan(d) ) return "NaN";
    if ( std::isinf(d) ) return d < 0 ? "-Infinity" : "Infinity";
    return fmt::format( "{}", d );
  }

} // namespace stanza::internal

  // Text form of a value at a substitution site. Null renders as the empty
  // string, sequences as their elements joined by commas.
  inline std::string to_string_any( const ordered_node& n ) {
    using namespace internal;
    if ( n.is_null() ) return std::string();
    if ( n.is_string() ) return to_native_checked< std::string >( n );
    if ( n.is_integer() ) return std::to_string(
      to_native_checked< std::int64_t >( n )
    );
    if ( n.is_boolean() ) return n.get_value< bool >() ? "true" : "false";
    if ( n.is_float_number() ) return format_float(
      to_native_checked< double >( n )
    );
    if ( n.is_sequence() ) {
      std::string s;
      for ( size_t i = 0; i < n.size(); ++i ) {
        if ( i ) s += ',';
        s += to_string_any( n.at(i) );
      }
      return s;
    }

    // We did not match any of the scalar types, so fall back to serialization
    return ordered_node::serialize( n );
  }

  // Truthiness: the empty string, zero, false, null/absent and the empty
  // sequence are falsy. Everything else (including an empty mapping) is truthy
  inline bool is_truthy( const ordered_node& n ) {
    using namespace internal;
    if ( n.is_null() ) return false;
    if ( n.is_boolean() ) return n.get_value< bool >();
    if ( n.is_integer() ) return to_native_checked< std::int64_t >( n ) != 0;
    if ( n.is_float_number() ) {
      double d = to_native_checked< double >( n );
      return d != 0.0 && !std::isnan( d );
    }
    if ( n.is_string() ) return !to_native_checked< std::string >( n ).empty();
    if ( n.is_sequence() ) return n.size() > 0;
    return true;
  }

  inline bool is_truthy( const maybe_node& n ) {
    return n.has_value() && is_truthy( *n );
  }

  // Strict structural equality. Integers and floats compare by numeric value;
  // all other kinds must match exactly
  inline bool values_equal( const ordered_node& a, const ordered_node& b ) {
    using namespace internal;
    if ( is_number(a) && is_number(b) ) {
      if ( a.is_integer() && b.is_integer() ) {
        return to_native_checked< std::int64_t >( a )
          == to_native_checked< std::int64_t >( b );
      }
      return as_double( a ) == as_double( b );
    }
    if ( a.is_null() || b.is_null() ) return a.is_null() && b.is_null();
    if ( a.is_boolean() && b.is_boolean() ) {
      return a.get_value< bool >() == b.get_value< bool >();
    }
    if ( a.is_string() && b.is_string() ) {
      return to_native_checked< std::string >( a )
        == to_native_checked< std::string >( b );
    }
    if ( a.is_sequence() && b.is_sequence() ) {
      if ( a.size() != b.size() ) return false;
      for ( size_t i = 0; i < a.size(); ++i ) {
        if ( !values_equal(a.at(i), b.at(i)) ) return false;
      }
      return true;
    }
    if ( a.is_mapping() && b.is_mapping() ) {
      if ( a.size() != b.size() ) return false;
      for ( const auto& [ak, av] : a.map_items() ) {
        const std::string key = ak.get_value< std::string >();
        if ( !b.contains(key) ) return false;
        if ( !values_equal(av, b.at(key)) ) return false;
      }
      return true;
    }
    return false;
  }

  // Parse a literal token: a quoted string, an integer, a float, true, false
  // or null. Returns std::nullopt if the token is not a literal (i.e., it
  // should be treated as a path)
  inline maybe_node parse_literal( const std::string& tok ) {
    using namespace internal;
    if ( tok.size() >= 2 ) {
      const char q = tok.front();
      if ( (q == '"' || q == '\'') && tok.back() == q ) {
        return make_string( tok.substr(1, tok.size() - 2) );
      }
    }
    if ( tok == "true" ) return make_bool( true );
    if ( tok == "false" ) return make_bool( false );
    if ( tok == "null" ) return ordered_node();

    static const std::regex int_re( R"(^-?[0-9]+$)" );
    static const std::regex float_re(
      R"(^-?([0-9]+\.[0-9]*|\.[0-9]+|[0-9]+)([eE][+-]?[0-9]+)?$)" );

    if ( std::regex_match(tok, int_re) ) {
      try {
        return make_int( std::stoll(tok) );
      }
      catch ( const std::out_of_range& ) {
        // Too wide for int64: keep the magnitude as a float
        return make_float( std::stod(tok) );
      }
    }
    if ( std::regex_match(tok, float_re) ) {
      try {
        return make_float( std::stod(tok) );
      }
      catch ( const std::out_of_range& ) {
        // Overflow saturates; underflow collapses to zero
        const bool big = tok.find_first_of( "eE" ) != std::string::npos
          && tok.find( "e-" ) == std::string::npos
          && tok.find( "E-" ) == std::string::npos;
        const double mag = big ? HUGE_VAL : 0.0;
        return make_float( tok.front() == '-' ? -mag : mag );
      }
    }
    return std::nullopt;
  }

} // namespace stanza
