//  stanza
//  Context-escaping text template engine
//  version 0.1.0 | MIT License
#pragma once

// Standard library includes
#include <algorithm>
#include <cctype>
#include <string>

// JSON for Modern C++ (string serialization for structured literals)
#include <nlohmann/json.hpp>

#include "stanza/errors.hh"

namespace stanza {

  // Destination syntax of the rendered output. Exactly one context is active
  // for a render call; Raw is only reachable through a raw-output marker at
  // the substitution site.
  enum class Context { Markup, Script, Shell, StructuredLiteral, Url, Raw };

  inline const char* context_name( Context c ) {
    switch ( c ) {
      case Context::Markup: return "markup";
      case Context::Script: return "script";
      case Context::Shell: return "shell-command";
      case Context::StructuredLiteral: return "structured-literal";
      case Context::Url: return "url";
      case Context::Raw: return "raw";
    }
    return "markup";
  }

  // Accepts the canonical names plus the short names used by existing
  // templates (html, js, bash, json, none, ...)
  inline Context parse_context( const std::string& name ) {
    std::string n = name;
    std::transform( n.begin(), n.end(), n.begin(),
      []( unsigned char c ) { return std::tolower( c ); } );

    if ( n == "markup" || n == "html" ) return Context::Markup;
    if ( n == "script" || n == "js" || n == "javascript" ) {
      return Context::Script;
    }
    if ( n == "shell" || n == "shell-command" || n == "bash" ) {
      return Context::Shell;
    }
    if ( n == "structured-literal" || n == "json" ) {
      return Context::StructuredLiteral;
    }
    if ( n == "url" ) return Context::Url;
    if ( n == "raw" || n == "none" ) return Context::Raw;

    throw EscapingContextError( "Unknown escaping context '" + name + "'" );
  }

  // & < > " ' / ` = become entities
  inline std::string escape_markup( const std::string& s ) {
    std::string out;
    out.reserve( s.size() );
    for ( char c : s ) {
      switch ( c ) {
        case '&': out += "&amp;"; break;
        case '<': out += "&lt;"; break;
        case '>': out += "&gt;"; break;
        case '"': out += "&quot;"; break;
        case '\'': out += "&#39;"; break;
        case '/': out += "&#x2F;"; break;
        case '`': out += "&#x60;"; break;
        case '=': out += "&#x3D;"; break;
        default: out.push_back( c );
      }
    }
    return out;
  }

  // Backslash escapes for a script string literal. U+2028 and U+2029
  // (UTF-8 E2 80 A8 / E2 80 A9) terminate statements in many interpreters
  // and are escaped as \u2028 / \u2029.
  inline std::string escape_script( const std::string& s ) {
    std::string out;
    out.reserve( s.size() );
    for ( size_t i = 0; i < s.size(); ++i ) {
      const char c = s[ i ];
      switch ( c ) {
        case '\\': out += "\\\\"; continue;
        case '"': out += "\\\""; continue;
        case '\'': out += "\\'"; continue;
        case '\n': out += "\\n"; continue;
        case '\r': out += "\\r"; continue;
        case '\t': out += "\\t"; continue;
        case '\b': out += "\\b"; continue;
        case '\f': out += "\\f"; continue;
        case '\v': out += "\\v"; continue;
        // Never "\0": a following digit would turn it into an octal escape
        case '\0': out += "\\x00"; continue;
        default: break;
      }
      if ( static_cast< unsigned char >( c ) == 0xE2 && i + 2 < s.size()
        && static_cast< unsigned char >( s[i + 1] ) == 0x80 )
      {
        const unsigned char third = static_cast< unsigned char >( s[i + 2] );
        if ( third == 0xA8 || third == 0xA9 ) {
          out += ( third == 0xA8 ) ? "\\u2028" : "\\u2029";
          i += 2;
          continue;
        }
      }
      out.push_back( c );
    }
    return out;
  }

  // Single-quote the whole value; an embedded ' becomes '\'' (close quote,
  // escaped quote, reopen)
  inline std::string escape_shell( const std::string& s ) {
    std::string out = "'";
    for ( char c : s ) {
      if ( c == '\'' ) out += "'\\''";
      else out.push_back( c );
    }
    out += '\'';
    return out;
  }

  // JSON string encoding without the surrounding quote pair; the template
  // supplies its own quotes. Invalid UTF-8 is replaced, not rejected.
  inline std::string escape_structured_literal( const std::string& s ) {
    const std::string quoted = nlohmann::json( s ).dump( -1, ' ', false,
      nlohmann::json::error_handler_t::replace );
    return quoted.substr( 1, quoted.size() - 2 );
  }

  // URI component encoding: unreserved characters pass through, every other
  // byte is percent-encoded with uppercase hex digits
  inline std::string escape_url( const std::string& s ) {
    static const char* HEX = "0123456789ABCDEF";
    std::string out;
    out.reserve( s.size() );
    for ( char ch : s ) {
      const unsigned char c = static_cast< unsigned char >( ch );
      if ( std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '!'
        || c == '~' || c == '*' || c == '\'' || c == '(' || c == ')' )
      {
        out.push_back( ch );
      }
      else {
        out.push_back( '%' );
        out.push_back( HEX[c >> 4] );
        out.push_back( HEX[c & 0x0F] );
      }
    }
    return out;
  }

  inline std::string escape( const std::string& value, Context context ) {
    switch ( context ) {
      case Context::Markup: return escape_markup( value );
      case Context::Script: return escape_script( value );
      case Context::Shell: return escape_shell( value );
      case Context::StructuredLiteral: return escape_structured_literal( value );
      case Context::Url: return escape_url( value );
      case Context::Raw: return value;
    }
    return escape_markup( value );
  }

} // namespace stanza
