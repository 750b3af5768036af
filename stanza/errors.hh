//  stanza
//  Context-escaping text template engine
//  version 0.1.0 | MIT License
#pragma once

// Standard library includes
#include <cstddef>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace stanza {

  // Base class for every failure raised by the engine. All of them abort
  // the render call that raised them; no partial output is ever returned.
  class Error : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
  };

  // Unmatched, unterminated or improperly nested block, or a malformed tag
  class SyntaxError : public Error {
  public:
    SyntaxError( const std::string& msg, std::size_t line, std::size_t column,
      const std::string& origin = std::string() )
      : Error( compose(msg, line, column, origin) ), line_( line ),
      column_( column ) {}

    std::size_t line() const { return line_; }
    std::size_t column() const { return column_; }

  private:
    std::size_t line_;
    std::size_t column_;

    static std::string compose( const std::string& msg, std::size_t line,
      std::size_t column, const std::string& origin )
    {
      std::ostringstream oss;
      if ( !origin.empty() ) oss << origin << ':';
      oss << line << ':' << column << ": " << msg;
      return oss.str();
    }
  };

  // A helper-call expression names an unregistered helper
  class UnknownHelperError : public Error {
  public:
    explicit UnknownHelperError( const std::string& helper )
      : Error( "Unknown helper '" + helper + "'" ), helper_( helper ) {}

    const std::string& helper() const { return helper_; }

  protected:
    UnknownHelperError( const std::string& helper, const std::string& msg )
      : Error( msg ), helper_( helper ) {}

  private:
    std::string helper_;
  };

  // A registered helper was invoked with argument kinds (or an argument
  // count) it does not accept
  class HelperContractError : public UnknownHelperError {
  public:
    HelperContractError( const std::string& helper, const std::string& msg )
      : UnknownHelperError( helper,
        "Helper '" + helper + "' contract violation: " + msg ) {}
  };

  // Raised only in strict mode, before rendering starts
  class UnresolvedVariableError : public Error {
  public:
    explicit UnresolvedVariableError( const std::vector< std::string >& names )
      : Error( compose(names) ), names_( names ) {}

    const std::vector< std::string >& names() const { return names_; }

  private:
    std::vector< std::string > names_;

    static std::string compose( const std::vector< std::string >& names ) {
      std::ostringstream oss;
      oss << "Unresolved template variable" << ( names.size() == 1 ? "" : "s" )
        << ": ";
      for ( size_t i = 0; i < names.size(); ++i ) {
        if ( i ) oss << ", ";
        oss << names[ i ];
      }
      return oss.str();
    }
  };

  // An unknown or unsupported escaping context was requested explicitly
  class EscapingContextError : public Error {
  public:
    using Error::Error;
  };

  // A template source could not supply text for an origin identifier
  class TemplateLoadError : public Error {
  public:
    TemplateLoadError( const std::string& origin, const std::string& reason )
      : Error( "Failed to load template '" + origin + "': " + reason ),
      origin_( origin ) {}

    const std::string& origin() const { return origin_; }

  private:
    std::string origin_;
  };

} // namespace stanza
