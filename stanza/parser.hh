//  stanza
//  Context-escaping text template engine
//  version 0.1.0 | MIT License
#pragma once

// Standard library includes
#include <cctype>
#include <cstddef>
#include <regex>
#include <string>
#include <vector>

#include "stanza/errors.hh"
#include "stanza/scope.hh"
#include "stanza/value.hh"

namespace stanza {

  // Position of a token in the template text (1-based)
  struct SourceLocation {
    std::size_t line = 1;
    std::size_t column = 1;
  };

  enum class TokenKind {
    Text,
    Substitution, // {{ expr }}
    RawSubstitution, // {{{ expr }}} or {{!expr}}
    OpenIf, // {{#if cond}}
    Else, // {{else}}
    CloseIf, // {{/if}}
    OpenEach, // {{#each expr}}
    CloseEach // {{/each}}
  };

  struct Token {
    TokenKind kind;
    // Literal text for Text tokens, trimmed tag body otherwise
    std::string text;
    SourceLocation where;
  };

  // A single argument: either a literal value or a dotted path
  struct Operand {
    bool is_literal = false;
    ordered_node literal;
    std::vector< std::string > segments;
    std::string text;
  };

  enum class ExprKind { Operand, HelperCall };

  // {{ path }}, {{ 'literal' }} or {{ helper arg1 arg2 ... }}
  struct Expression {
    ExprKind kind = ExprKind::Operand;
    Operand operand; // ExprKind::Operand
    std::string helper; // ExprKind::HelperCall
    std::vector< Operand > args; // ExprKind::HelperCall
    std::string text;

    // True for a bare dot-path (not a literal, not a helper call)
    bool is_plain_path() const {
      return kind == ExprKind::Operand && !operand.is_literal;
    }
  };

  // Zero or more leading negation markers applied to an expression
  struct Condition {
    std::size_t negations = 0;
    Expression expr;
  };

  enum class NodeKind { Text, Substitution, Conditional, Iteration };

  // Tagged template node. Conditionals use body (then-branch) and alt
  // (else-branch); iterations use expr (source) and body.
  struct Node {
    NodeKind kind = NodeKind::Text;
    std::string text;
    Expression expr;
    bool raw = false;
    Condition cond;
    std::vector< Node > body;
    std::vector< Node > alt;
    SourceLocation where;
  };

  // Splits template text into a flat token stream. Throws SyntaxError on an
  // unterminated tag or an unknown block keyword.
  inline std::vector< Token > tokenize( const std::string& text,
    const std::string& origin = std::string() );

  // Parses a single expression (substitution body or block argument)
  inline Expression parse_expression( const std::string& text,
    const SourceLocation& where, const std::string& origin = std::string() );

  // Builds the node tree from a template by depth tracking over the token
  // stream. Throws SyntaxError for unmatched, unterminated or improperly
  // nested blocks, or for nesting deeper than max_depth.
  inline std::vector< Node > parse( const std::string& text,
    const std::string& origin = std::string(), int max_depth = 64 );

namespace internal {

  inline const std::string OPEN_TAG = "{{";
  inline const std::string CLOSE_TAG = "}}";
  inline const std::string OPEN_RAW_TAG = "{{{";
  inline const std::string CLOSE_RAW_TAG = "}}}";
  inline constexpr char TAG_ESCAPE = '\\';
  inline constexpr char NEGATION = '!';
  inline constexpr char BLOCK_OPEN = '#';
  inline constexpr char BLOCK_CLOSE = '/';

  inline const std::string KW_IF = "if";
  inline const std::string KW_EACH = "each";
  inline const std::string KW_ELSE = "else";

  inline bool is_space( char c ) {
    return std::isspace( static_cast< unsigned char >( c ) ) != 0;
  }

  inline std::string trim( const std::string& s ) {
    std::size_t b = 0, e = s.size();
    while ( b < e && is_space(s[b]) ) ++b;
    while ( e > b && is_space(s[e - 1]) ) --e;
    return s.substr( b, e - b );
  }

  // Moves a location across text[from, to)
  inline SourceLocation advance( SourceLocation loc, const std::string& text,
    std::size_t from, std::size_t to )
  {
    for ( std::size_t i = from; i < to && i < text.size(); ++i ) {
      if ( text[i] == '\n' ) { ++loc.line; loc.column = 1; }
      else ++loc.column;
    }
    return loc;
  }

  [[noreturn]] inline void throw_syntax( const std::string& msg,
    const SourceLocation& where, const std::string& origin )
  {
    throw SyntaxError( msg, where.line, where.column, origin );
  }

  // Split an expression into whitespace-separated words. Quoted literals
  // keep their quotes and may contain whitespace.
  inline std::vector< std::string > split_words( const std::string& s,
    const SourceLocation& where, const std::string& origin )
  {
    std::vector< std::string > words;
    std::size_t i = 0;
    while ( i < s.size() ) {
      while ( i < s.size() && is_space(s[i]) ) ++i;
      if ( i >= s.size() ) break;

      std::size_t start = i;
      if ( s[i] == '"' || s[i] == '\'' ) {
        const char q = s[ i ];
        std::size_t close = s.find( q, i + 1 );
        if ( close == std::string::npos ) {
          throw_syntax( "Unterminated string literal in '" + s + "'",
            where, origin );
        }
        i = close + 1;
        if ( i < s.size() && !is_space(s[i]) ) {
          throw_syntax( "Unexpected character after string literal in '"
            + s + "'", where, origin );
        }
      }
      else {
        while ( i < s.size() && !is_space(s[i]) ) ++i;
      }
      words.push_back( s.substr(start, i - start) );
    }
    return words;
  }

  inline Operand parse_operand( const std::string& word,
    const SourceLocation& where, const std::string& origin )
  {
    // Identifier segments may contain letters, digits, '_', '$' and '-';
    // the first segment may carry the '@' prefix of loop-local names
    static const std::regex path_re(
      R"(^@?[A-Za-z_$][A-Za-z0-9_$\-]*(\.[A-Za-z0-9_$\-]+)*$)" );

    Operand op;
    op.text = word;
    if ( maybe_node lit = parse_literal(word) ) {
      op.is_literal = true;
      op.literal = *lit;
      return op;
    }
    if ( !std::regex_match(word, path_re) ) {
      throw_syntax( "Invalid path or literal '" + word + "'", where, origin );
    }
    op.segments = split_segments( word );
    return op;
  }

  inline bool is_helper_name( const std::string& word ) {
    static const std::regex name_re( R"(^[A-Za-z_][A-Za-z0-9_\-]*$)" );
    return std::regex_match( word, name_re );
  }

  // Accumulates the nodes of one block level
  struct TreeBuilder {
    const std::vector< Token >& tokens;
    const std::string& origin;
    int max_depth;
    std::size_t pos = 0;

    // Token that closed the last call to parse_until(), if any
    const Token* closer = nullptr;

    // Parse nodes until one of the given closers (or end of input when
    // `opener` is null). Returns the collected nodes.
    std::vector< Node > parse_until( const Token* opener, int depth );

    Node parse_if( const Token& open, int depth );
    Node parse_each( const Token& open, int depth );
  };

  inline const char* describe( TokenKind k ) {
    switch ( k ) {
      case TokenKind::OpenIf: return "{{#if}}";
      case TokenKind::Else: return "{{else}}";
      case TokenKind::CloseIf: return "{{/if}}";
      case TokenKind::OpenEach: return "{{#each}}";
      case TokenKind::CloseEach: return "{{/each}}";
      default: return "tag";
    }
  }

  inline std::string opened_at( const Token& t ) {
    return std::string( describe(t.kind) ) + " opened at line "
      + std::to_string( t.where.line ) + ", column "
      + std::to_string( t.where.column );
  }

} // namespace stanza::internal

} // namespace stanza

// Lexer

inline std::vector< stanza::Token > stanza::tokenize( const std::string& text,
  const std::string& origin )
{
  using namespace internal;

  std::vector< Token > out;
  std::string pending; // text accumulated since the last tag
  SourceLocation pending_at;
  SourceLocation loc; // location of text[i]

  auto flush_text = [&]() {
    if ( pending.empty() ) return;
    out.push_back( Token{ TokenKind::Text, pending, pending_at } );
    pending.clear();
  };

  auto add_text = [&]( const std::string& s, const SourceLocation& at ) {
    if ( pending.empty() ) pending_at = at;
    pending += s;
  };

  std::size_t i = 0;
  while ( i < text.size() ) {
    std::size_t open = text.find( OPEN_TAG, i );
    if ( open == std::string::npos ) {
      add_text( text.substr(i), loc );
      break;
    }

    // Protected delimiter: \{{ is a literal {{
    if ( open > i && text[open - 1] == TAG_ESCAPE ) {
      add_text( text.substr(i, open - 1 - i), loc );
      loc = advance( loc, text, i, open );
      add_text( OPEN_TAG, loc );
      loc = advance( loc, text, open, open + OPEN_TAG.size() );
      i = open + OPEN_TAG.size();
      continue;
    }

    add_text( text.substr(i, open - i), loc );
    loc = advance( loc, text, i, open );
    const SourceLocation tag_at = loc;

    const bool triple = text.compare( open, OPEN_RAW_TAG.size(),
      OPEN_RAW_TAG ) == 0;
    const std::string& closer = triple ? CLOSE_RAW_TAG : CLOSE_TAG;
    const std::size_t body_start = open + ( triple ? OPEN_RAW_TAG.size()
      : OPEN_TAG.size() );
    const std::size_t close = text.find( closer, body_start );
    if ( close == std::string::npos ) {
      throw_syntax( std::string( "Unterminated tag, expected '" ) + closer
        + "'", tag_at, origin );
    }

    const std::string body = trim( text.substr(body_start, close - body_start) );
    const std::size_t next = close + closer.size();

    flush_text();

    if ( body.empty() ) throw_syntax( "Empty tag", tag_at, origin );

    if ( triple ) {
      if ( body[0] == BLOCK_OPEN || body[0] == BLOCK_CLOSE ) {
        throw_syntax( "Block markers are not allowed inside '{{{ }}}'",
          tag_at, origin );
      }
      out.push_back( Token{ TokenKind::RawSubstitution, body, tag_at } );
    }
    else if ( body[0] == BLOCK_OPEN ) {
      const std::string rest = body.substr( 1 );
      std::size_t kw_end = 0;
      while ( kw_end < rest.size() && !is_space(rest[kw_end]) ) ++kw_end;
      const std::string kw = rest.substr( 0, kw_end );
      const std::string arg = trim( rest.substr(kw_end) );

      TokenKind kind;
      if ( kw == KW_IF ) kind = TokenKind::OpenIf;
      else if ( kw == KW_EACH ) kind = TokenKind::OpenEach;
      else throw_syntax( "Unknown block '#" + kw + "'", tag_at, origin );

      if ( arg.empty() ) {
        throw_syntax( "Block '#" + kw + "' requires an argument", tag_at,
          origin );
      }
      out.push_back( Token{ kind, arg, tag_at } );
    }
    else if ( body[0] == BLOCK_CLOSE ) {
      const std::string kw = trim( body.substr(1) );
      if ( kw == KW_IF ) {
        out.push_back( Token{ TokenKind::CloseIf, kw, tag_at } );
      }
      else if ( kw == KW_EACH ) {
        out.push_back( Token{ TokenKind::CloseEach, kw, tag_at } );
      }
      else throw_syntax( "Unknown closing block '/" + kw + "'", tag_at, origin );
    }
    else if ( body == KW_ELSE ) {
      out.push_back( Token{ TokenKind::Else, body, tag_at } );
    }
    else if ( body[0] == NEGATION ) {
      const std::string expr = trim( body.substr(1) );
      if ( expr.empty() ) throw_syntax( "Empty tag", tag_at, origin );
      out.push_back( Token{ TokenKind::RawSubstitution, expr, tag_at } );
    }
    else {
      out.push_back( Token{ TokenKind::Substitution, body, tag_at } );
    }

    loc = advance( loc, text, open, next );
    i = next;
  }

  flush_text();
  return out;
}

// Expressions

inline stanza::Expression stanza::parse_expression( const std::string& text,
  const SourceLocation& where, const std::string& origin )
{
  using namespace internal;

  const std::vector< std::string > words = split_words( text, where, origin );
  if ( words.empty() ) throw_syntax( "Empty expression", where, origin );

  Expression e;
  e.text = text;
  if ( words.size() == 1 ) {
    e.kind = ExprKind::Operand;
    e.operand = parse_operand( words[0], where, origin );
    return e;
  }

  // More than one word: the first names a helper, the rest are its
  // arguments
  if ( !is_helper_name(words[0]) ) {
    throw_syntax( "Invalid helper name '" + words[0] + "'", where, origin );
  }
  e.kind = ExprKind::HelperCall;
  e.helper = words[ 0 ];
  for ( std::size_t i = 1; i < words.size(); ++i ) {
    e.args.push_back( parse_operand(words[i], where, origin) );
  }
  return e;
}

// Parser

inline std::vector< stanza::Node > stanza::internal::TreeBuilder::parse_until(
  const Token* opener, int depth )
{
  if ( depth > max_depth ) {
    throw_syntax( "Blocks nested deeper than " + std::to_string( max_depth )
      + " levels", opener ? opener->where : SourceLocation(), origin );
  }

  std::vector< Node > nodes;
  closer = nullptr;

  while ( pos < tokens.size() ) {
    const Token& t = tokens[ pos ];
    switch ( t.kind ) {
      case TokenKind::Text: {
        Node n;
        n.kind = NodeKind::Text;
        n.text = t.text;
        n.where = t.where;
        nodes.push_back( std::move(n) );
        ++pos;
        break;
      }
      case TokenKind::Substitution:
      case TokenKind::RawSubstitution: {
        Node n;
        n.kind = NodeKind::Substitution;
        n.raw = ( t.kind == TokenKind::RawSubstitution );
        n.expr = parse_expression( t.text, t.where, origin );
        n.where = t.where;
        nodes.push_back( std::move(n) );
        ++pos;
        break;
      }
      case TokenKind::OpenIf:
        ++pos;
        nodes.push_back( parse_if(t, depth + 1) );
        break;
      case TokenKind::OpenEach:
        ++pos;
        nodes.push_back( parse_each(t, depth + 1) );
        break;
      case TokenKind::Else:
      case TokenKind::CloseIf:
      case TokenKind::CloseEach: {
        if ( !opener ) {
          throw_syntax( std::string( "Unmatched " ) + describe( t.kind ),
            t.where, origin );
        }
        // The caller decides whether this closer fits its block
        closer = &t;
        ++pos;
        return nodes;
      }
    }
  }

  if ( opener ) {
    throw_syntax( "Unterminated block: " + opened_at( *opener ),
      opener->where, origin );
  }
  return nodes;
}

inline stanza::Node stanza::internal::TreeBuilder::parse_if(
  const Token& open, int depth )
{
  Node n;
  n.kind = NodeKind::Conditional;
  n.where = open.where;

  // Leading negation markers, with optional whitespace between them
  std::string rest = open.text;
  while ( !rest.empty() && rest[0] == NEGATION ) {
    ++n.cond.negations;
    rest = trim( rest.substr(1) );
  }
  if ( rest.empty() ) {
    throw_syntax( "Negation without a condition", open.where, origin );
  }
  n.cond.expr = parse_expression( rest, open.where, origin );

  n.body = parse_until( &open, depth );
  if ( closer->kind == TokenKind::Else ) {
    const Token* else_tok = closer;
    n.alt = parse_until( &open, depth );
    if ( closer->kind == TokenKind::Else ) {
      throw_syntax( "Second {{else}} for " + opened_at( open )
        + " (first at line " + std::to_string( else_tok->where.line ) + ")",
        closer->where, origin );
    }
  }
  if ( closer->kind != TokenKind::CloseIf ) {
    throw_syntax( std::string( "Expected {{/if}} but found " )
      + describe( closer->kind ) + " for " + opened_at( open ),
      closer->where, origin );
  }
  return n;
}

inline stanza::Node stanza::internal::TreeBuilder::parse_each(
  const Token& open, int depth )
{
  Node n;
  n.kind = NodeKind::Iteration;
  n.where = open.where;
  n.expr = parse_expression( open.text, open.where, origin );

  n.body = parse_until( &open, depth );
  if ( closer->kind != TokenKind::CloseEach ) {
    throw_syntax( std::string( "Expected {{/each}} but found " )
      + describe( closer->kind ) + " for " + opened_at( open ),
      closer->where, origin );
  }
  return n;
}

inline std::vector< stanza::Node > stanza::parse( const std::string& text,
  const std::string& origin, int max_depth )
{
  const std::vector< Token > tokens = tokenize( text, origin );
  internal::TreeBuilder builder{ tokens, origin, max_depth };
  return builder.parse_until( nullptr, 0 );
}
