//  stanza
//  Context-escaping text template engine
//  version 0.1.0 | MIT License
#pragma once

// Standard library includes
#include <cstddef>
#include <string>
#include <unordered_set>
#include <vector>

#include "stanza/parser.hh"
#include "stanza/scope.hh"
#include "stanza/value.hh"

namespace stanza {

  // Top-level names referenced by plain substitutions, and the subset of
  // them absent from the root bindings. Both lists keep first-appearance
  // order and hold no duplicates.
  struct AuditReport {
    std::vector< std::string > referenced_names;
    std::vector< std::string > missing_names;

    bool ok() const { return missing_names.empty(); }
  };

  // Scans the substitution sites of a template (escaped or raw) whose
  // expression is a single dot-path. Helper calls, literals and block
  // arguments are not reported; neither are loop-local names inside an
  // {{#each}} body. Outside any loop those names resolve against the root
  // bindings like any other.
  inline std::vector< std::string > referenced_names( const std::string& text,
    const std::string& origin = std::string() )
  {
    std::vector< std::string > names;
    std::unordered_set< std::string > seen;
    std::size_t loop_depth = 0;

    for ( const Token& t : tokenize(text, origin) ) {
      if ( t.kind == TokenKind::OpenEach ) ++loop_depth;
      if ( t.kind == TokenKind::CloseEach && loop_depth > 0 ) --loop_depth;
      if ( t.kind != TokenKind::Substitution
        && t.kind != TokenKind::RawSubstitution ) continue;

      const Expression e = parse_expression( t.text, t.where, origin );
      if ( !e.is_plain_path() ) continue;

      const std::string& top = e.operand.segments.front();
      if ( loop_depth > 0 && internal::is_loop_local(top) ) continue;
      if ( seen.insert(top).second ) names.push_back( top );
    }
    return names;
  }

  inline AuditReport audit( const std::string& text,
    const ordered_node& bindings, const std::string& origin = std::string() )
  {
    AuditReport report;
    report.referenced_names = referenced_names( text, origin );
    for ( const auto& name : report.referenced_names ) {
      const bool present = bindings.is_mapping() && bindings.contains( name );
      if ( !present ) report.missing_names.push_back( name );
    }
    return report;
  }

} // namespace stanza
