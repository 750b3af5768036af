//  stanza
//  Context-escaping text template engine
//  version 0.1.0 | MIT License
#pragma once

// Standard library includes
#include <cstddef>
#include <map>
#include <optional>
#include <sstream>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

// Fast C++ logging library
#include <spdlog/spdlog.h>

#include "stanza/audit.hh"
#include "stanza/errors.hh"
#include "stanza/escape.hh"
#include "stanza/helpers.hh"
#include "stanza/loader.hh"
#include "stanza/parser.hh"
#include "stanza/scope.hh"
#include "stanza/value.hh"

namespace stanza {

  // Per-call settings
  struct RenderOptions {
    // Explicit escaping context; inferred from the origin when unset
    std::optional< Context > context;

    // Origin identifier used for inference and error messages
    std::optional< std::string > origin;

    // Audit before rendering and throw UnresolvedVariableError for any
    // missing top-level name
    bool strict = false;
  };

  struct RenderResult {
    std::string output;

    // Top-level names the auditor could not find in the root bindings
    std::vector< std::string > missing_names;

    // Full paths of plain substitutions that rendered empty because they
    // did not resolve (includes nested misses such as "a.b")
    std::vector< std::string > warnings;
  };

  class Engine {
  private:

    // Default limit on nested {{#if}}/{{#each}} blocks
    static constexpr int DEFAULT_MAX_BLOCK_DEPTH = 64;
    int max_block_depth_ = DEFAULT_MAX_BLOCK_DEPTH;

  public:
    // The helper registry is fixed for the lifetime of the engine
    inline explicit Engine(
      HelperRegistry helpers = HelperRegistry::with_builtins(),
      int max_block_depth = DEFAULT_MAX_BLOCK_DEPTH )
      : max_block_depth_( max_block_depth ), helpers_( std::move(helpers) ) {}

    // Render template text against root bindings (a mapping)
    std::string render( const std::string& text, const ordered_node& bindings,
      const RenderOptions& options = RenderOptions() ) const;

    std::string render( const Template& tmpl, const ordered_node& bindings,
      const RenderOptions& options = RenderOptions() ) const;

    // Audit, then render; missing plain variables are returned rather than
    // thrown (strict is ignored here)
    RenderResult audit_then_render( const std::string& text,
      const ordered_node& bindings,
      const RenderOptions& options = RenderOptions() ) const;

    AuditReport audit( const std::string& text,
      const ordered_node& bindings ) const;

    // Obtain the text from the loader, then render it. The template's origin
    // drives context inference unless options say otherwise.
    std::string load_and_render( TemplateLoader& loader,
      const std::string& origin, const ordered_node& bindings,
      const RenderOptions& options = RenderOptions() ) const;

    // Render a batch of templates: name -> origin in, name -> output out.
    // Any failure is logged and rethrown.
    std::map< std::string, std::string > render_all( TemplateLoader& loader,
      const std::map< std::string, std::string >& templates,
      const ordered_node& bindings,
      const RenderOptions& options = RenderOptions() ) const;

    const HelperRegistry& helpers() const { return helpers_; }
    int max_block_depth() const { return max_block_depth_; }

  private:

    const HelperRegistry helpers_;

    // Auditor report with names answered by a zero-argument helper removed
    AuditReport audit_impl( const std::string& text,
      const ordered_node& bindings, const std::string& origin ) const;

    // Shared implementation of render() and audit_then_render()
    std::string render_impl( const std::string& text,
      const ordered_node& bindings, const RenderOptions& options,
      std::vector< std::string >& warnings ) const;

  }; // class Engine

namespace internal {

  // Recursive evaluator for one render call. Holds the scope arena and the
  // unresolved-variable warnings of that call; nothing else is mutated.
  struct Evaluator {
    const HelperRegistry& helpers;
    Context context;
    const std::string& origin;
    ScopeArena arena;
    std::vector< std::string > warnings;
    std::unordered_set< std::string > warned;

    void eval_nodes( const std::vector< Node >& nodes, std::size_t scope,
      std::string& out );

    maybe_node eval_operand( const Operand& op, std::size_t scope ) const {
      if ( op.is_literal ) return op.literal;
      return arena.resolve( op.segments, scope );
    }

    maybe_node eval_expression( const Expression& e, std::size_t scope ) const;

    bool eval_condition( const Condition& c, std::size_t scope ) const {
      bool value = is_truthy( eval_expression(c.expr, scope) );
      if ( c.negations % 2 ) value = !value;
      return value;
    }

    void record_unresolved( const std::string& path ) {
      if ( warned.insert(path).second ) warnings.push_back( path );
    }
  };

} // namespace stanza::internal

} // namespace stanza

// Evaluator member function definitions

inline stanza::maybe_node stanza::internal::Evaluator::eval_expression(
  const Expression& e, std::size_t scope ) const
{
  if ( e.kind == ExprKind::Operand ) {
    maybe_node v = eval_operand( e.operand, scope );
    // A bare word that no scope binds may name a zero-argument helper
    if ( !v && e.operand.segments.size() == 1
      && helpers.contains(e.operand.text) )
    {
      return helpers.invoke( e.operand.text, helper_args() );
    }
    return v;
  }

  // Helpers are only consulted for helper-call expressions; the scope
  // chain is never searched for behaviour
  if ( !helpers.contains(e.helper) ) throw UnknownHelperError( e.helper );

  helper_args args;
  args.reserve( e.args.size() );
  for ( const auto& a : e.args ) {
    maybe_node v = eval_operand( a, scope );
    args.push_back( v ? *v : ordered_node() );
  }
  return helpers.invoke( e.helper, args );
}

inline void stanza::internal::Evaluator::eval_nodes(
  const std::vector< Node >& nodes, std::size_t scope, std::string& out )
{
  for ( const Node& n : nodes ) {
    switch ( n.kind ) {
      case NodeKind::Text:
        out += n.text;
        break;

      case NodeKind::Substitution: {
        maybe_node v = eval_expression( n.expr, scope );
        if ( !v ) {
          if ( n.expr.is_plain_path() ) record_unresolved( n.expr.operand.text );
          break;
        }
        if ( v->is_null() ) break;
        const std::string s = to_string_any( *v );
        out += n.raw ? s : escape( s, context );
        break;
      }

      case NodeKind::Conditional:
        eval_nodes( eval_condition(n.cond, scope) ? n.body : n.alt, scope, out );
        break;

      case NodeKind::Iteration: {
        // Empty or non-list targets render nothing
        const maybe_node list = eval_expression( n.expr, scope );
        if ( !list || !list->is_sequence() ) break;

        const std::size_t count = list->size();
        for ( std::size_t i = 0; i < count; ++i ) {
          const std::size_t child = arena.push_loop( scope, list->at(i), i,
            count );
          eval_nodes( n.body, child, out );
          arena.pop();
        }
        break;
      }
    }
  }
}

// Engine member function definitions

inline std::string stanza::Engine::render_impl( const std::string& text,
  const ordered_node& bindings, const RenderOptions& options,
  std::vector< std::string >& warnings ) const
{
  const std::string origin = options.origin.value_or( std::string() );
  const Context context = select_context( options.context, options.origin );
  if ( context == Context::Raw ) {
    throw EscapingContextError( "The raw context cannot be selected for a "
      "whole render; use {{{ }}} at the substitution site instead" );
  }
  spdlog::debug( "Rendering '{}' with {} escaping",
    origin.empty() ? "<string>" : origin, context_name( context ) );

  if ( options.strict ) {
    const AuditReport report = audit_impl( text, bindings, origin );
    if ( !report.ok() ) throw UnresolvedVariableError( report.missing_names );
  }

  const std::vector< Node > nodes = parse( text, origin, max_block_depth_ );

  internal::Evaluator ev{ helpers_, context, origin };
  const std::size_t root = ev.arena.push_root( bindings );

  // Build into a local buffer so a failure part-way through returns nothing
  std::string out;
  out.reserve( text.size() );
  ev.eval_nodes( nodes, root, out );

  if ( !ev.warnings.empty() ) {
    std::ostringstream oss;
    for ( std::size_t i = 0; i < ev.warnings.size(); ++i ) {
      if ( i ) oss << ", ";
      oss << ev.warnings[ i ];
    }
    spdlog::warn( "Template '{}' rendered {} unresolved variable{} as empty: {}",
      origin.empty() ? "<string>" : origin, ev.warnings.size(),
      ev.warnings.size() == 1 ? "" : "s", oss.str() );
  }

  warnings = std::move( ev.warnings );
  return out;
}

inline std::string stanza::Engine::render( const std::string& text,
  const ordered_node& bindings, const RenderOptions& options ) const
{
  std::vector< std::string > warnings;
  return render_impl( text, bindings, options, warnings );
}

inline std::string stanza::Engine::render( const Template& tmpl,
  const ordered_node& bindings, const RenderOptions& options ) const
{
  RenderOptions opts = options;
  if ( !opts.origin ) opts.origin = tmpl.origin();
  return render( tmpl.source(), bindings, opts );
}

inline stanza::RenderResult stanza::Engine::audit_then_render(
  const std::string& text, const ordered_node& bindings,
  const RenderOptions& options ) const
{
  RenderOptions opts = options;
  opts.strict = false;

  RenderResult result;
  result.missing_names = audit_impl( text, bindings,
    opts.origin.value_or(std::string()) ).missing_names;
  result.output = render_impl( text, bindings, opts, result.warnings );
  return result;
}

inline stanza::AuditReport stanza::Engine::audit_impl(
  const std::string& text, const ordered_node& bindings,
  const std::string& origin ) const
{
  AuditReport report = stanza::audit( text, bindings, origin );
  std::vector< std::string > missing;
  for ( const auto& name : report.missing_names ) {
    if ( !helpers_.contains(name) ) missing.push_back( name );
  }
  report.missing_names = std::move( missing );
  return report;
}

inline stanza::AuditReport stanza::Engine::audit( const std::string& text,
  const ordered_node& bindings ) const
{
  return audit_impl( text, bindings, std::string() );
}

inline std::string stanza::Engine::load_and_render( TemplateLoader& loader,
  const std::string& origin, const ordered_node& bindings,
  const RenderOptions& options ) const
{
  const std::shared_ptr< const Template > tmpl = loader.load( origin );
  return render( *tmpl, bindings, options );
}

inline std::map< std::string, std::string > stanza::Engine::render_all(
  TemplateLoader& loader, const std::map< std::string, std::string >& templates,
  const ordered_node& bindings, const RenderOptions& options ) const
{
  std::map< std::string, std::string > results;
  for ( const auto& [name, origin] : templates ) {
    try {
      results[ name ] = load_and_render( loader, origin, bindings, options );
    }
    catch ( const std::exception& ex ) {
      spdlog::error( "Failed to process template {}: {}", name, ex.what() );
      throw;
    }
  }
  return results;
}
