//  stanza
//  Context-escaping text template engine
//  version 0.1.0 | MIT License
#pragma once

// Standard library includes
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "stanza/errors.hh"
#include "stanza/value.hh"

namespace stanza {

namespace internal {

  // Names bound by every loop frame
  inline const std::string CURRENT_ITEM = "this";
  inline const std::string LOOP_INDEX = "@index";
  inline const std::string LOOP_FIRST = "@first";
  inline const std::string LOOP_LAST = "@last";

  // Pseudo-property answered by sequences and strings
  inline const std::string LENGTH = "length";

  inline bool is_loop_local( const std::string& name ) {
    return name == CURRENT_ITEM || name == LOOP_INDEX || name == LOOP_FIRST
      || name == LOOP_LAST;
  }

  inline bool is_all_digits( const std::string& s ) {
    if ( s.empty() ) return false;
    for ( char c : s ) {
      if ( c < '0' || c > '9' ) return false;
    }
    return true;
  }

  // Single step of a dotted path: mapping key, sequence index or length
  inline maybe_node step_into( const ordered_node& v, const std::string& seg ) {
    if ( v.is_mapping() ) {
      if ( v.contains(seg) ) return v.at( seg );
      return std::nullopt;
    }
    if ( v.is_sequence() ) {
      if ( is_all_digits(seg) ) {
        // Longer than any index we could hold
        if ( seg.size() > 18 ) return std::nullopt;
        const std::size_t idx = static_cast< std::size_t >( std::stoull(seg) );
        if ( idx < v.size() ) return v.at( idx );
        return std::nullopt;
      }
      if ( seg == LENGTH ) {
        return make_int( static_cast< std::int64_t >( v.size() ) );
      }
      return std::nullopt;
    }
    if ( v.is_string() && seg == LENGTH ) {
      return make_int( static_cast< std::int64_t >(
        to_native_checked< std::string >( v ).size() ) );
    }
    return std::nullopt;
  }

} // namespace stanza::internal

  // One layer of the binding environment. The root frame points at the
  // caller's mapping; a loop frame carries the current element and its
  // position. Frames refer to their parent by arena index, never by
  // ownership.
  struct Scope {
    static constexpr std::size_t NO_PARENT = static_cast< std::size_t >( -1 );

    std::size_t parent = NO_PARENT;

    // Root frame
    const ordered_node* bindings = nullptr;

    // Loop frame
    bool is_loop = false;
    ordered_node item;
    std::size_t index = 0;
    std::size_t count = 0;

    bool has_parent() const { return parent != NO_PARENT; }

    // Looks up a single name in this frame only
    maybe_node lookup( const std::string& name ) const;
  };

  // Stack-disciplined arena of scopes. Only loop evaluation pushes frames;
  // each is popped as soon as its iteration ends.
  class ScopeArena {
  public:
    // The root frame must be a mapping (a null root counts as empty)
    std::size_t push_root( const ordered_node& bindings );

    std::size_t push_loop( std::size_t parent, const ordered_node& item,
      std::size_t index, std::size_t count );

    void pop() { frames_.pop_back(); }

    const Scope& at( std::size_t id ) const { return frames_.at( id ); }
    std::size_t size() const { return frames_.size(); }

    // Resolve a dotted path, starting at frame `id` and climbing the parent
    // chain to find the first segment. Returns std::nullopt (undefined) if
    // any step is absent; never throws for a missing name.
    maybe_node resolve( const std::vector< std::string >& segs,
      std::size_t id ) const;

    maybe_node resolve( const std::string& path, std::size_t id ) const {
      return resolve( internal::split_segments(path), id );
    }

  private:
    std::vector< Scope > frames_;
  };

  // Literal or dotted path, resolved against a scope
  inline maybe_node resolve( const std::string& path, const ScopeArena& arena,
    std::size_t id )
  {
    if ( maybe_node lit = parse_literal(path) ) return lit;
    return arena.resolve( path, id );
  }

} // namespace stanza

// Scope member function definitions

inline stanza::maybe_node stanza::Scope::lookup(
  const std::string& name ) const
{
  using namespace internal;
  if ( is_loop ) {
    if ( name == CURRENT_ITEM ) return item;
    if ( name == LOOP_INDEX ) return make_int( static_cast< std::int64_t >( index ) );
    if ( name == LOOP_FIRST ) return make_bool( index == 0 );
    if ( name == LOOP_LAST ) return make_bool( index + 1 == count );
    return std::nullopt;
  }
  if ( bindings && bindings->is_mapping() && bindings->contains(name) ) {
    return bindings->at( name );
  }
  return std::nullopt;
}

// ScopeArena member function definitions

inline std::size_t stanza::ScopeArena::push_root(
  const ordered_node& bindings )
{
  if ( !bindings.is_mapping() && !bindings.is_null() ) {
    throw Error( "Template bindings must be a mapping of names to values" );
  }
  Scope s;
  s.bindings = &bindings;
  frames_.push_back( std::move(s) );
  return frames_.size() - 1;
}

inline std::size_t stanza::ScopeArena::push_loop( std::size_t parent,
  const ordered_node& item, std::size_t index, std::size_t count )
{
  Scope s;
  s.parent = parent;
  s.is_loop = true;
  s.item = item;
  s.index = index;
  s.count = count;
  frames_.push_back( std::move(s) );
  return frames_.size() - 1;
}

inline stanza::maybe_node stanza::ScopeArena::resolve(
  const std::vector< std::string >& segs, std::size_t id ) const
{
  if ( segs.empty() || frames_.empty() ) return std::nullopt;

  // First segment: innermost scope first, then up the parent chain
  maybe_node cur;
  std::size_t frame = id;
  while ( true ) {
    cur = frames_.at( frame ).lookup( segs[0] );
    if ( cur || !frames_.at(frame).has_parent() ) break;
    frame = frames_.at( frame ).parent;
  }
  if ( !cur ) return std::nullopt;

  // Remaining segments walk into the value; an absent or null intermediate
  // stops resolution
  for ( std::size_t i = 1; i < segs.size(); ++i ) {
    if ( cur->is_null() ) return std::nullopt;
    cur = internal::step_into( *cur, segs[i] );
    if ( !cur ) return std::nullopt;
  }
  return cur;
}
