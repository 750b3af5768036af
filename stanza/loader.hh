//  stanza
//  Context-escaping text template engine
//  version 0.1.0 | MIT License
#pragma once

// Standard library includes
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <system_error>
#include <unordered_map>
#include <utility>

// Fast C++ logging library
#include <spdlog/spdlog.h>

#include "stanza/errors.hh"
#include "stanza/escape.hh"

namespace stanza {

  // Immutable template text plus the identifier it was loaded from. The
  // origin is only used for context inference and error messages.
  class Template {
  public:
    explicit Template( std::string source,
      std::optional< std::string > origin = std::nullopt )
      : source_( std::move(source) ), origin_( std::move(origin) ) {}

    const std::string& source() const { return source_; }
    const std::optional< std::string >& origin() const { return origin_; }

  private:
    std::string source_;
    std::optional< std::string > origin_;
  };

namespace internal {

  inline const std::string TEMPLATE_SUFFIX = ".template";

  inline bool ends_with( const std::string& s, const std::string& suffix ) {
    return s.size() >= suffix.size()
      && s.compare( s.size() - suffix.size(), suffix.size(), suffix ) == 0;
  }

} // namespace stanza::internal

  // Context implied by an origin identifier's name. A trailing ".template"
  // is ignored, so "deploy.sh.template" counts as a shell script.
  inline Context infer_context( const std::string& origin ) {
    using internal::ends_with;

    std::string name = origin;
    std::transform( name.begin(), name.end(), name.begin(),
      []( unsigned char c ) { return std::tolower( c ); } );
    if ( ends_with(name, internal::TEMPLATE_SUFFIX) ) {
      name.resize( name.size() - internal::TEMPLATE_SUFFIX.size() );
    }

    const std::filesystem::path p( name );
    const std::string ext = p.extension().string();
    const std::string filename = p.filename().string();

    if ( ext == ".sh" || ext == ".bash" || ext == ".zsh" ) return Context::Shell;
    if ( ext == ".js" || ext == ".mjs" || ext == ".cjs" || ext == ".ts" ) {
      return Context::Script;
    }
    if ( ext == ".json" ) return Context::StructuredLiteral;
    if ( ext == ".html" || ext == ".htm" || ext == ".xml" ) {
      return Context::Markup;
    }

    // Deployment config and helper scripts that end up on a command line
    if ( filename.find("script") != std::string::npos
      || filename.find("wrangler") != std::string::npos || ext == ".toml" )
    {
      return Context::Shell;
    }

    return Context::Markup;
  }

  // Selection policy: explicit context, else inference from the origin,
  // else markup
  inline Context select_context( const std::optional< Context >& explicit_ctx,
    const std::optional< std::string >& origin )
  {
    if ( explicit_ctx ) return *explicit_ctx;
    if ( origin && !origin->empty() ) return infer_context( *origin );
    return Context::Markup;
  }

  // Supplies raw template text for an origin identifier. Implementations do
  // the I/O; the engine itself never does.
  class TemplateSource {
  public:
    virtual ~TemplateSource() = default;

    // Throws TemplateLoadError if the origin cannot be read
    virtual std::string read( const std::string& origin ) const = 0;

    // Canonical form of an origin, used as the cache key
    virtual std::string canonical( const std::string& origin ) const {
      return origin;
    }
  };

  // Reads templates from a directory tree. Relative origins are taken
  // relative to the root; absolute ones are used as-is.
  class FileSystemSource : public TemplateSource {
  public:
    explicit FileSystemSource( std::filesystem::path root = "." )
      : root_( std::move(root) ) {}

    std::string read( const std::string& origin ) const override;
    std::string canonical( const std::string& origin ) const override;

    // Every "*.template" file under the root, keyed by its path relative to
    // the root (with '/' separators)
    std::map< std::string, std::string > available_templates() const;

    const std::filesystem::path& root() const { return root_; }

  private:
    std::filesystem::path root_;

    std::filesystem::path full_path( const std::string& origin ) const {
      const std::filesystem::path p( origin );
      return p.is_absolute() ? p : root_ / p;
    }
  };

  // In-memory origin -> text table
  class MemorySource : public TemplateSource {
  public:
    MemorySource() = default;
    explicit MemorySource( std::map< std::string, std::string > entries )
      : entries_( std::move(entries) ) {}

    void add( const std::string& origin, std::string text ) {
      entries_[ origin ] = std::move( text );
    }

    std::string read( const std::string& origin ) const override {
      auto it = entries_.find( origin );
      if ( it == entries_.end() ) {
        throw TemplateLoadError( origin, "no such template" );
      }
      return it->second;
    }

  private:
    std::map< std::string, std::string > entries_;
  };

  // Obtains Template values from a source, caching them by canonical
  // origin. Loading may happen from several threads at once.
  class TemplateLoader {
  public:
    explicit TemplateLoader( std::shared_ptr< const TemplateSource > source,
      bool cache_enabled = true )
      : source_( std::move(source) ), cache_enabled_( cache_enabled )
    {
      if ( !source_ ) throw Error( "TemplateLoader requires a source" );
    }

    std::shared_ptr< const Template > load( const std::string& origin );

    // Wraps literal text; nothing is read or cached
    static std::shared_ptr< const Template > from_string( std::string text,
      std::optional< std::string > origin = std::nullopt )
    {
      return std::make_shared< const Template >( std::move(text),
        std::move(origin) );
    }

    void clear_cache();
    std::size_t cached_count() const;

    const TemplateSource& source() const { return *source_; }

  private:
    std::shared_ptr< const TemplateSource > source_;
    bool cache_enabled_;
    mutable std::mutex mutex_;
    std::unordered_map< std::string,
      std::shared_ptr< const Template > > cache_;
  };

} // namespace stanza

// FileSystemSource member function definitions

inline std::string stanza::FileSystemSource::canonical(
  const std::string& origin ) const
{
  return full_path( origin ).lexically_normal().string();
}

inline std::string stanza::FileSystemSource::read(
  const std::string& origin ) const
{
  const std::filesystem::path p = full_path( origin );
  std::error_code ec;
  if ( !std::filesystem::is_regular_file(p, ec) ) {
    throw TemplateLoadError( origin, "template not found at " + p.string() );
  }
  std::ifstream in( p, std::ios::in | std::ios::binary );
  if ( !in ) {
    throw TemplateLoadError( origin, "cannot open " + p.string() );
  }
  std::ostringstream ss;
  ss << in.rdbuf();
  if ( in.bad() ) {
    throw TemplateLoadError( origin, "read error on " + p.string() );
  }
  return ss.str();
}

inline std::map< std::string, std::string >
  stanza::FileSystemSource::available_templates() const
{
  std::map< std::string, std::string > out;
  std::error_code ec;
  if ( !std::filesystem::is_directory(root_, ec) ) return out;

  for ( auto it = std::filesystem::recursive_directory_iterator( root_, ec );
    it != std::filesystem::recursive_directory_iterator(); it.increment(ec) )
  {
    if ( ec ) {
      throw TemplateLoadError( root_.string(), "cannot scan directory: "
        + ec.message() );
    }
    const bool regular = it->is_regular_file( ec );
    // Dangling links are not templates
    if ( ec == std::errc::no_such_file_or_directory ) continue;
    if ( ec ) {
      throw TemplateLoadError( it->path().string(), "cannot stat: "
        + ec.message() );
    }
    if ( !regular ) continue;
    const std::string name = it->path().filename().string();
    if ( !internal::ends_with(name, internal::TEMPLATE_SUFFIX) ) continue;

    const std::filesystem::path rel = std::filesystem::relative( it->path(),
      root_, ec );
    if ( ec ) {
      throw TemplateLoadError( it->path().string(), "cannot relate to "
        + root_.string() + ": " + ec.message() );
    }
    out[ rel.generic_string() ] = it->path().string();
  }
  if ( ec ) {
    throw TemplateLoadError( root_.string(), "cannot scan directory: "
      + ec.message() );
  }
  return out;
}

// TemplateLoader member function definitions

inline std::shared_ptr< const stanza::Template > stanza::TemplateLoader::load(
  const std::string& origin )
{
  const std::string key = source_->canonical( origin );

  if ( cache_enabled_ ) {
    std::lock_guard< std::mutex > lock( mutex_ );
    auto it = cache_.find( key );
    if ( it != cache_.end() ) {
      spdlog::debug( "Template cache hit for '{}'", key );
      return it->second;
    }
  }

  // Read outside the lock so slow sources do not serialize other loads
  auto tmpl = std::make_shared< const Template >( source_->read(origin), key );
  spdlog::debug( "Loaded template '{}' ({} bytes)", key, tmpl->source().size() );

  if ( cache_enabled_ ) {
    std::lock_guard< std::mutex > lock( mutex_ );
    // Another thread may have loaded it first; either copy is equivalent
    auto inserted = cache_.emplace( key, tmpl );
    return inserted.first->second;
  }
  return tmpl;
}

inline void stanza::TemplateLoader::clear_cache() {
  std::lock_guard< std::mutex > lock( mutex_ );
  cache_.clear();
}

inline std::size_t stanza::TemplateLoader::cached_count() const {
  std::lock_guard< std::mutex > lock( mutex_ );
  return cache_.size();
}
