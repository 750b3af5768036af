#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

#include <spdlog/cfg/env.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "stanza/stanza.hh"

// Usage: stanza <template> [bindings.yaml] [context]
//
// Renders the template file against the bindings (a YAML mapping) and writes
// the result to stdout. A template path of "-" reads the template from stdin.
// The escaping context is inferred from the template name unless given.
int main( int argc, char** argv ) {
  // Keep log lines out of the rendered output; SPDLOG_LEVEL sets the level
  spdlog::set_default_logger( spdlog::stderr_color_mt("stderr") );
  spdlog::cfg::load_env_levels();

  if ( argc < 2 || argc > 4 ) {
    std::cerr << "usage: " << argv[0]
      << " <template|-> [bindings.yaml] [context]\n";
    return 2;
  }

  try {
    const std::string template_arg = argv[ 1 ];

    stanza::ordered_node bindings = stanza::ordered_node::mapping();
    if ( argc >= 3 ) {
      std::ifstream in( argv[2] );
      if ( !in ) {
        throw stanza::Error( std::string( "cannot open bindings file " )
          + argv[2] );
      }
      std::ostringstream ss;
      ss << in.rdbuf();
      bindings = stanza::ordered_node::deserialize( ss.str() );
    }

    stanza::RenderOptions options;
    if ( argc == 4 ) options.context = stanza::parse_context( argv[3] );

    stanza::Engine engine;
    std::string output;
    if ( template_arg == "-" ) {
      std::ostringstream ss;
      ss << std::cin.rdbuf();
      output = engine.render( ss.str(), bindings, options );
    }
    else {
      stanza::TemplateLoader loader(
        std::make_shared< stanza::FileSystemSource >( "." ), false );
      output = engine.load_and_render( loader, template_arg, bindings,
        options );
    }

    std::cout << output;
    return 0;
  } catch (const std::exception& ex) {
    std::cerr << "[stanza] error: " << ex.what() << "\n";
    return 1;
  }
}
