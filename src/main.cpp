#include <iostream>
#include <memory>
#include <span>
#include <stdexcept>
#include <string>
#include <vector>
#ifdef _WIN32
#  include <fcntl.h>
#  include <io.h>
#endif
#include <elab/engine.hpp>
#include <server/dispatcher.hpp>
#include <session/session.hpp>
#include "config.hpp"

using std::cin, std::cout, std::cerr, std::endl;
using namespace arbor;

auto main(int argc, char* argv[]) -> int {
  // Responses are line-based; keep "\r\n" from being rewritten on Windows.
#ifdef _WIN32
  _setmode(_fileno(stdin), _O_BINARY);
  _setmode(_fileno(stdout), _O_BINARY);
#endif

  auto const args = std::span(argv, static_cast<size_t>(argc));
  auto config = Config();
  try {
    config = Config::parse(std::vector<std::string>(args.begin(), args.end()));
  } catch (ConfigError& e) {
    cerr << e.what() << endl << Config::usage;
    return 2;
  }
  if (config.help) {
    cout << Config::usage;
    return 0;
  }

  try {
    auto engine = std::unique_ptr<elab::ProofEngine>();
    try {
      engine = std::make_unique<elab::ProofEngine>(config.load, config.budget);
    } catch (std::runtime_error& e) {
      cerr << "failed to load environment: " << e.what() << endl;
      return 1;
    }
    auto session = session::Session(*engine, config.budget);
    auto dispatcher = server::Dispatcher(session, cin, cout, cerr, config.verbose);
    if (!dispatcher.run()) {
      if (config.verbose) cerr << "input closed before commit" << endl;
      return 1;
    }
    if (config.verbose) cerr << "committed, exiting" << endl;
    return 0;
  } catch (std::logic_error& e) {
    cerr << "fatal: " << e.what() << endl;
    return 1;
  }
}
