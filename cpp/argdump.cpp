#include <fstream>
#include <iostream>
#include <set>
#include <sstream>
#include <string>

#include <argh.h>

#include "args.hpp"

using namespace modjson;

std::set<std::string> allowed_flags = {"t", "trace-parser", "h", "help"};

int main(int argc, char *argv[]) {
  argh::parser cmdl(argv);

  for (const auto &flag : cmdl.flags()) {
    if (allowed_flags.find(flag) == allowed_flags.end()) {
      std::cerr << "Unknown flag: " << flag << std::endl;
      return 1;
    }
  }

  if (cmdl[{"-h", "--help"}] || !cmdl(1)) {
    std::cout << "Usage: " << cmdl[0] << " [options] <args-file>" << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  -t, --trace-parser   Also trace the lexer on stderr"
              << std::endl;
    std::cout << "  -h, --help    Show this help message" << std::endl;
    std::cout << "Prints one JSON line per argument token." << std::endl;
    return cmdl[{"-h", "--help"}] ? 0 : 1;
  }

  std::ifstream file(cmdl[1]);
  if (!file.is_open()) {
    std::cerr << "Failed to open file: " << cmdl[1] << std::endl;
    return 1;
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  std::string content = buffer.str();
  while (!content.empty() && content.back() == '\n') {
    content.pop_back();
  }

  Lexer lexer(content, cmdl[{"-t", "--trace-parser"}]);
  while (true) {
    TokenType tk = lexer.next_token();
    if (tk == TK_EOF)
      break;
    if (tk == TK_ERR) {
      std::cerr << lexer.result << std::endl;
      return 1;
    }
    // {"type": "TK_NAMED", "name": "owner", "raw": "jane doe", "value": ...}
    std::cout << "{" << "\"type\": \"" << tk << "\","
              << " \"begin\": " << lexer.begin << ","
              << " \"end\": " << lexer.end << ","
              << " \"name\": " << quote(lexer.name) << ","
              << " \"raw\": " << quote(lexer.token_body()) << ","
              << " \"value\": " << quote(unescape(lexer.token_body())) << "}"
              << std::endl;
  }

  return 0;
}
