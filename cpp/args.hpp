// args.hpp

// Lexer and validator for the argument line of a legacy plugin invocation:
//
//   path=/tmp/a.txt mode=0644 owner="jane doe" extra words
//
// - Words are separated by whitespace; a word of the form name=value is a
//   named argument, anything else is positional
// - A value may be double quoted; \" inside the quotes does not end it
// - Escapes are kept by the lexer and decoded once by ArgParser

#ifndef _MODJSON_ARGS_HPP
#define _MODJSON_ARGS_HPP

#include <initializer_list>
#include <iostream>
#include <set>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

#include "json.hpp"

namespace modjson {

enum Status { S_OK = 0, S_ERR = 1 };

enum ErrorKind {
  E_NONE = 0,
  E_MALFORMED = 1,
  E_UNSUPPORTED_ARGUMENT = 2,
  E_UNSUPPORTED_POSITIONAL = 3,
  E_INVALID_INVOCATION = 4,
  E_IO = 5,
  E_COMMAND = 6,
};

inline const char *error_kind_name(ErrorKind k) {
  switch (k) {
  case E_NONE:
    return "none";
  case E_MALFORMED:
    return "malformed argument line";
  case E_UNSUPPORTED_ARGUMENT:
    return "unsupported argument";
  case E_UNSUPPORTED_POSITIONAL:
    return "unsupported positional argument";
  case E_INVALID_INVOCATION:
    return "invalid invocation";
  case E_IO:
    return "i/o error";
  case E_COMMAND:
    return "command failed";
  }
  return "unknown";
}

#define MJ_ERR(x)                                                              \
  do {                                                                         \
    std::ostringstream _mj_err;                                                \
    _mj_err << x;                                                              \
    result = _mj_err.str();                                                    \
  } while (0)

enum TokenType {
  TK_NAMED = 0,
  TK_POSITIONAL = 1,
  TK_EOF = 2,
  TK_ERR = 3,
};

inline std::ostream &operator<<(std::ostream &os, TokenType t) {
  switch (t) {
  case TK_NAMED:
    return os << "TK_NAMED";
  case TK_POSITIONAL:
    return os << "TK_POSITIONAL";
  case TK_EOF:
    return os << "TK_EOF";
  case TK_ERR:
    return os << "TK_ERR";
  }
  return os << "TK_UNKNOWN";
}

struct Lexer {
  Lexer(const string_view &body_, bool trace_parser_ = false)
      : body(body_), trace_parser(trace_parser_) {}

  const string_view body;
  size_t cursor = 0;

  // Span of the raw value of the last token, quotes excluded
  size_t begin = 0, end = 0;
  string name;
  TokenType token = TK_EOF;
  string result;
  bool trace_parser;

  bool done() const { return cursor >= body.size(); }
  char peek() const { return body[cursor]; }
  char getc() { return body[cursor++]; }

  string_view token_body() const { return body.substr(begin, end - begin); }

  static bool is_sep(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r';
  }

  void consume_whitespace() {
    while (!done() && is_sep(peek())) {
      getc();
    }
  }

  /**
   * True when the character at pos is preceded by an odd run of backslashes
   * that starts at or after from. "\"" is escaped, "\\"" is not.
   */
  bool escaped(size_t pos, size_t from) const {
    size_t n = 0;
    while (pos > from && body[pos - 1] == '\\') {
      n++;
      pos--;
    }
    return n % 2 == 1;
  }

  /**
   * Length of a name= prefix at the cursor, 0 if the word is positional
   */
  size_t name_length() const {
    size_t j = cursor;
    while (j < body.size() && !is_sep(body[j]) && body[j] != '=') {
      j++;
    }
    if (j < body.size() && body[j] == '=' && j > cursor) {
      return j - cursor;
    }
    return 0;
  }

  TokenType _next_token() {
    name.clear();
    consume_whitespace();
    if (done()) {
      begin = end = cursor;
      return token = TK_EOF;
    }

    size_t n = name_length();
    if (n) {
      name = string(body.substr(cursor, n));
      // Skip name and =
      cursor += n + 1;
      token = TK_NAMED;
    } else {
      token = TK_POSITIONAL;
    }

    begin = cursor;
    if (!done() && peek() == '"') {
      // Skip opening "
      getc();
      begin = cursor;
      while (!done()) {
        char c = getc();
        if (c == '"' && !escaped(cursor - 1, begin)) {
          end = cursor - 1;
          return token;
        }
      }
      MJ_ERR("unterminated quote in argument '"
             << (token == TK_NAMED ? name : string("<positional>"))
             << "': " << body.substr(begin - 1));
      begin = end = cursor;
      return token = TK_ERR;
    }

    while (!done()) {
      if (is_sep(peek()) && !escaped(cursor, begin)) {
        break;
      }
      getc();
    }
    end = cursor;
    return token;
  }

  TokenType next_token() {
    TokenType t = _next_token();
    if (trace_parser) {
      std::cerr << "{" << "\"type\": \"" << t << "\","
                << " \"begin\": " << begin << "," << " \"end\": " << end
                << "," << " \"name\": " << quote(name) << ","
                << " \"body\": " << quote(token_body()) << "}" << std::endl;
    }
    return t;
  }
};

// Listing this name in an allow list turns on positional arguments
inline const char *const POSITIONAL_MARKER = "...";

struct AllowList {
  AllowList(std::initializer_list<string> names_) { add(names_); }
  AllowList(const std::vector<string> &names_) { add(names_); }

  std::set<string> names;
  bool accepts_positional = false;

  template <typename C> void add(const C &list) {
    for (const string &n : list) {
      if (n == POSITIONAL_MARKER) {
        accepts_positional = true;
      } else {
        names.insert(n);
      }
    }
  }

  bool allows(const string &name) const {
    return names.find(name) != names.end();
  }
};

struct ArgToken {
  bool named;
  string name;
  string raw;
};

/**
 * Decoded arguments of one invocation. tokens keeps every word in order,
 * including earlier occurrences of a name that was given twice.
 */
struct Args {
  Vars named;
  std::vector<string> positional;
  std::vector<ArgToken> tokens;

  bool has(const string &name) const { return named.find(name) != named.end(); }

  string get(const string &name, const string &fallback = "") const {
    auto it = named.find(name);
    return it == named.end() ? fallback : it->second;
  }
};

struct ArgParser {
  ArgParser(bool trace_parser_ = false) : trace_parser(trace_parser_) {}

  string result;
  ErrorKind kind = E_NONE;
  bool trace_parser;

  Status fail(ErrorKind k) {
    kind = k;
    return S_ERR;
  }

  /**
   * Parse line against allow. out is only written when the whole line is
   * accepted.
   */
  Status parse(const string_view &line, const AllowList &allow, Args &out) {
    result.clear();
    kind = E_NONE;
    Lexer lx(line, trace_parser);
    Args args;

    while (true) {
      TokenType t = lx.next_token();
      if (t == TK_EOF) {
        break;
      }
      if (t == TK_ERR) {
        result = lx.result;
        return fail(E_MALFORMED);
      }

      string raw(lx.token_body());
      if (t == TK_POSITIONAL) {
        if (!allow.accepts_positional) {
          MJ_ERR("unsupported positional argument: '" << raw << "'");
          return fail(E_UNSUPPORTED_POSITIONAL);
        }
        args.positional.push_back(unescape(raw));
      } else {
        if (!allow.allows(lx.name)) {
          MJ_ERR("unsupported argument: '" << lx.name << "'");
          return fail(E_UNSUPPORTED_ARGUMENT);
        }
        args.named[lx.name] = unescape(raw);
      }
      args.tokens.push_back(ArgToken{t == TK_NAMED, lx.name, raw});
    }

    out = std::move(args);
    return S_OK;
  }
};

} // namespace modjson

#endif
