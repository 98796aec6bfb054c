// json.hpp

// Just enough JSON to answer the legacy plugin protocol: string escaping in
// both directions and hand-built arrays and flat objects. There is no value
// parser here, raw members are trusted to already be valid JSON.

#ifndef _MODJSON_JSON_HPP
#define _MODJSON_JSON_HPP

#include <initializer_list>
#include <map>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace modjson {

typedef std::string string;
typedef std::string_view string_view;

typedef std::map<string, string> Vars;

inline char hex_digit(unsigned v) {
  return v < 10 ? char('0' + v) : char('a' + (v - 10));
}

inline int hex_value(char c) {
  if (c >= '0' && c <= '9')
    return c - '0';
  if (c >= 'a' && c <= 'f')
    return c - 'a' + 10;
  if (c >= 'A' && c <= 'F')
    return c - 'A' + 10;
  return -1;
}

/**
 * Turn raw text into the body of a JSON string literal (no surrounding
 * quotes). Newlines become \n so multi-line values stay on one line.
 */
inline string escape(const string_view &s) {
  string out;
  out.reserve(s.size() + 8);
  for (size_t i = 0; i < s.size(); i++) {
    unsigned char c = s[i];
    switch (c) {
    case '\\':
      out += "\\\\";
      break;
    case '"':
      out += "\\\"";
      break;
    case '/':
      out += "\\/";
      break;
    case '\b':
      out += "\\b";
      break;
    case '\n':
      out += "\\n";
      break;
    case '\t':
      out += "\\t";
      break;
    case '\f':
      out += "\\f";
      break;
    case '\r':
      out += "\\r";
      break;
    default:
      if (c < 0x20) {
        out += "\\u00";
        out += hex_digit(c >> 4);
        out += hex_digit(c & 0xf);
      } else {
        out += (char)c;
      }
    }
  }
  return out;
}

/**
 * Inverse of escape. Works in one left-to-right pass, so a backslash that
 * came out of "\\" is never read again as the start of another escape.
 * A backslash before a separator (space, tab, CR, LF) yields the separator.
 * Other unknown sequences are left as they are.
 */
inline string unescape(const string_view &s) {
  string out;
  out.reserve(s.size());
  for (size_t i = 0; i < s.size(); i++) {
    char c = s[i];
    if (c != '\\' || i + 1 == s.size()) {
      out += c;
      continue;
    }
    char n = s[i + 1];
    switch (n) {
    case '\\':
      out += '\\';
      break;
    case '"':
      out += '"';
      break;
    case '/':
      out += '/';
      break;
    case 'b':
      out += '\b';
      break;
    case 'n':
      out += '\n';
      break;
    case 't':
      out += '\t';
      break;
    case 'f':
      out += '\f';
      break;
    case 'r':
      out += '\r';
      break;
    case ' ':
    case '\t':
    case '\r':
    case '\n':
      // Escaped separator from an unquoted argument value
      out += n;
      break;
    case 'u': {
      // Only the control range that escape() produces
      if (i + 5 < s.size() && s[i + 2] == '0' && s[i + 3] == '0' &&
          (s[i + 4] == '0' || s[i + 4] == '1') && hex_value(s[i + 5]) >= 0) {
        out += (char)((hex_value(s[i + 4]) << 4) | hex_value(s[i + 5]));
        i += 4;
        break;
      }
      out += c;
      out += n;
      break;
    }
    default:
      out += c;
      out += n;
    }
    i++;
  }
  return out;
}

inline string quote(const string_view &s) {
  return "\"" + escape(s) + "\"";
}

inline string format_array(const std::vector<string> &items) {
  std::ostringstream os;
  os << "[";
  for (size_t i = 0; i < items.size(); i++) {
    if (i)
      os << ", ";
    os << quote(items[i]);
  }
  os << "]";
  return os.str();
}

enum FieldKind { F_RAW = 0, F_STRING = 1, F_VAR = 2 };

/**
 * One member of a response object. The value is taken verbatim (F_RAW),
 * quoted (F_STRING) or looked up by name at format time (F_VAR).
 */
struct Field {
  Field(FieldKind kind_, const string &name_, const string &value_ = "")
      : kind(kind_), name(name_), value(value_) {}

  FieldKind kind;
  string name;
  string value;

  static Field raw(const string &name, const string &json) {
    return Field(F_RAW, name, json);
  }
  static Field str(const string &name, const string &text) {
    return Field(F_STRING, name, text);
  }
  static Field var(const string &name) { return Field(F_VAR, name); }

  /**
   * Read a field from its short form:
   *   name=text   string member
   *   name:json   raw member
   *   name        variable reference
   * An '=' that comes before any ':' wins.
   */
  static Field parse(const string &form) {
    size_t eq = form.find('=');
    size_t colon = form.find(':');
    if (eq != string::npos && (colon == string::npos || eq < colon)) {
      return str(form.substr(0, eq), form.substr(eq + 1));
    }
    if (colon != string::npos) {
      return raw(form.substr(0, colon), form.substr(colon + 1));
    }
    return var(form);
  }

  string render(const Vars &vars) const {
    switch (kind) {
    case F_RAW:
      return value;
    case F_STRING:
      return quote(value);
    case F_VAR: {
      auto it = vars.find(name);
      return quote(it == vars.end() ? string() : it->second);
    }
    }
    return "\"\"";
  }
};

inline std::vector<Field> fields(std::initializer_list<const char *> forms) {
  std::vector<Field> out;
  for (const char *s : forms) {
    out.push_back(Field::parse(s));
  }
  return out;
}

/**
 * Build a flat object. extra_vars are appended as variable references after
 * the explicit fields.
 */
inline string format_object(const std::vector<Field> &fields,
                            const std::vector<string> &extra_vars,
                            const Vars &vars) {
  std::ostringstream os;
  bool first = true;
  auto member = [&](const Field &f) {
    if (!first)
      os << ", ";
    first = false;
    os << quote(f.name) << ": " << f.render(vars);
  };
  os << "{";
  for (const Field &f : fields) {
    member(f);
  }
  for (const string &name : extra_vars) {
    member(Field::var(name));
  }
  os << "}";
  return os.str();
}

} // namespace modjson

#endif
