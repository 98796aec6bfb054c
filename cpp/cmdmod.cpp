#include "module.hpp"
#include <filesystem>
#include <string>
#include <vector>

using namespace modjson;

/*
 * Quote a word for /bin/sh so it reaches the command unchanged
 */
string shell_quote(const string &word) {
  string out("'");
  for (char c : word) {
    if (c == '\'') {
      out += "'\\''";
    } else {
      out += c;
    }
  }
  out += "'";
  return out;
}

Status command(Module &m) {
  const Args &args = m.args;
  if (args.positional.empty()) {
    m.result = "no command given";
    return S_ERR;
  }

  string cmd;
  for (const string &word : args.positional) {
    if (!cmd.empty()) {
      cmd += ' ';
    }
    cmd += shell_quote(word);
  }
  m.set_var("cmd", cmd);

  if (args.has("creates") && std::filesystem::exists(args.get("creates"))) {
    return m.emit({Field::raw("changed", "false"), Field::raw("rc", "0"),
                   Field::str("msg", "skipped, since " + args.get("creates") +
                                         " exists")});
  }
  if (args.has("removes") && !std::filesystem::exists(args.get("removes"))) {
    return m.emit({Field::raw("changed", "false"), Field::raw("rc", "0"),
                   Field::str("msg", "skipped, since " + args.get("removes") +
                                         " does not exist")});
  }

  if (args.has("chdir")) {
    MJ_RUN(m, "cd " + shell_quote(args.get("chdir")) + " && " + cmd);
  } else {
    MJ_RUN(m, cmd);
  }

  return m.emit({Field::raw("changed", "true"), Field::raw("rc", "0"),
                 Field::var("cmd"),
                 Field::raw("argv", format_array(args.positional))});
}

int main(int argc, char *argv[]) {
  Module m("cmdmod", {"chdir", "creates", "removes", POSITIONAL_MARKER});
  return m.main(argc, argv, command);
}
