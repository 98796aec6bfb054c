#include <cstdio>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>

#include <sys/wait.h>
#include <unistd.h>

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include "module.hpp"

using namespace modjson;

//
////// ESCAPING
//

TEST_CASE("escape handles every special character") {
  CHECK(escape("plain") == "plain");
  CHECK(escape("a\\b") == "a\\\\b");
  CHECK(escape("say \"hi\"") == "say \\\"hi\\\"");
  CHECK(escape("/tmp/a") == "\\/tmp\\/a");
  CHECK(escape("\b\n\t\f\r") == "\\b\\n\\t\\f\\r");
}

TEST_CASE("escape keeps multi-line text on one line") {
  string e = escape("line one\nline two\n");
  CHECK(e == "line one\\nline two\\n");
  CHECK(e.find('\n') == string::npos);
}

TEST_CASE("escape writes other control characters as unicode escapes") {
  CHECK(escape("\x01") == "\\u0001");
  CHECK(escape("a\x1f") == "a\\u001f");
  CHECK(unescape("\\u0001\\u001f") == "\x01\x1f");
}

TEST_CASE("unescape does not expand escapes twice") {
  CHECK(unescape("\\\\n") == "\\n");
  CHECK(unescape("\\\\\\\"") == "\\\"");
  CHECK(unescape("say \\\"hi\\\"") == "say \"hi\"");
  CHECK(unescape("\\/") == "/");
}

TEST_CASE("unescape leaves unknown sequences alone") {
  CHECK(unescape("a\\qb") == "a\\qb");
  CHECK(unescape("trailing\\") == "trailing\\");
  CHECK(unescape("\\u0041") == "\\u0041");
}

TEST_CASE("unescape turns an escaped separator into the separator") {
  CHECK(unescape("b\\ c") == "b c");
  CHECK(unescape("b\\\tc") == "b\tc");
  CHECK(unescape("b\\\\ c") == "b\\ c");
}

TEST_CASE("unescape reverses escape") {
  const char *samples[] = {
      "",
      "plain",
      "back\\slash",
      "\"quoted\"",
      "a/b\\/c",
      "tab\there\r\n",
      "\\\\\\\"",
      "mixed \b\f \x02 \x7f caf\xc3\xa9",
  };
  for (const char *s : samples) {
    CHECK(unescape(escape(s)) == s);
  }
}

//
////// FORMATTING
//

TEST_CASE("format_array") {
  CHECK(format_array({}) == "[]");
  CHECK(format_array({"a"}) == "[\"a\"]");
  CHECK(format_array({"a", "b \"c\""}) == "[\"a\", \"b \\\"c\\\"\"]");
}

TEST_CASE("format_object of nothing is an empty object") {
  CHECK(format_object({}, {}, Vars()) == "{}");
}

TEST_CASE("field short forms") {
  Field s = Field::parse("msg=File altered");
  CHECK(s.kind == F_STRING);
  CHECK(s.name == "msg");
  CHECK(s.value == "File altered");

  Field r = Field::parse("failed:false");
  CHECK(r.kind == F_RAW);
  CHECK(r.name == "failed");
  CHECK(r.value == "false");

  Field v = Field::parse("string1");
  CHECK(v.kind == F_VAR);
  CHECK(v.name == "string1");
}

TEST_CASE("an = before any : makes a string field") {
  Field a = Field::parse("time=12:30");
  CHECK(a.kind == F_STRING);
  CHECK(a.name == "time");
  CHECK(a.value == "12:30");

  Field b = Field::parse("list:[\"a=b\"]");
  CHECK(b.kind == F_RAW);
  CHECK(b.name == "list");
  CHECK(b.value == "[\"a=b\"]");
}

TEST_CASE("format_object renders all three kinds of field") {
  Vars vars = {{"string1", "hello"}};
  CHECK(format_object(fields({"failed:false", "msg=File altered", "string1"}),
                      {}, vars) ==
        "{\"failed\": false, \"msg\": \"File altered\", \"string1\": \"hello\"}");
}

TEST_CASE("format_object resolves missing variables to empty strings") {
  CHECK(format_object({Field::var("nope")}, {}, Vars()) == "{\"nope\": \"\"}");
}

TEST_CASE("format_object appends extra variables last") {
  Vars vars = {{"out", "a\nb"}};
  CHECK(format_object({Field::raw("rc", "0")}, {"out"}, vars) ==
        "{\"rc\": 0, \"out\": \"a\\nb\"}");
}

TEST_CASE("format_object nests raw arrays") {
  CHECK(format_object({Field::raw("items", format_array({"x", "y"}))}, {},
                      Vars()) == "{\"items\": [\"x\", \"y\"]}");
}

//
////// LEXER
//

struct Lexed {
  TokenType type;
  string name;
  string body;
};

std::vector<Lexed> lex(const string &line) {
  Lexer lx(line);
  std::vector<Lexed> out;
  while (true) {
    TokenType t = lx.next_token();
    if (t == TK_EOF)
      break;
    out.push_back(Lexed{t, lx.name, string(lx.token_body())});
    if (t == TK_ERR)
      break;
  }
  return out;
}

TEST_CASE("lexer splits named and positional words") {
  auto toks = lex("  file=/tmp/a.txt   word  mode=0644 ");
  REQUIRE(toks.size() == 3);
  CHECK(toks[0].type == TK_NAMED);
  CHECK(toks[0].name == "file");
  CHECK(toks[0].body == "/tmp/a.txt");
  CHECK(toks[1].type == TK_POSITIONAL);
  CHECK(toks[1].body == "word");
  CHECK(toks[2].name == "mode");
  CHECK(toks[2].body == "0644");
}

TEST_CASE("lexer on empty and blank lines") {
  CHECK(lex("").empty());
  CHECK(lex("   \t ").empty());
}

TEST_CASE("lexer strips quotes and keeps escaped quotes raw") {
  auto toks = lex("owner=\"jane doe\" msg=\"say \\\"hi\\\"\"");
  REQUIRE(toks.size() == 2);
  CHECK(toks[0].body == "jane doe");
  CHECK(toks[1].body == "say \\\"hi\\\"");
}

TEST_CASE("lexer: backslash quote continues, double backslash quote closes") {
  auto a = lex("a=\"x\\\" y\" b=1");
  REQUIRE(a.size() == 2);
  CHECK(a[0].body == "x\\\" y");
  CHECK(a[1].name == "b");

  auto b = lex("a=\"x\\\\\" b=1");
  REQUIRE(b.size() == 2);
  CHECK(b[0].body == "x\\\\");
  CHECK(b[1].name == "b");
  CHECK(b[1].body == "1");
}

TEST_CASE("lexer: empty and tricky values") {
  auto toks = lex("a= b=\"\" c=x=y =z");
  REQUIRE(toks.size() == 4);
  CHECK(toks[0].name == "a");
  CHECK(toks[0].body == "");
  CHECK(toks[1].name == "b");
  CHECK(toks[1].body == "");
  CHECK(toks[2].name == "c");
  CHECK(toks[2].body == "x=y");
  CHECK(toks[3].type == TK_POSITIONAL);
  CHECK(toks[3].body == "=z");
}

TEST_CASE("lexer: escaped space stays in an unquoted value") {
  auto toks = lex("path=a\\ b next");
  REQUIRE(toks.size() == 2);
  CHECK(toks[0].body == "a\\ b");
  CHECK(toks[1].body == "next");
}

TEST_CASE("lexer: a quote opening a word does not group a named argument") {
  auto toks = lex("\"k=v w\"");
  REQUIRE(toks.size() == 2);
  CHECK(toks[0].type == TK_NAMED);
  CHECK(toks[0].name == "\"k");
  CHECK(toks[0].body == "v");
  CHECK(toks[1].type == TK_POSITIONAL);
  CHECK(toks[1].body == "w\"");
}

TEST_CASE("lexer: quoted positional") {
  auto toks = lex("\"a b\" c");
  REQUIRE(toks.size() == 2);
  CHECK(toks[0].type == TK_POSITIONAL);
  CHECK(toks[0].body == "a b");
  CHECK(toks[1].body == "c");
}

TEST_CASE("lexer: unterminated quote is an error, not a partial token") {
  Lexer lx("a=1 owner=\"jane doe");
  CHECK(lx.next_token() == TK_NAMED);
  CHECK(lx.next_token() == TK_ERR);
  CHECK(lx.result.find("owner") != string::npos);
  CHECK(lx.result.find("\"jane doe") != string::npos);

  auto toks = lex("x=\"a \\\"");
  REQUIRE(toks.size() == 1);
  CHECK(toks[0].type == TK_ERR);
}

//
////// VALIDATION
//

TEST_CASE("named arguments from the allow list") {
  ArgParser p;
  Args args;
  REQUIRE(p.parse("file=/tmp/a.txt mode=0644 owner=\"jane doe\"",
                  {"file", "mode", "owner"}, args) == S_OK);
  CHECK(args.named.size() == 3);
  CHECK(args.get("file") == "/tmp/a.txt");
  CHECK(args.get("mode") == "0644");
  CHECK(args.get("owner") == "jane doe");
  CHECK(args.positional.empty());
}

TEST_CASE("positional arguments when accepted") {
  ArgParser p;
  Args args;
  REQUIRE(p.parse("a b c", {POSITIONAL_MARKER}, args) == S_OK);
  CHECK(args.named.empty());
  REQUIRE(args.positional.size() == 3);
  CHECK(args.positional[0] == "a");
  CHECK(args.positional[1] == "b");
  CHECK(args.positional[2] == "c");
}

TEST_CASE("unknown argument fails and binds nothing") {
  ArgParser p;
  Args args;
  args.named["keep"] = "me";
  CHECK(p.parse("baz=1 foo=bar baz=2", {"baz"}, args) == S_ERR);
  CHECK(p.kind == E_UNSUPPORTED_ARGUMENT);
  CHECK(p.result.find("'foo'") != string::npos);
  CHECK(args.named.size() == 1);
  CHECK(args.get("keep") == "me");
}

TEST_CASE("positional argument fails without the marker") {
  ArgParser p;
  Args args;
  CHECK(p.parse("file=x stray", {"file"}, args) == S_ERR);
  CHECK(p.kind == E_UNSUPPORTED_POSITIONAL);
  CHECK(args.named.empty());
}

TEST_CASE("malformed line is reported as such") {
  ArgParser p;
  Args args;
  CHECK(p.parse("a=\"open", {"a"}, args) == S_ERR);
  CHECK(p.kind == E_MALFORMED);
}

TEST_CASE("values are decoded once") {
  ArgParser p;
  Args args;
  REQUIRE(p.parse("msg=\"say \\\"hi\\\"\" path=C:\\\\dir", {"msg", "path"},
                  args) == S_OK);
  CHECK(args.get("msg") == "say \"hi\"");
  CHECK(escape(args.get("msg")) == "say \\\"hi\\\"");
  CHECK(args.get("path") == "C:\\dir");
}

TEST_CASE("escaped space in an unquoted value decodes to a space") {
  ArgParser p;
  Args args;
  REQUIRE(p.parse("a=b\\ c d=1", {"a", "d"}, args) == S_OK);
  CHECK(args.get("a") == "b c");
  CHECK(args.get("d") == "1");
}

TEST_CASE("repeated name: last one wins, both tokens are recorded") {
  ArgParser p;
  Args args;
  REQUIRE(p.parse("a=1 a=2", {"a"}, args) == S_OK);
  CHECK(args.get("a") == "2");
  REQUIRE(args.tokens.size() == 2);
  CHECK(args.tokens[0].name == "a");
  CHECK(args.tokens[0].raw == "1");
  CHECK(args.tokens[1].raw == "2");
}

TEST_CASE("marker in allow list is not a name") {
  AllowList allow({"a", POSITIONAL_MARKER});
  CHECK(allow.accepts_positional);
  CHECK(allow.allows("a"));
  CHECK_FALSE(allow.allows(POSITIONAL_MARKER));
}

//
////// MODULE
//

struct Invocation {
  std::vector<const char *> argv;

  Invocation(std::initializer_list<const char *> args) : argv(args) {
    argv.push_back(nullptr);
  }

  int argc() const { return (int)argv.size() - 1; }
};

TEST_CASE("module emits the response of the plugin") {
  std::ostringstream out;
  Module m("test", {"file", "mode", "owner"}, out);
  Invocation inv({"test", "--args", "file=/tmp/a.txt owner=\"jane doe\""});
  int rc = m.main(inv.argc(), inv.argv.data(), [](Module &m) {
    m.set_var("string1", "hello");
    return m.emit(fields({"failed:false", "msg=File altered", "string1"}),
                  {"owner"});
  });
  CHECK(rc == 0);
  CHECK(out.str() == "{\"failed\": false, \"msg\": \"File altered\", "
                     "\"string1\": \"hello\", \"owner\": \"jane doe\"}\n");
}

TEST_CASE("module rejects unsupported arguments with a failure response") {
  std::ostringstream out;
  Module m("test", {"baz"}, out);
  Invocation inv({"test", "--args", "foo=bar"});
  bool called = false;
  int rc = m.main(inv.argc(), inv.argv.data(), [&called](Module &m) {
    called = true;
    return m.emit({});
  });
  CHECK(rc == 0);
  CHECK_FALSE(called);
  CHECK(out.str() ==
        "{\"failed\": true, \"rc\": 1, \"msg\": \"unsupported argument: "
        "'foo'\"}\n");
}

TEST_CASE("module reports unknown options as a failure response") {
  std::ostringstream out;
  Module m("test", {"a"}, out);
  Invocation inv({"test", "--bogus", "--args", "a=1"});
  int rc = m.main(inv.argc(), inv.argv.data(),
                  [](Module &m) { return m.emit({}); });
  CHECK(rc == 0);
  CHECK(m.kind == E_INVALID_INVOCATION);
  CHECK(out.str().find("\"failed\": true") != string::npos);
  CHECK(out.str().find("unknown option: bogus") != string::npos);
}

TEST_CASE("module without an argument source") {
  std::ostringstream out;
  Module m("test", {"a"}, out);
  Invocation inv({"test"});
  CHECK(m.main(inv.argc(), inv.argv.data(),
               [](Module &m) { return m.emit({}); }) == 0);
  CHECK(m.kind == E_INVALID_INVOCATION);
  CHECK(out.str().find("usage: test") != string::npos);
}

TEST_CASE("module exits 1 without JSON on an unterminated quote") {
  std::ostringstream out;
  Module m("test", {"a"}, out);
  Invocation inv({"test", "--args", "a=\"never closed"});
  CHECK(m.main(inv.argc(), inv.argv.data(),
               [](Module &m) { return m.emit({}); }) == 1);
  CHECK(m.kind == E_MALFORMED);
  CHECK(out.str().empty());
}

TEST_CASE("failed command becomes a failure response") {
  std::ostringstream out;
  Module m("test", {"a"}, out);
  Invocation inv({"test", "--args", "a=1"});
  bool after = false;
  int rc = m.main(inv.argc(), inv.argv.data(), [&after](Module &m) {
    MJ_RUN(m, "exit 3");
    after = true;
    return m.emit({});
  });
  CHECK(rc == 0);
  CHECK_FALSE(after);
  CHECK(m.failure.rc == 3);
  CHECK(m.failure.command == "exit 3");
  CHECK(m.failure.line > 0);
  string s = out.str();
  CHECK(s.find("\"failed\": true, \"rc\": 3") == 1);
  CHECK(s.find("'exit 3' failed with rc 3") != string::npos);
  CHECK(s.find("test.cpp: line ") != string::npos);
}

TEST_CASE("tolerated command does not fail the plugin") {
  std::ostringstream out;
  Module m("test", {"a"}, out);
  Invocation inv({"test", "--args", "a=1"});
  m.main(inv.argc(), inv.argv.data(), [](Module &m) {
    int rc = m.try_command("exit 2");
    return m.emit({Field::raw("failed", "false"),
                   Field::raw("rc", std::to_string(rc))});
  });
  CHECK(out.str() == "{\"failed\": false, \"rc\": 2}\n");
}

TEST_CASE("exceptions become a failure response") {
  std::ostringstream out;
  Module m("test", {"a"}, out);
  Invocation inv({"test", "--args", "a=1"});
  int rc = m.main(inv.argc(), inv.argv.data(), [](Module &m) -> Status {
    throw std::runtime_error("boom");
  });
  CHECK(rc == 0);
  CHECK(out.str() == "{\"failed\": true, \"rc\": 1, \"msg\": \"unhandled "
                     "exception: boom\"}\n");
}

TEST_CASE("plugin error status carries its message") {
  std::ostringstream out;
  Module m("test", {"a"}, out);
  Invocation inv({"test", "--args", "a=1"});
  m.main(inv.argc(), inv.argv.data(), [](Module &m) {
    m.result = "a must be 2";
    return S_ERR;
  });
  CHECK(out.str() ==
        "{\"failed\": true, \"rc\": 1, \"msg\": \"a must be 2\"}\n");
}

TEST_CASE("plugin that never answers still produces a response") {
  std::ostringstream out;
  Module m("test", {"a"}, out);
  Invocation inv({"test", "--args", "a=1"});
  m.main(inv.argc(), inv.argv.data(), [](Module &) { return S_OK; });
  CHECK(out.str() == "{\"failed\": true, \"rc\": 1, \"msg\": \"test finished "
                     "without a response\"}\n");
}

TEST_CASE("only the first response is emitted") {
  std::ostringstream out;
  Module m("test", {"a"}, out);
  Invocation inv({"test", "--args", "a=1"});
  Status second = S_OK;
  m.main(inv.argc(), inv.argv.data(), [&second](Module &m) {
    m.emit({Field::raw("changed", "true")});
    second = m.emit({Field::raw("changed", "false")});
    return second;
  });
  CHECK(second == S_ERR);
  CHECK(out.str() == "{\"changed\": true}\n");
}

TEST_CASE("named arguments are available as variables") {
  std::ostringstream out;
  Module m("test", {"path", POSITIONAL_MARKER}, out);
  Invocation inv({"test", "--args", "path=\"/srv/my dir\" one two"});
  m.main(inv.argc(), inv.argv.data(), [](Module &m) {
    CHECK(m.get_var("path") == "/srv/my dir");
    return m.emit({Field::var("path"),
                   Field::raw("argv", format_array(m.args.positional))});
  });
  CHECK(out.str() ==
        "{\"path\": \"\\/srv\\/my dir\", \"argv\": [\"one\", \"two\"]}\n");
}

//
////// CAPTURE
//

string temp_args_file(const string &content) {
  char path[] = "/tmp/modjson-test-args.XXXXXX";
  int fd = mkstemp(path);
  REQUIRE(fd >= 0);
  close(fd);
  std::ofstream f(path);
  f << content;
  return path;
}

TEST_CASE("capture collects both streams and removes its files") {
  Capture c;
  REQUIRE(c.begin() == S_OK);
  string out_path = c.out_path, err_path = c.err_path;
  CHECK(out_path.find(std::to_string(getpid())) != string::npos);
  printf("hello\n");
  std::cout << "world";
  std::cerr << "oops";
  string out, err;
  REQUIRE(c.finish(out, err) == S_OK);
  CHECK(out == "hello\nworld");
  CHECK(err == "oops");
  CHECK(access(out_path.c_str(), F_OK) != 0);
  CHECK(access(err_path.c_str(), F_OK) != 0);
  CHECK(c.finish(out, err) == S_ERR);
}

TEST_CASE("capture is released when it goes out of scope") {
  string out_path;
  {
    Capture c;
    REQUIRE(c.begin() == S_OK);
    out_path = c.out_path;
    std::cout << "dropped" << std::flush;
  }
  CHECK(access(out_path.c_str(), F_OK) != 0);
}

TEST_CASE("file mode attaches captured output to the response") {
  string path = temp_args_file("who=world\n");
  std::ostringstream out;
  Module m("test", {"who"}, out);
  Invocation inv({"test", path.c_str()});
  int rc = m.main(inv.argc(), inv.argv.data(), [](Module &m) {
    std::cout << "hello " << m.get_var("who") << std::endl;
    std::cerr << "warning" << std::endl;
    return m.emit(fields({"failed:false"}));
  });
  unlink(path.c_str());
  CHECK(rc == 0);
  CHECK(out.str() == "{\"failed\": false, \"stdout\": \"hello world\\n\", "
                     "\"stderr\": \"warning\\n\"}\n");
}

TEST_CASE("file mode captures the output of a failing command") {
  string path = temp_args_file("");
  std::ostringstream out;
  Module m("test", {POSITIONAL_MARKER}, out);
  Invocation inv({"test", path.c_str()});
  m.main(inv.argc(), inv.argv.data(), [](Module &m) {
    MJ_RUN(m, "echo partial; exit 4");
    return m.emit({});
  });
  unlink(path.c_str());
  string s = out.str();
  CHECK(s.find("\"rc\": 4") != string::npos);
  CHECK(s.find("\"stdout\": \"partial\\n\"") != string::npos);
}

TEST_CASE("missing arguments file") {
  std::ostringstream out;
  Module m("test", {"a"}, out);
  Invocation inv({"test", "/nonexistent/modjson/args"});
  CHECK(m.main(inv.argc(), inv.argv.data(),
               [](Module &m) { return m.emit({}); }) == 0);
  CHECK(m.kind == E_IO);
  CHECK(out.str().find("cannot open arguments file") != string::npos);
}

TEST_CASE("file mode puts parser traces in the response") {
  string path = temp_args_file("foo=bar\n");
  std::ostringstream out;
  Module m("test", {"baz"}, out);
  Invocation inv({"test", "-t", path.c_str()});
  CHECK(m.main(inv.argc(), inv.argv.data(),
               [](Module &m) { return m.emit({}); }) == 0);
  unlink(path.c_str());
  string s = out.str();
  CHECK(s.find("unsupported argument: 'foo'") != string::npos);
  CHECK(s.find("\"stderr\": \"{\\\"type\\\": \\\"TK_NAMED\\\"") !=
        string::npos);
}

TEST_CASE("file mode reports a malformed line on the real stderr") {
  string path = temp_args_file("a=\"never closed\n");
  Capture outer;
  REQUIRE(outer.begin() == S_OK);
  std::ostringstream out;
  Module m("test", {"a"}, out);
  Invocation inv({"test", path.c_str()});
  int rc = m.main(inv.argc(), inv.argv.data(),
                  [](Module &m) { return m.emit({}); });
  string o, e;
  REQUIRE(outer.finish(o, e) == S_OK);
  unlink(path.c_str());
  CHECK(rc == 1);
  CHECK(out.str().empty());
  CHECK(e.find("test: unterminated quote") != string::npos);
}

TEST_CASE("output after the response is discarded") {
  string path = temp_args_file("who=world\n");
  Capture outer;
  REQUIRE(outer.begin() == S_OK);
  Module m("test", {"who"});
  Invocation inv({"test", path.c_str()});
  int rc = m.main(inv.argc(), inv.argv.data(), [](Module &m) {
    if (m.emit(fields({"failed:false"})) != S_OK)
      return S_ERR;
    std::cout << "after emit" << std::endl;
    std::cerr << "late warning" << std::endl;
    m.try_command("echo child; echo child-err >&2");
    return S_OK;
  });
  string o, e;
  REQUIRE(outer.finish(o, e) == S_OK);
  unlink(path.c_str());
  CHECK(rc == 0);
  CHECK(o == "{\"failed\": false}\n");
  CHECK(e.empty());
}

//
////// ABNORMAL EXIT
//

struct ChildRun {
  int status = -1;
  string output;
};

/**
 * Run a file mode plugin in a child process with its own TMPDIR and with
 * stdout going to a file. The child only returns through the exit hooks.
 */
ChildRun run_in_child(const string &tmpdir, body_func_t body) {
  ChildRun r;
  string args = temp_args_file("");
  char out_path[] = "/tmp/modjson-test-out.XXXXXX";
  int out_fd = mkstemp(out_path);
  REQUIRE(out_fd >= 0);

  flush_std_streams();
  pid_t pid = fork();
  REQUIRE(pid >= 0);
  if (pid == 0) {
    setenv("TMPDIR", tmpdir.c_str(), 1);
    if (dup2(out_fd, STDOUT_FILENO) < 0)
      _exit(2);
    close(out_fd);
    Module m("test", {POSITIONAL_MARKER});
    Invocation inv({"test", args.c_str()});
    m.main(inv.argc(), inv.argv.data(), body);
    _exit(1);
  }
  close(out_fd);
  waitpid(pid, &r.status, 0);
  Capture::read_file(out_path, r.output);
  unlink(out_path);
  unlink(args.c_str());
  return r;
}

TEST_CASE("exit inside the plugin still sends a failure response") {
  char dir[] = "/tmp/modjson-test-tmp.XXXXXX";
  REQUIRE(mkdtemp(dir) != nullptr);
  ChildRun r = run_in_child(dir, [](Module &) -> Status {
    std::cout << "partial" << std::flush;
    std::exit(3);
  });
  REQUIRE(WIFEXITED(r.status));
  CHECK(WEXITSTATUS(r.status) == 0);
  CHECK(r.output.find("\"failed\": true") != string::npos);
  CHECK(r.output.find("test exited before sending a response") !=
        string::npos);
  CHECK(r.output.find("\"stdout\": \"partial\"") != string::npos);
  // Capture files are gone, so the directory is empty
  CHECK(rmdir(dir) == 0);
}

TEST_CASE("terminate inside the plugin still sends a failure response") {
  char dir[] = "/tmp/modjson-test-tmp.XXXXXX";
  REQUIRE(mkdtemp(dir) != nullptr);
  ChildRun r = run_in_child(dir, [](Module &) -> Status { std::terminate(); });
  REQUIRE(WIFEXITED(r.status));
  CHECK(WEXITSTATUS(r.status) == 0);
  CHECK(r.output.find("test terminated before sending a response") !=
        string::npos);
  CHECK(rmdir(dir) == 0);
}

TEST_CASE("exit after the response keeps the single response") {
  char dir[] = "/tmp/modjson-test-tmp.XXXXXX";
  REQUIRE(mkdtemp(dir) != nullptr);
  ChildRun r = run_in_child(dir, [](Module &m) -> Status {
    if (m.emit(fields({"failed:false"})) != S_OK)
      _exit(4);
    std::cout << "late" << std::endl;
    std::exit(5);
  });
  REQUIRE(WIFEXITED(r.status));
  CHECK(WEXITSTATUS(r.status) == 0);
  CHECK(r.output == "{\"failed\": false}\n");
  CHECK(rmdir(dir) == 0);
}
