// module.hpp

// Plugin side of the legacy protocol. A plugin is a Status(Module &) function
// handed to Module::main, which:
//
// - reads the argument line from the file named on the command line (or from
//   --args in local test mode) and checks it against the allow list
// - captures stdout and stderr into temporary files while the plugin runs
// - writes exactly one JSON object to the real stdout, turning errors,
//   exceptions and a missing response into {"failed": true, ...}

#ifndef _MODJSON_MODULE_HPP
#define _MODJSON_MODULE_HPP

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <exception>
#include <fstream>
#include <functional>
#include <iostream>
#include <set>
#include <sstream>
#include <string>
#include <vector>

#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

#include <argh.h>

#include "args.hpp"
#include "json.hpp"

namespace modjson {

inline void flush_std_streams() {
  std::cout.flush();
  std::cerr.flush();
  fflush(stdout);
  fflush(stderr);
}

/**
 * Redirects fd 1 and 2 into two temporary files for the lifetime of the
 * capture. The files are removed by finish() or, on any other path, by the
 * destructor.
 */
struct Capture {
  Capture() {}
  ~Capture() { release(); }
  Capture(const Capture &) = delete;
  Capture &operator=(const Capture &) = delete;

  bool active = false;
  int saved_out = -1, saved_err = -1;
  string out_path, err_path;
  string result;

  static string temp_dir() {
    const char *dir = getenv("TMPDIR");
    return dir && *dir ? string(dir) : string("/tmp");
  }

  /**
   * mkstemp with the pid in the name so concurrent invocations never share
   * a buffer
   */
  Status make_temp(const char *stream, string &path, int &fd) {
    std::ostringstream tmpl;
    tmpl << temp_dir() << "/modjson." << getpid() << "." << stream
         << ".XXXXXX";
    string t = tmpl.str();
    std::vector<char> buf(t.begin(), t.end());
    buf.push_back('\0');
    fd = mkstemp(buf.data());
    if (fd < 0) {
      MJ_ERR("cannot create capture file " << t << ": " << strerror(errno));
      return S_ERR;
    }
    path = buf.data();
    return S_OK;
  }

  Status begin() {
    if (active) {
      MJ_ERR("capture already active");
      return S_ERR;
    }
    int out_fd = -1, err_fd = -1;
    if (make_temp("stdout", out_path, out_fd) != S_OK) {
      return S_ERR;
    }
    if (make_temp("stderr", err_path, err_fd) != S_OK) {
      close(out_fd);
      remove_files();
      return S_ERR;
    }

    flush_std_streams();
    saved_out = dup(STDOUT_FILENO);
    saved_err = dup(STDERR_FILENO);
    if (saved_out < 0 || saved_err < 0 || dup2(out_fd, STDOUT_FILENO) < 0 ||
        dup2(err_fd, STDERR_FILENO) < 0) {
      MJ_ERR("cannot redirect output: " << strerror(errno));
      close(out_fd);
      close(err_fd);
      restore();
      remove_files();
      return S_ERR;
    }
    close(out_fd);
    close(err_fd);
    active = true;
    return S_OK;
  }

  void restore() {
    flush_std_streams();
    if (saved_out >= 0) {
      dup2(saved_out, STDOUT_FILENO);
      close(saved_out);
      saved_out = -1;
    }
    if (saved_err >= 0) {
      dup2(saved_err, STDERR_FILENO);
      close(saved_err);
      saved_err = -1;
    }
  }

  void remove_files() {
    if (!out_path.empty()) {
      unlink(out_path.c_str());
      out_path.clear();
    }
    if (!err_path.empty()) {
      unlink(err_path.c_str());
      err_path.clear();
    }
  }

  static bool read_file(const string &path, string &content) {
    std::ifstream file(path);
    if (!file.is_open()) {
      return false;
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    content = buffer.str();
    return true;
  }

  /**
   * Put the real streams back and hand over what was written meanwhile
   */
  Status finish(string &out, string &err) {
    if (!active) {
      MJ_ERR("capture not active");
      return S_ERR;
    }
    restore();
    active = false;
    Status s = S_OK;
    if (!read_file(out_path, out) || !read_file(err_path, err)) {
      MJ_ERR("cannot read captured output");
      s = S_ERR;
    }
    remove_files();
    return s;
  }

  /**
   * Point fd 1 and 2 at /dev/null until the next restore(). Used once the
   * response is out, so nothing else reaches the real streams.
   */
  Status sink() {
    flush_std_streams();
    int null_fd = open("/dev/null", O_WRONLY);
    if (null_fd < 0) {
      MJ_ERR("cannot open /dev/null: " << strerror(errno));
      return S_ERR;
    }
    saved_out = dup(STDOUT_FILENO);
    saved_err = dup(STDERR_FILENO);
    if (saved_out < 0 || saved_err < 0 || dup2(null_fd, STDOUT_FILENO) < 0 ||
        dup2(null_fd, STDERR_FILENO) < 0) {
      MJ_ERR("cannot redirect output: " << strerror(errno));
      close(null_fd);
      restore();
      return S_ERR;
    }
    close(null_fd);
    return S_OK;
  }

  void release() {
    restore();
    remove_files();
    active = false;
  }
};

/**
 * The single response of an invocation. emit() works once; later calls are
 * refused. With a capture running, whatever the plugin writes after emit()
 * is discarded.
 */
struct Response {
  Response(std::ostream &out_ = std::cout) : out(out_) {}

  std::ostream &out;
  Capture *capture = nullptr;
  bool emitted = false;
  string result;

  Status emit(const std::vector<Field> &fields,
              const std::vector<string> &extra_vars, const Vars &vars) {
    if (emitted) {
      MJ_ERR("response already emitted");
      return S_ERR;
    }
    emitted = true;

    Vars v(vars);
    std::vector<string> extra(extra_vars);
    bool captured = capture && capture->active;
    if (captured) {
      string captured_out, captured_err;
      if (capture->finish(captured_out, captured_err) != S_OK) {
        std::cerr << "modjson: " << capture->result << std::endl;
      }
      if (!captured_out.empty()) {
        v["stdout"] = captured_out;
        extra.push_back("stdout");
      }
      if (!captured_err.empty()) {
        v["stderr"] = captured_err;
        extra.push_back("stderr");
      }
    }

    out << format_object(fields, extra, v) << std::endl;
    if (captured && capture->sink() != S_OK) {
      std::cerr << "modjson: " << capture->result << std::endl;
    }
    return S_OK;
  }

  static string failure_message(const string &reason, int rc,
                                const string &file, int line,
                                const string &command) {
    std::ostringstream msg;
    if (!file.empty()) {
      msg << file << ": line " << line << ": ";
    }
    if (!command.empty()) {
      msg << "'" << command << "' failed with rc " << rc;
      if (!reason.empty()) {
        msg << ": ";
      }
    }
    msg << reason;
    return msg.str();
  }

  Status emit_failure(const string &reason, int rc, const string &file = "",
                      int line = 0, const string &command = "") {
    std::vector<Field> fields = {
        Field::raw("failed", "true"),
        Field::raw("rc", std::to_string(rc)),
        Field::str("msg", failure_message(reason, rc, file, line, command)),
    };
    return emit(fields, {}, Vars());
  }
};

/**
 * The operation that stopped a plugin, as recorded by run_command
 */
struct Failure {
  int rc = 0;
  string command;
  string file;
  int line = 0;
};

struct Module;

typedef std::function<Status(Module &)> body_func_t;

#define MJ_RUN(m, cmd)                                                         \
  do {                                                                         \
    if ((m).run_command((cmd), __FILE__, __LINE__) != modjson::S_OK)           \
      return modjson::S_ERR;                                                   \
  } while (0)

struct Module {
  Module(const string &name_, const AllowList &allow_,
         std::ostream &out_ = std::cout)
      : name(name_), allow(allow_), response(out_) {
    response.capture = &capture;
  }

  string name;
  AllowList allow;
  Args args;
  Vars vars;
  Capture capture;
  Response response;

  Failure failure;
  bool command_failed = false;
  string result;
  ErrorKind kind = E_NONE;

  bool trace_parser = false;
  bool literal = false;

  Status fail(ErrorKind k) {
    kind = k;
    return S_ERR;
  }

  //
  ////// VARIABLES
  //

  void set_var(const string &n, const string &val) { vars[n] = val; }

  string get_var(const string &n) const {
    auto it = vars.find(n);
    return it == vars.end() ? string() : it->second;
  }

  //
  ////// SETUP
  //

  /**
   * Parse the argument line and bind its values. Named arguments become
   * variables so responses can refer to them by name.
   */
  Status load(const string_view &line) {
    ArgParser p(trace_parser);
    if (p.parse(line, allow, args) != S_OK) {
      result = p.result;
      return fail(p.kind);
    }
    for (const auto &kv : args.named) {
      set_var(kv.first, kv.second);
    }
    return S_OK;
  }

  Status read_args_file(const string &path, string &line) {
    std::ifstream file(path);
    if (!file.is_open()) {
      MJ_ERR("cannot open arguments file '" << path << "'");
      return fail(E_IO);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    line = buffer.str();
    while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) {
      line.pop_back();
    }
    return S_OK;
  }

  /**
   * <args-file>           read the line from a file and capture output
   * -a, --args <line>     take the line literally, no capture
   * -t, --trace-parser    log every token to stderr
   */
  Status setup(int argc, const char *const argv[]) {
    static const std::set<string> allowed_flags = {"t", "trace-parser"};
    static const std::set<string> allowed_params = {"a", "args"};

    argh::parser cmdl;
    cmdl.add_params({"-a", "--args"});
    cmdl.parse(argc, argv);

    for (const auto &flag : cmdl.flags()) {
      if (allowed_flags.find(flag) == allowed_flags.end()) {
        MJ_ERR("unknown option: " << flag);
        return fail(E_INVALID_INVOCATION);
      }
    }
    for (const auto &param : cmdl.params()) {
      if (allowed_params.find(param.first) == allowed_params.end()) {
        MJ_ERR("unknown option: " << param.first);
        return fail(E_INVALID_INVOCATION);
      }
    }

    trace_parser = cmdl[{"-t", "--trace-parser"}];

    const auto &params = cmdl.params();
    auto lit = params.find("args");
    if (lit == params.end()) {
      lit = params.find("a");
    }

    string line;
    if (lit != params.end()) {
      if (cmdl.pos_args().size() > 1) {
        MJ_ERR("arguments given both inline and as a file");
        return fail(E_INVALID_INVOCATION);
      }
      line = lit->second;
      literal = true;
    } else if (cmdl.pos_args().size() == 2) {
      if (read_args_file(cmdl[1], line) != S_OK) {
        return S_ERR;
      }
    } else {
      MJ_ERR("usage: " << name << " <args-file> | --args <line>");
      return fail(E_INVALID_INVOCATION);
    }

    // Capture first so parser traces end up in the response
    if (!literal && capture.begin() != S_OK) {
      result = capture.result;
      return fail(E_IO);
    }
    return load(line);
  }

  //
  ////// RESPONSE
  //

  Status emit(const std::vector<Field> &fields,
              const std::vector<string> &extra_vars = {}) {
    if (response.emit(fields, extra_vars, vars) != S_OK) {
      result = response.result;
      return S_ERR;
    }
    return S_OK;
  }

  Status emit_failure(const string &reason, int rc = 1,
                      const string &file = "", int line = 0,
                      const string &command = "") {
    if (response.emit_failure(reason, rc, file, line, command) !=
        S_OK) {
      result = response.result;
      return S_ERR;
    }
    return S_OK;
  }

  //
  ////// COMMANDS
  //

  /**
   * Run cmd through the shell and return its exit status. Output goes to
   * whatever stdout and stderr currently are, i.e. the capture files.
   */
  int try_command(const string &cmd) {
    flush_std_streams();
    int st = std::system(cmd.c_str());
    if (st == -1) {
      return 127;
    }
    if (WIFEXITED(st)) {
      return WEXITSTATUS(st);
    }
    if (WIFSIGNALED(st)) {
      return 128 + WTERMSIG(st);
    }
    return 1;
  }

  /**
   * Like try_command, but a non-zero status is a failure of the plugin.
   * Use MJ_RUN to record the call site and return S_ERR in one go.
   */
  Status run_command(const string &cmd, const char *file = "", int line = 0) {
    int rc = try_command(cmd);
    if (rc != 0) {
      failure.rc = rc;
      failure.command = cmd;
      failure.file = file ? file : "";
      failure.line = line;
      command_failed = true;
      MJ_ERR("command exited with status " << rc);
      return fail(E_COMMAND);
    }
    return S_OK;
  }

  //
  ////// ENTRY POINTS
  //

  /**
   * The module whose body is running, for the exit and terminate hooks
   */
  static Module *&live() {
    static Module *m = nullptr;
    return m;
  }

  /**
   * Answer for a body that left without going through run(), then drop the
   * capture files
   */
  static void abandon(const char *how) {
    Module *m = live();
    if (!m) {
      return;
    }
    live() = nullptr;
    if (!m->response.emitted) {
      m->emit_failure(m->name + " " + how + " before sending a response");
    }
    m->capture.release();
    flush_std_streams();
  }

  static void exit_hook() {
    if (live()) {
      abandon("exited");
      _exit(0);
    }
  }

  static void terminate_hook() {
    abandon("terminated");
    _exit(0);
  }

  /**
   * Call body and make sure exactly one response comes out of it
   */
  int run(body_func_t body) {
    static bool hooked = false;
    if (!hooked) {
      std::atexit(exit_hook);
      hooked = true;
    }
    live() = this;
    std::terminate_handler prev_terminate = std::set_terminate(terminate_hook);

    Status s = S_OK;
    try {
      s = body(*this);
    } catch (const std::exception &e) {
      MJ_ERR("unhandled exception: " << e.what());
      command_failed = false;
      s = S_ERR;
    } catch (...) {
      MJ_ERR("unhandled exception of unknown type");
      command_failed = false;
      s = S_ERR;
    }

    live() = nullptr;
    std::set_terminate(prev_terminate);

    if (!response.emitted) {
      if (s != S_OK && command_failed) {
        emit_failure(result, failure.rc, failure.file, failure.line,
                     failure.command);
      } else if (s != S_OK) {
        emit_failure(result.empty() ? string("plugin failed") : result);
      } else {
        emit_failure(name + " finished without a response");
      }
    }
    capture.release();
    return 0;
  }

  /**
   * Setup, then run. A malformed argument line is reported on stderr with
   * exit status 1; every other outcome is a JSON response and status 0.
   */
  int main(int argc, const char *const argv[], body_func_t body) {
    if (setup(argc, argv) != S_OK) {
      if (kind == E_MALFORMED) {
        capture.release();
        std::cerr << name << ": " << result << std::endl;
        return 1;
      }
      emit_failure(result);
      capture.release();
      return 0;
    }
    return run(body);
  }
};

} // namespace modjson

#endif
