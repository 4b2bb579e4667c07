#include "util/Exec.hpp"

#include <sys/types.h>
#include <sys/wait.h>
#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <cstdlib>
#include <filesystem>

namespace netmount::util {

static void close_fd(int& fd) {
  if (fd >= 0) {
    ::close(fd);
    fd = -1;
  }
}

CommandResult SystemCommandRunner::run(const std::vector<std::string>& argv, Capture capture) {
  CommandResult res;
  if (argv.empty()) return res;
  // resolved exactly as preflight resolves it
  const std::string program = find_tool(argv[0]);
  if (program.empty()) {
    res.exit_code = 127;
    return res;
  }

  int out_pipe[2] = {-1, -1};
  int err_pipe[2] = {-1, -1}; // reports execv errno back to the parent
  const bool capturing = capture != Capture::None;
  if (capturing && ::pipe2(out_pipe, O_CLOEXEC) != 0) return res;
  if (::pipe2(err_pipe, O_CLOEXEC) != 0) {
    close_fd(out_pipe[0]); close_fd(out_pipe[1]);
    return res;
  }

  std::vector<std::string> argv_storage = argv;
  std::vector<char*> argv_ptrs;
  argv_ptrs.reserve(argv_storage.size() + 1);
  for (auto& value : argv_storage) argv_ptrs.push_back(value.data());
  argv_ptrs.push_back(nullptr);

  pid_t pid = ::fork();
  if (pid < 0) {
    close_fd(out_pipe[0]); close_fd(out_pipe[1]);
    close_fd(err_pipe[0]); close_fd(err_pipe[1]);
    return res;
  }

  if (pid == 0) {
    if (capture == Capture::Stdout || capture == Capture::StdoutAndStderr)
      ::dup2(out_pipe[1], STDOUT_FILENO);
    if (capture == Capture::Stderr || capture == Capture::StdoutAndStderr)
      ::dup2(out_pipe[1], STDERR_FILENO);
    ::execv(program.c_str(), argv_ptrs.data());
    int e = errno;
    if (::write(err_pipe[1], &e, sizeof(e)) < 0) { /* parent sees EOF */ }
    _exit(127);
  }

  close_fd(out_pipe[1]);
  close_fd(err_pipe[1]);

  if (capturing) {
    char buf[4096];
    for (;;) {
      ssize_t n = ::read(out_pipe[0], buf, sizeof(buf));
      if (n > 0) { res.output.append(buf, static_cast<size_t>(n)); continue; }
      if (n < 0 && errno == EINTR) continue;
      break;
    }
    close_fd(out_pipe[0]);
  }

  int exec_errno = 0;
  ssize_t n;
  do {
    n = ::read(err_pipe[0], &exec_errno, sizeof(exec_errno));
  } while (n < 0 && errno == EINTR);
  close_fd(err_pipe[0]);

  int status = 0;
  while (::waitpid(pid, &status, 0) < 0) {
    if (errno != EINTR) return res;
  }

  if (n == static_cast<ssize_t>(sizeof(exec_errno))) {
    res.launched = false;
    res.exit_code = 127;
    return res;
  }

  res.launched = true;
  if (WIFEXITED(status)) res.exit_code = WEXITSTATUS(status);
  else if (WIFSIGNALED(status)) res.exit_code = 128 + WTERMSIG(status);
  return res;
}

std::string find_tool(const std::string& name) {
  if (name.find('/') != std::string::npos) {
    std::error_code ec;
    return std::filesystem::exists(name, ec) ? name : std::string();
  }
  if (const char* path = std::getenv("PATH")) {
    std::string p(path);
    size_t start = 0;
    while (start <= p.size()) {
      size_t end = p.find(':', start);
      std::string dir = p.substr(start, end == std::string::npos ? std::string::npos : end - start);
      if (!dir.empty()) {
        std::string cand = dir + "/" + name;
        if (::access(cand.c_str(), X_OK) == 0) return cand;
      }
      if (end == std::string::npos) break;
      start = end + 1;
    }
  }
  const char* dirs[] = {"/usr/sbin", "/usr/bin", "/sbin", "/bin", "/usr/local/sbin", "/usr/local/bin"};
  for (const char* d : dirs) {
    std::string cand = std::string(d) + "/" + name;
    if (::access(cand.c_str(), X_OK) == 0) return cand;
  }
  return std::string();
}

std::string format_command(const std::vector<std::string>& argv) {
  std::string out;
  for (const auto& a : argv) {
    if (!out.empty()) out.push_back(' ');
    if (a.find(' ') != std::string::npos) out += "'" + a + "'";
    else out += a;
  }
  return out;
}

} // namespace netmount::util
