/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "RizinBackend.h"

#include <array>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <sstream>

#include <pthread.h>
#include <sys/wait.h>
#include <time.h>
#include <unistd.h>

#include "ApkScopeException.h"
#include "Debug.h"
#include "Trace.h"

namespace {

[[noreturn]] void channel_failure(const std::string& what,
                                  const std::string& path) {
  throw apkscope::BackendFailureException(
      what, {{"backend", "rizin"}, {"input", path}});
}

/*
 * Blocks SIGPIPE in the calling thread for the guard's lifetime, so a write
 * to a dead rizin fails with EPIPE instead of killing the process. A SIGPIPE
 * raised meanwhile is consumed before the old mask comes back. The process
 * signal dispositions are left alone.
 */
class SigpipeGuard {
 public:
  SigpipeGuard() {
    sigemptyset(&m_sigpipe);
    sigaddset(&m_sigpipe, SIGPIPE);
    m_was_pending = is_pending();
    pthread_sigmask(SIG_BLOCK, &m_sigpipe, &m_old_mask);
  }

  ~SigpipeGuard() {
    int saved_errno = errno;
    if (!m_was_pending && is_pending()) {
      struct timespec zero {};
      int sig;
      do {
        sig = sigtimedwait(&m_sigpipe, nullptr, &zero);
      } while (sig == -1 && errno == EINTR);
    }
    pthread_sigmask(SIG_SETMASK, &m_old_mask, nullptr);
    errno = saved_errno;
  }

  SigpipeGuard(const SigpipeGuard&) = delete;
  SigpipeGuard& operator=(const SigpipeGuard&) = delete;

 private:
  static bool is_pending() {
    sigset_t pending;
    sigemptyset(&pending);
    return sigpending(&pending) == 0 && sigismember(&pending, SIGPIPE) == 1;
  }

  sigset_t m_sigpipe;
  sigset_t m_old_mask;
  bool m_was_pending;
};

std::string hex_address(uint64_t address) {
  std::ostringstream ss;
  ss << "0x" << std::hex << address;
  return ss.str();
}

} // namespace

RizinBackend::~RizinBackend() { close(); }

std::string RizinBackend::render(const BackendQuery& query) const {
  auto at = [&query]() {
    always_assert_log(query.address, "%s needs an address",
                      show(query.command));
    return " @ " + hex_address(*query.address);
  };
  switch (query.command) {
  case BackendCommand::ANALYZE_ALL:
    return m_options.analysis_command;
  case BackendCommand::LIST_SYMBOLS:
    return "isj";
  case BackendCommand::LIST_CLASSES:
    return "icj";
  case BackendCommand::LIST_STRINGS:
    return "izzj";
  case BackendCommand::XREFS_TO:
    return "axtj" + at();
  case BackendCommand::DISASSEMBLE_FUNCTION:
    return "pdfj" + at();
  case BackendCommand::SYMBOL_AT:
    return "is.j" + at();
  }
  not_reached();
}

void RizinBackend::open(const std::string& path) {
  always_assert_log(m_child == -1, "rizin backend already open on %s",
                    m_path.c_str());
  m_path = path;

  int in_pipe[2];
  int out_pipe[2];
  if (pipe(in_pipe) == -1) {
    channel_failure(std::string("pipe failed: ") + strerror(errno), path);
  }
  if (pipe(out_pipe) == -1) {
    ::close(in_pipe[0]);
    ::close(in_pipe[1]);
    channel_failure(std::string("pipe failed: ") + strerror(errno), path);
  }

  std::vector<std::string> argv_strings;
  argv_strings.push_back(m_options.path);
  argv_strings.push_back("-q0");
  for (const auto& arg : m_options.args) {
    argv_strings.push_back(arg);
  }
  argv_strings.push_back(path);
  std::vector<char*> argv;
  for (auto& arg : argv_strings) {
    argv.push_back(const_cast<char*>(arg.c_str()));
  }
  argv.push_back(nullptr);

  auto child = fork();
  if (child == -1) {
    for (int fd : {in_pipe[0], in_pipe[1], out_pipe[0], out_pipe[1]}) {
      ::close(fd);
    }
    channel_failure(std::string("fork failed: ") + strerror(errno), path);
  }
  if (child == 0) {
    dup2(in_pipe[0], STDIN_FILENO);
    dup2(out_pipe[1], STDOUT_FILENO);
    for (int fd : {in_pipe[0], in_pipe[1], out_pipe[0], out_pipe[1]}) {
      ::close(fd);
    }
    execvp(argv[0], argv.data());
    // Only reached when exec failed. The parent sees EOF.
    _exit(127);
  }

  ::close(in_pipe[0]);
  ::close(out_pipe[1]);
  m_child = child;
  m_to_child = in_pipe[1];
  m_from_child = out_pipe[0];
  TRACE(BACKEND, 2, "Spawned %s (pid %d) on %s", m_options.path.c_str(),
        static_cast<int>(child), path.c_str());

  // rizin announces that it is ready with a lone NUL.
  read_response();
}

std::string RizinBackend::run(const BackendQuery& query) {
  if (m_child == -1) {
    channel_failure("rizin backend is not open", m_path);
  }
  auto command = render(query);
  TRACE(BACKEND, 3, "rizin> %s", command.c_str());
  write_command(command);
  auto response = read_response();
  TRACE(BACKEND, 4, "rizin< %zu bytes", response.size());
  return response;
}

void RizinBackend::write_command(const std::string& command) {
  std::string line = command + "\n";
  SigpipeGuard guard;
  const char* data = line.data();
  size_t remaining = line.size();
  while (remaining > 0) {
    auto written = write(m_to_child, data, remaining);
    if (written == -1) {
      if (errno == EINTR) {
        continue;
      }
      channel_failure(std::string("write to rizin failed: ") + strerror(errno),
                      m_path);
    }
    data += written;
    remaining -= written;
  }
}

std::string RizinBackend::read_response() {
  std::string response;
  std::array<char, 4096> buf;
  for (;;) {
    auto n = read(m_from_child, buf.data(), buf.size());
    if (n == -1) {
      if (errno == EINTR) {
        continue;
      }
      channel_failure(std::string("read from rizin failed: ") + strerror(errno),
                      m_path);
    }
    if (n == 0) {
      channel_failure("rizin closed its output", m_path);
    }
    auto* nul = static_cast<char*>(memchr(buf.data(), '\0', n));
    if (nul != nullptr) {
      // Requests are strictly sequential, nothing follows the terminator.
      response.append(buf.data(), nul - buf.data());
      return response;
    }
    response.append(buf.data(), n);
  }
}

void RizinBackend::close() {
  if (m_child == -1) {
    return;
  }
  static const char quit[] = "q!\n";
  {
    SigpipeGuard guard;
    if (write(m_to_child, quit, sizeof(quit) - 1) == -1) {
      TRACE(BACKEND, 2, "rizin on %s is already gone: %s", m_path.c_str(),
            strerror(errno));
    }
  }
  ::close(m_to_child);
  ::close(m_from_child);
  int status = 0;
  if (waitpid(m_child, &status, 0) == -1) {
    TRACE(BACKEND, 1, "waitpid on rizin failed: %s", strerror(errno));
  } else if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) {
    TRACE(BACKEND, 1, "rizin on %s exited abnormally (status %d)",
          m_path.c_str(), status);
  }
  m_child = -1;
  m_to_child = -1;
  m_from_child = -1;
}
