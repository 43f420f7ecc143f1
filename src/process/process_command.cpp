#include "process/process_command.hpp"
#include "logger/logger.hpp"
#include <boost/log/trivial.hpp>
#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>
#include <vector>

extern char** environ;

namespace tbstream {
namespace process {

namespace {

const char* const SHELL_PATH = "/bin/sh";
const char* const MEMORY_ENV_KEY = "HADOOP_OPTS=";

std::string errno_message(const std::string& what) {
  return what + ": " + std::strerror(errno);
}

// Creates a close-on-exec pipe so siblings never inherit each other's ends
void make_pipe(utils::ScopedFd& read_end, utils::ScopedFd& write_end) {
  int fds[2];
  if (::pipe2(fds, O_CLOEXEC) != 0) {
    throw SpawnError(errno_message("pipe2 failed"));
  }
  read_end.reset(fds[0]);
  write_end.reset(fds[1]);
}

// Unlinked temporary file: child_end for the child, spool_end to read it back
void make_spool(utils::ScopedFd& child_end, utils::ScopedFd& spool_end) {
  std::string path = (std::filesystem::temp_directory_path() / "tbstream_spool_XXXXXX").string();
  int fd = ::mkostemp(&path[0], O_CLOEXEC);
  if (fd < 0) {
    throw SpawnError(errno_message("mkostemp failed for " + path));
  }
  child_end.reset(fd);
  ::unlink(path.c_str());

  int copy = ::fcntl(fd, F_DUPFD_CLOEXEC, 0);
  if (copy < 0) {
    throw SpawnError(errno_message("dup of spool file failed"));
  }
  spool_end.reset(copy);
}

void prepare_stream(StreamMode mode, bool child_reads, utils::ScopedFd& parent_end,
                    utils::ScopedFd& child_end, utils::ScopedFd* spool_end) {
  switch (mode) {
    case StreamMode::PIPE:
      if (child_reads) {
        make_pipe(child_end, parent_end);
      } else {
        make_pipe(parent_end, child_end);
      }
      break;
    case StreamMode::DISCARD: {
      int fd = ::open("/dev/null", (child_reads ? O_RDONLY : O_WRONLY) | O_CLOEXEC);
      if (fd < 0) {
        throw SpawnError(errno_message("open /dev/null failed"));
      }
      child_end.reset(fd);
      break;
    }
    case StreamMode::SPOOL:
      if (child_reads || spool_end == nullptr) {
        throw SpawnError("spooling is only supported for stdout and stderr");
      }
      make_spool(child_end, *spool_end);
      break;
    case StreamMode::INHERIT:
      break;
  }
}

// Parent environment with the memory ceiling replaced
std::vector<std::string> build_environment(int java_mem_mb) {
  const std::string key(MEMORY_ENV_KEY);
  std::vector<std::string> env;
  for (char** entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
    std::string value(*entry);
    if (value.compare(0, key.size(), key) != 0) {
      env.push_back(value);
    }
  }
  env.push_back(key + "-Xmx" + std::to_string(java_mem_mb) + "m");
  return env;
}

} // namespace


//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

ProcessCommand::ProcessCommand(const std::string& command, const CommandOptions& options)
  : command_(command)
  , options_(options) {
  spawn();
  BOOST_LOG_TRIVIAL(debug) << "ProcessCommand: Spawned pid " << pid_ << " for: " << command_;
}

ProcessCommand::~ProcessCommand() {
  if (pid_ > 0 && running()) {
    BOOST_LOG_TRIVIAL(debug) << "ProcessCommand: Terminating still running pid " << pid_;
    terminate();
  }

  stdin_.reset();
  stdout_.reset();
  stderr_.reset();

  if (pid_ > 0 && running()) {
    reap();
  }
}


//==============================================
// SPAWN SUPPORT
//==============================================

void ProcessCommand::spawn() {
  utils::ScopedFd child_in;
  utils::ScopedFd child_out;
  utils::ScopedFd child_err;
  prepare_stream(options_.std_in, true, stdin_, child_in, nullptr);
  prepare_stream(options_.std_out, false, stdout_, child_out, &stdout_spool_);
  prepare_stream(options_.std_err, false, stderr_, child_err, &stderr_spool_);

  // Everything the child touches is built before fork
  std::vector<std::string> env_strings = build_environment(options_.java_mem_mb);
  std::vector<char*> envp;
  envp.reserve(env_strings.size() + 1);
  for (auto& entry : env_strings) {
    envp.push_back(entry.data());
  }
  envp.push_back(nullptr);

  std::string shell(SHELL_PATH);
  std::string flag("-c");
  std::string command(command_);
  std::vector<char*> argv{shell.data(), flag.data(), command.data(), nullptr};

  pid_t pid = ::fork();
  if (pid < 0) {
    throw SpawnError(errno_message("fork failed for [" + command_ + "]"));
  }

  if (pid == 0) {
    // Child: async-signal-safe calls only
    ::setpgid(0, 0);
    if (child_in.valid()) {
      ::dup2(child_in.get(), STDIN_FILENO);
    }
    if (child_out.valid()) {
      ::dup2(child_out.get(), STDOUT_FILENO);
    }
    if (child_err.valid()) {
      ::dup2(child_err.get(), STDERR_FILENO);
    }

    // An ignored SIGPIPE survives exec, give the tools the default back
    struct sigaction action {};
    action.sa_handler = SIG_DFL;
    ::sigemptyset(&action.sa_mask);
    ::sigaction(SIGPIPE, &action, nullptr);

    ::execve(SHELL_PATH, argv.data(), envp.data());
    ::_exit(127);
  }

  // Also set from the parent so the group exists before any kill
  ::setpgid(pid, pid);
  pid_ = pid;
}


//==============================================
// PROCESS CONTROL
//==============================================

std::optional<int> ProcessCommand::poll() {
  if (exit_code_) {
    return exit_code_;
  }

  int status = 0;
  pid_t result = ::waitpid(pid_, &status, WNOHANG);
  if (result == pid_) {
    record_status(status);
  } else if (result < 0 && errno != EINTR) {
    throw ProcessError(errno_message("waitpid failed for pid " + std::to_string(pid_)));
  }
  return exit_code_;
}

ProcessResult ProcessCommand::wait() {
  close_stdin();
  drain_to_eof();
  if (running()) {
    reap();
  }
  collect_spool(stdout_spool_, stdout_data_);
  collect_spool(stderr_spool_, stderr_data_);

  BOOST_LOG_TRIVIAL(debug) << "ProcessCommand: pid " << pid_ << " exited with code " << *exit_code_;
  return ProcessResult{*exit_code_, stdout_data_, stderr_data_};
}

ProcessResult ProcessCommand::checked() {
  ProcessResult result = wait();
  if (result.exit_code != 0) {
    BOOST_LOG_TRIVIAL(error) << "ProcessCommand: Command [" << command_ << "] failed with code "
                             << result.exit_code << ": "
                             << logging::clean_hadoop_stderr(result.stderr_data);
    throw ExternalCommandError(command_, result.exit_code, result.stdout_data, result.stderr_data);
  }
  return result;
}

void ProcessCommand::drain_available() {
  for (int round = 0; round < MAX_DRAIN_ROUNDS && drain_ready(0); ++round) {
  }
}

void ProcessCommand::terminate() {
  if (!running()) {
    return;
  }
  // The child leads its own process group, this also reaches the tools the shell started
  if (::kill(-pid_, SIGTERM) != 0) {
    ::kill(pid_, SIGTERM);
  }
}

void ProcessCommand::close_stdin() {
  if (stdin_.valid()) {
    BOOST_LOG_TRIVIAL(trace) << "ProcessCommand: Closing stdin of pid " << pid_;
    stdin_.reset();
  }
}

int ProcessCommand::claim_stdout() {
  stdout_claimed_ = true;
  return stdout_.get();
}


//==============================================
// OUTPUT CAPTURE
//==============================================

bool ProcessCommand::read_into(utils::ScopedFd& fd, std::string& sink) {
  char buffer[4096];
  ssize_t n = ::read(fd.get(), buffer, sizeof(buffer));
  if (n > 0) {
    sink.append(buffer, static_cast<std::size_t>(n));
    return true;
  }
  if (n < 0 && (errno == EINTR || errno == EAGAIN)) {
    return true;
  }
  if (n < 0) {
    BOOST_LOG_TRIVIAL(warning) << "ProcessCommand: Read from pid " << pid_ << " failed: " << std::strerror(errno);
  }
  fd.reset();
  return false;
}

void ProcessCommand::drain_to_eof() {
  while (capturing()) {
    drain_ready(-1);
  }
}

void ProcessCommand::collect_spool(utils::ScopedFd& spool, std::string& sink) {
  if (!spool.valid()) {
    return;
  }

  char buffer[4096];
  off_t offset = 0;
  while (true) {
    ssize_t n = ::pread(spool.get(), buffer, sizeof(buffer), offset);
    if (n < 0 && errno == EINTR) {
      continue;
    }
    if (n < 0) {
      BOOST_LOG_TRIVIAL(warning) << "ProcessCommand: Reading spooled output of pid " << pid_
                                 << " failed: " << std::strerror(errno);
      break;
    }
    if (n == 0) {
      break;
    }
    sink.append(buffer, static_cast<std::size_t>(n));
    offset += n;
  }
  spool.reset();
}

bool ProcessCommand::capturing() const {
  return (stdout_.valid() && !stdout_claimed_) || stderr_.valid();
}

bool ProcessCommand::drain_ready(int timeout_ms) {
  pollfd fds[2];
  utils::ScopedFd* owners[2];
  std::string* sinks[2];
  nfds_t count = 0;

  if (stdout_.valid() && !stdout_claimed_) {
    fds[count] = pollfd{stdout_.get(), POLLIN, 0};
    owners[count] = &stdout_;
    sinks[count++] = &stdout_data_;
  }
  if (stderr_.valid()) {
    fds[count] = pollfd{stderr_.get(), POLLIN, 0};
    owners[count] = &stderr_;
    sinks[count++] = &stderr_data_;
  }
  if (count == 0) {
    return false;
  }

  int ready = ::poll(fds, count, timeout_ms);
  if (ready < 0 && errno != EINTR) {
    throw ProcessError(errno_message("poll failed"));
  }
  if (ready <= 0) {
    return false;
  }

  for (nfds_t i = 0; i < count; ++i) {
    if (fds[i].revents != 0) {
      read_into(*owners[i], *sinks[i]);
    }
  }
  return true;
}

void ProcessCommand::record_status(int status) {
  if (WIFEXITED(status)) {
    exit_code_ = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    exit_code_ = 128 + WTERMSIG(status);
  } else {
    exit_code_ = -1;
  }
}

void ProcessCommand::reap() {
  int status = 0;
  while (::waitpid(pid_, &status, 0) < 0) {
    if (errno != EINTR) {
      BOOST_LOG_TRIVIAL(error) << "ProcessCommand: waitpid failed for pid " << pid_ << ": " << std::strerror(errno);
      exit_code_ = -1;
      return;
    }
  }
  record_status(status);
}

} // namespace process
} // namespace tbstream
