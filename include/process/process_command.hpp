#pragma once

#include <optional>
#include <string>
#include <sys/types.h>
#include "utils/scoped_fd.hpp"
#include "process/process_error.hpp"

namespace tbstream {
namespace process {

// Where a child's standard stream is connected
enum class StreamMode {
  PIPE = 0,
  INHERIT,
  DISCARD,
  // Output only: written to an unlinked temporary file, read back by wait().
  // The child never blocks on it.
  SPOOL
};

struct CommandOptions {
  StreamMode std_in{StreamMode::INHERIT};
  StreamMode std_out{StreamMode::PIPE};
  StreamMode std_err{StreamMode::PIPE};
  // Exported to the child as HADOOP_OPTS=-Xmx<N>m
  int java_mem_mb{100};
};

struct ProcessResult {
  int exit_code{0};
  std::string stdout_data;
  std::string stderr_data;
};

class ProcessCommand {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  // Spawns "/bin/sh -c command" with the requested redirections
  ProcessCommand(const std::string& command, const CommandOptions& options = CommandOptions{});
  // Terminates and reaps a child that is still running
  ~ProcessCommand();

  ProcessCommand(const ProcessCommand&) = delete;
  ProcessCommand& operator=(const ProcessCommand&) = delete;


  // ---- PROCESS CONTROL ----
  // Non-blocking exit check, returns the exit code once the child is gone
  std::optional<int> poll();
  // Closes stdin, drains piped output until EOF and reaps the child
  ProcessResult wait();
  // wait(), throwing ExternalCommandError on a nonzero exit code
  ProcessResult checked();
  // Reads piped output that is ready without blocking, at most
  // MAX_DRAIN_ROUNDS reads per pipe
  void drain_available();
  // Closes the parent's end of the stdin pipe, signalling EOF to the child
  void close_stdin();
  // Sends SIGTERM to the child's process group, does not reap
  void terminate();


  // ---- GETTERS ----
  const std::string& command() const { return command_; }
  pid_t pid() const { return pid_; }
  bool running() const { return !exit_code_.has_value(); }

  // Parent ends of the pipes, -1 when the stream is not piped.
  // The descriptors stay owned by this object.
  int stdin_fd() const { return stdin_.get(); }
  int stdout_fd() const { return stdout_.get(); }
  int stderr_fd() const { return stderr_.get(); }

  // Hands stdout over to an external reader, wait() no longer drains it
  int claim_stdout();

  const std::string& captured_stdout() const { return stdout_data_; }
  const std::string& captured_stderr() const { return stderr_data_; }

  static constexpr int MAX_DRAIN_ROUNDS = 16;

private:
  // ---- PARAMETERS ----
  std::string command_;
  CommandOptions options_;
  pid_t pid_{-1};
  std::optional<int> exit_code_;
  bool stdout_claimed_{false};
  utils::ScopedFd stdin_;
  utils::ScopedFd stdout_;
  utils::ScopedFd stderr_;
  utils::ScopedFd stdout_spool_;
  utils::ScopedFd stderr_spool_;
  std::string stdout_data_;
  std::string stderr_data_;


  // ---- SPAWN SUPPORT ----
  void spawn();


  // ---- OUTPUT CAPTURE ----
  // Reads once from fd into sink, closes fd at EOF. Returns false at EOF.
  bool read_into(utils::ScopedFd& fd, std::string& sink);
  // Polls the captured pipes once and reads the ready ones.
  // Returns false when nothing was ready.
  bool drain_ready(int timeout_ms);
  // Drains until both captured pipes reach EOF
  void drain_to_eof();
  // Appends a spool file's contents to sink and closes it
  void collect_spool(utils::ScopedFd& spool, std::string& sink);
  bool capturing() const;
  // Records the exit code from a waitpid status
  void record_status(int status);
  // Blocks in waitpid until the child is reaped
  void reap();
};

} // namespace process
} // namespace tbstream
