#pragma once

#include <memory>
#include <optional>
#include <string>
#include "hdfs/cluster_config.hpp"
#include "process/process_command.hpp"

namespace tbstream {
namespace hdfs {

// Explicit context shared by the filesystem queries, readers and writers.
// Values that need a round trip to the cluster are resolved once and kept here.
class Session {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit Session(ClusterConfig config = ClusterConfig{});


  // ---- COMMAND CONSTRUCTION ----
  // "<hadoop> fs <args>"
  std::string fs_command(const std::string& args) const;
  // "<hadoop> jar <streaming jar> <action> '<path>'"
  std::string jar_command(const std::string& action, const std::string& path);
  // Single quotes an argument for /bin/sh
  static std::string quote(const std::string& argument);


  // ---- COMMAND EXECUTION ----
  // Spawns with the session's memory ceiling applied
  std::unique_ptr<process::ProcessCommand> spawn(
    const std::string& command,
    process::CommandOptions options = process::CommandOptions{}) const;
  // Runs to completion and returns the exit code and captured output
  process::ProcessResult run(const std::string& command) const;
  // run(), throwing ExternalCommandError on a nonzero exit code
  process::ProcessResult run_checked(const std::string& command) const;


  // ---- RESOLVED STATE ----
  const std::string& streaming_jar();
  // Parent directory of the first entry of "ls ."
  const std::string& home_directory();


  // ---- GETTERS ----
  const ClusterConfig& config() const { return config_; }

private:
  // ---- PARAMETERS ----
  ClusterConfig config_;
  std::optional<std::string> streaming_jar_;
  std::optional<std::string> home_directory_;
};

} // namespace hdfs
} // namespace tbstream
