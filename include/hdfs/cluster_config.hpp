#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace tbstream {
namespace hdfs {

struct ClusterConfig {
  // Cluster command line tool, HADOOP_CMD overrides the default
  std::string hadoop_command{default_hadoop_command()};
  // Empty means discover on first use
  std::string streaming_jar;
  int java_mem_mb{100};
  // Maximum number of concurrent dump processes per reader
  std::size_t num_procs{10};
  // Skip files whose name starts with '_' when reading directories
  bool ignore_logs{true};

  static std::string default_hadoop_command();
};

// Directories searched for hadoop*streaming*.jar, in order
std::vector<std::string> streaming_jar_search_dirs();

// Returns the configured jar, HADOOP_STREAMING_JAR, or the first
// hadoop*streaming*.jar in the search directories.
// Throws StreamingJarNotFoundError when nothing matches.
std::string find_streaming_jar(const ClusterConfig& config);

} // namespace hdfs
} // namespace tbstream
