#include "hdfs/cluster_config.hpp"
#include "hdfs/hdfs_error.hpp"
#include <boost/log/trivial.hpp>
#include <algorithm>
#include <cstdlib>
#include <filesystem>

namespace tbstream {
namespace hdfs {

namespace {

bool is_streaming_jar(const std::filesystem::path& path) {
  const std::string name = path.filename().string();
  return name.rfind("hadoop", 0) == 0
      && name.find("streaming") != std::string::npos
      && path.extension() == ".jar";
}

} // namespace

std::string ClusterConfig::default_hadoop_command() {
  const char* command = std::getenv("HADOOP_CMD");
  return (command && *command) ? command : "hadoop";
}

std::vector<std::string> streaming_jar_search_dirs() {
  std::vector<std::string> dirs;
  if (const char* home = std::getenv("HADOOP_HOME"); home && *home) {
    dirs.push_back(std::string(home) + "/contrib/streaming");
    dirs.push_back(home);
  }
  dirs.push_back("/usr/lib/hadoop/contrib/streaming");
  dirs.push_back("/usr/lib/hadoop");
  dirs.push_back("/usr/lib/hadoop-mapreduce");
  return dirs;
}

std::string find_streaming_jar(const ClusterConfig& config) {
  if (!config.streaming_jar.empty()) {
    return config.streaming_jar;
  }

  if (const char* jar = std::getenv("HADOOP_STREAMING_JAR"); jar && *jar) {
    BOOST_LOG_TRIVIAL(debug) << "Config: Streaming jar from HADOOP_STREAMING_JAR: " << jar;
    return jar;
  }

  for (const auto& dir : streaming_jar_search_dirs()) {
    std::error_code ec;
    if (!std::filesystem::is_directory(dir, ec)) {
      continue;
    }

    // Sorted so the choice does not depend on directory order
    std::vector<std::filesystem::path> matches;
    std::filesystem::directory_iterator it(dir, ec);
    for (; !ec && it != std::filesystem::directory_iterator(); it.increment(ec)) {
      std::error_code type_ec;
      if (it->is_regular_file(type_ec) && is_streaming_jar(it->path())) {
        matches.push_back(it->path());
      }
    }
    if (ec) {
      BOOST_LOG_TRIVIAL(warning) << "Config: Stopped scanning " << dir << ": " << ec.message();
    }
    if (!matches.empty()) {
      std::sort(matches.begin(), matches.end());
      BOOST_LOG_TRIVIAL(info) << "Config: Found streaming jar: " << matches.front().string();
      return matches.front().string();
    }
  }

  BOOST_LOG_TRIVIAL(error) << "Config: No hadoop*streaming*.jar found, set HADOOP_HOME or HADOOP_STREAMING_JAR";
  throw StreamingJarNotFoundError("set HADOOP_HOME or HADOOP_STREAMING_JAR");
}

} // namespace hdfs
} // namespace tbstream
