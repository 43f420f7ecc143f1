#pragma once

#include <string>
#include <vector>
#include "hdfs/session.hpp"
#include "hdfs/hdfs_error.hpp"

namespace tbstream {
namespace hdfs {

// One-shot "hadoop fs" commands. Failures of the checked operations
// surface as process::ExternalCommandError.
class FileSystemQuery {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit FileSystemQuery(Session& session);


  // ---- PATH TESTS ----
  // Path must not contain wildcards
  bool exists(const std::string& path) const;
  bool isdir(const std::string& path) const;
  // True for zero length files and for directories
  bool isempty(const std::string& path) const;


  // ---- PATH QUERIES ----
  // Lists a file, directory or glob. Returns the paths in listing order.
  std::vector<std::string> ls(const std::string& path) const;
  // Absolute, normalized path without trailing slash
  std::string abspath(const std::string& path) const;


  // ---- MODIFICATIONS ----
  // Recursive remove, path may contain wildcards
  void rmr(const std::string& path) const;
  // Copies a local file to the cluster
  void put(const std::string& local_path, const std::string& hdfs_path) const;
  // Copies a cluster file to the local filesystem
  void get(const std::string& hdfs_path, const std::string& local_path) const;


  // ---- LISTING SUPPORT ----
  // Extracts the paths from "hadoop fs -ls" output
  static std::vector<std::string> parse_listing(const std::string& output);
  // Lexically normalizes an absolute path and strips the trailing slash
  static std::string normalize(const std::string& path);

private:
  // ---- PARAMETERS ----
  Session& session_;

  bool test(const std::string& flag, const std::string& path) const;
};

} // namespace hdfs
} // namespace tbstream
