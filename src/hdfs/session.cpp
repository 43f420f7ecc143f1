#include "hdfs/session.hpp"
#include "hdfs/filesystem_query.hpp"
#include <boost/log/trivial.hpp>

namespace tbstream {
namespace hdfs {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

Session::Session(ClusterConfig config)
  : config_(std::move(config)) {
  BOOST_LOG_TRIVIAL(info) << "Session: Using cluster tool: " << config_.hadoop_command
                          << " with " << config_.java_mem_mb << "MB heap";
}


//==============================================
// COMMAND CONSTRUCTION
//==============================================

std::string Session::fs_command(const std::string& args) const {
  return config_.hadoop_command + " fs " + args;
}

std::string Session::jar_command(const std::string& action, const std::string& path) {
  return config_.hadoop_command + " jar " + quote(streaming_jar()) + " " + action + " " + quote(path);
}

std::string Session::quote(const std::string& argument) {
  std::string quoted = "'";
  for (char c : argument) {
    if (c == '\'') {
      quoted += "'\\''";
    } else {
      quoted += c;
    }
  }
  quoted += "'";
  return quoted;
}


//==============================================
// COMMAND EXECUTION
//==============================================

std::unique_ptr<process::ProcessCommand> Session::spawn(
  const std::string& command, process::CommandOptions options) const {
  options.java_mem_mb = config_.java_mem_mb;
  return std::make_unique<process::ProcessCommand>(command, options);
}

process::ProcessResult Session::run(const std::string& command) const {
  BOOST_LOG_TRIVIAL(debug) << "Session: Running: " << command;
  return spawn(command)->wait();
}

process::ProcessResult Session::run_checked(const std::string& command) const {
  BOOST_LOG_TRIVIAL(debug) << "Session: Running checked: " << command;
  return spawn(command)->checked();
}


//==============================================
// RESOLVED STATE
//==============================================

const std::string& Session::streaming_jar() {
  if (!streaming_jar_) {
    streaming_jar_ = find_streaming_jar(config_);
  }
  return *streaming_jar_;
}

const std::string& Session::home_directory() {
  if (home_directory_) {
    return *home_directory_;
  }

  FileSystemQuery fs(*this);
  std::vector<std::string> entries;
  try {
    entries = fs.ls(".");
  } catch (const process::ExternalCommandError&) {
    if (!fs.exists(".")) {
      BOOST_LOG_TRIVIAL(error) << "Session: Home directory doesn't exist";
      throw PathNotFoundError(".");
    }
    throw;
  }

  if (entries.empty()) {
    throw HdfsError("Cannot resolve home directory: listing of '.' is empty");
  }

  const std::string& first = entries.front();
  std::size_t slash = first.rfind('/');
  home_directory_ = slash == std::string::npos ? std::string() : first.substr(0, slash);
  if (home_directory_->empty()) {
    home_directory_ = "/";
  }
  BOOST_LOG_TRIVIAL(info) << "Session: Resolved home directory: " << *home_directory_;
  return *home_directory_;
}

} // namespace hdfs
} // namespace tbstream
