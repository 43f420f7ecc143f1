#include "hdfs/filesystem_query.hpp"
#include <boost/log/trivial.hpp>
#include <filesystem>
#include <regex>
#include <sstream>

namespace tbstream {
namespace hdfs {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

FileSystemQuery::FileSystemQuery(Session& session)
  : session_(session) {}


//==============================================
// PATH TESTS
//==============================================

bool FileSystemQuery::exists(const std::string& path) const {
  return test("-e", path);
}

bool FileSystemQuery::isdir(const std::string& path) const {
  return test("-d", path);
}

bool FileSystemQuery::isempty(const std::string& path) const {
  return test("-z", path);
}

bool FileSystemQuery::test(const std::string& flag, const std::string& path) const {
  auto result = session_.run(session_.fs_command("-test " + flag + " " + Session::quote(path)));
  BOOST_LOG_TRIVIAL(debug) << "FileSystem: test " << flag << " " << path << " -> " << result.exit_code;
  return result.exit_code == 0;
}


//==============================================
// PATH QUERIES
//==============================================

std::vector<std::string> FileSystemQuery::ls(const std::string& path) const {
  auto result = session_.run_checked(session_.fs_command("-ls " + Session::quote(path)));
  auto entries = parse_listing(result.stdout_data);
  BOOST_LOG_TRIVIAL(debug) << "FileSystem: Listed " << entries.size() << " entries under " << path;
  return entries;
}

std::string FileSystemQuery::abspath(const std::string& path) const {
  if (path.empty()) {
    return session_.home_directory();
  }
  if (path.front() == '/') {
    return normalize(path);
  }
  if (path.find("://") != std::string::npos) {
    return path;
  }
  return normalize(session_.home_directory() + "/" + path);
}


//==============================================
// MODIFICATIONS
//==============================================

void FileSystemQuery::rmr(const std::string& path) const {
  BOOST_LOG_TRIVIAL(info) << "FileSystem: Removing " << path;
  session_.run_checked(session_.fs_command("-rmr " + Session::quote(path)));
}

void FileSystemQuery::put(const std::string& local_path, const std::string& hdfs_path) const {
  BOOST_LOG_TRIVIAL(info) << "FileSystem: Copying " << local_path << " to " << hdfs_path;
  session_.run_checked(session_.fs_command("-put " + Session::quote(local_path) + " " + Session::quote(hdfs_path)));
}

void FileSystemQuery::get(const std::string& hdfs_path, const std::string& local_path) const {
  BOOST_LOG_TRIVIAL(info) << "FileSystem: Copying " << hdfs_path << " to " << local_path;
  session_.run_checked(session_.fs_command("-get " + Session::quote(hdfs_path) + " " + Session::quote(local_path)));
}


//==============================================
// LISTING SUPPORT
//==============================================

std::vector<std::string> FileSystemQuery::parse_listing(const std::string& output) {
  static const std::regex found_line("Found [0-9]+ items$");

  std::vector<std::string> entries;
  std::istringstream lines(output);
  std::string line;
  while (std::getline(lines, line)) {
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    if (line.empty() || std::regex_search(line, found_line)) {
      continue;
    }
    // The path is the last space separated field
    std::size_t space = line.rfind(' ');
    entries.push_back(space == std::string::npos ? line : line.substr(space + 1));
  }
  return entries;
}

std::string FileSystemQuery::normalize(const std::string& path) {
  std::string normal = std::filesystem::path(path).lexically_normal().generic_string();
  while (normal.size() > 1 && normal.back() == '/') {
    normal.pop_back();
  }
  return normal;
}

} // namespace hdfs
} // namespace tbstream
