#include "hdfs/record_stream_multiplexer.hpp"
#include "hdfs/filesystem_query.hpp"
#include "hdfs/hdfs_error.hpp"
#include "logger/logger.hpp"
#include <boost/log/trivial.hpp>
#include <algorithm>
#include <stdexcept>

namespace tbstream {
namespace hdfs {

ReaderOptions ReaderOptions::from_config(const ClusterConfig& config) {
  ReaderOptions options;
  options.num_procs = config.num_procs;
  options.ignore_logs = config.ignore_logs;
  return options;
}


//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

RecordStreamMultiplexer::RecordStreamMultiplexer(Session& session, const std::vector<std::string>& roots,
                                                 const ReaderOptions& options)
  : session_(session)
  , options_(options) {
  if (options_.num_procs == 0) {
    BOOST_LOG_TRIVIAL(error) << "Multiplexer: num_procs must be at least 1";
    throw std::invalid_argument("Multiplexer: num_procs must be at least 1");
  }

  enumerate(roots);
  BOOST_LOG_TRIVIAL(info) << "Multiplexer: " << pending_.size() << " files pending under "
                          << roots.size() << " roots, up to " << options_.num_procs << " readers";

  // Resolved before the first spawn so a missing jar fails cleanly
  session_.streaming_jar();
  activate();
}

RecordStreamMultiplexer::RecordStreamMultiplexer(Session& session, const std::vector<std::string>& roots)
  : RecordStreamMultiplexer(session, roots, ReaderOptions::from_config(session.config())) {}

RecordStreamMultiplexer::~RecordStreamMultiplexer() {
  if (!active_.empty() || !pending_.empty()) {
    BOOST_LOG_TRIVIAL(info) << "Multiplexer: Abandoned with " << active_.size() << " active and "
                            << pending_.size() << " pending files";
  }
  release_all();
}


//==============================================
// ITERATION
//==============================================

bool RecordStreamMultiplexer::next(codec::Record& record) {
  try {
    while (!active_.empty()) {
      if (ready_.empty()) {
        collect_ready();
        continue;
      }

      int fd = ready_.front();
      ready_.pop_front();
      auto it = active_.find(fd);
      if (it == active_.end()) {
        continue;
      }

      if (codec_.decode(*it->second->input, record)) {
        ++records_read_;
        return true;
      }

      retire(fd);
      activate();
    }
  }
  catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Multiplexer: Aborting merged read: " << e.what();
    release_all();
    throw;
  }

  BOOST_LOG_TRIVIAL(info) << "Multiplexer: Finished, " << records_read_ << " records from "
                          << sources_retired_ << " files";
  return false;
}

bool RecordStreamMultiplexer::is_log_file(const std::string& path) {
  std::size_t slash = path.rfind('/');
  std::size_t start = slash == std::string::npos ? 0 : slash + 1;
  return start < path.size() && path[start] == '_';
}


//==============================================
// SCHEDULING
//==============================================

void RecordStreamMultiplexer::enumerate(const std::vector<std::string>& roots) {
  FileSystemQuery fs(session_);

  for (const auto& root : roots) {
    std::vector<std::string> entries;
    try {
      entries = fs.ls(root);
    } catch (const process::ExternalCommandError& e) {
      BOOST_LOG_TRIVIAL(error) << "Multiplexer: Cannot list " << root << ": "
                               << logging::clean_hadoop_stderr(e.stderr_data());
      throw PathNotFoundError(root);
    }

    for (const auto& entry : entries) {
      if (options_.ignore_logs && is_log_file(entry)) {
        BOOST_LOG_TRIVIAL(debug) << "Multiplexer: Skipping log file " << entry;
        continue;
      }
      pending_.push_back(entry);
    }
  }
}

void RecordStreamMultiplexer::activate() {
  while (active_.size() < options_.num_procs && !pending_.empty()) {
    std::string path = pending_.front();
    pending_.pop_front();
    open_source(path);
  }
}

void RecordStreamMultiplexer::open_source(const std::string& path) {
  process::CommandOptions options;
  options.std_in = process::StreamMode::DISCARD;
  options.std_out = process::StreamMode::PIPE;
  options.std_err = process::StreamMode::SPOOL;

  auto source = std::make_unique<Source>();
  source->path = path;
  source->process = session_.spawn(session_.jar_command("dumptb", path), options);
  source->stdout_fd = source->process->claim_stdout();

  boost::iostreams::file_descriptor_source device(source->stdout_fd, boost::iostreams::never_close_handle);
  source->input = std::make_unique<PipeStream>(device);

  poller_.add(source->stdout_fd);

  BOOST_LOG_TRIVIAL(debug) << "Multiplexer: Reading " << path << " (pid " << source->process->pid() << ")";
  int fd = source->stdout_fd;
  active_.emplace(fd, std::move(source));
}

void RecordStreamMultiplexer::collect_ready() {
  // Bytes already pulled into a decoder's buffer never wake the poller
  bool buffered = false;
  for (const auto& [fd, source] : active_) {
    if (source->input->rdbuf()->in_avail() > 0) {
      ready_.push_back(fd);
      buffered = true;
    }
  }

  for (int fd : poller_.wait(buffered ? 0 : -1)) {
    if (active_.count(fd) && std::find(ready_.begin(), ready_.end(), fd) == ready_.end()) {
      ready_.push_back(fd);
    }
  }
}

void RecordStreamMultiplexer::retire(int stdout_fd) {
  auto it = active_.find(stdout_fd);
  std::unique_ptr<Source> source = std::move(it->second);
  active_.erase(it);

  poller_.remove(source->stdout_fd);
  forget_ready(source->stdout_fd);

  source->input.reset();
  auto result = source->process->wait();
  ++sources_retired_;

  if (result.exit_code != 0) {
    BOOST_LOG_TRIVIAL(error) << "Multiplexer: Dump of " << source->path << " exited with code "
                             << result.exit_code << ": " << logging::clean_hadoop_stderr(result.stderr_data);
    if (options_.check_exit_status) {
      throw process::ExternalCommandError(source->process->command(), result.exit_code,
                                          result.stdout_data, result.stderr_data);
    }
  }

  BOOST_LOG_TRIVIAL(debug) << "Multiplexer: Finished " << source->path << ", "
                           << active_.size() << " active, " << pending_.size() << " pending";
}


//==============================================
// RESOURCE SUPPORT
//==============================================

void RecordStreamMultiplexer::forget_ready(int fd) {
  ready_.erase(std::remove(ready_.begin(), ready_.end(), fd), ready_.end());
}

void RecordStreamMultiplexer::release_all() {
  for (auto& [fd, source] : active_) {
    BOOST_LOG_TRIVIAL(debug) << "Multiplexer: Releasing " << source->path;
    try {
      poller_.remove(source->stdout_fd);
    } catch (const process::ProcessError& e) {
      BOOST_LOG_TRIVIAL(warning) << "Multiplexer: " << e.what();
    }
    source->input.reset();
    source->process.reset();
  }
  active_.clear();
  ready_.clear();
  pending_.clear();
}

} // namespace hdfs
} // namespace tbstream
