#pragma once

#include <deque>
#include <map>
#include <memory>
#include <string>
#include <vector>
#include <boost/iostreams/device/file_descriptor.hpp>
#include <boost/iostreams/stream.hpp>
#include "codec/typed_bytes_codec.hpp"
#include "hdfs/readiness_poller.hpp"
#include "hdfs/session.hpp"
#include "process/process_command.hpp"

namespace tbstream {
namespace hdfs {

struct ReaderOptions {
  // Maximum number of dump processes running at once
  std::size_t num_procs{10};
  // Skip files whose name starts with '_' (_SUCCESS, _logs)
  bool ignore_logs{true};
  // Raise ExternalCommandError when a dump process exits nonzero
  bool check_exit_status{true};

  static ReaderOptions from_config(const ClusterConfig& config);
};

// Reads typed bytes records from every file under the given roots through
// a bounded pool of "dumptb" processes and merges them into one sequence.
// Records of one file keep their order, files interleave arbitrarily.
// Single pass, one consuming thread.
class RecordStreamMultiplexer {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  // Lists every root first, throws PathNotFoundError before any process
  // is started when a root cannot be listed
  RecordStreamMultiplexer(Session& session, const std::vector<std::string>& roots,
                          const ReaderOptions& options);
  RecordStreamMultiplexer(Session& session, const std::vector<std::string>& roots);
  // Terminates and reaps every process still active
  ~RecordStreamMultiplexer();

  RecordStreamMultiplexer(const RecordStreamMultiplexer&) = delete;
  RecordStreamMultiplexer& operator=(const RecordStreamMultiplexer&) = delete;


  // ---- ITERATION ----
  // Produces the next record. Returns false once every file is exhausted.
  bool next(codec::Record& record);


  // ---- QUERY METHODS ----
  std::size_t active_count() const { return active_.size(); }
  std::size_t pending_count() const { return pending_.size(); }
  std::size_t records_read() const { return records_read_; }
  std::size_t sources_retired() const { return sources_retired_; }

  // True for names the cluster writes next to the data (leading '_')
  static bool is_log_file(const std::string& path);

private:
  using PipeStream = boost::iostreams::stream<boost::iostreams::file_descriptor_source>;

  // One running dump: its process and the decoder's view of its stdout.
  // stderr is spooled by the process and collected at retirement.
  struct Source {
    std::string path;
    std::unique_ptr<process::ProcessCommand> process;
    std::unique_ptr<PipeStream> input;
    int stdout_fd{-1};
  };

  // ---- PARAMETERS ----
  Session& session_;
  ReaderOptions options_;
  std::deque<std::string> pending_;
  ReadinessPoller poller_;
  std::map<int, std::unique_ptr<Source>> active_;
  std::deque<int> ready_;
  codec::TypedBytesCodec codec_;
  std::size_t records_read_{0};
  std::size_t sources_retired_{0};


  // ---- SCHEDULING ----
  // Lists the roots into the pending queue
  void enumerate(const std::vector<std::string>& roots);
  // Starts pending files until the pool is full or nothing is pending
  void activate();
  void open_source(const std::string& path);
  // Collects the sources that can be decoded without waiting for new input
  void collect_ready();
  // Waits for the finished dump and frees its slot
  void retire(int stdout_fd);


  // ---- RESOURCE SUPPORT ----
  void forget_ready(int fd);
  // Drops every active and pending source
  void release_all();
};

} // namespace hdfs
} // namespace tbstream
