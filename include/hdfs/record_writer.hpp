#pragma once

#include <memory>
#include <string>
#include <boost/iostreams/device/file_descriptor.hpp>
#include <boost/iostreams/stream.hpp>
#include "codec/typed_bytes_codec.hpp"
#include "hdfs/session.hpp"
#include "process/process_command.hpp"

namespace tbstream {
namespace hdfs {

// Streams records into one "loadtb" process that stores them at path.
// Records are forwarded one at a time, the loader consumes incrementally.
// SIGPIPE is ignored process wide while any writer is open.
class RecordWriter {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  RecordWriter(Session& session, const std::string& path);
  // Kills the loader when close() was never reached
  ~RecordWriter();

  RecordWriter(const RecordWriter&) = delete;
  RecordWriter& operator=(const RecordWriter&) = delete;


  // ---- WRITING ----
  // Throws ExternalCommandError when the loader has already quit
  void write(const codec::Record& record);
  // Flushes, closes the loader's input and waits for it to exit.
  // Throws ExternalCommandError on a nonzero exit code.
  void close();


  // ---- GETTERS ----
  const std::string& path() const { return path_; }
  std::size_t records_written() const { return records_written_; }

private:
  using PipeStream = boost::iostreams::stream<boost::iostreams::file_descriptor_sink>;

  // ---- PARAMETERS ----
  std::string path_;
  std::unique_ptr<process::ProcessCommand> loader_;
  std::unique_ptr<PipeStream> output_;
  codec::TypedBytesCodec codec_;
  std::size_t records_written_{0};
  bool closed_{false};


  // ---- FAILURE SUPPORT ----
  // Collects the loader's exit status and output into the error to throw
  process::ExternalCommandError loader_failure(const std::string& reason);
};

// Writes [begin, end) to path and returns the number of records written
template <typename Iterator>
std::size_t write_records(Session& session, const std::string& path, Iterator begin, Iterator end) {
  RecordWriter writer(session, path);
  for (; begin != end; ++begin) {
    writer.write(*begin);
  }
  writer.close();
  return writer.records_written();
}

} // namespace hdfs
} // namespace tbstream
