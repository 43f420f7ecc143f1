#include "hdfs/record_writer.hpp"
#include "logger/logger.hpp"
#include <boost/log/trivial.hpp>
#include <csignal>
#include <mutex>
#include <sstream>

namespace tbstream {
namespace hdfs {

namespace {

// Open writers share one SIG_IGN, the first installs it and the last restores
std::mutex sigpipe_mutex;
std::size_t sigpipe_holders = 0;
struct sigaction previous_sigpipe;

void hold_sigpipe_ignore() {
  std::lock_guard<std::mutex> lock(sigpipe_mutex);
  if (sigpipe_holders++ == 0) {
    struct sigaction ignore {};
    ignore.sa_handler = SIG_IGN;
    ::sigemptyset(&ignore.sa_mask);
    ::sigaction(SIGPIPE, &ignore, &previous_sigpipe);
  }
}

void release_sigpipe_ignore() {
  std::lock_guard<std::mutex> lock(sigpipe_mutex);
  if (--sigpipe_holders == 0) {
    ::sigaction(SIGPIPE, &previous_sigpipe, nullptr);
  }
}

} // namespace


//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

RecordWriter::RecordWriter(Session& session, const std::string& path)
  : path_(path) {
  BOOST_LOG_TRIVIAL(info) << "RecordWriter: Opening loader for " << path_;

  // A dead loader must surface as EPIPE, not kill the caller
  hold_sigpipe_ignore();

  try {
    process::CommandOptions options;
    options.std_in = process::StreamMode::PIPE;
    options.std_out = process::StreamMode::SPOOL;
    options.std_err = process::StreamMode::SPOOL;
    loader_ = session.spawn(session.jar_command("loadtb", path_), options);

    boost::iostreams::file_descriptor_sink sink(loader_->stdin_fd(), boost::iostreams::never_close_handle);
    output_ = std::make_unique<PipeStream>(sink);
  }
  catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "RecordWriter: Failed to start loader for " << path_ << ": " << e.what();
    release_sigpipe_ignore();
    throw;
  }
}

RecordWriter::~RecordWriter() {
  if (!closed_ && loader_) {
    BOOST_LOG_TRIVIAL(warning) << "RecordWriter: Abandoned after " << records_written_
                               << " records, killing loader for " << path_;
    // Killed before its input closes so a partial file is never committed
    loader_->terminate();
  }
  output_.reset();
  loader_.reset();
  release_sigpipe_ignore();
}


//==============================================
// WRITING
//==============================================

void RecordWriter::write(const codec::Record& record) {
  if (closed_) {
    throw process::ProcessError("RecordWriter: write after close for " + path_);
  }

  if (loader_->poll()) {
    BOOST_LOG_TRIVIAL(error) << "RecordWriter: Loader quit after " << records_written_ << " records";
    throw loader_failure("Child process quit while we were sending it data");
  }

  // Encoded apart from the pipe so a codec error never leaves half a record behind
  std::ostringstream encoded;
  codec_.encode(record, encoded);
  const std::string bytes = encoded.str();

  if (!output_->write(bytes.data(), static_cast<std::streamsize>(bytes.size())) || !output_->flush()) {
    BOOST_LOG_TRIVIAL(error) << "RecordWriter: Pipe to loader broke after " << records_written_ << " records";
    throw loader_failure("Child process closed its input while we were sending it data");
  }

  ++records_written_;
  BOOST_LOG_TRIVIAL(trace) << "RecordWriter: Sent record " << records_written_ << " (" << bytes.size() << " bytes)";
}

void RecordWriter::close() {
  if (closed_) {
    return;
  }
  closed_ = true;

  const bool flushed = static_cast<bool>(output_->flush());
  output_.reset();

  auto result = loader_->wait();
  if (result.exit_code != 0 || !flushed) {
    BOOST_LOG_TRIVIAL(error) << "RecordWriter: Loader for " << path_ << " failed with code " << result.exit_code
                             << ": " << logging::clean_hadoop_stderr(result.stderr_data);
    throw process::ExternalCommandError(loader_->command(), result.exit_code,
                                        result.stdout_data, result.stderr_data);
  }

  BOOST_LOG_TRIVIAL(info) << "RecordWriter: Stored " << records_written_ << " records at " << path_;
}


//==============================================
// FAILURE SUPPORT
//==============================================

process::ExternalCommandError RecordWriter::loader_failure(const std::string& reason) {
  closed_ = true;
  output_.reset();
  auto result = loader_->wait();
  BOOST_LOG_TRIVIAL(error) << "RecordWriter: " << reason << ". STDOUT[" << result.stdout_data
                           << "] STDERR[" << logging::clean_hadoop_stderr(result.stderr_data) << "]";
  return process::ExternalCommandError(loader_->command(), result.exit_code,
                                       result.stdout_data, result.stderr_data);
}

} // namespace hdfs
} // namespace tbstream
