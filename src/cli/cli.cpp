#include "cli/cli.hpp"
#include "codec/typed_bytes_codec.hpp"
#include "hdfs/record_stream_multiplexer.hpp"
#include "hdfs/record_writer.hpp"
#include <fstream>
#include <sstream>
#include <boost/log/trivial.hpp>

namespace tbstream {
namespace cli {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

CLI::CLI(hdfs::Session& session, std::istream& input, std::ostream& output)
  : running_(false)
  , session_(session)
  , fs_(session)
  , input_(input)
  , output_(output) {
  BOOST_LOG_TRIVIAL(info) << "CLI initialized";
}


//==============================================
// STARTUP
//==============================================

void CLI::run() {
  running_ = true;
  std::string line;

  BOOST_LOG_TRIVIAL(info) << "Starting CLI loop";
  output_ << "TB_Shell> " << std::flush;

  while (running_ && std::getline(input_, line)) {
    running_ = execute(line);
    if (running_) {
      output_ << "TB_Shell> " << std::flush;
    }
  }

  BOOST_LOG_TRIVIAL(info) << "CLI loop ended";
}

bool CLI::execute(const std::string& line) {
  std::istringstream iss(line);
  std::string command;
  if (!(iss >> command)) {
    return true;
  }
  if (command == "quit") {
    return false;
  }

  std::vector<std::string> args;
  std::string arg;
  while (iss >> arg) {
    args.push_back(arg);
  }

  process_command(command, args);
  return true;
}


//==============================================
// COMMAND PROCESSING
//==============================================

void CLI::process_command(const std::string& command, const std::vector<std::string>& args) {
  BOOST_LOG_TRIVIAL(debug) << "Processing command: " << command << " with " << args.size() << " arguments";

  try {
    if (command == "help" && args.empty()) {
      handle_help_command();
    }
    else if (command == "home" && args.empty()) {
      output_ << session_.home_directory() << std::endl;
    }
    else if (command == "ls" && args.size() <= 1) {
      handle_ls_command(args.empty() ? "." : args[0]);
    }
    else if (command == "exists" && args.size() == 1) {
      output_ << (fs_.exists(args[0]) ? "yes" : "no") << std::endl;
    }
    else if (command == "rmr" && args.size() == 1) {
      fs_.rmr(args[0]);
      output_ << "Removed " << args[0] << std::endl;
    }
    else if (command == "put" && args.size() == 2) {
      fs_.put(args[0], args[1]);
    }
    else if (command == "get" && args.size() == 2) {
      fs_.get(args[0], args[1]);
    }
    else if (command == "cat" && !args.empty()) {
      handle_cat_command(args);
    }
    else if (command == "load" && args.size() == 2) {
      handle_load_command(args[0], args[1]);
    }
    else {
      output_ << "Unknown command or invalid arguments, try help" << std::endl;
    }
  } catch (const std::exception& e) {
    log_and_display_error("Error running " + command, e.what());
  }
}

void CLI::handle_ls_command(const std::string& path) {
  for (const auto& entry : fs_.ls(path)) {
    output_ << entry << std::endl;
  }
}

void CLI::handle_cat_command(const std::vector<std::string>& paths) {
  hdfs::RecordStreamMultiplexer reader(session_, paths);
  codec::Record record;
  while (reader.next(record)) {
    output_ << record.key.to_string() << "\t" << record.value.to_string() << "\n";
  }
  output_ << std::flush;
}

void CLI::handle_load_command(const std::string& local_path, const std::string& hdfs_path) {
  std::ifstream file(local_path, std::ios::binary);
  if (!file) {
    output_ << "Error opening file: " << local_path << std::endl;
    return;
  }

  codec::TypedBytesCodec codec;
  hdfs::RecordWriter writer(session_, hdfs_path);
  codec::Record record;
  while (codec.decode(file, record)) {
    writer.write(record);
  }
  writer.close();
  output_ << "Stored " << writer.records_written() << " records at " << hdfs_path << std::endl;
}

void CLI::handle_help_command() {
  output_ << "Available commands:" << std::endl;
  output_ << "  help                  Display this help message" << std::endl;
  output_ << "  home                  Print the cluster home directory" << std::endl;
  output_ << "  ls [path]             List files under <path>" << std::endl;
  output_ << "  exists <path>         Check whether <path> exists" << std::endl;
  output_ << "  rmr <path>            Recursively remove <path>" << std::endl;
  output_ << "  put <local> <remote>  Copy a local file to the cluster" << std::endl;
  output_ << "  get <remote> <local>  Copy a cluster file to local disk" << std::endl;
  output_ << "  cat <path>...         Print the records stored under <path>" << std::endl;
  output_ << "  load <local> <remote> Store a local typed bytes file as records" << std::endl;
  output_ << "  quit                  Exit the shell" << std::endl << std::endl;
}

void CLI::log_and_display_error(const std::string& message, const std::string& error) {
  BOOST_LOG_TRIVIAL(error) << message << ": " << error;
  output_ << message << ": " << error << std::endl;
}

} // namespace cli
} // namespace tbstream
