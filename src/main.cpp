#include "cli/cli.hpp"
#include "hdfs/session.hpp"
#include "logger/logger.hpp"
#include <iostream>
#include <string>
#include <unordered_set>

struct ProgramOptions {
  tbstream::hdfs::ClusterConfig config;
  std::string log_file{"tbstream.log"};
  std::string log_level{"info"};
  bool valid{false};
};

void print_usage(const std::string& program_name) {
  std::cerr << "Usage: " << program_name << " [options]\n"
            << "Options:\n"
            << "  --hadoop <cmd>     Cluster command line tool (default: hadoop)\n"
            << "  --jar <path>       Streaming jar (default: discovered)\n"
            << "  --mem <mb>         Java heap of spawned tools in MB (default: 100)\n"
            << "  --procs <n>        Concurrent readers for cat (default: 10)\n"
            << "  --keep-logs <0|1>  Also read files starting with '_' (default: 0)\n"
            << "  --log <file>       Log file (default: tbstream.log)\n"
            << "  --level <level>    trace, debug, info, warning, error (default: info)\n"
            << "Example: " << program_name << " --jar /usr/lib/hadoop/contrib/streaming/hadoop-streaming.jar\n";
}

ProgramOptions parse_command_line(int argc, char* argv[]) {
  const std::unordered_set<std::string> flags = {
    "--hadoop", "--jar", "--mem", "--procs", "--keep-logs", "--log", "--level"
  };

  ProgramOptions options;

  if (argc % 2 == 0) {
    std::cerr << "Error: Every option needs a value\n";
    print_usage(argv[0]);
    return options;
  }

  for (int i = 1; i < argc - 1; i += 2) {
    const std::string flag(argv[i]);
    const std::string value(argv[i + 1]);

    if (flags.count(flag) == 0) {
      std::cerr << "Error: Unknown argument: " << flag << '\n';
      print_usage(argv[0]);
      return options;
    }

    try {
      if (flag == "--hadoop") {
        options.config.hadoop_command = value;
      } else if (flag == "--jar") {
        options.config.streaming_jar = value;
      } else if (flag == "--mem") {
        options.config.java_mem_mb = std::stoi(value);
      } else if (flag == "--procs") {
        options.config.num_procs = static_cast<std::size_t>(std::stoul(value));
      } else if (flag == "--keep-logs") {
        options.config.ignore_logs = std::stoi(value) == 0;
      } else if (flag == "--log") {
        options.log_file = value;
      } else if (flag == "--level") {
        options.log_level = value;
      }
    } catch (const std::exception&) {
      std::cerr << "Error: Invalid value for " << flag << ": " << value << '\n';
      print_usage(argv[0]);
      return options;
    }
  }

  if (options.config.java_mem_mb <= 0 || options.config.num_procs == 0) {
    std::cerr << "Error: --mem and --procs must be positive\n";
    print_usage(argv[0]);
    return options;
  }

  options.valid = true;
  return options;
}

bool run_shell(const ProgramOptions& options) {
  try {
    tbstream::logging::init_logging(options.log_file, tbstream::logging::parse_level(options.log_level));
    tbstream::hdfs::Session session(options.config);
    tbstream::cli::CLI cli(session);
    cli.run();
    return true;
  } catch (const std::exception& e) {
    std::cerr << "Error: Failed to start shell: " << e.what() << '\n';
    return false;
  }
}

int main(int argc, char* argv[]) {
  if (const auto options = parse_command_line(argc, argv); !options.valid) {
    return 1;
  } else if (!run_shell(options)) {
    return 1;
  }
  return 0;
}
