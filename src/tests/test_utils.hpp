#ifndef TBSTREAM_TEST_UTILS_HPP
#define TBSTREAM_TEST_UTILS_HPP

#include <boost/log/core.hpp>
#include <boost/log/trivial.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/sources/severity_logger.hpp>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>
#include <unistd.h>
#include "codec/typed_bytes_codec.hpp"
#include "hdfs/cluster_config.hpp"

// Set logging severity level and configure logging
inline void init_logging() {
    // Remove any existing sinks to prevent duplicates
    boost::log::core::get()->remove_all_sinks();

    // Add console output with formatting
    boost::log::register_simple_formatter_factory<boost::log::trivial::severity_level, char>("Severity");

    auto console_sink = boost::log::add_console_log(
        std::cout,
        boost::log::keywords::format = "[%TimeStamp%] [%ThreadID%] [%Severity%] %Message%",
        boost::log::keywords::auto_flush = true
    );

    // Warnings and up, the process tests are chatty at debug
    boost::log::core::get()->set_filter(
        boost::log::trivial::severity >= boost::log::trivial::warning
    );

    // Add commonly used attributes
    boost::log::add_common_attributes();
}

// Unique scratch directory under the system temp directory
inline std::filesystem::path make_test_dir(const std::string& prefix) {
    static std::atomic<int> counter{0};
    auto dir = std::filesystem::temp_directory_path() /
        (prefix + "_" + std::to_string(::getpid()) + "_" +
         std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()) + "_" +
         std::to_string(counter++));
    std::filesystem::create_directories(dir);
    return dir;
}

// A stand-in for the "hadoop" tool backed by a local directory.
// "fs" commands act on <base>/dfs, "jar <jar> dumptb|loadtb <path>" cat
// files out of and into it. Paths containing "broken" dump their data and
// exit 3, paths containing "fail" make the loader quit after one byte.
// Paths containing "noisy" write 200000 bytes to stderr: a dump does it in
// the middle of its single record ("k", "v"), a loader before reading input.
class FakeCluster {
public:
    FakeCluster() : base_(make_test_dir("tbstream_cluster")), root_(base_ / "dfs") {
        std::filesystem::create_directories(root_ / "user" / "tester");
        script_ = base_ / "hadoop";
        write_script();
    }

    ~FakeCluster() {
        std::error_code ec;
        std::filesystem::remove_all(base_, ec);
    }

    FakeCluster(const FakeCluster&) = delete;
    FakeCluster& operator=(const FakeCluster&) = delete;

    tbstream::hdfs::ClusterConfig config(std::size_t num_procs = 10) const {
        tbstream::hdfs::ClusterConfig config;
        config.hadoop_command = script_.string();
        config.streaming_jar = "fake-streaming.jar";
        config.java_mem_mb = 64;
        config.num_procs = num_procs;
        return config;
    }

    const std::filesystem::path& base() const { return base_; }

    // Local location of a cluster path
    std::filesystem::path local(const std::string& hdfs_path) const {
        return root_ / hdfs_path.substr(hdfs_path.find_first_not_of('/'));
    }

    void mkdir(const std::string& hdfs_path) const {
        std::filesystem::create_directories(local(hdfs_path));
    }

    void write_raw(const std::string& hdfs_path, const std::string& bytes) const {
        auto path = local(hdfs_path);
        std::filesystem::create_directories(path.parent_path());
        std::ofstream file(path, std::ios::binary | std::ios::trunc);
        file.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    }

    void write_records(const std::string& hdfs_path, const std::vector<tbstream::codec::Record>& records) const {
        tbstream::codec::TypedBytesCodec codec;
        std::ostringstream encoded;
        for (const auto& record : records) {
            codec.encode(record, encoded);
        }
        write_raw(hdfs_path, encoded.str());
    }

    std::vector<tbstream::codec::Record> read_records(const std::string& hdfs_path) const {
        tbstream::codec::TypedBytesCodec codec;
        std::ifstream file(local(hdfs_path), std::ios::binary);
        std::vector<tbstream::codec::Record> records;
        tbstream::codec::Record record;
        while (codec.decode(file, record)) {
            records.push_back(record);
        }
        return records;
    }

    // Paths handed to dumptb, in spawn order
    std::vector<std::string> dump_log() const { return read_lines(base_ / "dump.log"); }
    // Argument lists of every invocation
    std::vector<std::string> command_log() const { return read_lines(base_ / "commands.log"); }

    // Records of one file: key names the file, value carries the position
    static std::vector<tbstream::codec::Record> make_records(const std::string& name, int count,
                                                             std::size_t padding = 0) {
        std::vector<tbstream::codec::Record> records;
        for (int i = 0; i < count; ++i) {
            tbstream::codec::Record record;
            record.key = tbstream::codec::TypedValue::string(name);
            record.value = tbstream::codec::TypedValue::vector({
                tbstream::codec::TypedValue::int32(i),
                tbstream::codec::TypedValue::bytes(std::string(padding, 'x'))
            });
            records.push_back(record);
        }
        return records;
    }

private:
    std::filesystem::path base_;
    std::filesystem::path root_;
    std::filesystem::path script_;

    static std::vector<std::string> read_lines(const std::filesystem::path& path) {
        std::vector<std::string> lines;
        std::ifstream file(path);
        std::string line;
        while (std::getline(file, line)) {
            lines.push_back(line);
        }
        return lines;
    }

    void write_script() const {
        std::ofstream script(script_);
        script << "#!/bin/sh\n"
               << "export LC_ALL=C\n"
               << "ROOT='" << root_.string() << "'\n"
               << "BASE='" << base_.string() << "'\n"
               << R"SCRIPT(echo "$*" >> "$BASE/commands.log"
resolve() {
  case "$1" in
    /*) echo "$1" ;;
    .) echo "/user/tester" ;;
    *) echo "/user/tester/$1" ;;
  esac
}
if [ "$1" = "fs" ]; then
  op="$2"
  shift 2
  case "$op" in
    -test)
      p="$ROOT$(resolve "$2")"
      case "$1" in
        -e) [ -e "$p" ] ;;
        -d) [ -d "$p" ] ;;
        -z) [ -d "$p" ] || { [ -e "$p" ] && [ ! -s "$p" ]; } ;;
        *) exit 2 ;;
      esac
      exit $? ;;
    -ls)
      rel="$(resolve "$1")"
      p="$ROOT$rel"
      if [ ! -e "$p" ]; then
        echo "ls: Cannot access $1: No such file or directory." >&2
        exit 255
      fi
      if [ -d "$p" ]; then
        n=$(ls -1 "$p" | wc -l | tr -d ' ')
        echo "Found $n items"
        ls -1 "$p" | while read -r f; do
          echo "-rw-r--r--   1 tester supergroup          0 2010-11-02 13:40 ${rel%/}/$f"
        done
      else
        echo "-rw-r--r--   1 tester supergroup          0 2010-11-02 13:40 $rel"
      fi
      exit 0 ;;
    -rmr)
      p="$ROOT$(resolve "$1")"
      if [ ! -e "$p" ]; then
        echo "rmr: cannot remove $1: No such file or directory." >&2
        exit 255
      fi
      rm -rf "$p"
      echo "Deleted $1"
      exit 0 ;;
    -put)
      dest="$ROOT$(resolve "$2")"
      mkdir -p "$(dirname "$dest")" && cp "$1" "$dest"
      exit $? ;;
    -get)
      cp "$ROOT$(resolve "$1")" "$2"
      exit $? ;;
  esac
  echo "Unknown fs command $op" >&2
  exit 255
fi
if [ "$1" = "jar" ]; then
  rel="$(resolve "$4")"
  case "$3" in
    dumptb)
      echo "$rel" >> "$BASE/dump.log"
      echo "10/11/02 13:40:01 INFO streaming.DumpTypedBytes: dumping $rel" >&2
      case "$rel" in
        *broken*)
          cat "$ROOT$rel"
          echo "dump failed" >&2
          exit 3 ;;
        *noisy*)
          printf '\007\000\000\000\001k'
          head -c 200000 /dev/zero | tr '\000' 'e' >&2
          printf '\007\000\000\000\001v'
          exit 0 ;;
      esac
      cat "$ROOT$rel"
      exit $? ;;
    loadtb)
      echo "$rel" >> "$BASE/load.log"
      case "$rel" in
        *fail*)
          head -c 1 > /dev/null
          echo "loader exploded" >&2
          exit 1 ;;
        *noisy*)
          head -c 200000 /dev/zero | tr '\000' 'e' >&2 ;;
      esac
      mkdir -p "$(dirname "$ROOT$rel")" && cat > "$ROOT$rel"
      exit $? ;;
  esac
fi
echo "Unknown command $*" >&2
exit 255
)SCRIPT";
        script.close();
        std::filesystem::permissions(script_,
            std::filesystem::perms::owner_all | std::filesystem::perms::group_read |
            std::filesystem::perms::group_exec | std::filesystem::perms::others_read |
            std::filesystem::perms::others_exec);
    }
};

#endif // TBSTREAM_TEST_UTILS_HPP
