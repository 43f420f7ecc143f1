#ifndef TBSTREAM_HDFS_ERROR_HPP
#define TBSTREAM_HDFS_ERROR_HPP

#include <stdexcept>
#include <string>

namespace tbstream::hdfs {

class HdfsError : public std::runtime_error {
public:
    explicit HdfsError(const std::string& message)
        : std::runtime_error(message) {}
};

// A root path could not be listed
class PathNotFoundError : public HdfsError {
public:
    explicit PathNotFoundError(const std::string& path)
        : HdfsError("No such file or directory: '" + path + "'")
        , path_(path) {}

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

class StreamingJarNotFoundError : public HdfsError {
public:
    explicit StreamingJarNotFoundError(const std::string& message)
        : HdfsError("Streaming jar not found: " + message) {}
};

} // namespace tbstream::hdfs

#endif // TBSTREAM_HDFS_ERROR_HPP
