#ifndef TBSTREAM_PROCESS_ERROR_HPP
#define TBSTREAM_PROCESS_ERROR_HPP

#include <stdexcept>
#include <string>

namespace tbstream::process {

class ProcessError : public std::runtime_error {
public:
    explicit ProcessError(const std::string& message)
        : std::runtime_error(message) {}
};

// Failure to create pipes or fork the command
class SpawnError : public ProcessError {
public:
    explicit SpawnError(const std::string& message)
        : ProcessError("Spawn error: " + message) {}
};

// A spawned command exited with a nonzero status
class ExternalCommandError : public ProcessError {
public:
    ExternalCommandError(const std::string& command, int exit_code,
                         const std::string& stdout_data, const std::string& stderr_data)
        : ProcessError("Ran[" + command + "] exit " + std::to_string(exit_code) + ": " + stderr_data)
        , command_(command)
        , exit_code_(exit_code)
        , stdout_data_(stdout_data)
        , stderr_data_(stderr_data) {}

    const std::string& command() const { return command_; }
    int exit_code() const { return exit_code_; }
    const std::string& stdout_data() const { return stdout_data_; }
    const std::string& stderr_data() const { return stderr_data_; }

private:
    std::string command_;
    int exit_code_;
    std::string stdout_data_;
    std::string stderr_data_;
};

} // namespace tbstream::process

#endif // TBSTREAM_PROCESS_ERROR_HPP
