#pragma once

#include <iostream>
#include <string>
#include <vector>
#include "hdfs/session.hpp"
#include "hdfs/filesystem_query.hpp"

namespace tbstream {
namespace cli {

class CLI {
public:
    // ---- CONSTRUCTOR AND DESTRUCTOR ----
    CLI(hdfs::Session& session, std::istream& input = std::cin, std::ostream& output = std::cout);


    // ---- STARTUP ----
    void run();
    // Runs one command line, returns false for "quit"
    bool execute(const std::string& line);

private:
    // ---- PARAMETERS ----
    bool running_;
    hdfs::Session& session_;
    hdfs::FileSystemQuery fs_;
    std::istream& input_;
    std::ostream& output_;


    // ---- COMMAND PROCESSING ----
    void process_command(const std::string& command, const std::vector<std::string>& args);
    void handle_ls_command(const std::string& path);
    void handle_cat_command(const std::vector<std::string>& paths);
    void handle_load_command(const std::string& local_path, const std::string& hdfs_path);
    void handle_help_command();
    void log_and_display_error(const std::string& message, const std::string& error);
};

} // namespace cli
} // namespace tbstream
