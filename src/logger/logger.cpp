#include "logger/logger.hpp"
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/sinks/text_file_backend.hpp>
#include <boost/log/sinks/sync_frontend.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/make_shared.hpp>
#include <filesystem>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace tbstream::logging {

const char* to_string(boost::log::trivial::severity_level level) {
    switch (level) {
        case boost::log::trivial::trace:   return "TRACE";
        case boost::log::trivial::debug:   return "DEBUG";
        case boost::log::trivial::info:    return "INFO";
        case boost::log::trivial::warning: return "WARNING";
        case boost::log::trivial::error:   return "ERROR";
        case boost::log::trivial::fatal:   return "FATAL";
        default:                           return "UNKNOWN";
    }
}

boost::log::trivial::severity_level parse_level(const std::string& name) {
    boost::log::trivial::severity_level level;
    if (!boost::log::trivial::from_string(name.c_str(), name.size(), level)) {
        throw std::invalid_argument("Unknown log level: " + name);
    }
    return level;
}

void init_logging(const std::string& log_file, boost::log::trivial::severity_level min_level) {
    try {
        // Clear any existing sinks
        boost::log::core::get()->remove_all_sinks();

        auto backend = boost::make_shared<boost::log::sinks::text_file_backend>();

        // Convert to absolute path
        std::filesystem::path log_path = std::filesystem::absolute(log_file);
        backend->set_file_name_pattern(log_path.string());
        backend->set_open_mode(std::ios::out | std::ios::app);
        backend->auto_flush(true);

        using text_sink = boost::log::sinks::synchronous_sink<boost::log::sinks::text_file_backend>;
        auto sink = boost::make_shared<text_sink>(backend);

        namespace expr = boost::log::expressions;
        sink->set_formatter(
            expr::stream
                << expr::format_date_time<boost::posix_time::ptime>("TimeStamp", "%Y-%m-%d %H:%M:%S.%f")
                << " [" << boost::log::trivial::severity << "]"
                << " [Thread " << expr::attr<boost::log::attributes::current_thread_id::value_type>("ThreadID") << "] "
                << expr::smessage
        );

        boost::log::core::get()->add_sink(sink);
        boost::log::add_common_attributes();
        set_log_level(min_level);
        boost::log::core::get()->set_logging_enabled(true);

        BOOST_LOG_TRIVIAL(info) << "Logging system initialized with file: " << log_path.string();
    }
    catch (const std::exception& e) {
        std::cerr << "Failed to initialize logging: " << e.what() << std::endl;
        throw;
    }
}

void set_log_level(boost::log::trivial::severity_level min_level) {
    boost::log::core::get()->set_filter(boost::log::trivial::severity >= min_level);
}

std::string clean_hadoop_stderr(const std::string& stderr_text) {
    std::istringstream input(stderr_text);
    std::ostringstream output;
    std::string line;

    // Cluster log lines look like "10/11/02 13:40:01 INFO mapred.FileInputFormat: ..."
    while (std::getline(input, line)) {
        std::istringstream fields(line);
        std::vector<std::string> parts;
        std::string part;
        while (parts.size() < 3 && fields >> part) {
            parts.push_back(part);
        }
        if (parts.size() == 3 && (parts[2] == "INFO" || parts[2] == "WARN")) {
            continue;
        }
        output << line << '\n';
    }
    return output.str();
}

} // namespace tbstream::logging
