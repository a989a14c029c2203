#include "logvec/common/logger.h"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <iostream>

namespace logvec {
namespace common {

void Logger::Init(bool use_stderr) {
    try {
        auto console = use_stderr ? spdlog::stderr_color_mt("console")
                                  : spdlog::stdout_color_mt("console");
        spdlog::set_default_logger(console);
        spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [thread %t] %v");
        spdlog::set_level(spdlog::level::info);
    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "Log initialization failed: " << ex.what() << std::endl;
    }
}

void Logger::SetLevel(spdlog::level::level_enum level) {
    spdlog::set_level(level);
}

bool Logger::ParseLevel(const std::string& name, spdlog::level::level_enum& level) {
    if (name == "trace") level = spdlog::level::trace;
    else if (name == "debug") level = spdlog::level::debug;
    else if (name == "info") level = spdlog::level::info;
    else if (name == "warn") level = spdlog::level::warn;
    else if (name == "error") level = spdlog::level::err;
    else if (name == "off") level = spdlog::level::off;
    else return false;
    return true;
}

} // namespace common
} // namespace logvec
