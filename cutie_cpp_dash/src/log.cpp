#include "log.h"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <memory>

#include "util.h"

namespace cutie {

spdlog::level::level_enum parse_log_level(const std::string& name, bool* recognized) {
    const std::string n = to_lower(trim(name));
    if (recognized) {
        *recognized = true;
    }
    if (n == "debug") return spdlog::level::debug;
    if (n == "info") return spdlog::level::info;
    if (n == "warn" || n == "warning") return spdlog::level::warn;
    if (n == "error") return spdlog::level::err;
    if (recognized) {
        *recognized = false;
    }
    return spdlog::level::info;
}

void init_logging(const std::string& path, spdlog::level::level_enum level) {
    std::shared_ptr<spdlog::logger> logger;
    std::string open_error;
    try {
        logger = spdlog::basic_logger_mt("cutie", path);
    } catch (const spdlog::spdlog_ex& ex) {
        open_error = ex.what();
        spdlog::drop("cutie");
        logger = spdlog::stderr_color_mt("cutie");
    }

    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
    logger->set_level(level);
    logger->flush_on(spdlog::level::warn);
    spdlog::set_default_logger(logger);

    if (!open_error.empty()) {
        spdlog::warn("log file {} unavailable ({}), logging to stderr", path, open_error);
    }
}

}  // namespace cutie
