#ifndef CUTIE_LOG_H
#define CUTIE_LOG_H

#include <spdlog/spdlog.h>

#include <string>

namespace cutie {

spdlog::level::level_enum parse_log_level(const std::string& name, bool* recognized = nullptr);

// Installs the process-wide "cutie" logger. The terminal belongs to ncurses,
// so output goes to a file; stderr is used only when the file cannot be opened.
void init_logging(const std::string& path, spdlog::level::level_enum level);

}  // namespace cutie

#endif  // CUTIE_LOG_H
