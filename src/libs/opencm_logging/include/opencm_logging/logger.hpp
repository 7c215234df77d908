#pragma once

#include <spdlog/spdlog.h>
#include <memory>
#include <string>

namespace opencm_logging {

// Shared "opencm" logger. Falls back to spdlog's default logger until
// init_file_logging() registers one.
std::shared_ptr<spdlog::logger> logger();

// Registers the shared logger writing to a file (truncated on open).
// Returns false and keeps the default logger if the sink cannot be created.
bool init_file_logging(const std::string& path, spdlog::level::level_enum level);

void set_level(spdlog::level::level_enum level);

} // namespace opencm_logging
