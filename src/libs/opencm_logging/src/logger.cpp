#include <opencm_logging/logger.hpp>
#include <spdlog/sinks/basic_file_sink.h>
#include <filesystem>

namespace opencm_logging {

namespace {

const char* const logger_name = "opencm";

} // namespace

std::shared_ptr<spdlog::logger> logger() {
    if (auto registered = spdlog::get(logger_name))
        return registered;
    return spdlog::default_logger();
}

bool init_file_logging(const std::string& path, spdlog::level::level_enum level) {
    try {
        const std::filesystem::path log_file(path);
        if (log_file.has_parent_path())
            std::filesystem::create_directories(log_file.parent_path());
        spdlog::drop(logger_name);
        auto file_logger = spdlog::basic_logger_mt(logger_name, log_file.string(), true);
        file_logger->set_level(level);
        file_logger->flush_on(spdlog::level::warn);
        file_logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
        file_logger->info("OpenCM logger initialized. file={}", log_file.string());
        return true;
    } catch (const spdlog::spdlog_ex& e) {
        spdlog::default_logger()->error("Could not open log file '{}': {}", path, e.what());
        return false;
    } catch (const std::filesystem::filesystem_error& e) {
        spdlog::default_logger()->error("Could not create log directory for '{}': {}", path, e.what());
        return false;
    }
}

void set_level(spdlog::level::level_enum level) {
    logger()->set_level(level);
}

} // namespace opencm_logging
