#include "tiercache/core/logging/Logging.hpp"
#include <filesystem>
#include <mutex>
#include <vector>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace tiercache {
namespace core {
namespace logging {

namespace {

std::mutex& creationMutex() {
    static std::mutex mutex;
    return mutex;
}

} // namespace

std::shared_ptr<spdlog::logger> logger() {
    if (auto existing = spdlog::get(kLoggerName)) {
        return existing;
    }

    std::lock_guard<std::mutex> lock(creationMutex());
    if (auto existing = spdlog::get(kLoggerName)) {
        return existing;
    }
    auto created = spdlog::stdout_color_mt(kLoggerName);
    created->set_level(spdlog::level::warn);
    created->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] [%n] %v");
    return created;
}

void initialize(const LoggingConfig& config) {
    std::lock_guard<std::mutex> lock(creationMutex());

    std::vector<spdlog::sink_ptr> sinks;

    // Консольный sink
    if (config.enableConsole) {
        auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        consoleSink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v");
        sinks.push_back(consoleSink);
    }

    // Файловый sink
    if (config.enableFile) {
        auto parent = std::filesystem::path(config.filePath).parent_path();
        if (!parent.empty()) {
            std::filesystem::create_directories(parent);
        }
        auto fileSink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            config.filePath, config.maxFileSize, config.maxFiles);
        fileSink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");
        sinks.push_back(fileSink);
    }

    auto configured = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
    configured->set_level(spdlog::level::from_str(config.level));

    spdlog::drop(kLoggerName);
    spdlog::register_logger(configured);

    configured->info("tiercache: логирование инициализировано (level={}, file={})",
                     config.level, config.enableFile ? config.filePath : "-");
}

void setLevel(const std::string& level) {
    logger()->set_level(spdlog::level::from_str(level));
}

} // namespace logging
} // namespace core
} // namespace tiercache
