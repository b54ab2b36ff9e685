#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <spdlog/spdlog.h>

namespace tiercache {
namespace core {
namespace logging {

// Конфигурация логирования библиотеки
struct LoggingConfig {
    std::string level = "info";                   // trace|debug|info|warn|error|critical|off
    bool enableConsole = true;                    // Цветной вывод в stdout
    bool enableFile = true;                       // Ротируемый файл
    std::string filePath = "logs/tiercache.log";  // Путь к файлу
    size_t maxFileSize = 1024 * 1024 * 5;         // 5 MB
    size_t maxFiles = 3;
};

/// Имя общего логгера библиотеки в реестре spdlog.
constexpr const char* kLoggerName = "tiercache";

/**
 * @brief Общий логгер библиотеки.
 * @details Если приложение не вызвало initialize(), создаётся логгер
 *          с цветным выводом в stdout на уровне warn.
 */
std::shared_ptr<spdlog::logger> logger();

/**
 * @brief Настроить логгер библиотеки: консоль и ротируемый файл.
 * @throws spdlog::spdlog_ex если не удалось создать файл лога
 */
void initialize(const LoggingConfig& config);

/// Сменить уровень логгера ("debug", "warn", ...).
void setLevel(const std::string& level);

} // namespace logging
} // namespace core
} // namespace tiercache
