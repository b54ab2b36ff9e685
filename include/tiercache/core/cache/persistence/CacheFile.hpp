#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace tiercache {
namespace core {
namespace cache {

// Настройки файла сохраняемого кэша
struct PersistenceConfig {
    std::string name = "cache.json";             // Имя файла
    std::filesystem::path directory = "cache";   // Каталог файла
    bool enableChecksum = true;                  // SHA-256 секции values
    bool enableCompression = false;              // zlib для всего документа

    std::filesystem::path filePath() const { return directory / name; }

    bool validate() const {
        if (name.empty()) return false;
        if (std::filesystem::path(name).has_parent_path()) return false;
        return true;
    }
};

/**
 * @brief Файл сохраняемого кэша: чтение, запись и удаление документа.
 * @details Документ: {"version": 1, "checksum": "<sha256>", "values": {...}}.
 *          Контрольная сумма считается по values.dump(). При включённом
 *          сжатии файл начинается с сигнатуры "TCZ1", за которой идут
 *          8 байт исходного размера (little-endian) и данные zlib.
 *          Сжатый файл распознаётся по сигнатуре независимо от настроек.
 */
class CacheFile {
public:
    static constexpr int kFormatVersion = 1;

    explicit CacheFile(PersistenceConfig config);

    const std::filesystem::path& path() const { return path_; }
    const PersistenceConfig& config() const { return config_; }
    bool exists() const;

    /**
     * @brief Прочитать секцию values.
     * @return std::nullopt, если файла нет
     * @throws PersistenceError при ошибке чтения, распаковки, версии или контрольной суммы
     * @throws nlohmann::json::exception если документ не является JSON
     */
    std::optional<nlohmann::json> read() const;

    /**
     * @brief Записать секцию values (каталог создаётся при необходимости).
     * @throws PersistenceError при ошибке записи или сжатия
     */
    void write(const nlohmann::json& values) const;

    /// @throws PersistenceError если файл не удалось удалить
    void remove() const;

    /// SHA-256 в hex.
    static std::string checksum(const std::string& data);

private:
    std::string compress(const std::string& data) const;
    std::string decompress(const std::string& data) const;

    PersistenceConfig config_;
    std::filesystem::path path_;
};

} // namespace cache
} // namespace core
} // namespace tiercache
