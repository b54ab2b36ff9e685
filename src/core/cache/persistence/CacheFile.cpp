#include "tiercache/core/cache/persistence/CacheFile.hpp"
#include "tiercache/core/cache/base/CacheErrors.hpp"
#include "tiercache/core/logging/Logging.hpp"
#include <cstdint>
#include <fstream>
#include <limits>
#include <iomanip>
#include <iterator>
#include <sstream>
#include <system_error>
#include <utility>
#include <vector>
#include <openssl/evp.h>
#include <zlib.h>

namespace tiercache {
namespace core {
namespace cache {

namespace {

constexpr char kCompressionMagic[] = "TCZ1";
constexpr size_t kMagicSize = sizeof(kCompressionMagic) - 1;
constexpr size_t kHeaderSize = kMagicSize + sizeof(uint64_t);
// Предельная степень сжатия deflate около 1032:1
constexpr uint64_t kMaxCompressionRatio = 1032;

bool isCompressed(const std::string& data) {
    return data.size() >= kHeaderSize && data.compare(0, kMagicSize, kCompressionMagic) == 0;
}

} // namespace

CacheFile::CacheFile(PersistenceConfig config)
    : config_(std::move(config)), path_(config_.filePath()) {}

bool CacheFile::exists() const {
    std::error_code ec;
    return std::filesystem::exists(path_, ec);
}

std::optional<nlohmann::json> CacheFile::read() const {
    if (!exists()) {
        return std::nullopt;
    }

    std::ifstream file(path_, std::ios::binary);
    if (!file) {
        throw PersistenceError("Failed to open cache file", path_);
    }
    std::string data((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (file.bad()) {
        throw PersistenceError("Failed to read cache file", path_);
    }

    if (isCompressed(data)) {
        data = decompress(data);
    }

    auto document = nlohmann::json::parse(data);
    if (!document.is_object()) {
        throw PersistenceError("Cache file is not a JSON object", path_);
    }
    if (document.value("version", 0) != kFormatVersion) {
        throw PersistenceError("Unsupported cache file version", path_);
    }
    auto valuesIt = document.find("values");
    if (valuesIt == document.end() || !valuesIt->is_object()) {
        throw PersistenceError("Cache file has no values", path_);
    }

    if (config_.enableChecksum) {
        auto expected = document.value("checksum", std::string());
        if (expected != checksum(valuesIt->dump())) {
            throw PersistenceError("Cache file checksum mismatch", path_);
        }
    }

    logging::logger()->debug("CacheFile: прочитано {} записей из {}", valuesIt->size(), path_.string());
    return *valuesIt;
}

void CacheFile::write(const nlohmann::json& values) const {
    nlohmann::json document = {
        {"version", kFormatVersion},
        {"values", values}
    };
    if (config_.enableChecksum) {
        document["checksum"] = checksum(values.dump());
    }

    std::string data = document.dump(4);
    if (config_.enableCompression) {
        data = compress(data);
    }

    std::error_code ec;
    if (path_.has_parent_path()) {
        std::filesystem::create_directories(path_.parent_path(), ec);
        if (ec) {
            throw PersistenceError("Failed to create cache directory (" + ec.message() + ")", path_.parent_path());
        }
    }

    std::ofstream file(path_, std::ios::binary | std::ios::trunc);
    if (!file) {
        throw PersistenceError("Failed to open cache file for writing", path_);
    }
    file.write(data.data(), static_cast<std::streamsize>(data.size()));
    file.flush();
    if (!file) {
        throw PersistenceError("Failed to write cache file", path_);
    }

    logging::logger()->debug("CacheFile: записано {} записей в {} ({} байт)",
                             values.size(), path_.string(), data.size());
}

void CacheFile::remove() const {
    std::error_code ec;
    if (!std::filesystem::remove(path_, ec)) {
        throw PersistenceError(ec ? "Failed to remove cache file (" + ec.message() + ")"
                                  : std::string("Cache file does not exist"), path_);
    }
    logging::logger()->debug("CacheFile: удалён {}", path_.string());
}

std::string CacheFile::checksum(const std::string& data) {
    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int length = 0;
    if (EVP_Digest(data.data(), data.size(), hash, &length, EVP_sha256(), nullptr) != 1) {
        throw CacheError("SHA-256 computation failed");
    }

    std::stringstream ss;
    for (unsigned int i = 0; i < length; i++) {
        ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
    }
    return ss.str();
}

std::string CacheFile::compress(const std::string& data) const {
    uLongf compressedSize = compressBound(static_cast<uLong>(data.size()));
    std::vector<Bytef> buffer(compressedSize);
    int result = compress2(buffer.data(), &compressedSize,
                           reinterpret_cast<const Bytef*>(data.data()),
                           static_cast<uLong>(data.size()), Z_BEST_COMPRESSION);
    if (result != Z_OK) {
        throw PersistenceError("zlib compression failed (code " + std::to_string(result) + ")", path_);
    }

    std::string output(kCompressionMagic, kMagicSize);
    uint64_t originalSize = data.size();
    for (size_t i = 0; i < sizeof(uint64_t); ++i) {
        output.push_back(static_cast<char>((originalSize >> (8 * i)) & 0xFF));
    }
    output.append(reinterpret_cast<const char*>(buffer.data()), compressedSize);
    return output;
}

std::string CacheFile::decompress(const std::string& data) const {
    uint64_t originalSize = 0;
    for (size_t i = 0; i < sizeof(uint64_t); ++i) {
        originalSize |= static_cast<uint64_t>(static_cast<unsigned char>(data[kMagicSize + i])) << (8 * i);
    }

    const uint64_t compressedSize = data.size() - kHeaderSize;
    if (originalSize > compressedSize * kMaxCompressionRatio ||
        originalSize > static_cast<uint64_t>(std::numeric_limits<uLongf>::max())) {
        throw PersistenceError("Corrupt compressed header (declared size " + std::to_string(originalSize) + ")", path_);
    }

    std::string output(static_cast<size_t>(originalSize), '\0');
    uLongf outputSize = static_cast<uLongf>(originalSize);
    int result = uncompress(reinterpret_cast<Bytef*>(output.data()), &outputSize,
                            reinterpret_cast<const Bytef*>(data.data() + kHeaderSize),
                            static_cast<uLong>(data.size() - kHeaderSize));
    if (result != Z_OK || outputSize != originalSize) {
        throw PersistenceError("zlib decompression failed (code " + std::to_string(result) + ")", path_);
    }
    return output;
}

} // namespace cache
} // namespace core
} // namespace tiercache
