#include "tiercache/core/cache/metrics/CacheConfig.hpp"
#include <fstream>
#include <stdexcept>

namespace tiercache {
namespace core {
namespace cache {

namespace {

bool isKnownPolicy(const std::string& policy) {
    return policy == "plain" || policy == "lru" || policy == "expiring" || policy == "persistent";
}

bool isKnownLevel(const std::string& level) {
    return level == "trace" || level == "debug" || level == "info" || level == "warn" ||
           level == "error" || level == "critical" || level == "off";
}

} // namespace

ExpirationConfig ExpirationConfig::from(const ExpirationDuration& duration) {
    ExpirationConfig config;
    config.unit = ExpirationDuration::unitName(duration.unit());
    config.value = duration.value();
    return config;
}

ExpirationDuration ExpirationConfig::toDuration() const {
    switch (ExpirationDuration::unitFromName(unit)) {
        case ExpirationDuration::Unit::Minutes: return ExpirationDuration::minutes(value);
        case ExpirationDuration::Unit::Hours: return ExpirationDuration::hours(value);
        case ExpirationDuration::Unit::Seconds:
        default: return ExpirationDuration::seconds(value);
    }
}

bool CacheConfig::validate() const {
    if (!isKnownPolicy(policy)) return false;
    if (!isKnownLevel(logLevel)) return false;
    if (policy == "expiring") {
        if (expiration.value < 0) return false;
        if (expiration.unit != "seconds" && expiration.unit != "minutes" && expiration.unit != "hours") {
            return false;
        }
        if (expiration.toDuration().exceedsLimit()) return false;
    }
    if (policy == "persistent" && !persistence.validate()) return false;
    return true;
}

nlohmann::json CacheConfig::toJson() const {
    return {
        {"policy", policy},
        {"capacity", capacity},
        {"expiration", {
            {"unit", expiration.unit},
            {"value", expiration.value}
        }},
        {"persistence", {
            {"name", persistence.name},
            {"directory", persistence.directory.string()},
            {"checksum", persistence.enableChecksum},
            {"compression", persistence.enableCompression}
        }},
        {"logLevel", logLevel}
    };
}

CacheConfig CacheConfig::fromJson(const nlohmann::json& json) {
    CacheConfig config;
    config.policy = json.value("policy", config.policy);
    auto capacity = json.value("capacity", static_cast<int64_t>(config.capacity));
    if (capacity < 0) {
        throw std::runtime_error("Invalid cache capacity: " + std::to_string(capacity));
    }
    config.capacity = static_cast<size_t>(capacity);
    config.logLevel = json.value("logLevel", config.logLevel);

    if (auto it = json.find("expiration"); it != json.end()) {
        config.expiration.unit = it->value("unit", config.expiration.unit);
        config.expiration.value = it->value("value", config.expiration.value);
    }

    if (auto it = json.find("persistence"); it != json.end()) {
        config.persistence.name = it->value("name", config.persistence.name);
        config.persistence.directory = it->value("directory", config.persistence.directory.string());
        config.persistence.enableChecksum = it->value("checksum", config.persistence.enableChecksum);
        config.persistence.enableCompression = it->value("compression", config.persistence.enableCompression);
    }

    if (!isKnownPolicy(config.policy)) {
        throw std::runtime_error("Unknown cache policy: " + config.policy);
    }
    if (!config.validate()) {
        throw std::runtime_error("Invalid cache configuration: " + json.dump());
    }
    return config;
}

CacheConfig CacheConfig::fromFile(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Failed to open cache config: " + path.string());
    }
    nlohmann::json json;
    file >> json;
    return fromJson(json);
}

} // namespace cache
} // namespace core
} // namespace tiercache
