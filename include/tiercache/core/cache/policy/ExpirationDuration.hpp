#pragma once

#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace tiercache {
namespace core {
namespace cache {

// Срок жизни записи истекающего кэша
class ExpirationDuration {
public:
    enum class Unit {
        Seconds,
        Minutes,
        Hours
    };

    static ExpirationDuration seconds(int64_t value) { return ExpirationDuration(value, Unit::Seconds); }
    static ExpirationDuration minutes(int64_t value) { return ExpirationDuration(value, Unit::Minutes); }
    static ExpirationDuration hours(int64_t value) { return ExpirationDuration(value, Unit::Hours); }

    int64_t value() const { return value_; }
    Unit unit() const { return unit_; }

    // Верхняя граница срока, принимаемая конфигурацией: 100 лет
    static constexpr int64_t kMaxSeconds = int64_t(100) * 365 * 24 * 3600;

    /// Длительность в секундах; при переполнении насыщается до seconds::max().
    std::chrono::seconds toDuration() const {
        const int64_t factor = secondsPerUnit(unit_);
        const int64_t limit = std::chrono::seconds::max().count() / factor;
        if (value_ > limit) return std::chrono::seconds::max();
        if (value_ < -limit) return std::chrono::seconds::min();
        return std::chrono::seconds(value_ * factor);
    }

    bool exceedsLimit() const {
        return toDuration().count() > kMaxSeconds;
    }

    static int64_t secondsPerUnit(Unit unit) {
        switch (unit) {
            case Unit::Minutes: return 60;
            case Unit::Hours: return 3600;
            case Unit::Seconds:
            default: return 1;
        }
    }

    static std::string unitName(Unit unit) {
        switch (unit) {
            case Unit::Minutes: return "minutes";
            case Unit::Hours: return "hours";
            case Unit::Seconds:
            default: return "seconds";
        }
    }

    /// @throws std::invalid_argument для неизвестной единицы
    static Unit unitFromName(const std::string& name) {
        if (name == "seconds") return Unit::Seconds;
        if (name == "minutes") return Unit::Minutes;
        if (name == "hours") return Unit::Hours;
        throw std::invalid_argument("Unknown expiration unit: " + name);
    }

    bool operator==(const ExpirationDuration& other) const {
        return toDuration() == other.toDuration();
    }
    bool operator!=(const ExpirationDuration& other) const { return !(*this == other); }

private:
    ExpirationDuration(int64_t value, Unit unit) : value_(value), unit_(unit) {}

    int64_t value_;
    Unit unit_;
};

} // namespace cache
} // namespace core
} // namespace tiercache
