#pragma once

#include <filesystem>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <nlohmann/json.hpp>
#include "tiercache/core/cache/base/KeyValueStore.hpp"
#include "tiercache/core/cache/persistence/CacheFile.hpp"
#include "tiercache/core/logging/Logging.hpp"

namespace tiercache {
namespace core {
namespace cache {

// Тип, который nlohmann::json умеет сериализовать и разбирать
template<typename T, typename = void>
struct is_json_persistable : std::false_type {};
template<typename T>
struct is_json_persistable<T, std::void_t<
    decltype(nlohmann::adl_serializer<T>::to_json(std::declval<nlohmann::json&>(), std::declval<const T&>())),
    decltype(nlohmann::adl_serializer<T>::from_json(std::declval<const nlohmann::json&>(), std::declval<T&>()))>>
    : std::true_type {};

namespace detail {

// Строковые ключи пишутся как есть, остальные — как текст JSON
template<typename Key>
std::string encodeKey(const Key& key) {
    if constexpr (std::is_same_v<Key, std::string>) {
        return key;
    } else {
        return nlohmann::json(key).dump();
    }
}

template<typename Key>
Key decodeKey(const std::string& text) {
    if constexpr (std::is_same_v<Key, std::string>) {
        return text;
    } else {
        return nlohmann::json::parse(text).template get<Key>();
    }
}

} // namespace detail

/**
 * @brief Кэш, сохраняемый в JSON-файл.
 * @details При создании загружает значения из файла (если он есть), затем
 *          поверх них записывает initialValues. Загрузка best effort:
 *          нечитаемый, повреждённый или не прошедший проверку контрольной
 *          суммы файл даёт пустой кэш и предупреждение в логе. Записи,
 *          ключ или значение которых не разбираются, пропускаются.
 *
 *          save() и deleteFile() вызываются явно; автоматического
 *          сохранения нет.
 * @tparam Key Тип ключа (std::string или тип, сериализуемый nlohmann::json)
 * @tparam Value Тип значения в памяти
 * @tparam PersistedValue Тип значения в файле
 */
template<typename Key, typename Value, typename PersistedValue = Value>
class PersistableCache : public Cacheable<Key, Value> {
    static_assert(is_json_persistable<PersistedValue>::value,
                  "PersistedValue must be convertible to and from nlohmann::json");

public:
    using KeySet = typename Cacheable<Key, Value>::KeySet;
    using Snapshot = typename Cacheable<Key, Value>::Snapshot;
    using ValueMatcher = typename Cacheable<Key, Value>::ValueMatcher;
    using ToPersisted = std::function<std::optional<PersistedValue>(const Value&)>;
    using FromPersisted = std::function<std::optional<Value>(const PersistedValue&)>;

    explicit PersistableCache(PersistenceConfig config,
                              Snapshot initialValues = {},
                              ToPersisted toPersisted = defaultToPersisted(),
                              FromPersisted fromPersisted = defaultFromPersisted());
    ~PersistableCache() override = default;

    PersistableCache(const PersistableCache&) = delete;
    PersistableCache& operator=(const PersistableCache&) = delete;

    std::optional<Value> fetch(const Key& key, const ValueMatcher& matcher) override {
        return store_.fetch(key, matcher);
    }
    Value fetchRequired(const Key& key, const ValueMatcher& matcher) override {
        return store_.fetchRequired(key, matcher);
    }
    void set(const Key& key, const Value& value) override { store_.set(key, value); }
    void remove(const Key& key) override { store_.remove(key); }
    bool contains(const Key& key) override { return store_.contains(key); }
    void clear() override { store_.clear(); }
    size_t size() const override { return store_.size(); }
    Snapshot snapshot(const ValueMatcher& matcher) const override { return store_.snapshot(matcher); }
    KeySet missingKeys(const KeySet& keys) override { return store_.missingKeys(keys); }

    /**
     * @brief Записать текущее содержимое в файл.
     * @throws PersistenceError при ошибке записи
     * @throws nlohmann::json::exception при ошибке сериализации
     */
    void save();

    /// @throws PersistenceError если файл не удалось удалить
    void deleteFile();

    const std::filesystem::path& path() const { return file_.path(); }
    const std::string& name() const { return file_.config().name; }

    static ToPersisted defaultToPersisted() {
        if constexpr (std::is_same_v<Value, PersistedValue>) {
            return [](const Value& value) { return std::optional<PersistedValue>(value); };
        } else {
            return [](const Value& value) { return ValueCast<PersistedValue>::from(value); };
        }
    }

    static FromPersisted defaultFromPersisted() {
        if constexpr (std::is_same_v<Value, PersistedValue> || std::is_constructible_v<Value, const PersistedValue&>) {
            return [](const PersistedValue& value) { return std::optional<Value>(Value(value)); };
        } else {
            return [](const PersistedValue& value) { return ValueCast<Value>::from(value); };
        }
    }

private:
    void load();

    CacheFile file_;
    ToPersisted toPersisted_;
    FromPersisted fromPersisted_;
    KeyValueStore<Key, Value> store_;
    std::mutex fileMutex_;
};

// Реализация шаблонного класса

template<typename Key, typename Value, typename PersistedValue>
PersistableCache<Key, Value, PersistedValue>::PersistableCache(PersistenceConfig config,
                                                               Snapshot initialValues,
                                                               ToPersisted toPersisted,
                                                               FromPersisted fromPersisted)
    : file_(std::move(config))
    , toPersisted_(std::move(toPersisted))
    , fromPersisted_(std::move(fromPersisted)) {
    load();
    for (auto& [key, value] : initialValues) {
        store_.set(key, std::move(value));
    }
}

template<typename Key, typename Value, typename PersistedValue>
void PersistableCache<Key, Value, PersistedValue>::load() {
    std::optional<nlohmann::json> values;
    try {
        values = file_.read();
    } catch (const std::exception& e) {
        logging::logger()->warn("PersistableCache: файл {} не загружен: {}", file_.path().string(), e.what());
        return;
    }
    if (!values) {
        return;
    }

    size_t skipped = 0;
    for (auto it = values->begin(); it != values->end(); ++it) {
        try {
            Key key = detail::decodeKey<Key>(it.key());
            auto value = fromPersisted_(it.value().template get<PersistedValue>());
            if (!value) {
                ++skipped;
                continue;
            }
            store_.set(key, std::move(*value));
        } catch (const nlohmann::json::exception& e) {
            ++skipped;
            logging::logger()->debug("PersistableCache: запись '{}' пропущена: {}", it.key(), e.what());
        }
    }
    logging::logger()->debug("PersistableCache: загружено {} записей из {} (пропущено {})",
                             store_.size(), file_.path().string(), skipped);
}

template<typename Key, typename Value, typename PersistedValue>
void PersistableCache<Key, Value, PersistedValue>::save() {
    std::lock_guard<std::mutex> lock(fileMutex_);
    nlohmann::json values = nlohmann::json::object();
    for (const auto& [key, value] : store_.allValues()) {
        if (auto persisted = toPersisted_(value)) {
            values[detail::encodeKey(key)] = *persisted;
        }
    }
    try {
        file_.write(values);
    } catch (const PersistenceError& e) {
        logging::logger()->error("PersistableCache: ошибка сохранения: {}", e.what());
        throw;
    }
}

template<typename Key, typename Value, typename PersistedValue>
void PersistableCache<Key, Value, PersistedValue>::deleteFile() {
    std::lock_guard<std::mutex> lock(fileMutex_);
    try {
        file_.remove();
    } catch (const PersistenceError& e) {
        logging::logger()->error("PersistableCache: ошибка удаления: {}", e.what());
        throw;
    }
}

} // namespace cache
} // namespace core
} // namespace tiercache
