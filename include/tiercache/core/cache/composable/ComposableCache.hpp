#pragma once

#include <any>
#include <memory>
#include <optional>
#include <stdexcept>
#include <utility>
#include <vector>
#include "tiercache/core/cache/base/KeyValueStore.hpp"
#include "tiercache/core/cache/composable/AnyCacheable.hpp"

namespace tiercache {
namespace core {
namespace cache {

/**
 * @brief Многоуровневый кэш: упорядоченный конвейер из кэшей разных типов.
 * @details Чтение идёт по ступеням в фиксированном порядке; побеждает первая
 *          ступень, у которой есть ключ совместимого типа. Несовпадение типа
 *          на ступени считается промахом. set, remove и clear применяются
 *          ко всем ступеням.
 *
 *          Список ступеней задаётся при создании и не меняется, поэтому
 *          собственной блокировки у конвейера нет: каждая ступень защищает
 *          себя сама.
 * @tparam Key Тип ключа (общий для всех ступеней)
 */
template<typename Key>
class ComposableCache : public Cacheable<Key, std::any> {
public:
    using KeySet = typename Cacheable<Key, std::any>::KeySet;
    using Snapshot = typename Cacheable<Key, std::any>::Snapshot;
    using ValueMatcher = typename Cacheable<Key, std::any>::ValueMatcher;
    using Stage = std::shared_ptr<AnyCacheable<Key>>;

    explicit ComposableCache(std::vector<Stage> stages);
    /// Одна ступень: KeyValueStore<Key, std::any> с начальными значениями.
    explicit ComposableCache(Snapshot initialValues);

    /// Собрать конвейер из кэшей с любыми типами значений.
    template<typename... Caches>
    static std::shared_ptr<ComposableCache> of(std::shared_ptr<Caches>... caches) {
        return std::make_shared<ComposableCache>(
            std::vector<Stage>{std::make_shared<AnyCacheable<Key>>(std::move(caches))...});
    }

    std::optional<std::any> fetch(const Key& key, const ValueMatcher& matcher) override;
    std::any fetchRequired(const Key& key, const ValueMatcher& matcher) override;
    void set(const Key& key, const std::any& value) override;
    void remove(const Key& key) override;
    bool contains(const Key& key) override;
    void clear() override;
    /// Размер первой ступени.
    size_t size() const override;
    /// Первый непустой снимок по порядку ступеней.
    Snapshot snapshot(const ValueMatcher& matcher) const override;
    /// Объединение отсутствующих ключей всех ступеней.
    KeySet missingKeys(const KeySet& keys) override;

    const std::vector<Stage>& stages() const { return stages_; }

private:
    const std::vector<Stage> stages_;
};

// Реализация шаблонного класса

template<typename Key>
ComposableCache<Key>::ComposableCache(std::vector<Stage> stages)
    : stages_(std::move(stages)) {
    for (const auto& stage : stages_) {
        if (!stage) {
            throw std::invalid_argument("ComposableCache: stage is null");
        }
    }
}

template<typename Key>
ComposableCache<Key>::ComposableCache(Snapshot initialValues)
    : ComposableCache(std::vector<Stage>{std::make_shared<AnyCacheable<Key>>(
          std::make_shared<KeyValueStore<Key, std::any>>(std::move(initialValues)))}) {}

template<typename Key>
std::optional<std::any> ComposableCache<Key>::fetch(const Key& key, const ValueMatcher& matcher) {
    for (const auto& stage : stages_) {
        if (auto value = stage->fetch(key, matcher)) {
            return value;
        }
    }
    return std::nullopt;
}

template<typename Key>
std::any ComposableCache<Key>::fetchRequired(const Key& key, const ValueMatcher& matcher) {
    if (auto value = fetch(key, matcher)) {
        return std::move(*value);
    }
    if (matcher) {
        // Ни одна ступень не дала совместимого значения. Если ключ где-то
        // есть, возвращаем его, и resolve сообщит о несовпадении типа.
        for (const auto& stage : stages_) {
            if (auto value = stage->fetch(key, ValueMatcher{})) {
                return std::move(*value);
            }
        }
    }
    throw MissingRequiredKeysError<Key>(KeySet{key});
}

template<typename Key>
void ComposableCache<Key>::set(const Key& key, const std::any& value) {
    for (const auto& stage : stages_) {
        stage->set(key, value);
    }
}

template<typename Key>
void ComposableCache<Key>::remove(const Key& key) {
    for (const auto& stage : stages_) {
        stage->remove(key);
    }
}

template<typename Key>
bool ComposableCache<Key>::contains(const Key& key) {
    for (const auto& stage : stages_) {
        if (stage->contains(key)) {
            return true;
        }
    }
    return false;
}

template<typename Key>
void ComposableCache<Key>::clear() {
    for (const auto& stage : stages_) {
        stage->clear();
    }
}

template<typename Key>
size_t ComposableCache<Key>::size() const {
    return stages_.empty() ? 0 : stages_.front()->size();
}

template<typename Key>
typename ComposableCache<Key>::Snapshot
ComposableCache<Key>::snapshot(const ValueMatcher& matcher) const {
    for (const auto& stage : stages_) {
        auto values = stage->snapshot(matcher);
        if (!values.empty()) {
            return values;
        }
    }
    return {};
}

template<typename Key>
typename ComposableCache<Key>::KeySet
ComposableCache<Key>::missingKeys(const KeySet& keys) {
    KeySet missing;
    for (const auto& stage : stages_) {
        auto stageMissing = stage->missingKeys(keys);
        missing.insert(stageMissing.begin(), stageMissing.end());
    }
    return missing;
}

} // namespace cache
} // namespace core
} // namespace tiercache
