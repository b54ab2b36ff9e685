#pragma once

#include <any>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include "tiercache/core/cache/base/Cacheable.hpp"
#include "tiercache/core/logging/Logging.hpp"

namespace tiercache {
namespace core {
namespace cache {

/**
 * @brief Кэш с любым типом значения, приведённый к Cacheable<Key, std::any>.
 * @details Позволяет собрать в один конвейер кэши с разными типами значений:
 *          чтение упаковывает значение в std::any, запись распаковывает
 *          std::any в тип значения обёрнутого кэша. Запись несовместимого
 *          значения молча игнорируется (только debug-лог).
 * @tparam Key Тип ключа
 */
template<typename Key>
class AnyCacheable : public Cacheable<Key, std::any> {
public:
    using KeySet = typename Cacheable<Key, std::any>::KeySet;
    using Snapshot = typename Cacheable<Key, std::any>::Snapshot;
    using ValueMatcher = typename Cacheable<Key, std::any>::ValueMatcher;

    template<typename Cache>
    explicit AnyCacheable(std::shared_ptr<Cache> cache)
        : impl_(std::make_shared<Model<typename Cache::DataType>>(std::move(cache))) {
        static_assert(std::is_base_of_v<Cacheable<Key, typename Cache::DataType>, Cache>,
                      "Cache must implement Cacheable<Key, Value>");
    }

    std::optional<std::any> fetch(const Key& key, const ValueMatcher& matcher) override {
        return impl_->fetch(key, matcher);
    }
    std::any fetchRequired(const Key& key, const ValueMatcher& matcher) override {
        return impl_->fetchRequired(key, matcher);
    }
    void set(const Key& key, const std::any& value) override { impl_->set(key, value); }
    void remove(const Key& key) override { impl_->remove(key); }
    bool contains(const Key& key) override { return impl_->contains(key); }
    void clear() override { impl_->clear(); }
    size_t size() const override { return impl_->size(); }
    Snapshot snapshot(const ValueMatcher& matcher) const override { return impl_->snapshot(matcher); }
    KeySet missingKeys(const KeySet& keys) override { return impl_->missingKeys(keys); }

    /// Имя типа значения обёрнутого кэша.
    std::string valueTypeName() const { return impl_->valueTypeName(); }

    /// Обёрнутый кэш, если его тип значения — Value.
    template<typename Value>
    std::shared_ptr<Cacheable<Key, Value>> unwrap() const {
        if (auto model = std::dynamic_pointer_cast<Model<Value>>(impl_)) {
            return model->cache;
        }
        return nullptr;
    }

private:
    struct Concept {
        virtual ~Concept() = default;
        virtual std::optional<std::any> fetch(const Key& key, const ValueMatcher& matcher) = 0;
        virtual std::any fetchRequired(const Key& key, const ValueMatcher& matcher) = 0;
        virtual void set(const Key& key, const std::any& value) = 0;
        virtual void remove(const Key& key) = 0;
        virtual bool contains(const Key& key) = 0;
        virtual void clear() = 0;
        virtual size_t size() const = 0;
        virtual Snapshot snapshot(const ValueMatcher& matcher) const = 0;
        virtual KeySet missingKeys(const KeySet& keys) = 0;
        virtual std::string valueTypeName() const = 0;
    };

    template<typename Value>
    struct Model : Concept {
        using InnerMatcher = typename Cacheable<Key, Value>::ValueMatcher;

        explicit Model(std::shared_ptr<Cacheable<Key, Value>> inner) : cache(std::move(inner)) {
            if (!cache) {
                throw std::invalid_argument("AnyCacheable: cache is null");
            }
        }

        static std::any box(const Value& value) {
            if constexpr (std::is_same_v<Value, std::any>) {
                return value;
            } else {
                return std::any(value);
            }
        }

        static InnerMatcher translate(const ValueMatcher& matcher) {
            if (!matcher) {
                return InnerMatcher{};
            }
            if constexpr (std::is_same_v<Value, std::any>) {
                return matcher;
            } else {
                return [&matcher](const Value& value) { return matcher(box(value)); };
            }
        }

        std::optional<std::any> fetch(const Key& key, const ValueMatcher& matcher) override {
            auto value = cache->fetch(key, translate(matcher));
            if (!value) {
                return std::nullopt;
            }
            return box(*value);
        }

        std::any fetchRequired(const Key& key, const ValueMatcher& matcher) override {
            return box(cache->fetchRequired(key, translate(matcher)));
        }

        void set(const Key& key, const std::any& value) override {
            if (auto typed = ValueCast<Value>::from(value)) {
                cache->set(key, *typed);
                return;
            }
            logging::logger()->debug("AnyCacheable: запись '{}' пропущена: {} не приводится к {}",
                                     describeKey(key), describeType(value), typeName<Value>());
        }

        void remove(const Key& key) override { cache->remove(key); }
        bool contains(const Key& key) override { return cache->contains(key); }
        void clear() override { cache->clear(); }
        size_t size() const override { return cache->size(); }

        Snapshot snapshot(const ValueMatcher& matcher) const override {
            Snapshot result;
            for (auto& [key, value] : cache->snapshot(translate(matcher))) {
                result.emplace(key, box(value));
            }
            return result;
        }

        KeySet missingKeys(const KeySet& keys) override { return cache->missingKeys(keys); }

        std::string valueTypeName() const override { return typeName<Value>(); }

        std::shared_ptr<Cacheable<Key, Value>> cache;
    };

    std::shared_ptr<Concept> impl_;
};

} // namespace cache
} // namespace core
} // namespace tiercache
