#pragma once
#include <cmath>
#include <cstdint>
#include <algorithm>
#include <functional>
#include <initializer_list>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace retrace::dom {

    using OptionValue = std::variant<std::monostate, bool, std::int64_t, double, std::string>;

    // Extra parameters carried by a transition and handed back to the browser on replay.
    // Ordered so that equality, hashing and export are independent of insertion order.
    class Options {
      public:
        using Map = std::map<std::string, OptionValue>;
        using const_iterator = Map::const_iterator;

        Options() = default;
        Options(std::initializer_list<std::pair<const std::string, OptionValue>> values) : values_(values) {}

        template <typename T> inline void set(const std::string &key, T value) {
            values_[key] = toValue(std::move(value));
        }

        template <typename T> inline std::optional<T> get(const std::string &key) const {
            auto it = values_.find(key);
            if (it == values_.end()) {
                return std::nullopt;
            }

            if constexpr (std::is_same_v<T, OptionValue>) {
                return it->second;
            } else if constexpr (std::is_same_v<T, bool>) {
                if (auto *v = std::get_if<bool>(&it->second))
                    return *v;
            } else if constexpr (std::is_integral_v<T>) {
                if (auto *v = std::get_if<std::int64_t>(&it->second)) {
                    if (!std::in_range<T>(*v))
                        return std::nullopt;
                    return static_cast<T>(*v);
                }
            } else if constexpr (std::is_floating_point_v<T>) {
                if (auto *v = std::get_if<double>(&it->second))
                    return static_cast<T>(*v);
            } else if constexpr (std::is_same_v<T, std::string>) {
                if (auto *v = std::get_if<std::string>(&it->second))
                    return *v;
            } else {
                static_assert(sizeof(T) == 0, "Unsupported option type");
            }
            return std::nullopt;
        }

        inline bool has(const std::string &key) const { return values_.find(key) != values_.end(); }

        inline bool remove(const std::string &key) { return values_.erase(key) > 0; }

        inline void clear() { values_.clear(); }

        inline std::vector<std::string> keys() const {
            std::vector<std::string> result;
            result.reserve(values_.size());
            for (const auto &[key, value] : values_) {
                result.push_back(key);
            }
            return result;
        }

        size_t size() const { return values_.size(); }
        bool empty() const { return values_.empty(); }

        const_iterator begin() const { return values_.begin(); }
        const_iterator end() const { return values_.end(); }

        // NaN options compare equal to NaN so a transition stays equal to its copies
        bool operator==(const Options &other) const {
            return std::equal(values_.begin(), values_.end(), other.values_.begin(), other.values_.end(),
                              [](const auto &lhs, const auto &rhs) {
                                  return lhs.first == rhs.first && sameValue(lhs.second, rhs.second);
                              });
        }
        bool operator!=(const Options &other) const { return !(*this == other); }

        inline size_t hash() const {
            size_t seed = values_.size();
            for (const auto &[key, value] : values_) {
                hashCombine(seed, std::hash<std::string>{}(key));
                hashCombine(seed, value.index());
                hashCombine(seed, std::visit(ValueHasher{}, value));
            }
            return seed;
        }

        static inline void hashCombine(size_t &seed, size_t value) {
            seed ^= value + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
        }

        static inline bool sameValue(const OptionValue &lhs, const OptionValue &rhs) {
            auto *l = std::get_if<double>(&lhs);
            auto *r = std::get_if<double>(&rhs);
            if (l && r && std::isnan(*l) && std::isnan(*r)) {
                return true;
            }
            return lhs == rhs;
        }

      private:
        struct ValueHasher {
            size_t operator()(std::monostate) const { return 0; }
            size_t operator()(bool v) const { return std::hash<bool>{}(v); }
            size_t operator()(std::int64_t v) const { return std::hash<std::int64_t>{}(v); }
            size_t operator()(double v) const {
                // Every NaN payload and both zeros must land on one hash, matching sameValue()
                if (std::isnan(v))
                    return 0x7ff8;
                if (v == 0.0)
                    return 0;
                return std::hash<double>{}(v);
            }
            size_t operator()(const std::string &v) const { return std::hash<std::string>{}(v); }
        };

        template <typename T> static OptionValue toValue(T value) {
            using V = std::decay_t<T>;
            if constexpr (std::is_same_v<V, OptionValue> || std::is_same_v<V, std::monostate>) {
                return OptionValue(std::move(value));
            } else if constexpr (std::is_same_v<V, bool>) {
                return OptionValue(value);
            } else if constexpr (std::is_integral_v<V>) {
                return OptionValue(static_cast<std::int64_t>(value));
            } else if constexpr (std::is_floating_point_v<V>) {
                return OptionValue(static_cast<double>(value));
            } else if constexpr (std::is_same_v<V, std::string>) {
                return OptionValue(std::move(value));
            } else if constexpr (std::is_convertible_v<V, std::string_view>) {
                if constexpr (std::is_pointer_v<V>) {
                    if (value == nullptr) {
                        throw std::invalid_argument("Option value cannot be a null string");
                    }
                }
                return OptionValue(std::string(std::string_view(value)));
            } else {
                static_assert(sizeof(V) == 0, "Unsupported option type");
            }
        }

        Map values_;
    };

} // namespace retrace::dom

template <> struct std::hash<retrace::dom::Options> {
    size_t operator()(const retrace::dom::Options &options) const noexcept { return options.hash(); }
};
