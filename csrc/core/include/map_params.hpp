#pragma once

#include <algorithm>
#include <any>
#include <cctype>
#include <cstdlib>
#include <limits>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_map>
#include <utility>

namespace chunkwise {

// Process-wide defaults for chunker parameters.
// Lookup order: explicit value, registered default, CHUNKWISE_<NAME> environment variable, built-in default.
class MapParams {
public:
    using MapType = std::unordered_map<std::string, std::any>;

    explicit MapParams(std::string env_prefix = "CHUNKWISE_") : _env_prefix(std::move(env_prefix)) {}

    template <typename T>
    T get_param_value(
        const std::string_view& param_name,
        const std::optional<T>& value,
        const T& default_value) const
    {
        if (value.has_value()) return *value;
        {
            std::lock_guard<std::mutex> guard(_lock);
            auto it = _params.find(std::string(param_name));
            if (it != _params.end()) return cast_param<T>(param_name, it->second);
        }
        if (auto env = env_value(param_name)) return parse_env<T>(param_name, *env);
        return default_value;
    }

    template <typename T>
    void set_default(const std::string_view& param_name, T value) {
        std::lock_guard<std::mutex> guard(_lock);
        _params[std::string(param_name)] = std::any(value);
    }

    void set_default(const MapType& updates) {
        std::lock_guard<std::mutex> guard(_lock);
        for (const auto& entry : updates) _params[entry.first] = entry.second;
    }

    MapType get_default() const {
        std::lock_guard<std::mutex> guard(_lock);
        return _params;
    }

    template <typename T>
    std::optional<T> get_default(const std::string& param_name) const {
        std::lock_guard<std::mutex> guard(_lock);
        auto it = _params.find(param_name);
        if (it == _params.end()) return std::nullopt;
        return cast_param<T>(param_name, it->second);
    }

    void reset_default() {
        std::lock_guard<std::mutex> guard(_lock);
        _params.clear();
    }

    std::string env_name(const std::string_view& param_name) const {
        std::string name = _env_prefix + std::string(param_name);
        std::transform(name.begin(), name.end(), name.begin(),
                       [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        return name;
    }

private:
    template <typename T>
    static T cast_param(const std::string_view& param_name, const std::any& value) {
        if (const T* typed = std::any_cast<T>(&value)) return *typed;
        throw std::invalid_argument("Default parameter '" + std::string(param_name) + "' has an unexpected type.");
    }

    std::optional<std::string> env_value(const std::string_view& param_name) const {
        const char* raw = std::getenv(env_name(param_name).c_str());
        if (raw == nullptr || *raw == '\0') return std::nullopt;
        return std::string(raw);
    }

    template <typename T>
    T parse_env(const std::string_view& param_name, const std::string& raw) const {
        if constexpr (std::is_same_v<T, std::string>) {
            return raw;
        } else if constexpr (std::is_integral_v<T>) {
            try {
                size_t consumed = 0;
                const long long parsed = std::stoll(raw, &consumed);
                if (consumed != raw.size()) throw std::invalid_argument(raw);
                if (!fits_in<T>(parsed)) throw std::out_of_range(raw);
                return static_cast<T>(parsed);
            } catch (const std::exception&) {
                throw std::invalid_argument(
                    "Environment variable " + env_name(param_name) + " is not an integer in range: " + raw);
            }
        } else {
            static_assert(std::is_same_v<T, std::string> || std::is_integral_v<T>,
                          "Unsupported parameter type.");
        }
    }

    template <typename T>
    static bool fits_in(long long value) {
        if constexpr (std::is_signed_v<T>) {
            return value >= static_cast<long long>(std::numeric_limits<T>::min()) &&
                   value <= static_cast<long long>(std::numeric_limits<T>::max());
        } else {
            return value >= 0 &&
                   static_cast<unsigned long long>(value) <= static_cast<unsigned long long>(std::numeric_limits<T>::max());
        }
    }

    std::string _env_prefix;
    mutable std::mutex _lock;
    MapType _params;
};

} // namespace chunkwise
