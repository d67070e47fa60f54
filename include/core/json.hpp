#pragma once

#include <glaze/glaze.hpp>

#include <cmath>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace vecture {

/**
 * @brief Read-only view over a parsed glz::json_t document
 *
 * Stores json_t by value. Element access returns copies and never throws;
 * a missing key or wrong type yields a null value. Typed accessors return
 * nullopt instead of throwing so key-file decoding can map every shape
 * problem to an error code.
 */
class JsonValue {
public:
    using array_t = glz::json_t::array_t;
    using object_t = glz::json_t::object_t;

    struct parse_error : std::runtime_error {
        using std::runtime_error::runtime_error;
    };

    JsonValue() = default;
    JsonValue(glz::json_t v) : data_(std::move(v)) {}

    // ===== Type Checks =====

    [[nodiscard]] bool is_object() const { return data_.is_object(); }
    [[nodiscard]] bool is_array() const { return data_.is_array(); }

    // ===== Container Properties =====

    [[nodiscard]] size_t size() const {
        if (data_.is_array()) return data_.get_array().size();
        if (data_.is_object()) return data_.get_object().size();
        return 0;
    }

    // ===== Const Element Access (returns copy) =====

    [[nodiscard]] JsonValue operator[](std::string_view key) const {
        if (!data_.is_object()) return {};
        const auto& obj = data_.get_object();
        auto it = obj.find(std::string(key));
        if (it != obj.end()) return JsonValue(it->second);
        return {};
    }

    [[nodiscard]] JsonValue operator[](size_t idx) const {
        if (!data_.is_array()) return {};
        const auto& arr = data_.get_array();
        if (idx < arr.size()) return JsonValue(arr[idx]);
        return {};
    }

    // ===== Typed Extraction (nullopt on type mismatch) =====

    [[nodiscard]] std::optional<std::string> as_string() const {
        if (!data_.is_string()) return std::nullopt;
        return data_.get_string();
    }

    [[nodiscard]] std::optional<bool> as_bool() const {
        if (!data_.is_boolean()) return std::nullopt;
        return data_.get_boolean();
    }

    // Non-negative integral number (json_t stores all numbers as double)
    [[nodiscard]] std::optional<uint64_t> as_uint() const {
        if (!data_.is_number()) return std::nullopt;
        const double d = data_.get_number();
        if (!std::isfinite(d) || d < 0 || d != std::floor(d) || d > 9007199254740992.0) {
            return std::nullopt;
        }
        return static_cast<uint64_t>(d);
    }

    [[nodiscard]] std::optional<std::string> string_at(std::string_view key) const {
        return (*this)[key].as_string();
    }

    [[nodiscard]] std::optional<uint64_t> uint_at(std::string_view key) const {
        return (*this)[key].as_uint();
    }

    [[nodiscard]] std::optional<bool> bool_at(std::string_view key) const {
        return (*this)[key].as_bool();
    }

    // ===== Static Factories =====

    [[nodiscard]] static JsonValue parse(const std::string& json_str) {
        glz::json_t result;
        auto ec = glz::read_json(result, json_str);
        if (ec) {
            throw parse_error("JSON parse error");
        }
        return JsonValue(std::move(result));
    }

private:
    glz::json_t data_{};
};

} // namespace vecture
