//! # JSON Value Implementation
//!
//! Equality and deep copy for `JsonValue`. Accessors are inline in the
//! header and serialization lives in `json_serializer.cpp`.
//!
//! ## Equality Semantics
//!
//! | Type     | Comparison Rule                                    |
//! |----------|----------------------------------------------------|
//! | `null`   | All nulls are equal                                |
//! | `bool`   | Standard boolean comparison                        |
//! | `number` | Same kind and same value (`1` != `1.0`)            |
//! | `string` | Byte-by-byte comparison                            |
//! | `array`  | Element-by-element in order                        |
//! | `object` | Same key set with equal values (order independent) |

#include "json/json_value.hpp"

namespace knit::json {

auto JsonValue::operator==(const JsonValue& other) const -> bool {
    if (data.index() != other.data.index()) {
        return false;
    }

    if (is_null()) {
        return true;
    }

    if (is_bool()) {
        return as_bool() == other.as_bool();
    }

    if (is_number()) {
        return as_number() == other.as_number();
    }

    if (is_string()) {
        return as_string() == other.as_string();
    }

    if (is_array()) {
        const auto& arr1 = as_array();
        const auto& arr2 = other.as_array();
        if (arr1.size() != arr2.size()) {
            return false;
        }
        for (size_t i = 0; i < arr1.size(); ++i) {
            if (arr1[i] != arr2[i]) {
                return false;
            }
        }
        return true;
    }

    if (is_object()) {
        const auto& obj1 = as_object();
        const auto& obj2 = other.as_object();
        if (obj1.size() != obj2.size()) {
            return false;
        }
        for (const auto& [key, val] : obj1) {
            auto it = obj2.find(key);
            if (it == obj2.end() || it->second != val) {
                return false;
            }
        }
        return true;
    }

    return false;
}

auto JsonValue::clone() const -> JsonValue {
    if (is_bool()) {
        return JsonValue(as_bool());
    }
    if (is_number()) {
        return JsonValue(as_number());
    }
    if (is_string()) {
        return JsonValue(as_string());
    }
    if (is_array()) {
        JsonArray arr;
        arr.reserve(as_array().size());
        for (const auto& elem : as_array()) {
            arr.push_back(elem.clone());
        }
        return JsonValue(std::move(arr));
    }
    if (is_object()) {
        JsonObject obj;
        for (const auto& [key, val] : as_object()) {
            obj.emplace(key, val.clone());
        }
        return JsonValue(std::move(obj));
    }
    return JsonValue();
}

} // namespace knit::json
