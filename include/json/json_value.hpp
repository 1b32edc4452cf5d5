//! # JSON Value Types
//!
//! This module provides the typed output model of the JSON grammar:
//! `JsonNumber` for the two number variants and `JsonValue` as a variant type
//! for all JSON values.
//!
//! ## Features
//!
//! - **Integer precision**: Numbers without a fractional part are stored as `int64_t`
//! - **Type discrimination**: Query and access values by their JSON type
//! - **Exclusive ownership**: Arrays and objects own their children through `Box`;
//!   values are move-only and `clone()` makes a deep copy
//! - **Factory functions**: Convenient `json_*()` functions for creating values
//!
//! ## Number Handling
//!
//! | JSON Input | Storage Type | Reason                 |
//! |------------|--------------|------------------------|
//! | `42`       | `Int`        | No decimal point       |
//! | `-7`       | `Int`        | No decimal point       |
//! | `3.14`     | `Float`      | Has decimal point      |
//!
//! `Int(1)` and `Float(1.0)` are different values.
//!
//! ## Strings
//!
//! A string value holds the raw content of a JSON string literal: the grammar
//! does not decode escapes and the serializer writes the content back
//! verbatim. Code that builds values from arbitrary text runs it through
//! `escape_string` first, so the serialized output stays valid JSON.
//!
//! ## Objects
//!
//! Keys are unique within one object. When a document repeats a key, the last
//! occurrence wins. Object equality ignores key order.
//!
//! ## Example
//!
//! ```cpp
//! #include "json/json_value.hpp"
//! using namespace knit::json;
//!
//! JsonObject obj;
//! obj["name"] = json_string("Alice");
//! obj["age"] = json_int(30);
//! JsonValue person(std::move(obj));
//!
//! if (auto* name = person.get("name"); name && name->is_string()) {
//!     std::cout << name->as_string() << std::endl;
//! }
//! ```

#pragma once

#include "common.hpp"

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace knit::json {

// ============================================================================
// Forward Declarations and Type Aliases
// ============================================================================

struct JsonValue;

/// A JSON array containing ordered values.
using JsonArray = std::vector<JsonValue>;

/// A JSON object mapping unique keys to values (ordered by key).
using JsonObject = std::map<std::string, JsonValue>;

// ============================================================================
// JsonNumber
// ============================================================================

/// Discriminated union for JSON numbers.
///
/// A number is either `Int` (signed 64-bit) or `Float` (IEEE 754 double). The
/// parser decides by the presence of a fractional part.
///
/// # Example
///
/// ```cpp
/// JsonNumber i(int64_t{42});   // Int
/// JsonNumber f(3.14);          // Float
///
/// assert(i.is_integer());
/// assert(f.is_float());
/// double d = i.as_f64();       // lossy for |i| > 2^53
/// ```
struct JsonNumber {
    /// The storage kind for this number.
    enum class Kind : uint8_t {
        Int,  ///< Signed 64-bit integer (`i64` field)
        Float ///< IEEE 754 double precision float (`f64` field)
    };

    /// The storage kind for this number.
    Kind kind;

    /// The number value (only one field is active based on `kind`).
    union {
        int64_t i64; ///< Active when `kind == Kind::Int`
        double f64;  ///< Active when `kind == Kind::Float`
    };

    /// Constructs an `Int` number.
    explicit JsonNumber(int64_t value) : kind(Kind::Int), i64(value) {}

    /// Constructs a `Float` number.
    explicit JsonNumber(double value) : kind(Kind::Float), f64(value) {}

    /// Default constructor creates zero as `Int`.
    JsonNumber() : kind(Kind::Int), i64(0) {}

    [[nodiscard]] auto is_integer() const -> bool {
        return kind == Kind::Int;
    }

    [[nodiscard]] auto is_float() const -> bool {
        return kind == Kind::Float;
    }

    /// Returns the integer value, or `std::nullopt` for a `Float`.
    [[nodiscard]] auto try_as_i64() const -> std::optional<int64_t> {
        if (kind == Kind::Int) {
            return i64;
        }
        return std::nullopt;
    }

    /// Gets the value as `double`.
    ///
    /// Always succeeds; integers beyond 2^53 lose precision.
    [[nodiscard]] auto as_f64() const -> double {
        switch (kind) {
        case Kind::Int:
            return static_cast<double>(i64);
        case Kind::Float:
            return f64;
        }
        return 0.0;
    }

    /// Two numbers are equal when they have the same kind and the same value.
    [[nodiscard]] auto operator==(const JsonNumber& other) const -> bool {
        if (kind != other.kind) {
            return false;
        }
        switch (kind) {
        case Kind::Int:
            return i64 == other.i64;
        case Kind::Float:
            return f64 == other.f64;
        }
        return false;
    }

    [[nodiscard]] auto operator!=(const JsonNumber& other) const -> bool {
        return !(*this == other);
    }
};

// ============================================================================
// JsonValue
// ============================================================================

/// JSON value variant type representing any JSON value.
///
/// # Type Hierarchy
///
/// | JSON Type    | C++ Storage       | Query Method  | Accessor                     |
/// |--------------|-------------------|---------------|------------------------------|
/// | `null`       | `std::monostate`  | `is_null()`   | -                            |
/// | `true/false` | `bool`            | `is_bool()`   | `as_bool()`                  |
/// | number       | `JsonNumber`      | `is_number()` | `as_number()`, `as_i64()`    |
/// | string       | `std::string`     | `is_string()` | `as_string()`                |
/// | array        | `Box<JsonArray>`  | `is_array()`  | `as_array()`, `operator[]`   |
/// | object       | `Box<JsonObject>` | `is_object()` | `as_object()`, `get()`       |
///
/// Arrays and objects are boxed so the variant can contain itself. Each child
/// is owned by exactly one parent; the tree has no sharing and no cycles.
///
/// Accessors (`as_*`) throw `std::bad_variant_access` on a type mismatch, the
/// same way `unwrap` does on a `Result`.
struct JsonValue {
    /// The null type (empty state).
    using Null = std::monostate;

    /// The variant type holding all possible JSON values.
    using ValueVariant = std::variant<Null,             // null
                                      bool,             // boolean
                                      JsonNumber,       // number
                                      std::string,      // string
                                      Box<JsonArray>,   // array (boxed)
                                      Box<JsonObject>>; // object (boxed)

    /// The underlying variant storage.
    ValueVariant data;

    // ========================================================================
    // Constructors
    // ========================================================================

    /// Default constructor creates a `null` value.
    JsonValue() : data(Null{}) {}

    explicit JsonValue(std::nullptr_t) : data(Null{}) {}

    explicit JsonValue(bool value) : data(value) {}

    /// Constructs an `Int` from `int`.
    explicit JsonValue(int value) : data(JsonNumber(static_cast<int64_t>(value))) {}

    explicit JsonValue(int64_t value) : data(JsonNumber(value)) {}

    explicit JsonValue(double value) : data(JsonNumber(value)) {}

    explicit JsonValue(const char* value) : data(std::string(value)) {}

    explicit JsonValue(std::string value) : data(std::move(value)) {}

    explicit JsonValue(std::string_view value) : data(std::string(value)) {}

    explicit JsonValue(JsonArray value) : data(make_box<JsonArray>(std::move(value))) {}

    explicit JsonValue(JsonObject value) : data(make_box<JsonObject>(std::move(value))) {}

    explicit JsonValue(JsonNumber value) : data(value) {}

    // ========================================================================
    // Type Queries
    // ========================================================================

    [[nodiscard]] auto is_null() const -> bool {
        return std::holds_alternative<Null>(data);
    }

    [[nodiscard]] auto is_bool() const -> bool {
        return std::holds_alternative<bool>(data);
    }

    [[nodiscard]] auto is_number() const -> bool {
        return std::holds_alternative<JsonNumber>(data);
    }

    [[nodiscard]] auto is_string() const -> bool {
        return std::holds_alternative<std::string>(data);
    }

    [[nodiscard]] auto is_array() const -> bool {
        return std::holds_alternative<Box<JsonArray>>(data);
    }

    [[nodiscard]] auto is_object() const -> bool {
        return std::holds_alternative<Box<JsonObject>>(data);
    }

    /// Returns `true` if this is an `Int` number.
    [[nodiscard]] auto is_integer() const -> bool {
        if (auto* num = std::get_if<JsonNumber>(&data)) {
            return num->is_integer();
        }
        return false;
    }

    /// Returns `true` if this is a `Float` number.
    [[nodiscard]] auto is_float() const -> bool {
        if (auto* num = std::get_if<JsonNumber>(&data)) {
            return num->is_float();
        }
        return false;
    }

    // ========================================================================
    // Accessors
    // ========================================================================

    [[nodiscard]] auto as_bool() const -> bool {
        return std::get<bool>(data);
    }

    [[nodiscard]] auto as_number() const -> const JsonNumber& {
        return std::get<JsonNumber>(data);
    }

    [[nodiscard]] auto as_string() const -> const std::string& {
        return std::get<std::string>(data);
    }

    [[nodiscard]] auto as_array() const -> const JsonArray& {
        return *std::get<Box<JsonArray>>(data);
    }

    [[nodiscard]] auto as_object() const -> const JsonObject& {
        return *std::get<Box<JsonObject>>(data);
    }

    /// Gets an `Int` value.
    ///
    /// # Panics
    ///
    /// Throws `std::bad_variant_access` if the value is not an `Int` number.
    [[nodiscard]] auto as_i64() const -> int64_t {
        auto opt = as_number().try_as_i64();
        if (!opt) {
            throw std::bad_variant_access();
        }
        return *opt;
    }

    /// Gets any number as `double`.
    [[nodiscard]] auto as_f64() const -> double {
        return as_number().as_f64();
    }

    // ========================================================================
    // Container Access
    // ========================================================================

    /// Looks up a key in an object.
    ///
    /// Returns `nullptr` if this is not an object or the key is absent.
    [[nodiscard]] auto get(const std::string& key) const -> const JsonValue* {
        if (auto* obj = std::get_if<Box<JsonObject>>(&data)) {
            auto it = (*obj)->find(key);
            if (it != (*obj)->end()) {
                return &it->second;
            }
        }
        return nullptr;
    }

    /// Returns `true` if this is an object containing `key`.
    [[nodiscard]] auto contains(const std::string& key) const -> bool {
        return get(key) != nullptr;
    }

    /// Indexes an array.
    ///
    /// # Panics
    ///
    /// Throws `std::bad_variant_access` if not an array and `std::out_of_range`
    /// if the index is past the end.
    [[nodiscard]] auto operator[](size_t index) const -> const JsonValue& {
        return as_array().at(index);
    }

    /// Element count of an array or object, 0 for scalars.
    [[nodiscard]] auto size() const -> size_t {
        if (auto* arr = std::get_if<Box<JsonArray>>(&data)) {
            return (*arr)->size();
        }
        if (auto* obj = std::get_if<Box<JsonObject>>(&data)) {
            return (*obj)->size();
        }
        return 0;
    }

    // ========================================================================
    // Serialization
    // ========================================================================

    /// Serializes to a compact JSON string (no whitespace).
    ///
    /// Strings are written verbatim between quotes, mirroring the parser
    /// which takes string content literally.
    [[nodiscard]] auto to_string() const -> std::string;

    /// Serializes with newlines and `indent` spaces per nesting level.
    [[nodiscard]] auto to_string_pretty(int indent = 2) const -> std::string;

    /// Writes the compact form to a stream.
    auto write_to(std::ostream& os) const -> std::ostream&;

    // ========================================================================
    // Cloning
    // ========================================================================

    /// Creates a deep copy of this value.
    ///
    /// Copy construction is disabled because arrays and objects are boxed.
    [[nodiscard]] auto clone() const -> JsonValue;

    // ========================================================================
    // Comparison
    // ========================================================================

    /// Structural equality. Values of different types are never equal and
    /// object comparison ignores key order.
    [[nodiscard]] auto operator==(const JsonValue& other) const -> bool;

    [[nodiscard]] auto operator!=(const JsonValue& other) const -> bool {
        return !(*this == other);
    }
};

/// Streams the compact form of `value`.
auto operator<<(std::ostream& os, const JsonValue& value) -> std::ostream&;

// ============================================================================
// Factory Functions
// ============================================================================

inline auto json_null() -> JsonValue {
    return JsonValue();
}

inline auto json_bool(bool value) -> JsonValue {
    return JsonValue(value);
}

inline auto json_int(int64_t value) -> JsonValue {
    return JsonValue(value);
}

inline auto json_float(double value) -> JsonValue {
    return JsonValue(value);
}

inline auto json_string(std::string value) -> JsonValue {
    return JsonValue(std::move(value));
}

/// Encodes plain text as string-literal content.
///
/// `"` and `\` are backslash-escaped, control characters use `\b`, `\f`,
/// `\n`, `\r`, `\t` or `\u00XX`. Other bytes, UTF-8 included, pass through.
///
/// # Example
///
/// ```cpp
/// escape_string("say \"hi\"\n");  // say \"hi\"\n  (with literal backslashes)
/// ```
[[nodiscard]] auto escape_string(std::string_view text) -> std::string;

/// Creates an empty array.
inline auto json_array() -> JsonValue {
    return JsonValue(JsonArray{});
}

/// Creates an empty object.
inline auto json_object() -> JsonValue {
    return JsonValue(JsonObject{});
}

} // namespace knit::json
