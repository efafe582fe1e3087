#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace schedview {
namespace ipc {

/**
 * Small JSON document model used by the wire protocol. Objects keep their
 * keys in insertion order so that encoding the same value always yields the
 * same bytes.
 */
class JsonValue {
public:
    enum class Type { Null, Bool, Number, String, Array, Object };

    using Array = std::vector<JsonValue>;
    using Object = std::vector<std::pair<std::string, JsonValue>>;

    JsonValue() = default;
    JsonValue(std::nullptr_t) {}
    JsonValue(bool value) : type_(Type::Bool), bool_(value) {}
    JsonValue(int value) : JsonValue(static_cast<std::int64_t>(value)) {}
    JsonValue(std::int64_t value)
        : type_(Type::Number), integral_(true), int_(value), number_(static_cast<double>(value)) {}
    JsonValue(std::uint64_t value) : JsonValue(static_cast<std::int64_t>(value)) {}
    JsonValue(double value) : type_(Type::Number), number_(value) {}
    JsonValue(const char* value) : type_(Type::String), string_(value) {}
    JsonValue(std::string value) : type_(Type::String), string_(std::move(value)) {}

    static JsonValue array() { JsonValue v; v.type_ = Type::Array; return v; }
    static JsonValue object() { JsonValue v; v.type_ = Type::Object; return v; }

    /**
     * Parse a complete JSON text. Trailing non-whitespace is an error.
     * @param text  Input document
     * @param error Receives a description on failure, may be nullptr
     */
    static std::optional<JsonValue> parse(const std::string& text, std::string* error = nullptr);

    /** Compact encoding without any whitespace. */
    std::string dump() const;

    Type type() const { return type_; }
    bool isNull() const { return type_ == Type::Null; }
    bool isBool() const { return type_ == Type::Bool; }
    bool isNumber() const { return type_ == Type::Number; }
    bool isString() const { return type_ == Type::String; }
    bool isArray() const { return type_ == Type::Array; }
    bool isObject() const { return type_ == Type::Object; }

    bool asBool() const { return bool_; }
    double asDouble() const { return number_; }
    const std::string& asString() const { return string_; }
    const Array& items() const { return array_; }
    const Object& members() const { return object_; }

    /** Integer value, if this is a number without a fractional part. */
    std::optional<std::int64_t> asInt() const;

    /** Member lookup on objects. Returns nullptr if absent or not an object. */
    const JsonValue* get(const std::string& key) const;

    /** Set or replace an object member. */
    JsonValue& set(const std::string& key, JsonValue value);

    /** Append an array element. */
    JsonValue& push(JsonValue value);

private:
    void dumpTo(std::string& out) const;

    Type type_{Type::Null};
    bool bool_{false};
    bool integral_{false};
    std::int64_t int_{0};
    double number_{0.0};
    std::string string_;
    Array array_;
    Object object_;
};

/** Quote and escape a string for JSON output. */
void appendJsonString(std::string& out, const std::string& value);

} // namespace ipc
} // namespace schedview
