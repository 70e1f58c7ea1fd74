#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "wincloud/wc_status.hpp"

namespace wincloud {

struct JsonValue {
    enum class Type {
        Null,
        Bool,
        Number,
        String,
        Array,
        Object
    };

    Type type = Type::Null;
    bool bool_value = false;
    double number_value = 0.0;
    // Set when the literal had no fraction or exponent and fits in 64 bits.
    bool is_integer = false;
    long long int_value = 0;
    std::string string_value;
    std::vector<JsonValue> array_value;
    // Insertion ordered so documents are written back in a stable order.
    std::vector<std::pair<std::string, JsonValue>> object_value;

    static JsonValue MakeNull();
    static JsonValue MakeBool(bool value);
    static JsonValue MakeInt(long long value);
    static JsonValue MakeDouble(double value);
    static JsonValue MakeString(std::string value);
    static JsonValue MakeArray();
    static JsonValue MakeObject();

    bool IsNull() const {
        return type == Type::Null;
    }

    const JsonValue* Find(std::string_view key) const;

    // Replaces an existing member of the same name.
    JsonValue& Set(const std::string& key, JsonValue value);
    void Push(JsonValue value);
};

class Json {
public:
    static WcStatus Parse(std::string_view text, JsonValue& out_value);

    // |indent| of 0 writes a single line.
    static std::string Serialize(const JsonValue& value, int indent = 0);

    static std::string Escape(std::string_view input);
};

}  // namespace wincloud
