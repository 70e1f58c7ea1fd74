#include "wincloud/json_value.hpp"

#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdio>
#include <cstdlib>

namespace wincloud {

namespace {

constexpr int kMaxDepth = 64;

void AppendUtf8(const std::uint32_t codepoint, std::string& out) {
    if (codepoint <= 0x7FU) {
        out.push_back(static_cast<char>(codepoint));
    } else if (codepoint <= 0x7FFU) {
        out.push_back(static_cast<char>(0xC0U | (codepoint >> 6U)));
        out.push_back(static_cast<char>(0x80U | (codepoint & 0x3FU)));
    } else if (codepoint <= 0xFFFFU) {
        out.push_back(static_cast<char>(0xE0U | (codepoint >> 12U)));
        out.push_back(static_cast<char>(0x80U | ((codepoint >> 6U) & 0x3FU)));
        out.push_back(static_cast<char>(0x80U | (codepoint & 0x3FU)));
    } else {
        out.push_back(static_cast<char>(0xF0U | (codepoint >> 18U)));
        out.push_back(static_cast<char>(0x80U | ((codepoint >> 12U) & 0x3FU)));
        out.push_back(static_cast<char>(0x80U | ((codepoint >> 6U) & 0x3FU)));
        out.push_back(static_cast<char>(0x80U | (codepoint & 0x3FU)));
    }
}

class JsonParser {
public:
    explicit JsonParser(const std::string_view input) : input_(input) {}

    bool ParseDocument(JsonValue& out_value) {
        SkipWhitespace();
        if (!ParseValue(out_value, 0)) {
            return false;
        }
        SkipWhitespace();
        return position_ == input_.size();
    }

private:
    bool ParseValue(JsonValue& out_value, const int depth) {
        if (depth > kMaxDepth) {
            return false;
        }
        SkipWhitespace();
        if (End()) {
            return false;
        }
        const char ch = input_[position_];
        if (ch == '{') {
            return ParseObject(out_value, depth);
        }
        if (ch == '[') {
            return ParseArray(out_value, depth);
        }
        if (ch == '"') {
            out_value.type = JsonValue::Type::String;
            return ParseString(out_value.string_value);
        }
        if (ch == 't') {
            if (!ConsumeLiteral("true")) {
                return false;
            }
            out_value.type = JsonValue::Type::Bool;
            out_value.bool_value = true;
            return true;
        }
        if (ch == 'f') {
            if (!ConsumeLiteral("false")) {
                return false;
            }
            out_value.type = JsonValue::Type::Bool;
            out_value.bool_value = false;
            return true;
        }
        if (ch == 'n') {
            if (!ConsumeLiteral("null")) {
                return false;
            }
            out_value.type = JsonValue::Type::Null;
            return true;
        }
        if (ch == '-' || std::isdigit(static_cast<unsigned char>(ch)) != 0) {
            out_value.type = JsonValue::Type::Number;
            return ParseNumber(out_value);
        }
        return false;
    }

    bool ParseObject(JsonValue& out_value, const int depth) {
        if (!ConsumeChar('{')) {
            return false;
        }

        out_value.type = JsonValue::Type::Object;
        out_value.object_value.clear();

        SkipWhitespace();
        if (ConsumeChar('}')) {
            return true;
        }

        while (true) {
            SkipWhitespace();
            std::string key;
            if (!ParseString(key)) {
                return false;
            }
            SkipWhitespace();
            if (!ConsumeChar(':')) {
                return false;
            }
            JsonValue value;
            if (!ParseValue(value, depth + 1)) {
                return false;
            }
            out_value.Set(key, std::move(value));
            SkipWhitespace();
            if (ConsumeChar('}')) {
                return true;
            }
            if (!ConsumeChar(',')) {
                return false;
            }
        }
    }

    bool ParseArray(JsonValue& out_value, const int depth) {
        if (!ConsumeChar('[')) {
            return false;
        }

        out_value.type = JsonValue::Type::Array;
        out_value.array_value.clear();

        SkipWhitespace();
        if (ConsumeChar(']')) {
            return true;
        }

        while (true) {
            JsonValue element;
            if (!ParseValue(element, depth + 1)) {
                return false;
            }
            out_value.array_value.push_back(std::move(element));
            SkipWhitespace();
            if (ConsumeChar(']')) {
                return true;
            }
            if (!ConsumeChar(',')) {
                return false;
            }
        }
    }

    bool ParseString(std::string& out_text) {
        if (!ConsumeChar('"')) {
            return false;
        }
        out_text.clear();
        while (!End()) {
            const char ch = input_[position_++];
            if (ch == '"') {
                return true;
            }
            if (ch == '\\') {
                if (End()) {
                    return false;
                }
                const char esc = input_[position_++];
                switch (esc) {
                    case '"':
                        out_text.push_back('"');
                        break;
                    case '\\':
                        out_text.push_back('\\');
                        break;
                    case '/':
                        out_text.push_back('/');
                        break;
                    case 'b':
                        out_text.push_back('\b');
                        break;
                    case 'f':
                        out_text.push_back('\f');
                        break;
                    case 'n':
                        out_text.push_back('\n');
                        break;
                    case 'r':
                        out_text.push_back('\r');
                        break;
                    case 't':
                        out_text.push_back('\t');
                        break;
                    case 'u': {
                        std::uint32_t codepoint = 0;
                        if (!ParseHex4(codepoint)) {
                            return false;
                        }
                        if (codepoint >= 0xD800U && codepoint <= 0xDBFFU) {
                            std::uint32_t low = 0;
                            if (!ConsumeChar('\\') || !ConsumeChar('u') || !ParseHex4(low) ||
                                low < 0xDC00U || low > 0xDFFFU) {
                                return false;
                            }
                            codepoint = 0x10000U + ((codepoint - 0xD800U) << 10U) + (low - 0xDC00U);
                        } else if (codepoint >= 0xDC00U && codepoint <= 0xDFFFU) {
                            return false;
                        }
                        AppendUtf8(codepoint, out_text);
                        break;
                    }
                    default:
                        return false;
                }
                continue;
            }
            if (static_cast<unsigned char>(ch) < 0x20U) {
                return false;
            }
            out_text.push_back(ch);
        }
        return false;
    }

    bool ParseHex4(std::uint32_t& out_value) {
        if (position_ + 4 > input_.size()) {
            return false;
        }
        out_value = 0;
        for (int i = 0; i < 4; ++i) {
            const char ch = input_[position_++];
            int digit = 0;
            if (ch >= '0' && ch <= '9') {
                digit = ch - '0';
            } else if (ch >= 'a' && ch <= 'f') {
                digit = 10 + (ch - 'a');
            } else if (ch >= 'A' && ch <= 'F') {
                digit = 10 + (ch - 'A');
            } else {
                return false;
            }
            out_value = (out_value << 4U) | static_cast<std::uint32_t>(digit);
        }
        return true;
    }

    bool ParseNumber(JsonValue& out_value) {
        const std::size_t start = position_;
        if (input_[position_] == '-') {
            ++position_;
            if (End()) {
                return false;
            }
        }
        if (std::isdigit(static_cast<unsigned char>(input_[position_])) == 0) {
            return false;
        }
        if (input_[position_] == '0' && position_ + 1 < input_.size() &&
            std::isdigit(static_cast<unsigned char>(input_[position_ + 1])) != 0) {
            return false;
        }
        ConsumeDigits();

        bool integral = true;
        if (!End() && input_[position_] == '.') {
            integral = false;
            ++position_;
            if (ConsumeDigits() == 0) {
                return false;
            }
        }
        if (!End() && (input_[position_] == 'e' || input_[position_] == 'E')) {
            integral = false;
            ++position_;
            if (!End() && (input_[position_] == '+' || input_[position_] == '-')) {
                ++position_;
            }
            if (ConsumeDigits() == 0) {
                return false;
            }
        }

        const std::string text(input_.substr(start, position_ - start));
        char* end_ptr = nullptr;
        const double value = std::strtod(text.c_str(), &end_ptr);
        if (end_ptr == nullptr || *end_ptr != '\0') {
            return false;
        }
        out_value.number_value = value;
        out_value.is_integer = false;
        if (integral) {
            errno = 0;
            const long long as_int = std::strtoll(text.c_str(), &end_ptr, 10);
            if (errno == 0 && end_ptr != nullptr && *end_ptr == '\0') {
                out_value.is_integer = true;
                out_value.int_value = as_int;
            }
        }
        return true;
    }

    std::size_t ConsumeDigits() {
        std::size_t count = 0;
        while (!End() && std::isdigit(static_cast<unsigned char>(input_[position_])) != 0) {
            ++position_;
            ++count;
        }
        return count;
    }

    bool ConsumeLiteral(const std::string_view literal) {
        if (position_ + literal.size() > input_.size()) {
            return false;
        }
        if (input_.substr(position_, literal.size()) != literal) {
            return false;
        }
        position_ += literal.size();
        return true;
    }

    bool ConsumeChar(const char expected) {
        if (!End() && input_[position_] == expected) {
            ++position_;
            return true;
        }
        return false;
    }

    void SkipWhitespace() {
        while (!End() && std::isspace(static_cast<unsigned char>(input_[position_])) != 0) {
            ++position_;
        }
    }

    bool End() const {
        return position_ >= input_.size();
    }

    std::string_view input_;
    std::size_t position_ = 0;
};

void NewLine(std::string& out, const int indent, const int level) {
    if (indent <= 0) {
        return;
    }
    out.push_back('\n');
    out.append(static_cast<std::size_t>(indent * level), ' ');
}

void SerializeInto(const JsonValue& value, const int indent, const int level, std::string& out) {
    switch (value.type) {
        case JsonValue::Type::Null:
            out += "null";
            return;
        case JsonValue::Type::Bool:
            out += value.bool_value ? "true" : "false";
            return;
        case JsonValue::Type::Number: {
            if (value.is_integer) {
                out += std::to_string(value.int_value);
                return;
            }
            if (!std::isfinite(value.number_value)) {
                out += "null";
                return;
            }
            char buffer[32] = {0};
            std::snprintf(buffer, sizeof(buffer), "%.17g", value.number_value);
            out += buffer;
            return;
        }
        case JsonValue::Type::String:
            out.push_back('"');
            out += Json::Escape(value.string_value);
            out.push_back('"');
            return;
        case JsonValue::Type::Array: {
            out.push_back('[');
            if (value.array_value.empty()) {
                out.push_back(']');
                return;
            }
            for (std::size_t i = 0; i < value.array_value.size(); ++i) {
                if (i > 0) {
                    out.push_back(',');
                }
                NewLine(out, indent, level + 1);
                SerializeInto(value.array_value[i], indent, level + 1, out);
            }
            NewLine(out, indent, level);
            out.push_back(']');
            return;
        }
        case JsonValue::Type::Object: {
            out.push_back('{');
            if (value.object_value.empty()) {
                out.push_back('}');
                return;
            }
            for (std::size_t i = 0; i < value.object_value.size(); ++i) {
                if (i > 0) {
                    out.push_back(',');
                }
                NewLine(out, indent, level + 1);
                out.push_back('"');
                out += Json::Escape(value.object_value[i].first);
                out += indent > 0 ? "\": " : "\":";
                SerializeInto(value.object_value[i].second, indent, level + 1, out);
            }
            NewLine(out, indent, level);
            out.push_back('}');
            return;
        }
    }
}

}  // namespace

JsonValue JsonValue::MakeNull() {
    return JsonValue{};
}

JsonValue JsonValue::MakeBool(const bool value) {
    JsonValue v;
    v.type = Type::Bool;
    v.bool_value = value;
    return v;
}

JsonValue JsonValue::MakeInt(const long long value) {
    JsonValue v;
    v.type = Type::Number;
    v.is_integer = true;
    v.int_value = value;
    v.number_value = static_cast<double>(value);
    return v;
}

JsonValue JsonValue::MakeDouble(const double value) {
    JsonValue v;
    v.type = Type::Number;
    v.number_value = value;
    return v;
}

JsonValue JsonValue::MakeString(std::string value) {
    JsonValue v;
    v.type = Type::String;
    v.string_value = std::move(value);
    return v;
}

JsonValue JsonValue::MakeArray() {
    JsonValue v;
    v.type = Type::Array;
    return v;
}

JsonValue JsonValue::MakeObject() {
    JsonValue v;
    v.type = Type::Object;
    return v;
}

const JsonValue* JsonValue::Find(const std::string_view key) const {
    if (type != Type::Object) {
        return nullptr;
    }
    for (const auto& member : object_value) {
        if (member.first == key) {
            return &member.second;
        }
    }
    return nullptr;
}

JsonValue& JsonValue::Set(const std::string& key, JsonValue value) {
    type = Type::Object;
    for (auto& member : object_value) {
        if (member.first == key) {
            member.second = std::move(value);
            return member.second;
        }
    }
    object_value.emplace_back(key, std::move(value));
    return object_value.back().second;
}

void JsonValue::Push(JsonValue value) {
    type = Type::Array;
    array_value.push_back(std::move(value));
}

WcStatus Json::Parse(const std::string_view text, JsonValue& out_value) {
    JsonValue value;
    JsonParser parser(text);
    if (!parser.ParseDocument(value)) {
        return WcStatus::BadJson;
    }
    out_value = std::move(value);
    return WcStatus::Ok;
}

std::string Json::Serialize(const JsonValue& value, const int indent) {
    std::string out;
    SerializeInto(value, indent, 0, out);
    return out;
}

std::string Json::Escape(const std::string_view input) {
    std::string output;
    output.reserve(input.size() + 8);
    for (const char ch : input) {
        switch (ch) {
            case '"':
                output += "\\\"";
                break;
            case '\\':
                output += "\\\\";
                break;
            case '\b':
                output += "\\b";
                break;
            case '\f':
                output += "\\f";
                break;
            case '\n':
                output += "\\n";
                break;
            case '\r':
                output += "\\r";
                break;
            case '\t':
                output += "\\t";
                break;
            default: {
                const unsigned char byte = static_cast<unsigned char>(ch);
                if (byte < 0x20U) {
                    static constexpr char kHex[] = "0123456789ABCDEF";
                    output += "\\u00";
                    output.push_back(kHex[(byte >> 4U) & 0x0FU]);
                    output.push_back(kHex[byte & 0x0FU]);
                } else {
                    output.push_back(ch);
                }
                break;
            }
        }
    }
    return output;
}

}  // namespace wincloud
