// JsonFields.cpp
#include "JsonFields.hpp"

#include <cctype>

namespace Elixir {
namespace Json {

namespace {

size_t skipSpace(const std::string& json, size_t pos) {
    while (pos < json.size() && std::isspace(static_cast<unsigned char>(json[pos]))) ++pos;
    return pos;
}

// Reads the string literal opening at json[pos] (a '"'). On success sets
// `out` to the unescaped text and returns the index just past the closing quote.
// Returns npos on an unterminated string.
size_t readString(const std::string& json, size_t pos, std::string& out) {
    out.clear();
    for (size_t i = pos + 1; i < json.size(); ++i) {
        char c = json[i];
        if (c == '"') return i + 1;
        if (c != '\\') { out.push_back(c); continue; }
        if (++i >= json.size()) break;
        switch (json[i]) {
            case 'n': out.push_back('\n'); break;
            case 't': out.push_back('\t'); break;
            case 'r': out.push_back('\r'); break;
            case 'b': out.push_back('\b'); break;
            case 'f': out.push_back('\f'); break;
            case 'u':
                // Keep \uXXXX escapes verbatim; identity/version values are ASCII.
                out.append(json, i - 1, 6);
                i += 4;
                break;
            default: out.push_back(json[i]); break;
        }
    }
    return std::string::npos;
}

// Finds "key": among the members of the outermost object and returns the
// index of its value, or npos. Keys of nested objects never match.
size_t findValueStart(const std::string& json, const std::string& key) {
    std::string token;
    int depth = 0;
    size_t pos = 0;
    while (pos < json.size()) {
        char c = json[pos];
        if (c == '{' || c == '[') { ++depth; ++pos; continue; }
        if (c == '}' || c == ']') { --depth; ++pos; continue; }
        if (c != '"') { ++pos; continue; }

        size_t next = readString(json, pos, token);
        if (next == std::string::npos) return std::string::npos;
        size_t after = skipSpace(json, next);
        if (depth == 1 && after < json.size() && json[after] == ':' && token == key) {
            return skipSpace(json, after + 1);
        }
        pos = next;
    }
    return std::string::npos;
}

} // anonymous namespace

bool isObject(const std::string& json) {
    size_t first = skipSpace(json, 0);
    size_t last = json.find_last_not_of(" \t\r\n");
    return first < json.size() && last != std::string::npos && json[first] == '{' && json[last] == '}';
}

bool hasField(const std::string& json, const std::string& key) {
    return findValueStart(json, key) != std::string::npos;
}

std::optional<std::string> findScalar(const std::string& json, const std::string& key) {
    size_t start = findValueStart(json, key);
    if (start == std::string::npos || start >= json.size()) return std::nullopt;

    char c = json[start];
    if (c == '"') {
        std::string value;
        if (readString(json, start, value) == std::string::npos) return std::nullopt;
        return value;
    }
    if (c == '{' || c == '[') return std::nullopt;

    size_t end = json.find_first_of(",}] \t\r\n", start);
    std::string literal = json.substr(start, end == std::string::npos ? std::string::npos : end - start);
    if (literal.empty() || literal == "null") return std::nullopt;
    return literal;
}

} // namespace Json
} // namespace Elixir
