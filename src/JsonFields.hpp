// JsonFields.hpp
// Small JSON field lookups for health-check bodies (no full JSON library)
#pragma once

#include <optional>
#include <string>

namespace Elixir {
namespace Json {

// True if the body's first non-whitespace character opens an object and the
// last one closes it.
bool isObject(const std::string& json);

// True if "key" appears as an object key anywhere in the document.
bool hasField(const std::string& json, const std::string& key);

// Value of the first "key": <scalar>. String values are unescaped; numbers,
// booleans are returned as their literal text. Objects/arrays/null -> nullopt.
std::optional<std::string> findScalar(const std::string& json, const std::string& key);

} // namespace Json
} // namespace Elixir
