#pragma once

#include <optional>
#include <string>

namespace fd {

std::string trim(const std::string& value);

// Trimmed value of an environment variable, or nullopt when it is unset.
std::optional<std::string> readEnv(const char* name);

// Escapes a value for use inside a JSON string literal.
std::string jsonEscape(const std::string& value);

} // namespace fd
