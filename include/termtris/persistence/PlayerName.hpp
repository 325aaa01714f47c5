#pragma once

#include <string>

namespace termtris::persistence {

/// Make a player name safe for one-record-per-line storage: control
/// characters become spaces, surrounding whitespace is trimmed, empty
/// names become "anonymous".
std::string sanitizeName(const std::string& name);

// Copy of s without leading and trailing whitespace
std::string trimWhitespace(const std::string& s);

} // namespace termtris::persistence
