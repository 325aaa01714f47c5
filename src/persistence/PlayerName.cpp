#include "termtris/persistence/PlayerName.hpp"

#include <algorithm>
#include <cctype>

namespace termtris::persistence {

namespace {
    const char* const kAnonymous = "anonymous";

    bool isBlank(char c) {
        return std::isspace(static_cast<unsigned char>(c)) != 0;
    }
}

std::string trimWhitespace(const std::string& s)
{
    auto first = std::find_if_not(s.begin(), s.end(), isBlank);
    auto last = std::find_if_not(s.rbegin(), s.rend(), isBlank).base();
    if (first >= last) {
        return {};
    }
    return std::string(first, last);
}

std::string sanitizeName(const std::string& name)
{
    std::string out;
    out.reserve(name.size());
    for (char c : name) {
        out.push_back(std::iscntrl(static_cast<unsigned char>(c)) ? ' ' : c);
    }
    out = trimWhitespace(out);
    return out.empty() ? std::string{kAnonymous} : out;
}

} // namespace termtris::persistence
