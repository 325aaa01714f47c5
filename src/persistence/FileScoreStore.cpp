#include "termtris/persistence/FileScoreStore.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <utility>

#include "termtris/persistence/PlayerName.hpp"

namespace termtris::persistence {

std::string formatEntry(const core::HighScoreEntry& entry)
{
    return sanitizeName(entry.name) + ' ' + std::to_string(entry.score);
}

std::optional<core::HighScoreEntry> parseEntry(const std::string& line)
{
    const std::string s = trimWhitespace(line);
    const auto split = s.find_last_of(' ');
    if (split == std::string::npos) {
        return std::nullopt;
    }

    const std::string scoreText = s.substr(split + 1);
    const bool allDigits = !scoreText.empty() &&
        std::all_of(scoreText.begin(), scoreText.end(),
                    [](char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; });
    if (!allDigits) {
        return std::nullopt;
    }

    core::HighScoreEntry entry;
    try {
        entry.score = std::stoull(scoreText);
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }

    entry.name = trimWhitespace(s.substr(0, split));
    if (entry.name.empty()) {
        return std::nullopt;
    }
    return entry;
}

FileScoreStore::FileScoreStore(std::string path, std::size_t capacity)
    : m_path{std::move(path)}
    , m_capacity{capacity}
{
}

core::HighScoreTable FileScoreStore::load()
{
    core::HighScoreTable table{m_capacity};

    std::ifstream in(m_path);
    if (!in.is_open()) {
        // First run: nothing saved yet
        return table;
    }

    std::string line;
    int lineNo = 0;
    while (std::getline(in, line)) {
        ++lineNo;
        if (trimWhitespace(line).empty()) {
            continue;
        }
        auto entry = parseEntry(line);
        if (!entry) {
            std::cerr << "FileScoreStore: skipping malformed line " << lineNo
                      << " in " << m_path << "\n";
            continue;
        }
        table.update(std::move(entry->name), entry->score);
    }

    return table;
}

bool FileScoreStore::save(const core::HighScoreTable& table)
{
    std::ofstream out(m_path, std::ios::out | std::ios::trunc);
    if (!out.is_open()) {
        std::cerr << "FileScoreStore: cannot open " << m_path << " for writing\n";
        return false;
    }

    for (const auto& entry : table.entries()) {
        out << formatEntry(entry) << '\n';
    }
    out.flush();

    if (!out) {
        std::cerr << "FileScoreStore: write to " << m_path << " failed\n";
        return false;
    }
    return true;
}

} // namespace termtris::persistence
