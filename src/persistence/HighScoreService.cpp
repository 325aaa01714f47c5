#include "termtris/persistence/HighScoreService.hpp"

#include <stdexcept>
#include <utility>

#include "termtris/persistence/PlayerName.hpp"

namespace termtris::persistence {

HighScoreService::HighScoreService(IScoreStorePtr store)
    : m_store{std::move(store)}
{
    if (!m_store) {
        throw std::invalid_argument("HighScoreService requires a score store");
    }
    reload();
}

void HighScoreService::reload()
{
    m_table = m_store->load();
}

HighScoreService::SubmitResult HighScoreService::submit(const std::string& name, std::uint64_t score)
{
    SubmitResult result;
    result.rank = m_table.update(sanitizeName(name), score);
    result.saved = m_store->save(m_table);
    return result;
}

} // namespace termtris::persistence
