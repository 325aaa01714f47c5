#pragma once

#include "termtris/gui_sdl/Screen.hpp"

#include <optional>

#include "termtris/core/GameConfig.hpp"
#include "termtris/core/HighScoreTable.hpp"

namespace termtris::gui_sdl {

// Main menu: Play, High Scores, Quit. Enter starts a game, Esc quits.
class StartScreen final : public Screen {
public:
    explicit StartScreen(const termtris::core::GameConfig& config);

    void handleEvent(Application& app, const SDL_Event& e) override;
    void update(Application& app, float dtSeconds) override;
    void render(Application& app) override;

private:
    std::optional<termtris::core::HighScoreEntry> best_;
};

} // namespace termtris::gui_sdl
