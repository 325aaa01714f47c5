#pragma once

#include <string>

#include "termtris/gui_sdl/Screen.hpp"
#include "termtris/core/GameConfig.hpp"
#include "termtris/core/HighScoreTable.hpp"

namespace termtris::gui_sdl {

class HighScoresScreen final : public Screen {
public:
    explicit HighScoresScreen(const termtris::core::GameConfig& config);

    void handleEvent(Application& app, const SDL_Event& e) override;
    void update(Application& app, float dtSeconds) override;
    void render(Application& app) override;

private:
    std::string scoreFile_;
    termtris::core::HighScoreTable table_;
};

} // namespace termtris::gui_sdl
