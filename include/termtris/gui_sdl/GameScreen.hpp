#pragma once

#include <cstddef>
#include <optional>
#include <string>

#include "termtris/gui_sdl/Screen.hpp"
#include "termtris/core/GameConfig.hpp"
#include "termtris/core/GameState.hpp"
#include "termtris/controller/GameController.hpp"

namespace termtris::gui_sdl {

class GameScreen final : public Screen {
public:
    explicit GameScreen(const termtris::core::GameConfig& config);

    void handleEvent(Application& app, const SDL_Event& e) override;
    void update(Application& app, float dtSeconds) override;
    void render(Application& app) override;

private:
    // Rendering helpers
    void renderBoard(SDL_Renderer* renderer, int x, int y, int cellSize) const;
    void renderHUD(Application& app, int x, int y, int w);
    void renderGameOver(Application& app, int x, int y, int w);

    void restart();
    void submitScore();

private:
    termtris::core::GameState gameState_;
    termtris::controller::GameController controller_;

    // Side movement hold (DAS + ARR)
    float sideHoldSec_{0.0f};
    float sideRepeatAccSec_{0.0f};
    const float sideDasSec_{0.18f};
    const float sideArrSec_{0.06f};

    // Game-over name entry
    char nameBuffer_[32]{};
    bool scoreSubmitted_{false};
    std::optional<std::size_t> rank_;
    std::string saveMessage_;
};

} // namespace termtris::gui_sdl
