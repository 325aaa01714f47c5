#include "termtris/gui_sdl/GameScreen.hpp"

#include <algorithm>
#include <cstdint>
#include <memory>

#include <imgui.h>
#include <SDL.h>

#include "termtris/gui_sdl/Application.hpp"
#include "termtris/gui_sdl/Palette.hpp"
#include "termtris/gui_sdl/StartScreen.hpp"
#include "termtris/controller/InputAction.hpp"
#include "termtris/persistence/FileScoreStore.hpp"
#include "termtris/persistence/HighScoreService.hpp"

namespace termtris::gui_sdl {

using termtris::controller::InputAction;
using termtris::core::GameStatus;
using termtris::core::Position;

// Where the active piece would land on a hard drop
static Position computeGhost(const termtris::core::GameState& game)
{
    Position ghost = game.position();
    const auto& piece = *game.activeTetromino();
    while (!game.checkCollision(piece, Position{ghost.col, ghost.row + 1})) {
        ++ghost.row;
    }
    return ghost;
}

GameScreen::GameScreen(const termtris::core::GameConfig& config)
    : gameState_(config)
    , controller_(gameState_)
{
    gameState_.start();
    controller_.resetTiming();
}

void GameScreen::restart()
{
    gameState_.reset();
    gameState_.start();
    controller_.resetTiming();
    scoreSubmitted_ = false;
    rank_.reset();
    saveMessage_.clear();
}

void GameScreen::submitScore()
{
    const auto& config = gameState_.config();
    auto store = std::make_shared<termtris::persistence::FileScoreStore>(
        config.scoreFile, config.highScoreCapacity);
    termtris::persistence::HighScoreService scores{store};

    const auto result = scores.submit(nameBuffer_, gameState_.score());
    rank_ = result.rank;
    saveMessage_ = result.saved ? "Score saved."
                                : "Could not write " + store->path();
    scoreSubmitted_ = true;
}

void GameScreen::handleEvent(Application& app, const SDL_Event& e)
{
    // While typing a name, keys belong to the text field
    if (gameState_.status() == GameStatus::GameOver) {
        return;
    }

    if (e.type == SDL_KEYDOWN && e.key.repeat == 0) {
        switch (e.key.keysym.sym) {
            case SDLK_LEFT:
            case SDLK_a:
                controller_.handleAction(InputAction::MoveLeft);
                break;
            case SDLK_RIGHT:
            case SDLK_d:
                controller_.handleAction(InputAction::MoveRight);
                break;
            case SDLK_DOWN:
            case SDLK_s:
                controller_.handleAction(InputAction::SoftDrop);
                break;
            case SDLK_SPACE:
                controller_.handleAction(InputAction::HardDrop);
                break;
            case SDLK_UP:
            case SDLK_x:
            case SDLK_w:
                controller_.handleAction(InputAction::RotateCW);
                break;
            case SDLK_z:
                controller_.handleAction(InputAction::RotateCCW);
                break;
            case SDLK_p:
            case SDLK_ESCAPE:
                controller_.handleAction(InputAction::PauseResume);
                break;
            case SDLK_BACKSPACE:
                app.setScreen(std::make_unique<StartScreen>(app.config()));
                break;
            default:
                break;
        }
    }
}

void GameScreen::update(Application&, float dtSeconds)
{
    const int ms = static_cast<int>(dtSeconds * 1000.0f + 0.5f);
    controller_.update(termtris::controller::GameController::Duration{ms});

    if (gameState_.status() != GameStatus::Running) {
        sideHoldSec_ = 0.0f;
        sideRepeatAccSec_ = 0.0f;
        return;
    }

    const Uint8* keys = SDL_GetKeyboardState(nullptr);
    const bool leftHeld  = (keys[SDL_SCANCODE_LEFT] != 0) || (keys[SDL_SCANCODE_A] != 0);
    const bool rightHeld = (keys[SDL_SCANCODE_RIGHT] != 0) || (keys[SDL_SCANCODE_D] != 0);

    // Both or neither: no auto-repeat
    if (leftHeld == rightHeld) {
        sideHoldSec_ = 0.0f;
        sideRepeatAccSec_ = 0.0f;
        return;
    }

    sideHoldSec_ += dtSeconds;
    if (sideHoldSec_ < sideDasSec_) {
        sideRepeatAccSec_ = 0.0f;
        return;
    }

    sideRepeatAccSec_ += dtSeconds;
    while (sideRepeatAccSec_ >= sideArrSec_) {
        controller_.handleAction(leftHeld ? InputAction::MoveLeft : InputAction::MoveRight);
        sideRepeatAccSec_ -= sideArrSec_;
    }
}

void GameScreen::render(Application& app)
{
    int winW = 0, winH = 0;
    app.getWindowSize(winW, winH);

    const int rows = gameState_.board().rows();
    const int cols = gameState_.board().cols();
    const int margin = 20;
    const int panelW = 260;

    const int cellFromW = (winW - margin * 3 - panelW) / cols;
    const int cellFromH = (winH - margin * 2) / rows;
    const int cell = std::clamp(std::min(cellFromW, cellFromH), 12, 44);

    const int groupW = cols * cell + margin + panelW;
    const int boardX = std::max(margin, (winW - groupW) / 2);
    const int boardY = std::max(margin, (winH - rows * cell) / 2);
    const int panelX = boardX + cols * cell + margin;

    renderBoard(app.renderer(), boardX, boardY, cell);
    renderHUD(app, panelX, boardY, panelW);

    if (gameState_.status() == GameStatus::GameOver) {
        renderGameOver(app, boardX + (cols * cell - 300) / 2, boardY + rows * cell / 3, 300);
    }
}

void GameScreen::renderBoard(SDL_Renderer* renderer, int x, int y, int cellSize) const
{
    const auto& board = gameState_.board();
    const int rows = board.rows();
    const int cols = board.cols();

    SDL_SetRenderDrawColor(renderer, 12, 12, 16, 255);
    SDL_Rect boardRect{x, y, cols * cellSize, rows * cellSize};
    SDL_RenderFillRect(renderer, &boardRect);

    SDL_SetRenderDrawColor(renderer, 40, 40, 55, 255);
    for (int r = 0; r <= rows; ++r) {
        SDL_RenderDrawLine(renderer, x, y + r * cellSize, x + cols * cellSize, y + r * cellSize);
    }
    for (int c = 0; c <= cols; ++c) {
        SDL_RenderDrawLine(renderer, x + c * cellSize, y, x + c * cellSize, y + rows * cellSize);
    }

    std::uint8_t rr, gg, bb, aa;
    for (int r = 0; r < rows; ++r) {
        for (int c = 0; c < cols; ++c) {
            const auto value = board.cell(r, c);
            if (value == termtris::core::EmptyCell) continue;

            unpackImU32(colorForCell(value), rr, gg, bb, aa);
            SDL_SetRenderDrawColor(renderer, rr, gg, bb, aa);

            SDL_Rect rc{x + c * cellSize + 1, y + r * cellSize + 1, cellSize - 2, cellSize - 2};
            SDL_RenderFillRect(renderer, &rc);
        }
    }

    if (gameState_.activeTetromino().has_value()) {
        const auto& t = *gameState_.activeTetromino();

        // Ghost
        SDL_SetRenderDrawBlendMode(renderer, SDL_BLENDMODE_BLEND);
        SDL_SetRenderDrawColor(renderer, 255, 255, 255, 70);
        for (const auto& b : t.blocks(computeGhost(gameState_))) {
            if (b.row < 0) continue;
            SDL_Rect rc{x + b.col * cellSize + 2, y + b.row * cellSize + 2, cellSize - 4, cellSize - 4};
            SDL_RenderDrawRect(renderer, &rc);
        }
        SDL_SetRenderDrawBlendMode(renderer, SDL_BLENDMODE_NONE);

        // Active
        unpackImU32(colorForCell(t.fillValue()), rr, gg, bb, aa);
        SDL_SetRenderDrawColor(renderer, rr, gg, bb, aa);
        for (const auto& b : t.blocks(gameState_.position())) {
            if (b.row < 0) continue;
            SDL_Rect rc{x + b.col * cellSize + 1, y + b.row * cellSize + 1, cellSize - 2, cellSize - 2};
            SDL_RenderFillRect(renderer, &rc);
        }
    }

    if (gameState_.status() == GameStatus::Paused ||
        gameState_.status() == GameStatus::GameOver)
    {
        SDL_SetRenderDrawBlendMode(renderer, SDL_BLENDMODE_BLEND);
        SDL_SetRenderDrawColor(renderer, 0, 0, 0, 160);
        SDL_RenderFillRect(renderer, &boardRect);
        SDL_SetRenderDrawBlendMode(renderer, SDL_BLENDMODE_NONE);
    }
}

void GameScreen::renderHUD(Application& app, int x, int y, int w)
{
    ImGui::SetNextWindowPos(ImVec2((float)x, (float)y), ImGuiCond_Always);
    ImGui::SetNextWindowSizeConstraints(ImVec2((float)w, 0.0f), ImVec2((float)w, 600.0f));
    ImGui::Begin("Game", nullptr,
                 ImGuiWindowFlags_NoMove | ImGuiWindowFlags_NoCollapse | ImGuiWindowFlags_AlwaysAutoResize);

    ImGui::Text("Score: %llu", (unsigned long long)gameState_.score());
    ImGui::Text("Level: %d", gameState_.level());
    ImGui::Text("Speed: %d ms", gameState_.speed());
    ImGui::Text("Lines: %llu", (unsigned long long)gameState_.linesCleared());

    ImGui::Separator();

    switch (gameState_.status()) {
        case GameStatus::Running:
            ImGui::Text("Status: Running");
            break;
        case GameStatus::Paused:
            ImGui::TextColored(ImVec4(1.0f, 0.85f, 0.2f, 1.0f), "Status: Paused");
            break;
        case GameStatus::GameOver:
            ImGui::TextColored(ImVec4(1.0f, 0.25f, 0.25f, 1.0f), "Status: Game Over");
            break;
        default:
            ImGui::Text("Status: Not Started");
            break;
    }

    // Next piece preview
    ImGui::Separator();
    ImGui::TextUnformatted("Next");
    if (gameState_.nextTetromino().has_value()) {
        const auto& next = *gameState_.nextTetromino();
        const float cell = 20.0f;
        ImDrawList* dl = ImGui::GetWindowDrawList();
        const ImVec2 o = ImGui::GetCursorScreenPos();
        for (const auto& b : next.blocks(Position{0, 0})) {
            const ImVec2 p0(o.x + b.col * cell, o.y + b.row * cell);
            const ImVec2 p1(p0.x + cell - 2, p0.y + cell - 2);
            dl->AddRectFilled(p0, p1, colorForCell(next.fillValue()));
        }
        ImGui::Dummy(ImVec2(4 * cell, next.height() * cell));
    }

    ImGui::Separator();
    ImGui::TextUnformatted("Arrows/WASD: move, rotate");
    ImGui::TextUnformatted("Z: rotate CCW, Space: hard drop");
    ImGui::TextUnformatted("P/Esc: pause, Backspace: menu");

    if (ImGui::Button("Back to Menu", ImVec2(-1, 0))) {
        app.setScreen(std::make_unique<StartScreen>(app.config()));
    }

    ImGui::End();
}

void GameScreen::renderGameOver(Application& app, int x, int y, int w)
{
    ImGui::SetNextWindowPos(ImVec2((float)x, (float)y), ImGuiCond_Always);
    ImGui::SetNextWindowSize(ImVec2((float)w, 0.0f), ImGuiCond_Always);
    ImGui::Begin("GAME OVER", nullptr,
                 ImGuiWindowFlags_NoMove | ImGuiWindowFlags_NoCollapse | ImGuiWindowFlags_NoResize);

    ImGui::Text("Final score: %llu", (unsigned long long)gameState_.score());

    if (!scoreSubmitted_) {
        ImGui::InputText("Name", nameBuffer_, sizeof(nameBuffer_));
        if (ImGui::Button("Save Score", ImVec2(-1, 0))) {
            submitScore();
        }
    } else {
        if (rank_) {
            ImGui::Text("You placed #%zu", *rank_ + 1);
        } else {
            ImGui::TextUnformatted("Not a high score this time.");
        }
        ImGui::TextUnformatted(saveMessage_.c_str());
    }

    ImGui::Separator();
    if (ImGui::Button("Restart", ImVec2(-1, 0))) {
        restart();
    }
    if (ImGui::Button("Back to Menu", ImVec2(-1, 0))) {
        app.setScreen(std::make_unique<StartScreen>(app.config()));
    }

    ImGui::End();
}

} // namespace termtris::gui_sdl
