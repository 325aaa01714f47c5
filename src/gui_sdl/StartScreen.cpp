#include "termtris/gui_sdl/StartScreen.hpp"
#include "termtris/gui_sdl/Application.hpp"
#include "termtris/gui_sdl/GameScreen.hpp"
#include "termtris/gui_sdl/HighScoresScreen.hpp"

#include <memory>

#include <SDL.h>
#include <imgui.h>

#include "termtris/persistence/FileScoreStore.hpp"

namespace termtris::gui_sdl {

StartScreen::StartScreen(const termtris::core::GameConfig& config)
{
    termtris::persistence::FileScoreStore store{config.scoreFile, config.highScoreCapacity};
    const auto table = store.load();
    if (!table.empty()) {
        best_ = table.entries().front();
    }
}

void StartScreen::handleEvent(Application& app, const SDL_Event& e)
{
    if (e.type != SDL_KEYDOWN || e.key.repeat != 0) {
        return;
    }

    switch (e.key.keysym.sym) {
        case SDLK_RETURN:
        case SDLK_KP_ENTER:
            app.setScreen(std::make_unique<GameScreen>(app.config()));
            break;
        case SDLK_h:
            app.setScreen(std::make_unique<HighScoresScreen>(app.config()));
            break;
        case SDLK_ESCAPE:
            app.requestQuit();
            break;
        default:
            break;
    }
}

void StartScreen::update(Application&, float)
{
}

void StartScreen::render(Application& app)
{
    int w = 0, h = 0;
    app.getWindowSize(w, h);

    ImGui::SetNextWindowPos(ImVec2(w * 0.5f, h * 0.5f), ImGuiCond_Always, ImVec2(0.5f, 0.5f));
    ImGui::SetNextWindowSize(ImVec2(400, 0), ImGuiCond_Always);

    const ImGuiWindowFlags flags = ImGuiWindowFlags_NoResize
                                 | ImGuiWindowFlags_NoCollapse
                                 | ImGuiWindowFlags_NoMove
                                 | ImGuiWindowFlags_AlwaysAutoResize;

    ImGui::Begin("termtris", nullptr, flags);

    if (best_) {
        ImGui::Text("Best: %s  %llu", best_->name.c_str(),
                    static_cast<unsigned long long>(best_->score));
    } else {
        ImGui::TextDisabled("No high scores yet");
    }
    ImGui::Separator();

    if (ImGui::Button("Play", ImVec2(-1, 44))) {
        app.setScreen(std::make_unique<GameScreen>(app.config()));
    }
    if (ImGui::Button("High Scores", ImVec2(-1, 44))) {
        app.setScreen(std::make_unique<HighScoresScreen>(app.config()));
    }
    if (ImGui::Button("Quit", ImVec2(-1, 40))) {
        app.requestQuit();
    }

    ImGui::Separator();
    ImGui::TextDisabled("Arrows/WASD move, W/X/Up rotate, Z counter-rotate");
    ImGui::TextDisabled("Space hard drop, P pause, Backspace menu");

    ImGui::End();
}

} // namespace termtris::gui_sdl
