#include "termtris/gui_sdl/HighScoresScreen.hpp"

#include <memory>

#include <imgui.h>

#include "termtris/gui_sdl/Application.hpp"
#include "termtris/gui_sdl/StartScreen.hpp"
#include "termtris/persistence/FileScoreStore.hpp"

namespace termtris::gui_sdl {

HighScoresScreen::HighScoresScreen(const termtris::core::GameConfig& config)
    : scoreFile_{config.scoreFile}
    , table_{termtris::persistence::FileScoreStore{config.scoreFile, config.highScoreCapacity}.load()}
{
}

void HighScoresScreen::handleEvent(Application& app, const SDL_Event& e)
{
    if (e.type == SDL_KEYDOWN && e.key.repeat == 0 &&
        (e.key.keysym.sym == SDLK_ESCAPE || e.key.keysym.sym == SDLK_BACKSPACE)) {
        app.setScreen(std::make_unique<StartScreen>(app.config()));
    }
}

void HighScoresScreen::update(Application&, float) {}

void HighScoresScreen::render(Application& app)
{
    int w = 0, h = 0;
    app.getWindowSize(w, h);

    ImGui::SetNextWindowPos(ImVec2(w * 0.5f, h * 0.5f), ImGuiCond_Always, ImVec2(0.5f, 0.5f));
    ImGui::SetNextWindowSize(ImVec2(420, 380), ImGuiCond_Always);
    ImGui::Begin("High Scores", nullptr,
                 ImGuiWindowFlags_NoResize | ImGuiWindowFlags_NoCollapse | ImGuiWindowFlags_NoMove);

    ImGui::TextDisabled("%s", scoreFile_.c_str());
    ImGui::Separator();

    if (table_.empty()) {
        ImGui::TextUnformatted("No scores yet.");
    } else if (ImGui::BeginTable("scores", 3, ImGuiTableFlags_RowBg | ImGuiTableFlags_Borders)) {
        ImGui::TableSetupColumn("#", ImGuiTableColumnFlags_WidthFixed, 30.0f);
        ImGui::TableSetupColumn("Name");
        ImGui::TableSetupColumn("Score", ImGuiTableColumnFlags_WidthFixed, 90.0f);
        ImGui::TableHeadersRow();

        std::size_t rank = 1;
        for (const auto& entry : table_.entries()) {
            ImGui::TableNextRow();
            ImGui::TableSetColumnIndex(0);
            ImGui::Text("%zu", rank++);
            ImGui::TableSetColumnIndex(1);
            ImGui::TextUnformatted(entry.name.c_str());
            ImGui::TableSetColumnIndex(2);
            ImGui::Text("%llu", (unsigned long long)entry.score);
        }
        ImGui::EndTable();
    }

    ImGui::Separator();
    if (ImGui::Button("Back", ImVec2(-1, 0))) {
        app.setScreen(std::make_unique<StartScreen>(app.config()));
    }

    ImGui::End();
}

} // namespace termtris::gui_sdl
