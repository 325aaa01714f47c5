#include "termtris/gui_sdl/Application.hpp"
#include "termtris/gui_sdl/StartScreen.hpp"

#include <memory>
#include <string>

int main(int argc, char** argv) {
    termtris::core::GameConfig config;
    // Optional: termtris_sdl [score-file]
    if (argc > 1) {
        config.scoreFile = argv[1];
    }

    termtris::gui_sdl::Application app{config};
    if (!app.init("termtris (SDL2 + ImGui)", 900, 700)) {
        return 1;
    }

    app.setScreen(std::make_unique<termtris::gui_sdl::StartScreen>(app.config()));
    return app.run();
}
