#pragma once

#include <memory>

#include <SDL.h>

#include "termtris/core/GameConfig.hpp"
#include "termtris/gui_sdl/Screen.hpp"

namespace termtris::gui_sdl {

class Application {
public:
    explicit Application(termtris::core::GameConfig config = termtris::core::GameConfig{});
    ~Application();

    Application(const Application&) = delete;
    Application& operator=(const Application&) = delete;

    bool init(const char* title, int width, int height);
    int run();

    void requestQuit() { m_running = false; }

    // Screen management. The switch happens between frames, so a screen
    // may replace itself from inside its own callbacks.
    void setScreen(std::unique_ptr<Screen> screen);

    const termtris::core::GameConfig& config() const noexcept { return m_config; }

    // SDL accessors
    SDL_Window* window() const { return m_window; }
    SDL_Renderer* renderer() const { return m_renderer; }

    // Simple utility: window size
    void getWindowSize(int& w, int& h) const;

private:
    bool createWindow(const char* title, int width, int height);
    void initImGui();
    void shutdown();

    void pumpEvents();
    void drawFrame();
    void applyPendingScreen();

    // Longest step handed to update(); longer stalls (window drag,
    // debugger) would otherwise drop a burst of gravity ticks at once
    static constexpr float MaxFrameSeconds = 0.25f;

private:
    termtris::core::GameConfig m_config;
    bool m_running{false};
    bool m_imguiReady{false};

    SDL_Window* m_window{nullptr};
    SDL_Renderer* m_renderer{nullptr};

    std::unique_ptr<Screen> m_screen;
    std::unique_ptr<Screen> m_pendingScreen;
};

} // namespace termtris::gui_sdl
