#include "termtris/gui_sdl/Application.hpp"

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <utility>

#include <imgui.h>
#include <imgui_impl_sdl2.h>
#include <imgui_impl_sdlrenderer2.h>

namespace termtris::gui_sdl {

namespace {
    constexpr Uint32 kSdlSubsystems = SDL_INIT_VIDEO | SDL_INIT_TIMER | SDL_INIT_EVENTS;
}

Application::Application(termtris::core::GameConfig config)
    : m_config{std::move(config)}
{
}

Application::~Application() {
    shutdown();
}

bool Application::init(const char* title, int width, int height) {
    if (SDL_Init(kSdlSubsystems) != 0) {
        std::fprintf(stderr, "termtris: SDL_Init failed: %s\n", SDL_GetError());
        return false;
    }

    if (!createWindow(title, width, height)) {
        return false;
    }

    initImGui();
    m_running = true;
    return true;
}

bool Application::createWindow(const char* title, int width, int height) {
    m_window = SDL_CreateWindow(title,
                                SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED,
                                width, height,
                                SDL_WINDOW_SHOWN | SDL_WINDOW_RESIZABLE);
    if (!m_window) {
        std::fprintf(stderr, "termtris: cannot create window: %s\n", SDL_GetError());
        return false;
    }

    m_renderer = SDL_CreateRenderer(m_window, -1,
                                    SDL_RENDERER_ACCELERATED | SDL_RENDERER_PRESENTVSYNC);
    if (!m_renderer) {
        // Fall back to software so the game still runs without a GPU driver
        std::fprintf(stderr, "termtris: accelerated renderer unavailable (%s), using software\n",
                     SDL_GetError());
        m_renderer = SDL_CreateRenderer(m_window, -1, SDL_RENDERER_SOFTWARE);
    }
    if (!m_renderer) {
        std::fprintf(stderr, "termtris: cannot create renderer: %s\n", SDL_GetError());
        return false;
    }
    return true;
}

void Application::initImGui() {
    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    ImGui::GetIO().IniFilename = nullptr; // no imgui.ini next to the binary
    ImGui::StyleColorsDark();

    ImGui_ImplSDL2_InitForSDLRenderer(m_window, m_renderer);
    ImGui_ImplSDLRenderer2_Init(m_renderer);
    m_imguiReady = true;
}

void Application::shutdown() {
    if (!SDL_WasInit(kSdlSubsystems)) {
        return;
    }

    // Screens may hold ImGui state; drop them first
    m_pendingScreen.reset();
    m_screen.reset();

    if (m_imguiReady) {
        ImGui_ImplSDLRenderer2_Shutdown();
        ImGui_ImplSDL2_Shutdown();
        ImGui::DestroyContext();
        m_imguiReady = false;
    }

    if (m_renderer) {
        SDL_DestroyRenderer(m_renderer);
        m_renderer = nullptr;
    }
    if (m_window) {
        SDL_DestroyWindow(m_window);
        m_window = nullptr;
    }

    SDL_Quit();
}

void Application::setScreen(std::unique_ptr<Screen> screen) {
    if (!m_screen) {
        m_screen = std::move(screen);
    } else {
        m_pendingScreen = std::move(screen);
    }
}

void Application::applyPendingScreen() {
    if (m_pendingScreen) {
        m_screen = std::move(m_pendingScreen);
    }
}

void Application::getWindowSize(int& w, int& h) const {
    w = 0;
    h = 0;
    if (m_window) {
        SDL_GetWindowSize(m_window, &w, &h);
    }
}

void Application::pumpEvents() {
    SDL_Event e;
    while (SDL_PollEvent(&e)) {
        ImGui_ImplSDL2_ProcessEvent(&e);

        if (e.type == SDL_QUIT) {
            m_running = false;
            return;
        }
        if (m_screen) {
            m_screen->handleEvent(*this, e);
        }
        // A screen switched mid-batch gets the remaining events
        applyPendingScreen();
    }
}

void Application::drawFrame() {
    // Board first, ImGui panels on top
    SDL_SetRenderDrawColor(m_renderer, 20, 20, 20, 255);
    SDL_RenderClear(m_renderer);

    ImGui_ImplSDLRenderer2_NewFrame();
    ImGui_ImplSDL2_NewFrame();
    ImGui::NewFrame();

    if (m_screen) {
        m_screen->render(*this);
    }

    ImGui::Render();
    ImGui_ImplSDLRenderer2_RenderDrawData(ImGui::GetDrawData(), m_renderer);
    SDL_RenderPresent(m_renderer);
}

int Application::run() {
    using Clock = std::chrono::steady_clock;
    auto last = Clock::now();

    while (m_running) {
        pumpEvents();
        if (!m_running) {
            break;
        }

        const auto now = Clock::now();
        const float dt = std::min(std::chrono::duration<float>(now - last).count(),
                                  MaxFrameSeconds);
        last = now;

        if (m_screen) {
            m_screen->update(*this, dt);
        }
        applyPendingScreen();

        drawFrame();
        applyPendingScreen();
    }

    return 0;
}

} // namespace termtris::gui_sdl
