#pragma once

#include <SDL3/SDL.h>
#include <string>

// Owns the SDL window/renderer and the Dear ImGui context.
class AppContext
{
public:
    AppContext();
    ~AppContext();

    bool initialize(const char* title, int width, int height);
    void shutdown();

    bool processEvent(const SDL_Event& event);
    void beginFrame();
    void endFrame();

    SDL_Window* window() const { return window_; }

    SDL_Renderer* renderer() const { return renderer_; }

    void getWindowSize(int& w, int& h) const;

private:
    void updateRendererScale();

    bool initializeSDL();
    bool createWindow(const char* title, int width, int height);
    bool createRenderer();
    bool initializeImGui();
    void reportInitError(const char* phase, const std::string& details);

    SDL_Window* window_ = nullptr;
    SDL_Renderer* renderer_ = nullptr;
    bool sdl_initialized_ = false;
    bool imgui_initialized_ = false;
    bool initialized_ = false;
};
