#include "AppContext.hpp"
#include "utils/ErrorReporter.hpp"

#include <SDL3/SDL.h>
#include <imgui.h>
#include <backends/imgui_impl_sdl3.h>
#include <backends/imgui_impl_sdlrenderer3.h>
#include <plog/Log.h>
#include <cmath>

AppContext::AppContext() = default;

AppContext::~AppContext()
{
    shutdown();
}

// Bootstraps SDL window/renderer and ImGui backends.
bool AppContext::initialize(const char* title, int width, int height)
{
    if (initialized_)
        return true;

    if (!initializeSDL() || !createWindow(title, width, height) || !createRenderer() || !initializeImGui())
    {
        shutdown();
        return false;
    }

    initialized_ = true;
    return true;
}

// Tears down whatever initialize() managed to create.
void AppContext::shutdown()
{
    if (imgui_initialized_)
    {
        ImGui_ImplSDLRenderer3_Shutdown();
        ImGui_ImplSDL3_Shutdown();
        ImGui::DestroyContext();
        imgui_initialized_ = false;
    }

    if (renderer_)
    {
        SDL_DestroyRenderer(renderer_);
        renderer_ = nullptr;
    }
    if (window_)
    {
        SDL_DestroyWindow(window_);
        window_ = nullptr;
    }

    if (sdl_initialized_)
    {
        SDL_Quit();
        sdl_initialized_ = false;
    }
    initialized_ = false;
}

// Forwards events to ImGui and reports platform quit requests.
bool AppContext::processEvent(const SDL_Event& event)
{
    ImGui_ImplSDL3_ProcessEvent(&event);

    if (event.type == SDL_EVENT_WINDOW_PIXEL_SIZE_CHANGED ||
        event.type == SDL_EVENT_WINDOW_DISPLAY_SCALE_CHANGED ||
        event.type == SDL_EVENT_WINDOW_RESIZED)
    {
        if (window_ && renderer_ && event.window.windowID == SDL_GetWindowID(window_))
            updateRendererScale();
    }

    return event.type == SDL_EVENT_QUIT;
}

void AppContext::beginFrame()
{
    ImGui_ImplSDLRenderer3_NewFrame();
    ImGui_ImplSDL3_NewFrame();
    ImGui::NewFrame();
}

void AppContext::endFrame()
{
    ImGui::Render();
    SDL_SetRenderDrawColor(renderer_, 24, 26, 30, 255);
    SDL_RenderClear(renderer_);
    ImGui_ImplSDLRenderer3_RenderDrawData(ImGui::GetDrawData(), renderer_);
    SDL_RenderPresent(renderer_);
}

void AppContext::getWindowSize(int& w, int& h) const
{
    if (!window_) { w = h = 0; return; }
    SDL_GetWindowSize(window_, &w, &h);
}

void AppContext::updateRendererScale()
{
    if (!window_ || !renderer_)
        return;

    if (SDL_GetWindowFlags(window_) & SDL_WINDOW_MINIMIZED)
        return;

    int w = 0, h = 0;
    int pw = 0, ph = 0;
    SDL_GetWindowSize(window_, &w, &h);
    SDL_GetWindowSizeInPixels(window_, &pw, &ph);

    float sx = (w > 0) ? (float)pw / (float)w : 1.0f;
    float sy = (h > 0) ? (float)ph / (float)h : 1.0f;
    if (sx <= 0.0f || !std::isfinite(sx)) sx = 1.0f;
    if (sy <= 0.0f || !std::isfinite(sy)) sy = 1.0f;

    float curx = 1.0f, cury = 1.0f;
    SDL_GetRenderScale(renderer_, &curx, &cury);
    if (std::fabs(curx - sx) < 0.001f && std::fabs(cury - sy) < 0.001f)
        return;

    if (!SDL_SetRenderScale(renderer_, sx, sy))
    {
        PLOG_WARNING << "SDL_SetRenderScale(" << sx << "," << sy << ") failed: " << SDL_GetError()
                     << " w=" << w << " h=" << h << " pw=" << pw << " ph=" << ph;
    }
}

bool AppContext::initializeSDL()
{
    if (!SDL_Init(SDL_INIT_VIDEO))
    {
        reportInitError("SDL", std::string("SDL_Init failed: ") + SDL_GetError());
        return false;
    }
    sdl_initialized_ = true;
    return true;
}

bool AppContext::createWindow(const char* title, int width, int height)
{
    const SDL_WindowFlags window_flags = SDL_WINDOW_RESIZABLE | SDL_WINDOW_HIGH_PIXEL_DENSITY;
    window_ = SDL_CreateWindow(title, width, height, window_flags);
    if (!window_)
    {
        reportInitError("Window", std::string("SDL_CreateWindow failed: ") + SDL_GetError());
        return false;
    }
    return true;
}

bool AppContext::createRenderer()
{
    renderer_ = SDL_CreateRenderer(window_, nullptr);
    if (!renderer_)
    {
        reportInitError("Renderer", std::string("SDL_CreateRenderer failed: ") + SDL_GetError());
        return false;
    }

    if (!SDL_SetRenderVSync(renderer_, 1))
    {
        PLOG_WARNING << "Failed to enable VSync: " << SDL_GetError() << " (will continue without VSync)";
    }

    updateRendererScale();
    SDL_SetRenderDrawBlendMode(renderer_, SDL_BLENDMODE_BLEND);
    return true;
}

bool AppContext::initializeImGui()
{
    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    ImGui::GetIO().IniFilename = nullptr;
    ImGui::StyleColorsDark();

    if (!ImGui_ImplSDL3_InitForSDLRenderer(window_, renderer_))
    {
        reportInitError("ImGui SDL3 Backend", "ImGui_ImplSDL3_InitForSDLRenderer returned false");
        ImGui::DestroyContext();
        return false;
    }

    if (!ImGui_ImplSDLRenderer3_Init(renderer_))
    {
        reportInitError("ImGui Renderer Backend", "ImGui_ImplSDLRenderer3_Init returned false");
        ImGui_ImplSDL3_Shutdown();
        ImGui::DestroyContext();
        return false;
    }

    imgui_initialized_ = true;
    return true;
}

void AppContext::reportInitError(const char* phase, const std::string& details)
{
    PLOG_FATAL << phase << " initialization failed: " << details;
    utils::ErrorReporter::ReportFatal(utils::ErrorCategory::Initialization,
                                      std::string("Failed to initialize ") + phase, details);
}
