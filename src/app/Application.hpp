#pragma once

#include <memory>
#include <SDL3/SDL.h>

class AppContext;
class ConfigManager;

namespace deck
{
class DialogRegistry;
}

namespace ui
{
class ImGuiDialogHost;
class ControlPanel;
} // namespace ui

class Application
{
public:
    Application(int argc, char** argv);
    ~Application();

    int run();
    void requestExit();

    deck::DialogRegistry* registry() { return registry_.get(); }

private:
    bool initialize();
    bool initializeLogging();
    void setupSDLLogging();
    void setupManagers();
    void initializeConfig();
    void registerPlacementHandler();

    void mainLoop();
    void processEvents();
    void renderFrame();
    void pollConfigChanges();
    void cleanup();

    void parseCommandLineArgs();

    std::unique_ptr<AppContext> context_;
    std::unique_ptr<ConfigManager> config_;
    std::unique_ptr<ui::ImGuiDialogHost> host_;
    std::unique_ptr<deck::DialogRegistry> registry_;
    std::unique_ptr<ui::ControlPanel> control_panel_;

    bool quit_requested_ = false;
    bool running_ = true;
    bool verbose_ = false;
    bool cleaned_up_ = false;
    Uint64 last_config_poll_ = 0;

    int argc_ = 0;
    char** argv_ = nullptr;
};
