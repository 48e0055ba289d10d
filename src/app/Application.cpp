#include "Application.hpp"
#include "app/Version.hpp"
#include "config/ConfigManager.hpp"
#include "config/PlacementSerializer.hpp"
#include "ui/AppContext.hpp"
#include "ui/ControlPanel.hpp"
#include "ui/DialogRegistry.hpp"
#include "ui/ImGuiDialogHost.hpp"
#include "utils/ErrorReporter.hpp"
#include "utils/LogManager.hpp"

#include <plog/Log.h>
#include <toml++/toml.h>

#include <cstring>
#include <optional>

namespace
{

constexpr const char* kConfigPath = "config.toml";
constexpr Uint64 kConfigPollIntervalMs = 1000;

static void SDLCALL SDLLogBridge(void* userdata, int category, SDL_LogPriority priority, const char* message)
{
    (void)userdata;
    switch (priority)
    {
    case SDL_LOG_PRIORITY_VERBOSE:
        PLOG_VERBOSE << "[SDL:" << category << "] " << message;
        break;
    case SDL_LOG_PRIORITY_DEBUG:
        PLOG_DEBUG << "[SDL:" << category << "] " << message;
        break;
    case SDL_LOG_PRIORITY_INFO:
        PLOG_INFO << "[SDL:" << category << "] " << message;
        break;
    case SDL_LOG_PRIORITY_WARN:
        PLOG_WARNING << "[SDL:" << category << "] " << message;
        break;
    case SDL_LOG_PRIORITY_ERROR:
        PLOG_ERROR << "[SDL:" << category << "] " << message;
        break;
    case SDL_LOG_PRIORITY_CRITICAL:
        PLOG_FATAL << "[SDL:" << category << "] " << message;
        break;
    default:
        PLOG_INFO << "[SDL:" << category << "] " << message;
        break;
    }
}

} // namespace

Application::Application(int argc, char** argv)
    : argc_(argc)
    , argv_(argv)
{
}

Application::~Application() { cleanup(); }

bool Application::initialize()
{
    parseCommandLineArgs();

    if (!initializeLogging())
        return false;

    PLOG_INFO << "Dialog Deck " << DECK_VERSION_STRING << " starting";

    context_ = std::make_unique<AppContext>();
    if (!context_->initialize("Dialog Deck", 1280, 800))
        return false;

    setupSDLLogging();
    if (!SDL_SetAppMetadata("Dialog Deck", DECK_VERSION_STRING, "dialog-deck"))
        PLOG_DEBUG << "SDL_SetAppMetadata failed: " << SDL_GetError();

    setupManagers();
    initializeConfig();

    last_config_poll_ = SDL_GetTicks();
    return true;
}

bool Application::initializeLogging()
{
    if (!utils::LogManager::Initialize(kConfigPath))
    {
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Initialization, "Failed to initialize logging system",
                                            "");
        return false;
    }

    return utils::LogManager::RegisterLogger<0>({ .name = "main",
                                                  .filepath = "logs/dialog_deck.log",
                                                  .append_override = std::nullopt,
                                                  .level_override = verbose_ ? std::optional<plog::Severity>(plog::verbose)
                                                                             : std::nullopt,
                                                  .max_file_size = 5 * 1024 * 1024,
                                                  .backup_count = 3,
                                                  .add_console_appender = verbose_ });
}

void Application::setupSDLLogging()
{
    SDL_SetLogOutputFunction(SDLLogBridge, nullptr);
    SDL_SetLogPriority(SDL_LOG_CATEGORY_APPLICATION, SDL_LOG_PRIORITY_INFO);
}

void Application::setupManagers()
{
    config_ = std::make_unique<ConfigManager>(kConfigPath);
    host_ = std::make_unique<ui::ImGuiDialogHost>(*context_);
    registry_ = std::make_unique<deck::DialogRegistry>(*host_);
    control_panel_ = std::make_unique<ui::ControlPanel>(*registry_);
}

void Application::initializeConfig()
{
    registerPlacementHandler();

    // load() reports parse errors itself.
    if (!config_->load())
        PLOG_WARNING << "Starting with default settings: " << config_->lastError();
}

void Application::registerPlacementHandler()
{
    TableCallbacks cb;
    cb.load = [this](const toml::table& section) {
        deck::PlacementSettings settings;
        settings.applyDefaults();
        if (!PlacementSerializer::deserialize(section, settings))
            PLOG_WARNING << "Invalid [placement] values replaced by defaults";
        registry_->setSettings(settings);
    };
    cb.save = [this]() -> toml::table {
        return PlacementSerializer::serialize(registry_->settings());
    };

    if (!config_->registerTable("placement", std::move(cb)))
        PLOG_ERROR << "Placement settings will not be loaded: " << config_->lastError();
}

int Application::run()
{
    if (!initialize())
    {
        return -1;
    }
    mainLoop();
    return 0;
}

void Application::requestExit()
{
    PLOG_INFO << "Application exit requested";
    quit_requested_ = true;
}

void Application::mainLoop()
{
    while (running_)
    {
        processEvents();
        pollConfigChanges();
        renderFrame();

        if (quit_requested_)
            running_ = false;
    }
}

void Application::processEvents()
{
    SDL_Event event;

    if (SDL_WaitEventTimeout(&event, 16))
    {
        if (context_->processEvent(event))
            quit_requested_ = true;

        while (SDL_PollEvent(&event))
        {
            if (context_->processEvent(event))
                quit_requested_ = true;
        }
    }
}

void Application::renderFrame()
{
    context_->beginFrame();

    host_->render();
    control_panel_->render();

    // Host first: it must let go of dialogs before the panel destroys them.
    host_->processRemovals(*registry_);
    control_panel_->pruneRemovedDialogs();

    context_->endFrame();
}

void Application::pollConfigChanges()
{
    const Uint64 now = SDL_GetTicks();
    if (now - last_config_poll_ < kConfigPollIntervalMs)
        return;
    last_config_poll_ = now;
    config_->reloadIfChanged();
}

void Application::cleanup()
{
    if (cleaned_up_)
        return;
    cleaned_up_ = true;

    if (registry_)
    {
        registry_->clear();
        host_->processRemovals(*registry_);
        control_panel_->pruneRemovedDialogs();
    }

    if (config_ && config_->fileUnreadable())
        PLOG_INFO << "Config file has errors, not saving over it";
    else if (config_ && !config_->save())
        PLOG_WARNING << "Configuration not saved: " << config_->lastError();

    if (context_)
        context_->shutdown();
}

void Application::parseCommandLineArgs()
{
    for (int i = 1; i < argc_; ++i)
    {
        if (std::strcmp(argv_[i], "--verbose") == 0)
            verbose_ = true;
    }
}
