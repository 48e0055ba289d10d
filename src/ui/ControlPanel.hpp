#pragma once

#include "InfoDialog.hpp"
#include "../utils/ErrorReporter.hpp"

#include <array>
#include <deque>
#include <memory>
#include <string>
#include <vector>

namespace deck
{
class DialogRegistry;
}

namespace ui
{

// Small tool window that opens sample dialogs and drives the registry lifecycle.
class ControlPanel
{
public:
    explicit ControlPanel(deck::DialogRegistry& registry);
    ~ControlPanel();

    void render();

    // Destroys dialogs that were closed or dismissed. Call after the host dropped them.
    void pruneRemovedDialogs();

private:
    void renderOpenControls();
    void renderOpenDialogs();
    void renderMessages();
    void openDialog(const std::string& key, const std::string& title, int width, int height,
                    InfoDialog::ContentFn content);
    void collectErrors();

    static constexpr std::size_t kMaxMessages = 8;

    deck::DialogRegistry& registry_;
    std::vector<std::unique_ptr<InfoDialog>> dialogs_;
    std::deque<utils::ErrorReport> messages_;

    std::array<char, 64> key_buffer_{};
    int new_width_ = 240;
    int new_height_ = 120;
    int custom_counter_ = 0;
};

} // namespace ui
