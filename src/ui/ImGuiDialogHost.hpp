#pragma once

#include "DialogHost.hpp"

#include <cstddef>
#include <vector>

class AppContext;

namespace deck
{
class DialogRegistry;
}

namespace ui
{

class InfoDialog;

// Shows attached dialogs as fixed ImGui windows inside the SDL window.
class ImGuiDialogHost : public deck::DialogHost
{
public:
    explicit ImGuiDialogHost(AppContext& context);
    ~ImGuiDialogHost() override;

    void attach(deck::PlacedDialog& dialog) override;
    deck::Size displaySize() const override;

    void render();

    // Unregisters dialogs the user dismissed and drops every closed one from the view.
    void processRemovals(deck::DialogRegistry& registry);

    std::size_t visibleCount() const { return visible_.size(); }

private:
    AppContext& context_;
    std::vector<InfoDialog*> visible_;
};

} // namespace ui
