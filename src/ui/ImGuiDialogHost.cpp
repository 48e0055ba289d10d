#include "ImGuiDialogHost.hpp"

#include "AppContext.hpp"
#include "DialogRegistry.hpp"
#include "InfoDialog.hpp"
#include "../utils/ErrorReporter.hpp"

#include <imgui.h>
#include <plog/Log.h>

#include <algorithm>

namespace ui
{

ImGuiDialogHost::ImGuiDialogHost(AppContext& context)
    : context_(context)
{
}

ImGuiDialogHost::~ImGuiDialogHost() = default;

void ImGuiDialogHost::attach(deck::PlacedDialog& dialog)
{
    auto* info = dynamic_cast<InfoDialog*>(&dialog);
    if (!info)
    {
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Placement, "Dialog cannot be shown",
                                          "ImGuiDialogHost only renders InfoDialog instances");
        return;
    }
    visible_.push_back(info);
}

deck::Size ImGuiDialogHost::displaySize() const
{
    if (ImGui::GetCurrentContext())
    {
        const ImVec2 size = ImGui::GetMainViewport()->Size;
        return deck::Size{ static_cast<int>(size.x), static_cast<int>(size.y) };
    }

    int w = 0, h = 0;
    context_.getWindowSize(w, h);
    return deck::Size{ w, h };
}

void ImGuiDialogHost::render()
{
    for (auto* dialog : visible_)
        dialog->render();
}

void ImGuiDialogHost::processRemovals(deck::DialogRegistry& registry)
{
    for (auto* dialog : visible_)
    {
        if (dialog->dismissedByUser() && !dialog->isClosed() && registry.get(dialog->key()) == dialog)
        {
            PLOG_DEBUG << "Unregistering dismissed dialog '" << dialog->key() << "'";
            registry.remove(dialog->key());
        }
    }

    visible_.erase(std::remove_if(visible_.begin(), visible_.end(),
                                  [](const InfoDialog* dialog)
                                  {
                                      return dialog->shouldBeRemoved();
                                  }),
                   visible_.end());
}

} // namespace ui
