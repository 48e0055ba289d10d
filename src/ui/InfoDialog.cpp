#include "InfoDialog.hpp"

#include <imgui.h>
#include <plog/Log.h>

namespace ui
{

InfoDialog::InfoDialog(std::string key, std::string title, int width, int height, ContentFn content)
    : key_(std::move(key))
    , title_(std::move(title))
    , width_(width)
    , height_(height)
    , content_(std::move(content))
{
    window_label_ = title_ + "###dialog_" + key_;
    refresh();
}

InfoDialog::~InfoDialog() = default;

void InfoDialog::setPosition(int x, int y)
{
    x_ = x;
    y_ = y;
}

void InfoDialog::close()
{
    if (closed_)
        return;
    closed_ = true;
    lines_.clear();
    PLOG_DEBUG << "Dialog '" << key_ << "' released";
}

void InfoDialog::refresh()
{
    if (closed_)
        return;
    lines_ = content_ ? content_() : std::vector<std::string>{};
}

void InfoDialog::render()
{
    if (shouldBeRemoved())
        return;

    ImGui::SetNextWindowPos(ImVec2(static_cast<float>(x_), static_cast<float>(y_)), ImGuiCond_Always);
    ImGui::SetNextWindowSize(ImVec2(static_cast<float>(width_), static_cast<float>(height_)), ImGuiCond_Always);

    const ImGuiWindowFlags flags = ImGuiWindowFlags_NoMove | ImGuiWindowFlags_NoResize |
                                   ImGuiWindowFlags_NoCollapse | ImGuiWindowFlags_NoSavedSettings;
    bool open = true;
    if (ImGui::Begin(window_label_.c_str(), &open, flags))
    {
        for (const auto& line : lines_)
            ImGui::TextWrapped("%s", line.c_str());
    }
    ImGui::End();

    if (!open)
    {
        dismissed_ = true;
        PLOG_DEBUG << "Dialog '" << key_ << "' dismissed from its title bar";
    }
}

} // namespace ui
