#include "ControlPanel.hpp"

#include "DialogRegistry.hpp"

#include <imgui.h>
#include <plog/Log.h>

#include <algorithm>
#include <cstdio>
#include <ctime>

namespace
{
constexpr float kPanelWidth = 320.0f;
constexpr float kPanelHeight = 420.0f;
constexpr int kMinDialogSide = 40;

std::string current_time_string()
{
    std::time_t now = std::time(nullptr);
    std::tm tm_buf{};
#ifdef _WIN32
    localtime_s(&tm_buf, &now);
#else
    localtime_r(&now, &tm_buf);
#endif
    char buf[32];
    std::strftime(buf, sizeof(buf), "%H:%M:%S", &tm_buf);
    return buf;
}
} // namespace

namespace ui
{

ControlPanel::ControlPanel(deck::DialogRegistry& registry)
    : registry_(registry)
{
    std::snprintf(key_buffer_.data(), key_buffer_.size(), "custom");
}

ControlPanel::~ControlPanel() = default;

void ControlPanel::render()
{
    collectErrors();

    const ImGuiViewport* viewport = ImGui::GetMainViewport();
    ImGui::SetNextWindowPos(ImVec2(viewport->Pos.x + viewport->Size.x - kPanelWidth - 10.0f,
                                   viewport->Pos.y + viewport->Size.y - kPanelHeight - 10.0f),
                            ImGuiCond_Always);
    ImGui::SetNextWindowSize(ImVec2(kPanelWidth, kPanelHeight), ImGuiCond_Always);

    if (ImGui::Begin("Dialog Deck###control_panel", nullptr,
                     ImGuiWindowFlags_NoMove | ImGuiWindowFlags_NoResize | ImGuiWindowFlags_NoCollapse))
    {
        renderOpenControls();
        ImGui::Separator();
        renderOpenDialogs();
        ImGui::Separator();
        renderMessages();
    }
    ImGui::End();
}

void ControlPanel::renderOpenControls()
{
    if (ImGui::Button("Clock"))
    {
        openDialog("clock", "Clock", 180, 80, []() {
            return std::vector<std::string>{ "Refreshed at " + current_time_string() };
        });
    }
    ImGui::SameLine();
    if (ImGui::Button("Open dialogs"))
    {
        openDialog("registry", "Open dialogs", 220, 200, [this]() {
            std::vector<std::string> lines;
            for (const auto& key : registry_.keys())
                lines.push_back(key);
            return lines;
        });
    }
    ImGui::SameLine();
    if (ImGui::Button("Placement"))
    {
        openDialog("placement", "Placement", 260, 110, [this]() {
            const auto& settings = registry_.settings();
            return std::vector<std::string>{
                "Anchor: " + std::to_string(settings.anchor.x) + ", " + std::to_string(settings.anchor.y),
                "Gap: " + std::to_string(settings.gap),
            };
        });
    }

    ImGui::InputText("Key", key_buffer_.data(), key_buffer_.size());
    ImGui::InputInt("Width", &new_width_, 10, 50);
    ImGui::InputInt("Height", &new_height_, 10, 50);
    new_width_ = std::max(new_width_, kMinDialogSide);
    new_height_ = std::max(new_height_, kMinDialogSide);

    if (ImGui::Button("Open"))
    {
        std::string key(key_buffer_.data());
        if (key.empty())
            key = "custom_" + std::to_string(custom_counter_);
        const int serial = ++custom_counter_;
        const int width = new_width_;
        const int height = new_height_;
        openDialog(key, key, width, height, [serial, width, height]() {
            return std::vector<std::string>{ "Dialog #" + std::to_string(serial),
                                             std::to_string(width) + " x " + std::to_string(height) };
        });
    }
    ImGui::SameLine();
    if (ImGui::Button("Clear all"))
        registry_.clear();
}

void ControlPanel::renderOpenDialogs()
{
    ImGui::Text("Open: %zu", registry_.size());
    for (const auto& key : registry_.keys())
    {
        ImGui::PushID(key.c_str());
        if (ImGui::SmallButton("Refresh"))
            registry_.refreshDialog(key);
        ImGui::SameLine();
        if (ImGui::SmallButton("Close"))
            registry_.close(key);
        ImGui::SameLine();
        if (const auto* dialog = registry_.get(key))
            ImGui::Text("%s (%d, %d)", key.c_str(), dialog->x(), dialog->y());
        ImGui::PopID();
    }
}

void ControlPanel::renderMessages()
{
    if (messages_.empty())
        return;

    for (const auto& report : messages_)
    {
        ImGui::TextWrapped("[%s] %s", utils::ErrorReporter::SeverityToString(report.severity).c_str(),
                           report.user_message.c_str());
    }
    if (ImGui::SmallButton("Dismiss"))
        messages_.clear();
}

void ControlPanel::openDialog(const std::string& key, const std::string& title, int width, int height,
                              InfoDialog::ContentFn content)
{
    if (registry_.contains(key))
    {
        PLOG_DEBUG << "Dialog '" << key << "' already open, not creating another";
        return;
    }

    auto dialog = std::make_unique<InfoDialog>(key, title, width, height, std::move(content));
    registry_.open(key, *dialog);
    dialogs_.push_back(std::move(dialog));
}

void ControlPanel::pruneRemovedDialogs()
{
    dialogs_.erase(std::remove_if(dialogs_.begin(), dialogs_.end(),
                                  [](const std::unique_ptr<InfoDialog>& dialog)
                                  {
                                      return dialog->shouldBeRemoved();
                                  }),
                   dialogs_.end());
}

void ControlPanel::collectErrors()
{
    for (auto& report : utils::ErrorReporter::GetPendingErrors())
    {
        messages_.push_back(std::move(report));
        if (messages_.size() > kMaxMessages)
            messages_.pop_front();
    }
}

} // namespace ui
