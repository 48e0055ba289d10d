#include "DialogRegistry.hpp"

#include "DialogHost.hpp"
#include "PlacedDialog.hpp"
#include "../placement/PlacementSolver.hpp"

#include <plog/Log.h>

#include <algorithm>

namespace deck
{

DialogRegistry::DialogRegistry(DialogHost& host, PlacementSettings settings)
    : host_(host)
    , settings_(settings)
{
}

DialogRegistry::~DialogRegistry() = default;

void DialogRegistry::open(const std::string& key, PlacedDialog& dialog)
{
    if (contains(key))
    {
        PLOG_DEBUG << "Dialog '" << key << "' is already open";
        return;
    }

    PlacementSolver solver(settings_);
    const Point pos = solver.findPosition(occupiedRects(), dialog.width(), dialog.height(),
                                          [this]() { return host_.displaySize(); });
    dialog.setPosition(pos.x, pos.y);
    host_.attach(dialog);
    dialogs_.emplace(key, &dialog);

    PLOG_INFO << "Opened dialog '" << key << "' at (" << pos.x << ", " << pos.y << ") size "
              << dialog.width() << "x" << dialog.height();
}

PlacedDialog* DialogRegistry::get(const std::string& key) const
{
    auto it = dialogs_.find(key);
    if (it == dialogs_.end())
        return nullptr;
    return it->second;
}

// Forgets a dialog the host already tore down.
void DialogRegistry::remove(const std::string& key)
{
    if (dialogs_.erase(key) > 0)
        PLOG_DEBUG << "Removed dialog '" << key << "'";
}

void DialogRegistry::close(const std::string& key)
{
    auto it = dialogs_.find(key);
    if (it == dialogs_.end())
        return;

    PlacedDialog* dialog = it->second;
    dialog->close();
    // close() may have re-entered remove(), so erase by key.
    dialogs_.erase(key);
    PLOG_INFO << "Closed dialog '" << key << "'";
}

void DialogRegistry::refreshDialog(const std::string& key)
{
    if (auto* dialog = get(key))
        dialog->refresh();
}

void DialogRegistry::clear()
{
    // Snapshot first: close() mutates the map.
    for (const auto& key : keys())
        close(key);
}

std::vector<std::string> DialogRegistry::keys() const
{
    std::vector<std::string> result;
    result.reserve(dialogs_.size());
    for (const auto& [key, dialog] : dialogs_)
        result.push_back(key);
    std::sort(result.begin(), result.end());
    return result;
}

void DialogRegistry::setSettings(const PlacementSettings& settings)
{
    settings_ = settings;
    PLOG_DEBUG << "Placement anchor (" << settings_.anchor.x << ", " << settings_.anchor.y << "), gap "
               << settings_.gap;
}

std::vector<Rect> DialogRegistry::occupiedRects() const
{
    std::vector<Rect> rects;
    rects.reserve(dialogs_.size());
    for (const auto& [key, dialog] : dialogs_)
        rects.push_back(Rect{ dialog->x(), dialog->y(), dialog->width(), dialog->height() });
    return rects;
}

} // namespace deck
