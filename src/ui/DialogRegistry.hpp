#pragma once

#include "../placement/PlacementSettings.hpp"

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

namespace deck
{

class DialogHost;
class PlacedDialog;

/**
 * @brief Tracks open dialogs by key and places new ones next to them
 *
 * The registry references dialogs without owning them. Every operation on a missing or
 * duplicate key is a no-op. All calls are expected on the UI thread.
 */
class DialogRegistry
{
public:
    explicit DialogRegistry(DialogHost& host, PlacementSettings settings = {});
    ~DialogRegistry();

    DialogRegistry(const DialogRegistry&) = delete;
    DialogRegistry& operator=(const DialogRegistry&) = delete;

    void open(const std::string& key, PlacedDialog& dialog);
    PlacedDialog* get(const std::string& key) const;
    void remove(const std::string& key);
    void close(const std::string& key);
    void refreshDialog(const std::string& key);
    void clear();

    bool contains(const std::string& key) const { return dialogs_.count(key) != 0; }
    std::size_t size() const { return dialogs_.size(); }
    bool empty() const { return dialogs_.empty(); }
    std::vector<std::string> keys() const;

    const PlacementSettings& settings() const { return settings_; }
    // Applies to future placements only; open dialogs stay where they are.
    void setSettings(const PlacementSettings& settings);

private:
    std::vector<Rect> occupiedRects() const;

    DialogHost& host_;
    PlacementSettings settings_;
    std::unordered_map<std::string, PlacedDialog*> dialogs_;
};

} // namespace deck
