#pragma once

#include "PlacedDialog.hpp"

#include <functional>
#include <string>
#include <vector>

namespace ui
{

// Fixed-size text panel whose lines come from a content provider.
class InfoDialog : public deck::PlacedDialog
{
public:
    using ContentFn = std::function<std::vector<std::string>()>;

    InfoDialog(std::string key, std::string title, int width, int height, ContentFn content);
    ~InfoDialog() override;

    int x() const override { return x_; }
    int y() const override { return y_; }
    void setPosition(int x, int y) override;
    int width() const override { return width_; }
    int height() const override { return height_; }
    void close() override;
    void refresh() override;

    void render();

    const std::string& key() const { return key_; }
    const std::string& title() const { return title_; }
    const std::vector<std::string>& lines() const { return lines_; }
    bool isClosed() const { return closed_; }
    // Set when the user pressed the title bar close button.
    bool dismissedByUser() const { return dismissed_; }
    bool shouldBeRemoved() const { return closed_ || dismissed_; }

private:
    std::string key_;
    std::string title_;
    std::string window_label_;
    int x_ = 0;
    int y_ = 0;
    int width_;
    int height_;
    ContentFn content_;
    std::vector<std::string> lines_;
    bool closed_ = false;
    bool dismissed_ = false;
};

} // namespace ui
