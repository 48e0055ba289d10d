#pragma once

namespace deck
{

// A dialog the registry can position. Size is fixed for the dialog's lifetime.
class PlacedDialog
{
public:
    virtual ~PlacedDialog() = default;

    virtual int x() const = 0;
    virtual int y() const = 0;
    virtual void setPosition(int x, int y) = 0;

    virtual int width() const = 0;
    virtual int height() const = 0;

    // Releases host resources. The owner destroys the object afterwards.
    virtual void close() = 0;
    // Recomputes internal layout without moving the dialog.
    virtual void refresh() = 0;
};

} // namespace deck
