#pragma once

#include "../placement/Geometry.hpp"

namespace deck
{

class PlacedDialog;

// The UI container that actually shows dialogs.
class DialogHost
{
public:
    virtual ~DialogHost() = default;

    // Adds the dialog to the visible UI tree. Called once per successful open.
    virtual void attach(PlacedDialog& dialog) = 0;

    // Current display size, in the same units as dialog positions.
    virtual Size displaySize() const = 0;
};

} // namespace deck
