#pragma once

// mapinteraction namespace contains the mouse handling types of the map widget.
namespace mapinteraction {

// What a left-button drag does on the map.
enum class MouseMode {
    Drag,   // Pans the map, unless the press lands on a mapmark.
    Select, // Draws a rubber band; releasing reports the geo rect.
};

// Gesture currently in progress.
enum class Gesture {
    None,
    Pan,
    Select,
};

}  // namespace mapinteraction
