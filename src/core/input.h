#pragma once

#include <cstdint>

// Core Input subsystem
// Responsible for: the device-independent intent a frame consumes (movement, mode toggles, edits).
// Should NOT do: poll OS APIs, map key codes, or manage pointer lock.
namespace terravox::core {

enum class PointerButton : std::uint8_t {
    Primary = 0,
    Secondary = 1
};

struct InputState {
    // Axis values in [-1, 1]: +forward along the look direction, +strafe to the right.
    float moveForward = 0.0f;
    float moveStrafe = 0.0f;
    bool sprint = false;
    bool jump = false;
    bool descend = false;
    // Level-triggered; the session toggles flight on the rising edge.
    bool toggleFlyDown = false;

    // 1..9 selects a hotbar slot, 0 leaves the selection alone.
    int hotbarSlot = 0;
    int hotbarScroll = 0;

    bool breakPressed = false;
    bool placePressed = false;
};

} // namespace terravox::core
