#pragma once

#include <cstdint>

#include "core/input.h"

namespace terravox::app {

struct ScriptedFrame {
    core::InputState input{};
    float yawDegrees = 0.0f;
    float pitchDegrees = 0.0f;
};

// Frames per pass of the scripted tour; the script repeats after this many frames.
inline constexpr std::int32_t kDemoScriptLength = 480;

// Stand-in for device input in the headless build: walk, jump, sprint-strafe, fly up and back down,
// then dig and build while looking at the ground.
ScriptedFrame scriptedFrame(std::int32_t frameIndex);

} // namespace terravox::app
