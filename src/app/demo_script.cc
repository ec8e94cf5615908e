#include "app/demo_script.h"

namespace terravox::app {

ScriptedFrame scriptedFrame(std::int32_t frameIndex) {
    const std::int32_t t = ((frameIndex % kDemoScriptLength) + kDemoScriptLength) % kDemoScriptLength;
    const std::int32_t pass = frameIndex / kDemoScriptLength;

    ScriptedFrame frame{};
    // Each pass heads a quarter turn further round.
    frame.yawDegrees = 90.0f * static_cast<float>(pass % 4);

    if (t < 120) {
        frame.input.moveForward = 1.0f;
    } else if (t < 130) {
        frame.input.moveForward = 1.0f;
        frame.input.jump = true;
    } else if (t < 240) {
        frame.input.moveForward = 1.0f;
        frame.input.moveStrafe = (t < 180) ? 1.0f : -1.0f;
        frame.input.sprint = true;
    } else if (t < 300) {
        frame.input.toggleFlyDown = (t < 245);
        frame.input.jump = true;
    } else if (t < 340) {
        frame.input.toggleFlyDown = (t < 305);
        frame.input.moveForward = 0.5f;
    } else if (t < 400) {
        frame.pitchDegrees = -60.0f;
        frame.input.breakPressed = (t == 360);
        frame.input.placePressed = (t == 380);
        frame.input.hotbarScroll = (t == 370) ? 1 : 0;
    } else {
        frame.pitchDegrees = -30.0f;
        frame.input.hotbarSlot = (t == 400) ? 2 : 0;
        frame.input.moveStrafe = -1.0f;
    }
    return frame;
}

} // namespace terravox::app
