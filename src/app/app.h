#pragma once

#include "app/engine_config.h"
#include "app/session.h"

#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>

// App subsystem
// Responsible for: coordinating startup, the fixed-step frame loop over a scripted input source, and shutdown.
// Should NOT do: contain gameplay rules, own device input, or render.
namespace terravox::app {

class App {
public:
    bool init();
    void run();
    void update(std::int32_t frameIndex, float dt);
    void shutdown();

    [[nodiscard]] const EngineConfig& config() const { return m_config; }
    [[nodiscard]] const GameSession* session() const { return m_session.get(); }
    [[nodiscard]] std::int32_t framesRun() const { return m_framesRun; }
    [[nodiscard]] std::size_t peakInstanceCount() const { return m_peakInstanceCount; }

private:
    void logHud(std::int32_t frameIndex, const FrameReport& report, std::size_t instanceCount) const;
    void recordEdit(const std::optional<EditOutcome>& outcome);

    EngineConfig m_config{};
    std::unique_ptr<GameSession> m_session;
    std::int32_t m_framesRun = 0;
    std::array<std::uint32_t, 7> m_editOutcomeCounts{};
    std::uint32_t m_framesWithTarget = 0;
    std::size_t m_peakInstanceCount = 0;
};

} // namespace terravox::app
