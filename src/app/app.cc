#include "app/app.h"

#include <algorithm>
#include <chrono>

#include "app/demo_script.h"
#include "core/log.h"
#include "math/math.h"
#include "world/visibility_batcher.h"

namespace terravox::app {
namespace {

constexpr std::int32_t kSurfaceMapHalfExtent = 16;
constexpr std::int32_t kSurfaceMapScanTopY = 25;

} // namespace

bool App::init() {
    using Clock = std::chrono::steady_clock;
    const auto initStart = Clock::now();
    auto elapsedMs = [](const Clock::time_point& start) -> std::int64_t {
        return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start).count();
    };

    TVX_LOGI("app") << "init begin";
    applyEnvironmentOverrides(m_config);
    if (m_config.demo.fixedStepSeconds <= 0.0f) {
        TVX_LOGE("app") << "fixed step must be positive, got " << m_config.demo.fixedStepSeconds;
        return false;
    }

    m_session = std::make_unique<GameSession>(m_config);
    const auto worldStart = Clock::now();
    if (!m_session->generateWorld()) {
        TVX_LOGE("app") << "world generation did not run";
        return false;
    }
    TVX_LOGI("app") << "init step generateWorld took " << elapsedMs(worldStart) << " ms";

    const auto batchStart = Clock::now();
    const world::InstanceBatches& batches = m_session->instanceBatches();
    TVX_LOGI("app") << "initial batches: " << world::totalInstanceCount(batches) << " exposed of "
                    << m_session->store().size() << " blocks in " << elapsedMs(batchStart) << " ms";

    TVX_LOGI("app") << "init complete in " << elapsedMs(initStart) << " ms";
    return true;
}

void App::run() {
    if (!m_session) {
        TVX_LOGE("app") << "run called before a successful init";
        return;
    }

    TVX_LOGI("app") << "run begin (" << m_config.demo.frames << " frames at "
                    << m_config.demo.fixedStepSeconds << " s)";
    for (std::int32_t frameIndex = 0; frameIndex < m_config.demo.frames; ++frameIndex) {
        update(frameIndex, m_config.demo.fixedStepSeconds);
        ++m_framesRun;
    }
    TVX_LOGI("app") << "run exit after " << m_framesRun << " frame(s)";
}

void App::update(std::int32_t frameIndex, float dt) {
    const ScriptedFrame scripted = scriptedFrame(frameIndex);
    const math::Vector3 look = math::directionFromYawPitch(scripted.yawDegrees, scripted.pitchDegrees);
    const FrameReport report = m_session->step(scripted.input, look, dt);

    recordEdit(report.breakOutcome);
    recordEdit(report.placeOutcome);
    if (report.pick.has_value()) {
        ++m_framesWithTarget;
    }

    // Render collaborator stand-in: pull the memoized batches every frame.
    const world::InstanceBatches& batches = m_session->instanceBatches();
    const std::size_t instanceCount = world::totalInstanceCount(batches);
    m_peakInstanceCount = std::max(m_peakInstanceCount, instanceCount);

    if (m_config.demo.hudLogInterval > 0 && (frameIndex % m_config.demo.hudLogInterval) == 0) {
        logHud(frameIndex, report, instanceCount);
    }
}

void App::recordEdit(const std::optional<EditOutcome>& outcome) {
    if (!outcome.has_value()) {
        return;
    }
    ++m_editOutcomeCounts[static_cast<std::size_t>(*outcome)];
    TVX_LOGI("app") << "edit " << editOutcomeName(*outcome);
}

void App::logHud(std::int32_t frameIndex, const FrameReport& report, std::size_t instanceCount) const {
    const HudSnapshot& hud = report.hud;
    TVX_LOGI("app") << "frame " << frameIndex
                    << " pos=(" << hud.position.x << ", " << hud.position.y << ", " << hud.position.z << ")"
                    << " grounded=" << (hud.grounded ? 1 : 0)
                    << " flying=" << (hud.flying ? 1 : 0)
                    << " blocks=" << hud.blockCount
                    << " instances=" << instanceCount
                    << " slot=" << hud.selectedSlot << ":" << world::blockKindName(hud.selectedKind)
                    << " target=" << (report.pick.has_value() ? "yes" : "no");
}

void App::shutdown() {
    if (!m_session) {
        TVX_LOGI("app") << "shutdown (no session)";
        return;
    }

    const world::SurfaceMap map = m_session->surfaceMap(kSurfaceMapHalfExtent, kSurfaceMapScanTopY);
    std::size_t waterColumns = 0;
    for (const std::optional<world::BlockKind>& top : map.tops) {
        if (top == world::BlockKind::Water) {
            ++waterColumns;
        }
    }

    TVX_LOGI("app") << "summary: frames=" << m_framesRun
                    << " blocks=" << m_session->store().size()
                    << " revision=" << m_session->store().revision()
                    << " batchRecomputes=" << m_session->batcher().recomputeCount()
                    << " peakInstances=" << m_peakInstanceCount
                    << " framesWithTarget=" << m_framesWithTarget
                    << " editsApplied=" << m_editOutcomeCounts[static_cast<std::size_t>(EditOutcome::Applied)]
                    << " waterColumnsNearby=" << waterColumns << "/" << map.tops.size();
    m_session.reset();
}

} // namespace terravox::app
