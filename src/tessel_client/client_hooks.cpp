/**
 * @file client_hooks.cpp
 * @brief ClientHooks 实现
 */

#include <tessel_client/client_hooks.hpp>

#include <spdlog/spdlog.h>

#include <stdexcept>
#include <utility>

namespace tessel::client {

void ClientHooks::AddConfigureMainRenderTargetListener(ConfigureMainRenderTargetListener listener) {
    if (!listener) return;
    configureListeners_.push_back(std::move(listener));
}

void ClientHooks::AddRegisterStageListener(RegisterStageListener listener) {
    if (!listener) return;
    registerStageListeners_.push_back(std::move(listener));
}

void ClientHooks::AddRenderLevelStageListener(RenderLevelStageListener listener) {
    if (!listener) return;
    renderLevelStageListeners_.push_back(std::move(listener));
}

ConfigureMainRenderTargetEvent ClientHooks::FireConfigureMainRenderTarget(int width, int height) {
    ConfigureMainRenderTargetEvent event(width, height);
    for (const ConfigureMainRenderTargetListener& listener : configureListeners_)
        listener(event);
    spdlog::info("Main render target {}x{}: depth={}, stencil={}", event.Width(), event.Height(),
                 event.UseDepth(), event.UseStencil());
    return event;
}

void ClientHooks::FireRegisterStages() {
    if (registry_.IsSealed())
        throw std::logic_error("ClientHooks::FireRegisterStages: stages were already registered");
    RegisterStageEvent event(registry_);
    try {
        for (const RegisterStageListener& listener : registerStageListeners_)
            listener(event);
    } catch (...) {
        // 注册窗口只有一次：失败时同样关闭，已登记的阶段保留，异常交给宿主
        registry_.Seal();
        throw;
    }
    registry_.Seal();
}

void ClientHooks::FireRenderLevelStage(Stage stage, const LevelFrameContext& frame) {
    if (!registry_.IsValid(stage)) {
        spdlog::warn("FireRenderLevelStage: unknown stage index {}", stage.index);
        return;
    }
    if (config_.traceStageDispatch) {
        spdlog::trace("Stage '{}' tick={} listeners={}", registry_.GetName(stage), frame.renderTick,
                      renderLevelStageListeners_.size());
    }
    if (renderLevelStageListeners_.empty()) return;
    RenderLevelStageEvent event(stage, frame);
    for (const RenderLevelStageListener& listener : renderLevelStageListeners_)
        listener(event);
}

void ClientHooks::DrawRenderType(render::RenderTypeKey renderType,
                                 const LevelFrameContext& frame,
                                 const std::function<void()>& draw) {
    if (std::optional<Stage> before = registry_.StageBeforeRenderType(renderType))
        FireRenderLevelStage(*before, frame);
    if (draw) draw();
    if (std::optional<Stage> after = registry_.StageAfterRenderType(renderType))
        FireRenderLevelStage(*after, frame);
}

}  // namespace tessel::client
