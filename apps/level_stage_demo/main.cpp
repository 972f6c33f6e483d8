// Level Stage Demo - 模拟宿主渲染器：主渲染目标配置、阶段注册、一帧关卡渲染的阶段派发
// 两个“模组”：outline 请求 stencil 并在 AfterTranslucentBlocks 绘制描边；
// portals 为自定义渲染类型注册一对阶段，统计 AfterLevel 帧数与 portal pass 次数。

#include <tessel_client/client_hooks.hpp>
#include <tessel_client/stage_registry.hpp>
#include <tessel_render/render_type.hpp>

#include <spdlog/spdlog.h>

#include <exception>
#include <iostream>
#include <string>
#include <vector>

namespace {

using tessel::client::ClientHooks;
using tessel::client::LevelFrameContext;
using tessel::client::RenderLevelStageEvent;
using tessel::client::Stage;
namespace Stages = tessel::client::Stages;
namespace RenderTypes = tessel::render::RenderTypes;

/** 宿主一帧 renderLevel 的阶段顺序 */
void RenderLevel(ClientHooks& hooks,
                 const std::vector<tessel::render::RenderTypeKey>& opaqueLayers,
                 const std::vector<tessel::render::RenderTypeKey>& translucentLayers,
                 const LevelFrameContext& frame) {
    hooks.FireRenderLevelStage(Stages::BeforeLevel, frame);
    hooks.FireRenderLevelStage(Stages::BeforeSky, frame);
    hooks.FireRenderLevelStage(Stages::AfterSky, frame);
    for (tessel::render::RenderTypeKey rt : opaqueLayers)
        hooks.DrawRenderType(rt, frame, nullptr);
    hooks.FireRenderLevelStage(Stages::BeforeEntities, frame);
    hooks.FireRenderLevelStage(Stages::AfterEntities, frame);
    hooks.FireRenderLevelStage(Stages::BeforeBlockEntities, frame);
    hooks.FireRenderLevelStage(Stages::AfterBlockEntities, frame);
    for (tessel::render::RenderTypeKey rt : translucentLayers)
        hooks.DrawRenderType(rt, frame, nullptr);
    hooks.FireRenderLevelStage(Stages::BeforeParticles, frame);
    hooks.FireRenderLevelStage(Stages::AfterParticles, frame);
    hooks.FireRenderLevelStage(Stages::BeforeWeather, frame);
    hooks.FireRenderLevelStage(Stages::AfterWeather, frame);
    hooks.FireRenderLevelStage(Stages::AfterLevel, frame);
}

}  // namespace

int main() {
    spdlog::set_level(spdlog::level::debug);

    tessel::render::RenderTypeTable renderTypes;
    const tessel::render::RenderTypeKey portalType = renderTypes.Define("portals:portal_surface");

    ClientHooks::Config config;
    config.traceStageDispatch = false;
    ClientHooks hooks(config);

    // outline 模组
    hooks.AddConfigureMainRenderTargetListener(
        [](tessel::client::ConfigureMainRenderTargetEvent& e) { e.EnableStencil(); });
    int outlineDraws = 0;
    hooks.AddRenderLevelStageListener([&outlineDraws](const RenderLevelStageEvent& e) {
        if (e.GetStage() == Stages::AfterTranslucentBlocks) ++outlineDraws;
    });

    // portals 模组
    Stage portalBefore;
    Stage portalAfter;
    hooks.AddRegisterStageListener([&](tessel::client::RegisterStageEvent& e) {
        tessel::client::StagePair pair =
            e.RegisterPair("portals:before_portals", "portals:after_portals", portalType);
        portalBefore = pair.before;
        portalAfter = pair.after;
    });
    int levelFrames = 0;
    int portalPasses = 0;
    hooks.AddRenderLevelStageListener([&](const RenderLevelStageEvent& e) {
        if (e.GetStage() == Stages::AfterLevel) ++levelFrames;
        if (e.GetStage() == portalBefore) {
            e.GetPoseStack().PushPose();
            e.GetPoseStack().PopPose();
        }
        if (e.GetStage() == portalAfter) ++portalPasses;
    });

    tessel::client::ConfigureMainRenderTargetEvent target = hooks.FireConfigureMainRenderTarget(1920, 1080);
    std::cout << "Main target " << target.Width() << "x" << target.Height()
              << " depth=" << target.UseDepth() << " stencil=" << target.UseStencil() << "\n";

    try {
        hooks.FireRegisterStages();
    } catch (const std::exception& ex) {
        std::cerr << "Stage registration failed: " << ex.what() << "\n";
        return 1;
    }

    const std::vector<tessel::render::RenderTypeKey> opaqueLayers = {
        RenderTypes::Solid, RenderTypes::CutoutMipped, RenderTypes::Cutout};
    const std::vector<tessel::render::RenderTypeKey> translucentLayers = {
        RenderTypes::Translucent, portalType, RenderTypes::Tripwire};

    tessel::render::PoseStack poseStack;
    LevelFrameContext frame;
    frame.poseStack = &poseStack;
    for (int tick = 0; tick < 3; ++tick) {
        frame.renderTick = tick;
        frame.partialTick = 0.5f;
        RenderLevel(hooks, opaqueLayers, translucentLayers, frame);
    }

    std::cout << "Frames: " << levelFrames << ", outline draws: " << outlineDraws
              << ", portal passes: " << portalPasses << "\n";
    return 0;
}
