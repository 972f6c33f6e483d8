/**
 * @file render_level_stage_event.cpp
 * @brief RenderLevelStageEvent 实现
 */

#include <tessel_client/render_level_stage_event.hpp>

namespace tessel::client {

RenderLevelStageEvent::RenderLevelStageEvent(Stage stage, const LevelFrameContext& frame)
    : stage_(stage),
      levelRenderer_(frame.levelRenderer),
      ownedPoseStack_(frame.poseStack ? nullptr : std::make_unique<render::PoseStack>()),
      poseStack_(frame.poseStack ? frame.poseStack : ownedPoseStack_.get()),
      modelViewMatrix_(frame.modelViewMatrix),
      projectionMatrix_(frame.projectionMatrix),
      renderTick_(frame.renderTick),
      partialTick_(frame.partialTick),
      camera_(frame.camera),
      frustum_(frame.frustum) {}

}  // namespace tessel::client
