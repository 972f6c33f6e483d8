/**
 * @file render_level_stage_event.hpp
 * @brief 关卡渲染过程中各阶段触发的事件
 *
 * 监听者应先检查 GetStage()，仅在需要的阶段绘制。
 * LevelRenderer/Camera/Frustum 为宿主类型，此处仅作非占有指针透传。
 * 本事件不可取消。
 */

#pragma once

#include <tessel_client/stage_registry.hpp>
#include <tessel_render/pose_stack.hpp>

#include <glm/glm.hpp>

#include <memory>

// 宿主类型，仅前向声明
namespace tessel::host {
class LevelRenderer;
class Camera;
class Frustum;
}  // namespace tessel::host

namespace tessel::client {

/** 一帧关卡渲染的公共参数，由宿主在 renderLevel 开始时填充，各阶段共用 */
struct LevelFrameContext {
    host::LevelRenderer* levelRenderer = nullptr;
    render::PoseStack* poseStack = nullptr;  // 可为空，事件将自备单位姿态栈
    glm::mat4 modelViewMatrix{1.f};
    glm::mat4 projectionMatrix{1.f};
    int renderTick = 0;
    float partialTick = 0.f;
    const host::Camera* camera = nullptr;
    const host::Frustum* frustum = nullptr;
};

class RenderLevelStageEvent {
public:
    RenderLevelStageEvent(Stage stage, const LevelFrameContext& frame);

    RenderLevelStageEvent(const RenderLevelStageEvent&) = delete;
    RenderLevelStageEvent& operator=(const RenderLevelStageEvent&) = delete;

    /** 当前渲染阶段 */
    Stage GetStage() const { return stage_; }

    host::LevelRenderer* GetLevelRenderer() const { return levelRenderer_; }

    /** 绘制用姿态栈；宿主未提供时为事件自有的栈 */
    render::PoseStack& GetPoseStack() const { return *poseStack_; }

    const glm::mat4& GetModelViewMatrix() const { return modelViewMatrix_; }
    const glm::mat4& GetProjectionMatrix() const { return projectionMatrix_; }

    /** 关卡渲染器当前的 tick 计数 */
    int GetRenderTick() const { return renderTick_; }

    float GetPartialTick() const { return partialTick_; }

    const host::Camera* GetCamera() const { return camera_; }
    const host::Frustum* GetFrustum() const { return frustum_; }

    /** 事件是否持有自建姿态栈 */
    bool OwnsPoseStack() const { return ownedPoseStack_ != nullptr; }

private:
    Stage stage_;
    host::LevelRenderer* levelRenderer_;
    std::unique_ptr<render::PoseStack> ownedPoseStack_;
    render::PoseStack* poseStack_;
    glm::mat4 modelViewMatrix_;
    glm::mat4 projectionMatrix_;
    int renderTick_;
    float partialTick_;
    const host::Camera* camera_;
    const host::Frustum* frustum_;
};

}  // namespace tessel::client
