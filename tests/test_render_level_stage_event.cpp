/**
 * @file test_render_level_stage_event.cpp
 * @brief RenderLevelStageEvent 与 PoseStack 单元测试
 *
 * 覆盖：帧参数透传；未提供姿态栈时事件自建单位姿态栈；提供时直接引用宿主栈；
 * PoseStack Push/Pop/Clear 与弹出栈底抛 logic_error。
 */

#include <tessel_client/render_level_stage_event.hpp>
#include <tessel_client/stage_registry.hpp>
#include <tessel_render/pose_stack.hpp>

#include <glm/glm.hpp>

#include <cstdlib>
#include <iostream>
#include <stdexcept>

#define TEST_CHECK(cond)                                               \
    do {                                                               \
        if (!(cond)) {                                                 \
            std::cerr << "FAIL: " << __FILE__ << ":" << __LINE__        \
                      << " " << #cond << std::endl;                    \
            std::exit(1);                                              \
        }                                                              \
    } while (0)

using tessel::client::LevelFrameContext;
using tessel::client::RenderLevelStageEvent;
using tessel::render::PoseStack;
namespace Stages = tessel::client::Stages;

static void test_frame_fields() {
    LevelFrameContext frame;
    frame.modelViewMatrix = glm::mat4(2.f);
    frame.projectionMatrix = glm::mat4(3.f);
    frame.renderTick = 1234;
    frame.partialTick = 0.25f;
    RenderLevelStageEvent e(Stages::AfterWeather, frame);
    TEST_CHECK(e.GetStage() == Stages::AfterWeather);
    TEST_CHECK(e.GetModelViewMatrix() == glm::mat4(2.f));
    TEST_CHECK(e.GetProjectionMatrix() == glm::mat4(3.f));
    TEST_CHECK(e.GetRenderTick() == 1234);
    TEST_CHECK(e.GetPartialTick() == 0.25f);
    TEST_CHECK(e.GetLevelRenderer() == nullptr);
    TEST_CHECK(e.GetCamera() == nullptr);
    TEST_CHECK(e.GetFrustum() == nullptr);
}

static void test_owned_pose_stack() {
    LevelFrameContext frame;
    RenderLevelStageEvent e(Stages::BeforeLevel, frame);
    TEST_CHECK(e.OwnsPoseStack());
    TEST_CHECK(e.GetPoseStack().IsClear());
    TEST_CHECK(e.GetPoseStack().Last() == glm::mat4(1.f));
}

static void test_host_pose_stack() {
    PoseStack host;
    host.Last() = glm::mat4(5.f);
    LevelFrameContext frame;
    frame.poseStack = &host;
    RenderLevelStageEvent e(Stages::AfterSky, frame);
    TEST_CHECK(!e.OwnsPoseStack());
    TEST_CHECK(&e.GetPoseStack() == &host);
    e.GetPoseStack().PushPose();
    TEST_CHECK(host.Size() == 2u);
    TEST_CHECK(host.Last() == glm::mat4(5.f));
}

static void test_pose_stack_ops() {
    PoseStack ps;
    TEST_CHECK(ps.Size() == 1u);
    ps.Last() = glm::mat4(4.f);
    ps.PushPose();
    TEST_CHECK(ps.Last() == glm::mat4(4.f));
    ps.Last() = glm::mat4(6.f);
    ps.PopPose();
    TEST_CHECK(ps.Last() == glm::mat4(4.f));
    TEST_CHECK(ps.IsClear());

    bool threw = false;
    try {
        ps.PopPose();
    } catch (const std::logic_error&) {
        threw = true;
    }
    TEST_CHECK(threw);
    TEST_CHECK(ps.Size() == 1u);

    ps.PushPose();
    ps.PushPose();
    ps.Clear();
    TEST_CHECK(ps.IsClear());
    TEST_CHECK(ps.Last() == glm::mat4(1.f));
}

int main() {
    test_frame_fields();
    test_owned_pose_stack();
    test_host_pose_stack();
    test_pose_stack_ops();
    std::cout << "All RenderLevelStageEvent tests passed." << std::endl;
    return 0;
}
