/**
 * @file client_hooks.hpp
 * @brief 宿主渲染器调用的客户端钩子：按注册顺序通知各事件的监听者
 *
 * 宿主调用顺序：
 * FireConfigureMainRenderTarget(w, h) → 读回 depth/stencil 分配主渲染目标
 * → 关卡渲染器创建后 FireRegisterStages()（之后注册表 sealed）
 * → 每帧 renderLevel：BeforeLevel → 天空/各渲染类型（DrawRenderType）/实体/粒子/天气 → AfterLevel。
 *
 * 所有监听者在调用线程上同步执行；监听者抛出的异常直接传播给宿主。
 * ClientHooks 持有进程内唯一的 StageRegistry，Stage 句柄均相对于该注册表。
 */

#pragma once

#include <tessel_client/configure_main_render_target_event.hpp>
#include <tessel_client/register_stage_event.hpp>
#include <tessel_client/render_level_stage_event.hpp>
#include <tessel_client/stage_registry.hpp>
#include <tessel_render/render_type.hpp>

#include <functional>
#include <vector>

namespace tessel::client {

class ClientHooks {
public:
    struct Config {
        /** 每次阶段派发都输出 trace 日志（阶段名、tick、监听者数量） */
        bool traceStageDispatch = false;
    };

    using ConfigureMainRenderTargetListener = std::function<void(ConfigureMainRenderTargetEvent&)>;
    using RegisterStageListener = std::function<void(RegisterStageEvent&)>;
    using RenderLevelStageListener = std::function<void(const RenderLevelStageEvent&)>;

    ClientHooks() = default;
    explicit ClientHooks(const Config& config) : config_(config) {}

    ClientHooks(const ClientHooks&) = delete;
    ClientHooks& operator=(const ClientHooks&) = delete;

    // --- 监听者注册（空回调被忽略）---
    void AddConfigureMainRenderTargetListener(ConfigureMainRenderTargetListener listener);
    void AddRegisterStageListener(RegisterStageListener listener);
    void AddRenderLevelStageListener(RenderLevelStageListener listener);

    /**
     * 构造主渲染目标配置事件并依次通知监听者。
     * @return 监听者处理后的事件，宿主据此分配帧缓冲
     */
    ConfigureMainRenderTargetEvent FireConfigureMainRenderTarget(int width, int height);

    /**
     * 触发 RegisterStageEvent，结束后 Seal 注册表；监听者抛异常时同样先 Seal 再重新抛出。
     * @throws std::logic_error 注册表已 sealed（重复调用）
     * @throws std::invalid_argument 监听者注册了冲突的渲染类型
     */
    void FireRegisterStages();

    /** 通知 stage 的监听者；无效 stage 直接返回 */
    void FireRenderLevelStage(Stage stage, const LevelFrameContext& frame);

    /**
     * 绘制一个渲染类型：若存在 before 阶段则先触发，再调用 draw，若存在 after 阶段则最后触发。
     * @param draw 宿主实际的 draw call，可为空
     */
    void DrawRenderType(render::RenderTypeKey renderType,
                        const LevelFrameContext& frame,
                        const std::function<void()>& draw);

    StageRegistry& GetStageRegistry() { return registry_; }
    const StageRegistry& GetStageRegistry() const { return registry_; }

    const Config& GetConfig() const { return config_; }

private:
    Config config_;
    StageRegistry registry_;
    std::vector<ConfigureMainRenderTargetListener> configureListeners_;
    std::vector<RegisterStageListener> registerStageListeners_;
    std::vector<RenderLevelStageListener> renderLevelStageListeners_;
};

}  // namespace tessel::client
