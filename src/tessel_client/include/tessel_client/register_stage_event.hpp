/**
 * @file register_stage_event.hpp
 * @brief 注册自定义关卡渲染阶段的事件
 *
 * 在关卡渲染器创建后触发一次，是唯一的注册窗口；事件结束后注册表被 Seal。
 * 本事件不可取消。
 */

#pragma once

#include <tessel_client/stage_registry.hpp>

#include <optional>
#include <string>

namespace tessel::client {

class RegisterStageEvent {
public:
    explicit RegisterStageEvent(StageRegistry& registry) : registry_(registry) {}

    /**
     * @param name 阶段名
     * @param renderType 若非空，宿主绘制匹配的渲染类型之后自动触发；为空则须由实现方手动触发
     * @throws std::invalid_argument renderType 已被占用
     */
    Stage Register(const std::string& name,
                   std::optional<render::RenderTypeKey> renderType = std::nullopt) {
        return registry_.Register(name, renderType);
    }

    StagePair RegisterPair(const std::string& beforeName,
                           const std::string& afterName,
                           render::RenderTypeKey renderType) {
        return registry_.RegisterPair(beforeName, afterName, renderType);
    }

    const StageRegistry& GetRegistry() const { return registry_; }

private:
    StageRegistry& registry_;
};

}  // namespace tessel::client
