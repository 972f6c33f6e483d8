/**
 * @file configure_main_render_target_event.hpp
 * @brief 启动时配置主渲染目标（depth/stencil 缓冲）的事件
 *
 * 宿主在分配主渲染目标前构造本事件并依次通知监听者，随后读回
 * UseDepth/UseStencil/Width/Height 决定分配参数。
 * 本事件不可取消。
 */

#pragma once

namespace tessel::client {

/**
 * 主渲染目标配置。
 * depth 恒为开启；stencil 只能由 false 变为 true，任一监听者请求后不会再被关闭。
 * 宽高不做校验，由宿主在分配时裁剪。
 */
class ConfigureMainRenderTargetEvent {
public:
    ConfigureMainRenderTargetEvent(int width, int height)
        : useDepth_(true), useStencil_(false), width_(width), height_(height) {}

    /** 是否启用 depth 缓冲（恒为 true） */
    bool UseDepth() const { return useDepth_; }

    /** 是否已请求 stencil 缓冲 */
    bool UseStencil() const { return useStencil_; }

    /** 期望的帧缓冲宽度（像素） */
    int Width() const { return width_; }

    /** 期望的帧缓冲高度（像素） */
    int Height() const { return height_; }

    /**
     * 为主渲染目标启用 stencil 缓冲。可重复调用。
     * @return *this，便于链式调用
     */
    ConfigureMainRenderTargetEvent& EnableStencil() {
        useStencil_ = true;
        return *this;
    }

private:
    const bool useDepth_;
    bool useStencil_;
    const int width_;
    const int height_;
};

}  // namespace tessel::client
