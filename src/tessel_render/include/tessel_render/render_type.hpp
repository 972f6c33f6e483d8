/**
 * @file render_type.hpp
 * @brief 渲染类型键：宿主 draw call 分类的身份句柄与名称表
 *
 * RenderTypeKey 仅为身份键，不携带任何图形状态；具体的绘制状态由宿主渲染器持有。
 * 内置键（Solid/CutoutMipped/Cutout/Translucent/Tripwire）与宿主的方块层一一对应。
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace tessel::render {

/** 渲染类型句柄，id=0 表示无效 */
struct RenderTypeKey {
    std::uint64_t id = 0;

    bool IsValid() const { return id != 0; }
    bool operator==(const RenderTypeKey& other) const { return id == other.id; }
    bool operator!=(const RenderTypeKey& other) const { return id != other.id; }
};

/** 无效渲染类型键 */
constexpr RenderTypeKey kInvalidRenderType{0};

// =============================================================================
// 内置渲染类型
// =============================================================================

namespace RenderTypes {
constexpr RenderTypeKey Solid{1};
constexpr RenderTypeKey CutoutMipped{2};
constexpr RenderTypeKey Cutout{3};
constexpr RenderTypeKey Translucent{4};
constexpr RenderTypeKey Tripwire{5};
}  // namespace RenderTypes

/**
 * @brief 宿主渲染类型名称表
 *
 * 构造时预定义 5 个内置类型（solid、cutout_mipped、cutout、translucent、tripwire），
 * 宿主可通过 Define 追加自定义类型。同名重复 Define 返回已有键。
 */
class RenderTypeTable {
public:
    RenderTypeTable();

    /**
     * 定义渲染类型。
     * @param name 类型名（如 "translucent_no_crumbling"）
     * @return 新分配的键；若 name 已存在则返回已有键
     */
    RenderTypeKey Define(const std::string& name);

    /** 按名称查找，未定义返回 std::nullopt */
    std::optional<RenderTypeKey> Find(const std::string& name) const;

    /** 键对应的名称，未知键返回空串 */
    const std::string& GetName(RenderTypeKey key) const;

    std::size_t Size() const { return names_.size(); }

private:
    std::vector<std::string> names_;  // 下标 = id - 1
    std::unordered_map<std::string, RenderTypeKey> byName_;
};

}  // namespace tessel::render

namespace std {
template <>
struct hash<tessel::render::RenderTypeKey> {
    std::size_t operator()(const tessel::render::RenderTypeKey& key) const noexcept {
        return std::hash<std::uint64_t>{}(key.id);
    }
};
}  // namespace std
