/**
 * @file stage_registry.hpp
 * @brief 关卡渲染阶段（Stage）表与 before/after 配对查找
 *
 * Stage 为指向阶段表的不透明下标句柄，相等性即“同一注册项”，同名的两个注册项互不相等。
 * 内置的 22 个阶段在注册表构造时按固定下标插入，可直接用 Stages:: 常量引用。
 *
 * 生命周期：open（接受注册，配对表随注册增量更新）→ Seal() → sealed（只读）。
 * sealed 后注册表不可变，渲染线程上的并发查找无需加锁。
 */

#pragma once

#include <tessel_render/render_type.hpp>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace tessel::client {

/**
 * 阶段句柄：阶段表下标，kInvalidIndex 表示无效。
 * 句柄只在所属 StageRegistry 内有意义，不同注册表的同下标句柄比较相等但不代表同一阶段；
 * 进程内唯一的注册表由 ClientHooks 持有。
 */
struct Stage {
    static constexpr std::uint32_t kInvalidIndex = ~static_cast<std::uint32_t>(0);

    std::uint32_t index = kInvalidIndex;

    bool operator==(const Stage& other) const { return index == other.index; }
    bool operator!=(const Stage& other) const { return index != other.index; }
};

/** 同一渲染类型的 before/after 阶段对；由单个 Register 绑定时 before 为无效句柄 */
struct StagePair {
    Stage before;
    Stage after;
};

// =============================================================================
// 内置阶段（下标固定，与 StageRegistry 构造顺序一致）
// =============================================================================

namespace Stages {
/** 天空盒渲染前；无论天空是否实际绘制都会触发 */
constexpr Stage BeforeSky{0};
constexpr Stage AfterSky{1};
/** 不透明方块层（RenderTypes::Solid） */
constexpr Stage BeforeSolidBlocks{2};
constexpr Stage AfterSolidBlocks{3};
/** RenderTypes::CutoutMipped */
constexpr Stage BeforeCutoutMippedBlocks{4};
constexpr Stage AfterCutoutMippedBlocks{5};
/** RenderTypes::Cutout */
constexpr Stage BeforeCutoutBlocks{6};
constexpr Stage AfterCutoutBlocks{7};
constexpr Stage BeforeEntities{8};
constexpr Stage AfterEntities{9};
constexpr Stage BeforeBlockEntities{10};
constexpr Stage AfterBlockEntities{11};
/**
 * RenderTypes::Translucent。由于半透明排序，此处绘制的半透明几何体可能不正确，
 * 半透明内容建议放在 AfterTripwireBlocks 或 AfterParticles。
 */
constexpr Stage BeforeTranslucentBlocks{12};
constexpr Stage AfterTranslucentBlocks{13};
/** RenderTypes::Tripwire */
constexpr Stage BeforeTripwireBlocks{14};
constexpr Stage AfterTripwireBlocks{15};
/** 实体之后、粒子前后；处于 fabulous 图形模式的粒子目标内 */
constexpr Stage BeforeParticles{16};
constexpr Stage AfterParticles{17};
constexpr Stage BeforeWeather{18};
constexpr Stage AfterWeather{19};
/** 整个关卡渲染 pass 的首尾括号，不绑定渲染类型 */
constexpr Stage BeforeLevel{20};
constexpr Stage AfterLevel{21};

constexpr std::size_t kBuiltinCount = 22;
}  // namespace Stages

/**
 * @brief 阶段注册表
 *
 * 配对规则：
 * - 构造时对 11 个内置 (before, after) 对做一次折叠，丢弃 before 无渲染类型的对，其余按渲染类型建表；
 * - Register(name, rt)：rt 已被占用则抛 std::invalid_argument；否则阶段立即绑定为 rt 的 after 阶段
 *   （before 为空），宿主绘制 rt 后自动触发；
 * - RegisterPair 一次登记 before/after 整对，是获得绘制前后括号的唯一方式；rt 已被占用时抛 std::invalid_argument。
 */
class StageRegistry {
public:
    StageRegistry();

    StageRegistry(const StageRegistry&) = delete;
    StageRegistry& operator=(const StageRegistry&) = delete;

    /**
     * 注册新阶段。
     * @param name 阶段名（建议使用 "modid:path" 形式，保证唯一）
     * @param renderType 若非空，宿主绘制该渲染类型之后自动触发；为空则由实现方手动触发
     * @return 新阶段句柄
     * @throws std::invalid_argument renderType 无效或已被其他阶段占用
     * @throws std::logic_error 注册表已 Seal
     */
    Stage Register(const std::string& name,
                   std::optional<render::RenderTypeKey> renderType = std::nullopt);

    /**
     * 注册绑定到 renderType 的 before/after 阶段对。
     * @throws std::invalid_argument renderType 无效或已被占用
     * @throws std::logic_error 注册表已 Seal
     */
    StagePair RegisterPair(const std::string& beforeName,
                           const std::string& afterName,
                           render::RenderTypeKey renderType);

    /** renderType 对应的 before 阶段；无绑定或仅绑定了 after 阶段时返回 std::nullopt */
    std::optional<Stage> StageBeforeRenderType(render::RenderTypeKey renderType) const;

    /** renderType 对应的 after 阶段，无配对返回 std::nullopt */
    std::optional<Stage> StageAfterRenderType(render::RenderTypeKey renderType) const;

    /** 旧接口，等价于 StageAfterRenderType */
    [[deprecated("use StageAfterRenderType")]]
    std::optional<Stage> FromRenderType(render::RenderTypeKey renderType) const;

    bool IsValid(Stage stage) const { return stage.index < stages_.size(); }

    /** 阶段名；无效句柄返回空串 */
    const std::string& GetName(Stage stage) const;

    /** 阶段绑定的渲染类型；未绑定或无效句柄返回 std::nullopt */
    std::optional<render::RenderTypeKey> GetRenderType(Stage stage) const;

    /** 等价于 GetName，便于日志输出 */
    std::string ToString(Stage stage) const { return GetName(stage); }

    std::size_t Size() const { return stages_.size(); }
    std::size_t PairCount() const { return pairs_.size(); }

    /** 结束注册窗口。此后 Register/RegisterPair 抛 std::logic_error。重复调用无副作用 */
    void Seal();
    bool IsSealed() const { return sealed_; }

private:
    struct Entry {
        std::string name;
        std::optional<render::RenderTypeKey> renderType;
    };

    Stage Append(const std::string& name, std::optional<render::RenderTypeKey> renderType);
    void CheckOpen(const char* op) const;
    void CheckRenderTypeFree(const char* op, const std::string& name,
                             render::RenderTypeKey renderType) const;

    std::vector<Entry> stages_;
    std::unordered_map<render::RenderTypeKey, StagePair> pairs_;
    bool sealed_ = false;
};

}  // namespace tessel::client

namespace std {
template <>
struct hash<tessel::client::Stage> {
    std::size_t operator()(const tessel::client::Stage& stage) const noexcept {
        return std::hash<std::uint32_t>{}(stage.index);
    }
};
}  // namespace std
