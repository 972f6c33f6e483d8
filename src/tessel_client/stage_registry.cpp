/**
 * @file stage_registry.cpp
 * @brief StageRegistry 实现
 */

#include <tessel_client/stage_registry.hpp>

#include <spdlog/spdlog.h>

#include <stdexcept>

namespace tessel::client {

namespace {

struct BuiltinPair {
    const char* beforeName;
    const char* afterName;
    std::optional<render::RenderTypeKey> renderType;
};

// 顺序即 Stages:: 常量的下标顺序
const BuiltinPair kBuiltinPairs[] = {
    {"before_sky", "after_sky", std::nullopt},
    {"before_solid_blocks", "after_solid_blocks", render::RenderTypes::Solid},
    {"before_cutout_mipped_blocks", "after_cutout_mipped_blocks", render::RenderTypes::CutoutMipped},
    {"before_cutout_blocks", "after_cutout_blocks", render::RenderTypes::Cutout},
    {"before_entities", "after_entities", std::nullopt},
    {"before_block_entities", "after_block_entities", std::nullopt},
    {"before_translucent_blocks", "after_translucent_blocks", render::RenderTypes::Translucent},
    {"before_tripwire_blocks", "after_tripwire_blocks", render::RenderTypes::Tripwire},
    {"before_particles", "after_particles", std::nullopt},
    {"before_weather", "after_weather", std::nullopt},
    {"before_level", "after_level", std::nullopt},
};

const std::string kEmptyName;

}  // namespace

StageRegistry::StageRegistry() {
    stages_.reserve(Stages::kBuiltinCount);
    std::vector<StagePair> builtinPairs;
    for (const BuiltinPair& p : kBuiltinPairs) {
        Stage before = Append(p.beforeName, p.renderType);
        Stage after = Append(p.afterName, p.renderType);
        builtinPairs.push_back(StagePair{before, after});
    }
    for (const StagePair& pair : builtinPairs) {
        const std::optional<render::RenderTypeKey>& rt = stages_[pair.before.index].renderType;
        if (!rt) continue;
        pairs_[*rt] = pair;
    }
}

Stage StageRegistry::Append(const std::string& name,
                            std::optional<render::RenderTypeKey> renderType) {
    Stage stage{static_cast<std::uint32_t>(stages_.size())};
    stages_.push_back(Entry{name, renderType});
    return stage;
}

void StageRegistry::CheckOpen(const char* op) const {
    if (sealed_)
        throw std::logic_error(std::string("StageRegistry::") + op +
                               ": registry is sealed, stages can only be registered during startup");
}

void StageRegistry::CheckRenderTypeFree(const char* op, const std::string& name,
                                        render::RenderTypeKey renderType) const {
    if (!renderType.IsValid())
        throw std::invalid_argument(std::string("StageRegistry::") + op + ": invalid render type for stage '" +
                                    name + "'");
    if (pairs_.count(renderType) != 0) {
        spdlog::warn("Stage '{}' rejected: render type {} is already mapped to a stage pair", name,
                     renderType.id);
        throw std::invalid_argument(std::string("StageRegistry::") + op + ": render type " +
                                    std::to_string(renderType.id) + " is already mapped to a stage pair");
    }
}

Stage StageRegistry::Register(const std::string& name,
                              std::optional<render::RenderTypeKey> renderType) {
    CheckOpen("Register");
    if (!renderType) {
        Stage stage = Append(name, std::nullopt);
        spdlog::debug("Registered stage '{}' ({})", name, stage.index);
        return stage;
    }
    CheckRenderTypeFree("Register", name, *renderType);

    // 单个阶段绑定为 after 半对，before 半对留空
    Stage stage = Append(name, renderType);
    pairs_.emplace(*renderType, StagePair{Stage{}, stage});
    spdlog::debug("Registered stage '{}' ({}) after render type {}", name, stage.index, renderType->id);
    return stage;
}

StagePair StageRegistry::RegisterPair(const std::string& beforeName,
                                      const std::string& afterName,
                                      render::RenderTypeKey renderType) {
    CheckOpen("RegisterPair");
    CheckRenderTypeFree("RegisterPair", beforeName, renderType);
    StagePair pair{Append(beforeName, renderType), Append(afterName, renderType)};
    pairs_.emplace(renderType, pair);
    spdlog::debug("Registered stage pair '{}'/'{}' for render type {}", beforeName, afterName,
                  renderType.id);
    return pair;
}

std::optional<Stage> StageRegistry::StageBeforeRenderType(render::RenderTypeKey renderType) const {
    auto it = pairs_.find(renderType);
    if (it == pairs_.end() || it->second.before.index == Stage::kInvalidIndex)
        return std::nullopt;
    return it->second.before;
}

std::optional<Stage> StageRegistry::StageAfterRenderType(render::RenderTypeKey renderType) const {
    auto it = pairs_.find(renderType);
    if (it == pairs_.end())
        return std::nullopt;
    return it->second.after;
}

std::optional<Stage> StageRegistry::FromRenderType(render::RenderTypeKey renderType) const {
    return StageAfterRenderType(renderType);
}

const std::string& StageRegistry::GetName(Stage stage) const {
    if (!IsValid(stage))
        return kEmptyName;
    return stages_[stage.index].name;
}

std::optional<render::RenderTypeKey> StageRegistry::GetRenderType(Stage stage) const {
    if (!IsValid(stage))
        return std::nullopt;
    return stages_[stage.index].renderType;
}

void StageRegistry::Seal() {
    if (sealed_) return;
    sealed_ = true;
    spdlog::info("StageRegistry sealed: {} stages, {} render type pairs", stages_.size(), pairs_.size());
}

}  // namespace tessel::client
