/**
 * @file render_type.cpp
 * @brief RenderTypeTable 实现
 */

#include <tessel_render/render_type.hpp>

namespace tessel::render {

namespace {

const std::string kEmptyName;

}  // namespace

RenderTypeTable::RenderTypeTable() {
    // 顺序须与 RenderTypes:: 常量的 id 一致
    Define("solid");
    Define("cutout_mipped");
    Define("cutout");
    Define("translucent");
    Define("tripwire");
}

RenderTypeKey RenderTypeTable::Define(const std::string& name) {
    auto it = byName_.find(name);
    if (it != byName_.end())
        return it->second;
    names_.push_back(name);
    RenderTypeKey key{static_cast<std::uint64_t>(names_.size())};
    byName_.emplace(name, key);
    return key;
}

std::optional<RenderTypeKey> RenderTypeTable::Find(const std::string& name) const {
    auto it = byName_.find(name);
    if (it == byName_.end())
        return std::nullopt;
    return it->second;
}

const std::string& RenderTypeTable::GetName(RenderTypeKey key) const {
    if (!key.IsValid() || key.id > names_.size())
        return kEmptyName;
    return names_[static_cast<std::size_t>(key.id - 1)];
}

}  // namespace tessel::render
