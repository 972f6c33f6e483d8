/**
 * @file pose_stack.cpp
 * @brief PoseStack 实现
 */

#include <tessel_render/pose_stack.hpp>

#include <stdexcept>

namespace tessel::render {

PoseStack::PoseStack() {
    poses_.emplace_back(1.f);
}

void PoseStack::PushPose() {
    glm::mat4 top = poses_.back();
    poses_.push_back(top);
}

void PoseStack::PopPose() {
    if (poses_.size() <= 1)
        throw std::logic_error("PoseStack::PopPose: cannot pop the root pose");
    poses_.pop_back();
}

void PoseStack::Clear() {
    poses_.clear();
    poses_.emplace_back(1.f);
}

}  // namespace tessel::render
