/**
 * @file pose_stack.hpp
 * @brief 宿主绘制用的姿态栈（模型矩阵栈）
 *
 * 只负责保存/恢复矩阵，不做任何相机或视锥计算。
 * 栈底始终保留一个姿态；构造时栈底为单位矩阵。
 */

#pragma once

#include <glm/glm.hpp>

#include <cstddef>
#include <vector>

namespace tessel::render {

class PoseStack {
public:
    PoseStack();

    /** 复制栈顶姿态并压栈 */
    void PushPose();

    /**
     * 弹出栈顶姿态。
     * @throws std::logic_error 栈中仅剩栈底姿态时
     */
    void PopPose();

    /** 栈顶姿态（可写，宿主在此累乘变换） */
    glm::mat4& Last() { return poses_.back(); }
    const glm::mat4& Last() const { return poses_.back(); }

    /** 是否只剩栈底姿态 */
    bool IsClear() const { return poses_.size() == 1; }

    std::size_t Size() const { return poses_.size(); }

    /** 恢复为仅含单位矩阵的初始状态 */
    void Clear();

private:
    std::vector<glm::mat4> poses_;
};

}  // namespace tessel::render
