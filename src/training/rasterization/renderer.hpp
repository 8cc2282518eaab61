#pragma once

#include "color_stage.hpp"
#include "rasterizer.hpp"
#include <memory>

namespace appsplat::training {

    /**
     * @class Renderer
     * @brief 可微渲染步骤：投影 → 着色 → 合成
     * @details 渲染器变体通过替换光栅化器或着色阶段组合得到
     */
    class Renderer {
    public:
        Renderer(std::shared_ptr<IRasterizer> rasterizer,
                 std::shared_ptr<IColorStage> color_stage);

        /**
         * [功能描述]：渲染一个相机视角
         * @param background [3] 背景色
         * @param scaling_modifier 高斯缩放系数
         * @param warm_up 是否处于外观预热期
         */
        RenderOutput render(const Camera& camera,
                            const SplatData& splats,
                            const torch::Tensor& background,
                            float scaling_modifier = 1.0f,
                            bool warm_up = false);

        IRasterizer& rasterizer() { return *rasterizer_; }
        IColorStage& color_stage() { return *color_stage_; }

    private:
        std::shared_ptr<IRasterizer> rasterizer_;
        std::shared_ptr<IColorStage> color_stage_;
    };

} // namespace appsplat::training
