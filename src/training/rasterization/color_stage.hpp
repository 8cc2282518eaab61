#pragma once

#include "appsplat/camera.hpp"
#include "appsplat/splat_data.hpp"
#include <memory>
#include <torch/torch.h>

namespace appsplat::training {
    class AppearanceModel;

    /**
     * @class IColorStage
     * @brief 渲染管线中的着色阶段：为每个高斯计算当前视角下的RGB
     */
    class IColorStage {
    public:
        virtual ~IColorStage() = default;

        /**
         * @param visibility [N] bool，不可见高斯的颜色行为0
         * @param warm_up 是否处于外观模型预热期
         * @return [N, 3]
         */
        virtual torch::Tensor compute_colors(const Camera& camera,
                                             const SplatData& splats,
                                             const torch::Tensor& visibility,
                                             bool warm_up) = 0;
    };

    /**
     * @class SHColorStage
     * @brief 球谐基础颜色：clamp_min(SH(dir) + 0.5, 0)
     */
    class SHColorStage : public IColorStage {
    public:
        /**
         * [功能描述]：计算指定高斯的基础颜色（已加0.5，未截断）
         * @param indices [M] 高斯下标
         * @param view_dirs 输出 [M, 3] 归一化视线方向
         */
        torch::Tensor base_colors(const Camera& camera,
                                  const SplatData& splats,
                                  const torch::Tensor& indices,
                                  torch::Tensor& view_dirs) const;

        torch::Tensor compute_colors(const Camera& camera,
                                     const SplatData& splats,
                                     const torch::Tensor& visibility,
                                     bool warm_up) override;
    };

    /**
     * @class AppearanceColorStage
     * @brief 在球谐颜色上叠加外观残差的装饰器
     * @details 预热期直接返回基础颜色，不调用外观模型；
     *          预热后对可见高斯计算 clamp(base + model(...)·2 − 1, 0, 1)。
     */
    class AppearanceColorStage : public IColorStage {
    public:
        AppearanceColorStage(std::shared_ptr<SHColorStage> base,
                             std::shared_ptr<AppearanceModel> model);

        torch::Tensor compute_colors(const Camera& camera,
                                     const SplatData& splats,
                                     const torch::Tensor& visibility,
                                     bool warm_up) override;

        /// 外观模型被调用的次数
        int64_t residual_calls() const { return residual_calls_; }

    private:
        std::shared_ptr<SHColorStage> base_;
        std::shared_ptr<AppearanceModel> model_;
        int64_t residual_calls_ = 0;
    };

} // namespace appsplat::training
