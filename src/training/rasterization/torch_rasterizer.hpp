#pragma once

#include "rasterizer.hpp"

namespace appsplat::training {

    /**
     * @struct TorchRasterizerSettings
     * @brief LibTorch光栅化器的常量设置
     */
    struct TorchRasterizerSettings {
        float near_plane = 0.2f;              ///< 深度小于该值的高斯被剔除
        float eps2d = 0.3f;                   ///< 2D协方差的膨胀量（像素²）
        bool antialiased = false;             ///< 启用时用 filter_2d_kernel_size 膨胀并补偿不透明度
        float filter_2d_kernel_size = 0.1f;
        float max_alpha = 0.99f;
        float min_alpha = 1.0f / 255.0f;
        int64_t max_chunk_elements = 1 << 22; ///< 每个像素块中 像素数×高斯数 的上限
    };

    /**
     * @class TorchRasterizer
     * @brief 完全由LibTorch张量运算实现的可微光栅化器，CPU和CUDA上均可运行
     * @details 梯度通过autograd传回位置、缩放、旋转、颜色和不透明度。
     *          合成时对所有可见高斯做深度排序，按像素块计算，不做瓦片划分。
     */
    class TorchRasterizer : public IRasterizer {
    public:
        explicit TorchRasterizer(TorchRasterizerSettings settings = {});

        Projection project(const Camera& camera,
                           const torch::Tensor& means,
                           const torch::Tensor& scales,
                           const torch::Tensor& rotations,
                           float scaling_modifier) override;

        torch::Tensor composite(const Projection& projection,
                                const torch::Tensor& colors,
                                const torch::Tensor& opacities,
                                const torch::Tensor& background,
                                int width,
                                int height) override;

        const TorchRasterizerSettings& settings() const { return settings_; }

    private:
        TorchRasterizerSettings settings_;
    };

    /// 四元数 (w, x, y, z) 转旋转矩阵 [N, 3, 3]
    torch::Tensor quaternion_to_rotation_matrix(const torch::Tensor& quats);

} // namespace appsplat::training
