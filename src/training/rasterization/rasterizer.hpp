#pragma once

#include "appsplat/camera.hpp"
#include <torch/torch.h>

namespace appsplat::training {

    /**
     * @struct Projection
     * @brief 高斯投影到屏幕空间后的结果
     */
    struct Projection {
        torch::Tensor means2d;        ///< [N, 2] 像素坐标，保留梯度作为视空间梯度句柄
        torch::Tensor depths;         ///< [N] 相机空间深度
        torch::Tensor conics;         ///< [N, 3] 2D协方差逆矩阵 (a, b, c)
        torch::Tensor radii;          ///< [N] 屏幕空间半径（像素），不可见时为0
        torch::Tensor visibility;     ///< [N] bool，radii > 0
        torch::Tensor compensations;  ///< [N] 抗锯齿不透明度补偿，未启用时为1
    };

    /**
     * @struct RenderOutput
     * @brief 单次渲染结果
     */
    struct RenderOutput {
        torch::Tensor image;       ///< [3, H, W]
        torch::Tensor means2d;     ///< [N, 2]，backward后其grad用于密度控制
        torch::Tensor radii;       ///< [N]
        torch::Tensor visibility;  ///< [N] bool
        int width = 0;
        int height = 0;
    };

    /**
     * @class IRasterizer
     * @brief 可微光栅化接口：投影 + alpha合成
     */
    class IRasterizer {
    public:
        virtual ~IRasterizer() = default;

        /**
         * [功能描述]：将3D高斯投影到相机图像平面
         * @param camera 相机
         * @param means [N, 3] 位置
         * @param scales [N, 3] 激活后的缩放
         * @param rotations [N, 4] 归一化四元数 (w, x, y, z)
         * @param scaling_modifier 缩放系数
         */
        virtual Projection project(const Camera& camera,
                                   const torch::Tensor& means,
                                   const torch::Tensor& scales,
                                   const torch::Tensor& rotations,
                                   float scaling_modifier) = 0;

        /**
         * [功能描述]：按深度从前到后合成可见高斯
         * @param colors [N, 3] 每个高斯的颜色
         * @param opacities [N] 激活后的不透明度
         * @param background [3] 背景色
         * @return [3, H, W] 图像
         */
        virtual torch::Tensor composite(const Projection& projection,
                                        const torch::Tensor& colors,
                                        const torch::Tensor& opacities,
                                        const torch::Tensor& background,
                                        int width,
                                        int height) = 0;
    };

} // namespace appsplat::training
