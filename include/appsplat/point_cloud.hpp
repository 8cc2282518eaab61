#pragma once

#include <string>
#include <torch/torch.h>
#include <vector>

namespace appsplat {

    /**
     * @struct PointCloud
     * @brief 点云数据，既用于初始化（位置+颜色），也用于PLY导出（全部高斯属性）
     */
    struct PointCloud {
        torch::Tensor means;                 ///< [N, 3] 位置
        torch::Tensor colors;                ///< [N, 3] 颜色，uint8或float（0-255）
        torch::Tensor normals;               ///< [N, 3] 法线，导出时填零
        torch::Tensor sh0;                   ///< [N, 3] 展平后的0阶球谐系数
        torch::Tensor shN;                   ///< [N, 3*K] 展平后的高阶球谐系数
        torch::Tensor opacity;               ///< [N, 1] logit不透明度
        torch::Tensor scaling;               ///< [N, 3] 对数缩放
        torch::Tensor rotation;              ///< [N, 4] 四元数
        torch::Tensor appearance_features;   ///< [N, F] 高斯外观特征

        std::vector<std::string> attribute_names;

        int64_t size() const { return means.defined() ? means.size(0) : 0; }
    };

} // namespace appsplat
