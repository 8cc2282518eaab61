#pragma once

#include "appsplat/point_cloud.hpp"
#include <expected>
#include <filesystem>
#include <mutex>
#include <string>
#include <thread>
#include <torch/torch.h>
#include <vector>

namespace appsplat {
    namespace param {
        struct TrainingParameters;
    }

    /**
     * @class SplatData
     * @brief 高斯散射体数据，存储所有可训练的高斯属性
     * @details 管理位置、球谐系数、缩放、旋转、不透明度和外观特征。
     *          高斯数量只能通过密度控制改变。
     */
    class SplatData {
    public:
        SplatData() = default;
        ~SplatData();

        SplatData(const SplatData&) = delete;
        SplatData& operator=(const SplatData&) = delete;
        SplatData(SplatData&& other) noexcept;
        SplatData& operator=(SplatData&& other) noexcept;

        /**
         * @param sh_degree 最大球谐度数
         * @param means 位置 [N, 3]
         * @param sh0 0阶球谐系数 [N, 1, 3]
         * @param shN 高阶球谐系数 [N, K, 3]
         * @param scaling 对数缩放 [N, 3]
         * @param rotation 四元数 [N, 4]
         * @param opacity logit不透明度 [N, 1]
         * @param appearance_features 外观特征 [N, F]
         * @param scene_scale 场景范围（相机范围半径）
         */
        SplatData(int sh_degree,
                  torch::Tensor means,
                  torch::Tensor sh0,
                  torch::Tensor shN,
                  torch::Tensor scaling,
                  torch::Tensor rotation,
                  torch::Tensor opacity,
                  torch::Tensor appearance_features,
                  float scene_scale);

        /**
         * [功能描述]：从点云初始化高斯
         * @param params 训练参数，提供球谐度数、初始不透明度、特征维度和设备
         * @param point_cloud 初始点云（位置+颜色，颜色范围0-255）
         * @param scene_scale 场景范围
         */
        static std::expected<SplatData, std::string> init_model_from_pointcloud(
            const param::TrainingParameters& params,
            const PointCloud& point_cloud,
            float scene_scale);

        torch::Tensor get_means() const;
        torch::Tensor get_opacity() const;   ///< sigmoid后的不透明度 [N]
        torch::Tensor get_rotation() const;  ///< 归一化四元数 [N, 4]
        torch::Tensor get_scaling() const;   ///< exp后的缩放 [N, 3]
        torch::Tensor get_shs() const;       ///< [N, (max_degree+1)^2, 3]
        torch::Tensor get_shs_dc() const;    ///< [N, 1, 3] 未激活的0阶系数
        torch::Tensor get_shs_rest() const;  ///< [N, K, 3] 未激活的高阶系数
        torch::Tensor get_appearance_features() const;

        int get_active_sh_degree() const { return _active_sh_degree; }
        int get_max_sh_degree() const { return _max_sh_degree; }
        float get_scene_scale() const { return _scene_scale; }
        int64_t size() const { return _means.defined() ? _means.size(0) : 0; }

        torch::Tensor& means() { return _means; }
        const torch::Tensor& means() const { return _means; }
        torch::Tensor& opacity_raw() { return _opacity; }
        const torch::Tensor& opacity_raw() const { return _opacity; }
        torch::Tensor& rotation_raw() { return _rotation; }
        const torch::Tensor& rotation_raw() const { return _rotation; }
        torch::Tensor& scaling_raw() { return _scaling; }
        const torch::Tensor& scaling_raw() const { return _scaling; }
        torch::Tensor& sh0() { return _sh0; }
        const torch::Tensor& sh0() const { return _sh0; }
        torch::Tensor& shN() { return _shN; }
        const torch::Tensor& shN() const { return _shN; }
        torch::Tensor& appearance_features() { return _appearance_features; }
        const torch::Tensor& appearance_features() const { return _appearance_features; }

        /// 激活球谐度数加一，不超过最大度数
        void increment_sh_degree();

        /**
         * [功能描述]：导出PLY到 root/point_cloud/iteration_<iteration>/point_cloud.ply
         * @param join_thread true时同步写入，否则在后台线程写入当前快照
         * @details 先写入 .tmp 文件，成功后重命名，失败时不会破坏已有文件
         */
        void save_ply(const std::filesystem::path& root, int iteration, bool join_thread = false) const;

        /// 等待所有后台写入完成
        void wait_for_saves() const;

        std::vector<std::string> get_attribute_names() const;

    private:
        int _active_sh_degree = 0;
        int _max_sh_degree = 0;
        float _scene_scale = 0.f;

        torch::Tensor _means;
        torch::Tensor _sh0;
        torch::Tensor _shN;
        torch::Tensor _scaling;
        torch::Tensor _rotation;
        torch::Tensor _opacity;
        torch::Tensor _appearance_features;

        mutable std::vector<std::thread> _save_threads;
        mutable std::mutex _threads_mutex;

        PointCloud to_point_cloud() const;
    };
} // namespace appsplat
