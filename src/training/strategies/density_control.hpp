#pragma once

#include "appsplat/parameters.hpp"
#include "appsplat/splat_data.hpp"
#include "training/optimizers/scheduler.hpp"
#include <array>
#include <functional>
#include <memory>
#include <optional>
#include <string_view>
#include <torch/torch.h>
#include <vector>

namespace appsplat::training {

    namespace strategy {
        /// 高斯优化器参数组数量及顺序
        constexpr size_t kNumParamGroups = 7;
        constexpr std::array<std::string_view, kNumParamGroups> kParamGroupNames = {
            "xyz", "f_dc", "f_rest", "scaling", "rotation", "opacity", "appearance_features"};
        constexpr size_t kMeansGroup = 0;
        constexpr size_t kScalingGroup = 3;
        constexpr size_t kOpacityGroup = 5;

        using ParamUpdateFn = std::function<torch::Tensor(const int, const torch::Tensor)>;
        using OptimizerUpdateFn = std::function<std::unique_ptr<torch::optim::OptimizerParamState>(
            torch::optim::OptimizerParamState&, const torch::Tensor)>;

        /// 将高斯属性移动到指定设备并设为可训练的叶子张量
        void initialize_gaussians(SplatData& splat_data, const torch::Device& device);

        /**
         * [功能描述]：创建高斯参数的Adam优化器，每个属性一个参数组
         * @details 位置学习率乘以场景范围，高阶球谐学习率为0阶的1/20
         */
        std::unique_ptr<torch::optim::Adam> create_optimizer(
            SplatData& splat_data,
            const param::OptimizationParameters& params);

        /**
         * [功能描述]：替换参数张量并同步更新Adam状态
         * @param param_fn 由旧参数生成新参数
         * @param optimizer_fn 由旧Adam状态生成新状态
         * @param param_idxs 要更新的参数组下标，默认全部
         */
        void update_param_with_optimizer(
            const ParamUpdateFn& param_fn,
            const OptimizerUpdateFn& optimizer_fn,
            torch::optim::Optimizer& optimizer,
            SplatData& splat_data,
            std::vector<size_t> param_idxs = {0, 1, 2, 3, 4, 5, 6});
    } // namespace strategy

    /**
     * @struct DensifyResult
     * @brief 一次密度控制的统计
     */
    struct DensifyResult {
        int64_t num_cloned = 0;
        int64_t num_split = 0;
        int64_t num_pruned = 0;
    };

    /**
     * @class DensityControl
     * @brief 自适应密度控制：持有高斯、其优化器、位置学习率调度和逐高斯统计
     * @details 统计量 max_radii2D [N]、xyz_gradient_accum [N, 1]、denom [N, 1]
     *          的长度始终等于高斯数量，每次结构变化后清零重建。
     */
    class DensityControl {
    public:
        explicit DensityControl(SplatData&& splat_data);

        /// 创建优化器、位置学习率调度和统计量
        void initialize(const param::OptimizationParameters& params);

        SplatData& get_model() { return _splat_data; }
        const SplatData& get_model() const { return _splat_data; }
        torch::optim::Adam& optimizer() { return *_optimizer; }

        /**
         * [功能描述]：更新可见高斯的最大屏幕半径
         */
        void update_max_radii(const torch::Tensor& radii, const torch::Tensor& visibility);

        /**
         * [功能描述]：累积可见高斯的视空间位置梯度范数
         * @param means2d_grad [N, 2] 像素坐标梯度，乘以 (W/2, H/2) 转为NDC梯度
         */
        void add_densification_stats(const torch::Tensor& means2d_grad,
                                     const torch::Tensor& visibility,
                                     int width,
                                     int height);

        /**
         * [功能描述]：克隆、分裂、修剪
         * @param grad_threshold 平均梯度范数阈值
         * @param min_opacity 最小不透明度
         * @param extent 场景范围
         * @param max_screen_size 屏幕半径阈值，为空时不按尺寸修剪
         * @throws std::runtime_error 修剪后没有剩余高斯
         */
        DensifyResult densify_and_prune(float grad_threshold,
                                        float min_opacity,
                                        float extent,
                                        std::optional<float> max_screen_size);

        /// 所有不透明度设为 opacity_reset_value，并清零该参数组的Adam状态
        void reset_opacity();

        /// 应用位置学习率调度，返回新的学习率
        double update_learning_rate(int step);

        /// 复制 mask 为true的高斯到末尾，统计量随之复制
        void duplicate(const torch::Tensor& is_duplicated);

        /// 将 mask 为true的高斯替换为 split_count 个采样子高斯
        void split(const torch::Tensor& is_split);

        /// 删除 mask 为true的高斯
        void remove(const torch::Tensor& is_prune);

        /**
         * [功能描述]：检查统计量长度与高斯数量一致
         * @throws std::logic_error 长度不一致
         */
        void check_statistics_invariant() const;

        const torch::Tensor& max_radii2D() const { return _max_radii2D; }
        const torch::Tensor& xyz_gradient_accum() const { return _xyz_gradient_accum; }
        const torch::Tensor& denom() const { return _denom; }

    private:
        void reset_statistics();

        SplatData _splat_data;
        std::unique_ptr<torch::optim::Adam> _optimizer;
        std::unique_ptr<const param::OptimizationParameters> _params;
        PositionLRSchedule _position_lr;

        torch::Tensor _max_radii2D;
        torch::Tensor _xyz_gradient_accum;
        torch::Tensor _denom;
    };

} // namespace appsplat::training
