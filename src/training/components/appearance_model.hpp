#pragma once

#include "appsplat/parameters.hpp"
#include <filesystem>
#include <torch/torch.h>
#include <vector>

namespace appsplat::training {

    /**
     * @struct AppearanceDatasetStats
     * @brief 从训练数据统计出的外观信息，用于确定外观嵌入表大小
     */
    struct AppearanceDatasetStats {
        int max_appearance_id = 0;  ///< 训练集中出现的最大外观编号
    };

    /**
     * [功能描述]：视线方向的位置编码。
     * 输出为 [x, sin(2^0 x), cos(2^0 x), ..., sin(2^(L-1) x), cos(2^(L-1) x)]，共 3 + 6L 个通道。
     */
    torch::Tensor positional_encoding(const torch::Tensor& x, int n_frequencies);

    /**
     * [功能描述]：外观颜色模型。
     * 根据高斯外观特征、外观嵌入和（可选的）视线方向，用MLP预测 [0, 1] 范围的RGB，
     * 调用方将其映射到 [-1, 1] 作为颜色残差。
     *
     * 初始化分两步：configure() 根据数据集统计确定嵌入表大小，且只能调用一次；
     * allocate_parameters() 创建网络参数。从检查点恢复时用 restore() 代替这两步。
     */
    class AppearanceModel : public torch::nn::Module {
    public:
        explicit AppearanceModel(param::AppearanceModelParameters config);

        /**
         * [功能描述]：根据数据集统计确定嵌入表行数
         * @details n_appearances <= 0 时设为 max_appearance_id + 1
         * @throws std::logic_error 重复调用
         */
        void configure(const AppearanceDatasetStats& stats);

        /**
         * [功能描述]：创建嵌入表和MLP参数
         * @throws std::logic_error 未调用configure或已经分配
         */
        void allocate_parameters(const torch::Device& device);

        /**
         * [功能描述]：用保存的嵌入表恢复模型，表的行数覆盖配置中的n_appearances
         */
        void restore(const torch::Tensor& embedding_table, const torch::Device& device);

        /**
         * [功能描述]：前向计算
         * @param gaussian_features [参数说明]：[K, F] 可见高斯的外观特征
         * @param appearance_id [参数说明]：当前图像的外观编号
         * @param view_dirs [参数说明]：[K, 3] 归一化的视线方向
         * @return [返回值说明]：[K, 3]，值域[0, 1]
         */
        torch::Tensor forward(const torch::Tensor& gaussian_features,
                              int64_t appearance_id,
                              const torch::Tensor& view_dirs);

        std::vector<torch::Tensor> embedding_parameters() const;
        std::vector<torch::Tensor> network_parameters() const;

        /// 保存嵌入表和网络参数到 torch 归档文件
        void save_embedding(const std::filesystem::path& path) const;

        /// 从 save_embedding 写出的文件恢复，嵌入表行数以文件为准
        void load_embedding(const std::filesystem::path& path, const torch::Device& device);

        bool is_configured() const { return configured_; }
        bool is_allocated() const { return allocated_; }
        int n_appearances() const { return config_.n_appearances; }
        int n_input_dims() const;
        const param::AppearanceModelParameters& config() const { return config_; }

    private:
        void build_network(const torch::Device& device);

        param::AppearanceModelParameters config_;
        bool configured_ = false;
        bool allocated_ = false;

        torch::nn::Embedding embedding_{nullptr};
        torch::nn::ModuleList hidden_layers_{nullptr};   ///< 隐藏层，每层后接ReLU
        torch::nn::Linear output_layer_{nullptr};        ///< 输出层，后接Sigmoid
    };

} // namespace appsplat::training
