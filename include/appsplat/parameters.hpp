// Copyright (c) 2023 Janusch Patas.

/**
 * @file parameters.hpp
 * @brief 训练参数定义文件
 * @details 定义了外观嵌入高斯散射体训练所需的参数配置：优化参数、外观模型参数、数据集配置等
 */

#pragma once

#include <expected>
#include <filesystem>
#include <string>
#include <vector>

#include <nlohmann/json_fwd.hpp>

namespace appsplat {
    namespace param {
        /**
         * @struct OptimizationParameters
         * @brief 高斯体优化与密度控制参数
         */
        struct OptimizationParameters {
            // 基础训练参数
            size_t iterations = 30'000;                    ///< 总训练迭代次数
            int sh_degree = 3;                             ///< 最大球谐度数
            size_t sh_degree_interval = 1'000;             ///< 球谐度数增加的间隔步数
            float lambda_dssim = 0.2f;                     ///< DSSIM损失的权重

            // 学习率
            float means_lr = 0.00016f;                     ///< 位置初始学习率（乘以场景范围）
            float means_lr_final = 0.0000016f;             ///< 位置最终学习率（乘以场景范围）
            float means_lr_delay_mult = 0.01f;             ///< 位置学习率延迟系数
            size_t means_lr_max_steps = 30'000;            ///< 位置学习率衰减的总步数
            float shs_lr = 0.0025f;                        ///< 0阶球谐学习率，高阶为其1/20
            float opacity_lr = 0.05f;                      ///< 不透明度学习率
            float scaling_lr = 0.005f;                     ///< 缩放学习率
            float rotation_lr = 0.001f;                    ///< 旋转学习率
            float appearance_features_lr = 2e-3f;          ///< 高斯外观特征学习率
            float adam_eps = 1e-15f;                       ///< Adam的eps

            // 密度控制
            float percent_dense = 0.01f;                   ///< 克隆/分裂的尺度阈值（相对场景范围）
            size_t densification_interval = 100;           ///< 密度控制间隔
            size_t opacity_reset_interval = 3'000;         ///< 不透明度重置间隔
            size_t densify_from_iter = 500;                ///< 开始密度控制的步数
            size_t densify_until_iter = 15'000;            ///< 停止密度控制的步数
            float densify_grad_threshold = 0.0002f;        ///< 梯度阈值
            float min_opacity = 0.005f;                    ///< 修剪的最小不透明度
            float max_screen_size = 20.f;                  ///< 屏幕半径修剪阈值（像素）
            float max_world_size_factor = 0.1f;            ///< 世界空间尺度上限（相对场景范围）
            float opacity_reset_value = 0.01f;             ///< 不透明度重置后的值
            int split_count = 2;                           ///< 每个分裂高斯产生的子高斯数

            // 初始化
            float init_opacity = 0.1f;                     ///< 初始不透明度

            // 渲染
            bool white_background = false;                 ///< 是否使用白色背景
            bool antialiased = false;                      ///< 是否启用2D抗锯齿滤波
            float filter_2d_kernel_size = 0.1f;            ///< 2D滤波核尺寸

            // 评估和保存
            std::vector<size_t> eval_steps = {7'000, 30'000}; ///< 评估步数点
            std::vector<size_t> save_steps = {7'000, 30'000}; ///< 保存步数点
            bool enable_eval = false;                         ///< 是否启用评估

            // 运行环境
            std::string device = "cuda";                   ///< 训练设备：cuda 或 cpu
            int num_workers = 4;                           ///< 数据加载线程数

            nlohmann::json to_json() const;
            static OptimizationParameters from_json(const nlohmann::json& j);
        };

        /**
         * @struct AppearanceModelParameters
         * @brief 外观模型网络结构参数
         */
        struct AppearanceModelParameters {
            int n_gaussian_feature_dims = 64;              ///< 每个高斯的外观特征维度
            int n_appearances = -1;                        ///< 外观嵌入表行数，<=0时由数据集推导
            int n_appearance_embedding_dims = 32;          ///< 外观嵌入维度
            bool is_view_dependent = false;                ///< 是否输入视线方向
            int n_view_direction_frequencies = 4;          ///< 视线方向位置编码频率数
            int n_neurons = 64;                            ///< 隐藏层宽度
            int n_layers = 3;                              ///< 隐藏层数
            std::vector<int> skip_layers = {};             ///< 拼接输入的隐藏层下标
            bool normalize = false;                        ///< 是否对特征和嵌入做L2归一化

            nlohmann::json to_json() const;
            static AppearanceModelParameters from_json(const nlohmann::json& j);
        };

        /**
         * @struct AppearanceOptimizationParameters
         * @brief 外观模型优化参数
         */
        struct AppearanceOptimizationParameters {
            float embedding_lr_init = 2e-3f;               ///< 嵌入表初始学习率
            float lr_init = 1e-3f;                         ///< 网络初始学习率
            float lr_final_factor = 0.1f;                  ///< 最终学习率系数（两组共用）
            float eps = 1e-15f;                            ///< Adam的eps
            int max_steps = 30'000;                        ///< 衰减总步数
            int warm_up = 4'000;                           ///< 预热步数，期间不使用外观残差

            nlohmann::json to_json() const;
            static AppearanceOptimizationParameters from_json(const nlohmann::json& j);
        };

        /**
         * @struct DatasetConfig
         * @brief 数据集配置
         */
        struct DatasetConfig {
            std::filesystem::path data_path = "";          ///< 数据集路径
            std::filesystem::path output_path = "";        ///< 输出路径
            std::string images = "images";                 ///< 图像文件夹名称
            std::filesystem::path mask_dir = "";           ///< 掩码目录，为空表示不使用掩码
            int eval_step = -1;                            ///< 每隔多少张取一张作验证，<=1表示全部训练
            int resize_factor = -1;                        ///< 图像缩放因子，-1表示不缩放
        };

        /**
         * @struct TrainingParameters
         * @brief 完整的训练参数
         */
        struct TrainingParameters {
            DatasetConfig dataset;
            OptimizationParameters optimization;
            AppearanceModelParameters appearance_model;
            AppearanceOptimizationParameters appearance_optimization;
            std::filesystem::path config_path = "";        ///< 用户指定的JSON配置文件
        };

        /**
         * [功能描述]：从JSON文件读取训练参数
         * @param path [参数说明]：JSON文件路径，为空时读取程序目录下的 parameter/optimization_params.json
         * @return [返回值说明]：成功时返回参数，失败时返回错误信息
         */
        std::expected<TrainingParameters, std::string> read_optim_params_from_json(
            const std::filesystem::path& path = "");

        /**
         * [功能描述]：将训练参数保存到输出目录下的 training_config.json
         */
        std::expected<void, std::string> save_training_parameters_to_json(
            const TrainingParameters& params,
            const std::filesystem::path& output_path);

        /**
         * [功能描述]：检查参数是否自洽，在训练开始前调用
         */
        std::expected<void, std::string> validate(const TrainingParameters& params);
    } // namespace param
} // namespace appsplat
