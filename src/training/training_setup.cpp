#include "training_setup.hpp"
#include "appsplat/logger.hpp"
#include "loader/colmap_loader.hpp"
#include "training/components/appearance_model.hpp"
#include "training/strategies/density_control.hpp"
#include <format>
#include <print>

namespace appsplat::training {
    /**
     * [功能描述]：设置训练环境，包括数据加载、点云初始化、外观模型配置和训练器创建。
     * @param params [参数说明]：训练参数，包含数据集配置、优化参数和外观模型参数。
     * @return [返回值说明]：返回TrainingSetup结构，失败时返回错误字符串。
     */
    std::expected<TrainingSetup, std::string> setupTraining(const param::TrainingParameters& params) {
        auto load_result = loader::load_colmap(params.dataset);
        if (!load_result) {
            return std::unexpected(std::format("Failed to load dataset: {}", load_result.error()));
        }
        auto& scene = *load_result;

        std::println("Dataset loaded: {} train, {} validation images, {} points, extent {:.3f}",
                     scene.train.size(), scene.validation.size(),
                     scene.point_cloud.size(), scene.camera_extent);

        if (scene.point_cloud.size() == 0) {
            return std::unexpected("COLMAP reconstruction contains no 3D points");
        }

        auto splat_result = SplatData::init_model_from_pointcloud(params, scene.point_cloud, scene.camera_extent);
        if (!splat_result) {
            return std::unexpected(std::format("Failed to initialize model: {}", splat_result.error()));
        }

        try {
            const torch::Device device(params.optimization.device);

            // 外观嵌入表大小由训练集与验证集共同的最大外观编号决定
            auto appearance_model = std::make_shared<AppearanceModel>(params.appearance_model);
            appearance_model->configure(AppearanceDatasetStats{.max_appearance_id = scene.max_appearance_id});
            appearance_model->allocate_parameters(device);

            auto train_dataset = std::make_shared<CameraDataset>(scene.train.to_cameras(), params.dataset);
            std::shared_ptr<CameraDataset> val_dataset;
            if (params.optimization.enable_eval && !scene.validation.empty()) {
                val_dataset = std::make_shared<CameraDataset>(scene.validation.to_cameras(), params.dataset);
            }

            auto strategy = std::make_unique<DensityControl>(std::move(*splat_result));
            auto trainer = std::make_unique<Trainer>(train_dataset,
                                                     val_dataset,
                                                     std::move(strategy),
                                                     appearance_model,
                                                     params);

            return TrainingSetup{
                .trainer = std::move(trainer),
                .train_dataset = train_dataset,
                .val_dataset = val_dataset,
                .scene_center = scene.scene_center};
        } catch (const std::exception& e) {
            return std::unexpected(std::format("Failed to set up training: {}", e.what()));
        }
    }
} // namespace appsplat::training
