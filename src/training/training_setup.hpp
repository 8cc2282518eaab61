#pragma once

#include "appsplat/parameters.hpp"
#include "training/dataset.hpp"
#include "training/trainer.hpp"
#include <expected>
#include <memory>
#include <string>

namespace appsplat::training {

    /**
     * @struct TrainingSetup
     * @brief 训练准备结果
     */
    struct TrainingSetup {
        std::unique_ptr<Trainer> trainer;
        std::shared_ptr<CameraDataset> train_dataset;
        std::shared_ptr<CameraDataset> val_dataset;  ///< 未启用评估时为空
        torch::Tensor scene_center;
    };

    /**
     * [功能描述]：加载COLMAP场景，从稀疏点云初始化高斯，配置外观模型并创建训练器。
     */
    std::expected<TrainingSetup, std::string> setupTraining(const param::TrainingParameters& params);

} // namespace appsplat::training
