#include "appsplat/application.hpp"
#include "appsplat/logger.hpp"
#include "training/training_setup.hpp"
#include <print>

namespace appsplat {

    /**
     * [功能描述]：应用程序主运行函数：保存配置、准备训练环境并执行训练。
     * @param params [参数说明]：训练参数，包含数据集路径和优化配置。
     * @return [返回值说明]：程序退出码，0表示成功，-1表示失败。
     */
    int Application::run(std::unique_ptr<param::TrainingParameters> params) {
        if (params->dataset.data_path.empty()) {
            std::println(stderr, "Error: training requires --data-path");
            return -1;
        }

        if (auto saved = param::save_training_parameters_to_json(*params, params->dataset.output_path); !saved) {
            LOG_WARN("{}", saved.error());
        }

        std::println("Starting training...");

        auto setup_result = training::setupTraining(*params);
        if (!setup_result) {
            LOG_ERROR("{}", setup_result.error());
            std::println(stderr, "Error: {}", setup_result.error());
            return -1;
        }

        auto train_result = setup_result->trainer->train();
        if (!train_result) {
            LOG_ERROR("{}", train_result.error());
            std::println(stderr, "Training error: {}", train_result.error());
            return -1;
        }

        LOG_INFO("Results written to {}", params->dataset.output_path.string());
        return 0;
    }
} // namespace appsplat
