#pragma once

#include "appsplat/parameters.hpp"
#include "training/components/appearance_model.hpp"
#include "training/dataset.hpp"
#include "training/metrics/metrics.hpp"
#include "training/optimizers/scheduler.hpp"
#include "training/rasterization/renderer.hpp"
#include "training/step_hooks.hpp"
#include "training/strategies/density_control.hpp"
#include <expected>
#include <memory>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace appsplat::training {

    /**
     * @brief 训练阶段，只由步数决定
     */
    enum class TrainingPhase {
        WarmUp,              ///< step < 外观预热步数
        ActiveTraining,      ///< step < densify_until_iter
        DensificationEnded,  ///< step < iterations
        Converged            ///< step >= iterations
    };

    std::string_view to_string(TrainingPhase phase);

    TrainingPhase phase_for_step(int step, const param::TrainingParameters& params);

    /**
     * @struct StepStats
     * @brief 最近一个训练步的损失与高斯数量
     */
    struct StepStats {
        float loss = 0.f;
        float l1 = 0.f;
        float ssim = 0.f;
        int64_t num_gaussians = 0;
    };

    /**
     * @class Trainer
     * @brief 训练器：交替执行可微渲染、损失计算、两个优化器的手动更新和自适应密度控制
     */
    class Trainer {
    public:
        enum class StepResult {
            Continue,
            Stop
        };

        /**
         * [功能描述]：构造训练器
         * @param train_dataset [参数说明]：训练集
         * @param val_dataset [参数说明]：验证集，可为空
         * @param strategy [参数说明]：持有高斯的密度控制器，在构造函数中初始化
         * @param appearance_model [参数说明]：已分配参数的外观模型
         * @param params [参数说明]：训练参数
         */
        Trainer(std::shared_ptr<CameraDataset> train_dataset,
                std::shared_ptr<CameraDataset> val_dataset,
                std::unique_ptr<DensityControl> strategy,
                std::shared_ptr<AppearanceModel> appearance_model,
                const param::TrainingParameters& params);

        ~Trainer();

        Trainer(const Trainer&) = delete;
        Trainer& operator=(const Trainer&) = delete;

        /**
         * [功能描述]：执行完整训练循环
         * @return [返回值说明]：失败时返回错误信息（包括密度控制后没有剩余高斯）
         */
        std::expected<void, std::string> train(std::stop_token stop_token = {});

        /**
         * [功能描述]：执行单个训练步
         * @param step [参数说明]：当前步数，从1开始
         * @param mask [参数说明]：[H, W] bool，可为未定义张量
         */
        std::expected<StepResult, std::string> train_step(int step,
                                                          Camera* cam,
                                                          torch::Tensor gt_image,
                                                          torch::Tensor mask = {},
                                                          std::stop_token stop_token = {});

        /// 钩子按注册顺序在优化器更新前后调用
        void add_step_hook(std::shared_ptr<IStepHook> hook);

        /// 保存 PLY 与外观嵌入到 <root>/point_cloud/iteration_<step>/
        void save_checkpoint(const std::filesystem::path& root, int step, bool join_threads);

        DensityControl& strategy() { return *strategy_; }
        const DensityControl& strategy() const { return *strategy_; }
        AppearanceModel& appearance_model() { return *appearance_model_; }
        torch::optim::Adam& appearance_optimizer() { return *appearance_optimizer_; }
        const WarmupExponentialLR& embedding_scheduler() const { return *embedding_scheduler_; }
        const WarmupExponentialLR& network_scheduler() const { return *network_scheduler_; }
        Renderer& renderer() { return *renderer_; }
        const torch::Tensor& background() const { return background_; }
        const param::TrainingParameters& params() const { return params_; }

        TrainingPhase phase() const { return phase_; }
        int current_iteration() const { return current_iteration_; }
        const StepStats& last_step_stats() const { return last_stats_; }
        const std::vector<EvalMetrics>& validation_history() const { return validation_history_; }

    private:
        void update_phase(int step);
        void run_density_control(int step, const RenderOutput& output);

        std::shared_ptr<CameraDataset> train_dataset_;
        std::shared_ptr<CameraDataset> val_dataset_;
        std::unique_ptr<DensityControl> strategy_;
        std::shared_ptr<AppearanceModel> appearance_model_;
        param::TrainingParameters params_;

        std::unique_ptr<torch::optim::Adam> appearance_optimizer_;
        std::unique_ptr<WarmupExponentialLR> embedding_scheduler_;
        std::unique_ptr<WarmupExponentialLR> network_scheduler_;

        std::unique_ptr<Renderer> renderer_;
        std::vector<std::shared_ptr<IStepHook>> hooks_;
        std::unique_ptr<MetricsEvaluator> evaluator_;
        std::vector<EvalMetrics> validation_history_;

        torch::Tensor background_;
        torch::Device device_;

        TrainingPhase phase_ = TrainingPhase::WarmUp;
        bool phase_logged_ = false;
        int current_iteration_ = 0;
        StepStats last_stats_;
    };

} // namespace appsplat::training
