#pragma once

#include <chrono>
#include <string>
#include <torch/torch.h>
#include <vector>

namespace appsplat::training {

    /**
     * @class IStepHook
     * @brief 训练步钩子，在优化器更新前后被调用
     * @details 钩子按注册顺序调用，不得修改高斯集合的结构
     */
    class IStepHook {
    public:
        virtual ~IStepHook() = default;

        virtual void before_step(int step) = 0;
        virtual void after_step(int step) = 0;
    };

    /**
     * @class StepTimerHook
     * @brief 统计相邻训练步间隔，每隔 report_interval 步以debug级别输出平均耗时
     */
    class StepTimerHook : public IStepHook {
    public:
        explicit StepTimerHook(int report_interval = 100);

        void before_step(int step) override;
        void after_step(int step) override;

        /// 上一个统计窗口的平均步耗时（毫秒）
        double last_average_ms() const { return last_average_ms_; }

    private:
        int report_interval_;
        int steps_in_window_ = 0;
        bool started_ = false;
        double last_average_ms_ = 0.0;
        std::chrono::steady_clock::time_point window_start_;
    };

    /**
     * @struct NamedOptimizer
     * @brief 带参数组名称的优化器引用，参数组名称与 param_groups() 顺序一致
     */
    struct NamedOptimizer {
        std::string name;
        torch::optim::Optimizer* optimizer = nullptr;
        std::vector<std::string> group_names;
    };

    /**
     * @class LearningRateLoggerHook
     * @brief (step − 1) % interval == 0 时输出所有参数组的学习率
     */
    class LearningRateLoggerHook : public IStepHook {
    public:
        explicit LearningRateLoggerHook(std::vector<NamedOptimizer> optimizers, int interval = 100);

        void before_step(int step) override;
        void after_step(int) override {}

        /// 最近一次记录的 "<优化器>/<参数组>" 与学习率
        const std::vector<std::pair<std::string, double>>& last_logged() const { return last_logged_; }

    private:
        std::vector<NamedOptimizer> optimizers_;
        int interval_;
        std::vector<std::pair<std::string, double>> last_logged_;
    };

} // namespace appsplat::training
