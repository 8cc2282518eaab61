#include "step_hooks.hpp"
#include "appsplat/logger.hpp"
#include <format>

namespace appsplat::training {

    StepTimerHook::StepTimerHook(const int report_interval)
        : report_interval_(report_interval > 0 ? report_interval : 100) {
    }

    void StepTimerHook::before_step(int) {
        if (!started_) {
            window_start_ = std::chrono::steady_clock::now();
            steps_in_window_ = 0;
            started_ = true;
        }
    }

    void StepTimerHook::after_step(const int step) {
        ++steps_in_window_;
        if (steps_in_window_ < report_interval_) {
            return;
        }

        const auto elapsed = std::chrono::duration<double, std::milli>(
            std::chrono::steady_clock::now() - window_start_);
        last_average_ms_ = elapsed.count() / steps_in_window_;
        LOG_DEBUG("Step {}: {:.2f} ms/step over the last {} steps", step, last_average_ms_, steps_in_window_);

        window_start_ = std::chrono::steady_clock::now();
        steps_in_window_ = 0;
    }

    LearningRateLoggerHook::LearningRateLoggerHook(std::vector<NamedOptimizer> optimizers, const int interval)
        : optimizers_(std::move(optimizers)),
          interval_(interval > 0 ? interval : 100) {
    }

    void LearningRateLoggerHook::before_step(const int step) {
        if ((step - 1) % interval_ != 0) {
            return;
        }

        last_logged_.clear();
        for (const auto& named : optimizers_) {
            if (named.optimizer == nullptr) {
                continue;
            }
            auto& groups = named.optimizer->param_groups();
            for (size_t i = 0; i < groups.size(); ++i) {
                const auto group_name = i < named.group_names.size()
                                            ? named.group_names[i]
                                            : std::format("group_{}", i);
                const double lr = static_cast<torch::optim::AdamOptions&>(groups[i].options()).lr();
                last_logged_.emplace_back(std::format("{}/{}", named.name, group_name), lr);
                LOG_DEBUG("Step {} lr {}/{} = {:.3e}", step, named.name, group_name, lr);
            }
        }
    }

} // namespace appsplat::training
