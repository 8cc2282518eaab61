#include "scheduler.hpp"

#include <algorithm>
#include <cmath>
#include <format>
#include <numbers>
#include <stdexcept>

namespace appsplat::training {

    WarmupExponentialLR::WarmupExponentialLR(torch::optim::Optimizer& optimizer,
                                             double lr_init,
                                             double final_factor,
                                             int warm_up,
                                             int max_steps,
                                             int param_group_index)
        : optimizer_(optimizer),
          lr_init_(lr_init),
          final_factor_(final_factor),
          warm_up_(warm_up),
          max_steps_(max_steps),
          param_group_index_(param_group_index) {
        if (max_steps <= 0) {
            throw std::invalid_argument(std::format("WarmupExponentialLR: max_steps must be positive, got {}", max_steps));
        }
        if (warm_up < 0) {
            throw std::invalid_argument(std::format("WarmupExponentialLR: warm_up must be non-negative, got {}", warm_up));
        }
        if (param_group_index >= static_cast<int>(optimizer.param_groups().size())) {
            throw std::invalid_argument(std::format("WarmupExponentialLR: parameter group {} does not exist", param_group_index));
        }
        apply(lr_at(0));
    }

    double WarmupExponentialLR::lr_at(int64_t t) const {
        const double progress = std::clamp(static_cast<double>(t - warm_up_) / max_steps_, 0.0, 1.0);
        return lr_init_ * std::pow(final_factor_, progress);
    }

    void WarmupExponentialLR::step() {
        ++step_;
        apply(lr_at(step_));
    }

    void WarmupExponentialLR::apply(double lr) {
        if (param_group_index_ >= 0) {
            auto& group = optimizer_.param_groups()[param_group_index_];
            static_cast<torch::optim::AdamOptions&>(group.options()).lr(lr);
        } else {
            for (auto& group : optimizer_.param_groups()) {
                static_cast<torch::optim::AdamOptions&>(group.options()).lr(lr);
            }
        }
    }

    PositionLRSchedule::PositionLRSchedule(double lr_init,
                                           double lr_final,
                                           int64_t max_steps,
                                           double lr_delay_mult,
                                           int64_t lr_delay_steps)
        : lr_init_(lr_init),
          lr_final_(lr_final),
          max_steps_(max_steps),
          lr_delay_mult_(lr_delay_mult),
          lr_delay_steps_(lr_delay_steps) {
        if (max_steps <= 0) {
            throw std::invalid_argument(std::format("PositionLRSchedule: max_steps must be positive, got {}", max_steps));
        }
    }

    double PositionLRSchedule::operator()(int64_t step) const {
        if (step < 0 || (lr_init_ == 0.0 && lr_final_ == 0.0)) {
            return 0.0;
        }
        double delay_rate = 1.0;
        if (lr_delay_steps_ > 0) {
            const double t = std::clamp(static_cast<double>(step) / lr_delay_steps_, 0.0, 1.0);
            delay_rate = lr_delay_mult_ + (1.0 - lr_delay_mult_) * std::sin(0.5 * std::numbers::pi * t);
        }
        const double t = std::clamp(static_cast<double>(step) / max_steps_, 0.0, 1.0);
        const double log_lerp = std::exp(std::log(lr_init_) * (1.0 - t) + std::log(lr_final_) * t);
        return delay_rate * log_lerp;
    }
} // namespace appsplat::training
