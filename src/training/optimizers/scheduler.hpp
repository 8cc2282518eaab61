#pragma once

#include <torch/torch.h>

namespace appsplat::training {
    /**
     * [功能描述]：带预热偏移的指数学习率调度器。
     * LibTorch没有LambdaLR，这里直接按步数计算并写回优化器参数组的学习率：
     *     lr(t) = lr_init · final_factor^clamp((t − warm_up) / max_steps, 0, 1)
     *
     * 构造时立即写入 lr(0)，之后每次step()推进一步。
     */
    class WarmupExponentialLR {
    public:
        /**
         * @param optimizer [参数说明]：要调度的优化器，参数组选项必须是AdamOptions
         * @param lr_init [参数说明]：初始学习率
         * @param final_factor [参数说明]：max_steps步后学习率相对lr_init的倍数
         * @param warm_up [参数说明]：衰减开始前的步数
         * @param max_steps [参数说明]：衰减持续的步数，必须大于0
         * @param param_group_index [参数说明]：参数组索引，-1表示所有参数组
         * @throws std::invalid_argument max_steps <= 0 或 warm_up < 0
         */
        WarmupExponentialLR(torch::optim::Optimizer& optimizer,
                            double lr_init,
                            double final_factor,
                            int warm_up,
                            int max_steps,
                            int param_group_index = -1);

        void step();

        /// 第t步的学习率
        double lr_at(int64_t t) const;

        int64_t last_step() const { return step_; }
        int param_group_index() const { return param_group_index_; }

    private:
        void apply(double lr);

        torch::optim::Optimizer& optimizer_;
        double lr_init_;
        double final_factor_;
        int warm_up_;
        int max_steps_;
        int param_group_index_;
        int64_t step_ = 0;
    };

    /**
     * [功能描述]：位置学习率调度。
     * 对数空间线性插值，并在 lr_delay_steps 内用余弦延迟：
     *     delay = delay_mult + (1 − delay_mult)·sin(π/2 · clamp(t/delay_steps, 0, 1))
     *     lr(t) = delay · exp(log(lr_init)(1 − s) + log(lr_final)·s),  s = clamp(t/max_steps, 0, 1)
     */
    class PositionLRSchedule {
    public:
        PositionLRSchedule() = default;
        PositionLRSchedule(double lr_init,
                           double lr_final,
                           int64_t max_steps,
                           double lr_delay_mult = 1.0,
                           int64_t lr_delay_steps = 0);

        double operator()(int64_t step) const;

    private:
        double lr_init_ = 0.0;
        double lr_final_ = 0.0;
        int64_t max_steps_ = 1;
        double lr_delay_mult_ = 1.0;
        int64_t lr_delay_steps_ = 0;
    };
} // namespace appsplat::training
