#include "density_control.hpp"
#include "appsplat/logger.hpp"
#include "training/rasterization/torch_rasterizer.hpp"
#include <cmath>
#include <format>
#include <stdexcept>

namespace appsplat::training {

    namespace strategy {

        void initialize_gaussians(SplatData& splat_data, const torch::Device& device) {
            auto to_leaf = [&device](const torch::Tensor& t) {
                return t.to(device).detach().set_requires_grad(true);
            };
            splat_data.means() = to_leaf(splat_data.means());
            splat_data.sh0() = to_leaf(splat_data.sh0());
            splat_data.shN() = to_leaf(splat_data.shN());
            splat_data.scaling_raw() = to_leaf(splat_data.scaling_raw());
            splat_data.rotation_raw() = to_leaf(splat_data.rotation_raw());
            splat_data.opacity_raw() = to_leaf(splat_data.opacity_raw());
            splat_data.appearance_features() = to_leaf(splat_data.appearance_features());
        }

        std::unique_ptr<torch::optim::Adam> create_optimizer(
            SplatData& splat_data,
            const param::OptimizationParameters& params) {

            using torch::optim::AdamOptions;
            std::vector<torch::optim::OptimizerParamGroup> groups;

            const auto add_group = [&groups](const torch::Tensor& param, double lr) {
                groups.emplace_back(torch::optim::OptimizerParamGroup({param}, std::make_unique<AdamOptions>(lr)));
            };

            // 顺序必须与 kParamGroupNames 一致
            add_group(splat_data.means(), params.means_lr * splat_data.get_scene_scale());
            add_group(splat_data.sh0(), params.shs_lr);
            add_group(splat_data.shN(), params.shs_lr / 20.f);
            add_group(splat_data.scaling_raw(), params.scaling_lr);
            add_group(splat_data.rotation_raw(), params.rotation_lr);
            add_group(splat_data.opacity_raw(), params.opacity_lr);
            add_group(splat_data.appearance_features(), params.appearance_features_lr);

            for (auto& g : groups)
                static_cast<AdamOptions&>(g.options()).eps(params.adam_eps);

            return std::make_unique<torch::optim::Adam>(groups, AdamOptions(0.f).eps(params.adam_eps));
        }

        void update_param_with_optimizer(
            const ParamUpdateFn& param_fn,
            const OptimizerUpdateFn& optimizer_fn,
            torch::optim::Optimizer& optimizer,
            SplatData& splat_data,
            std::vector<size_t> param_idxs) {

            std::array<torch::Tensor*, kNumParamGroups> params = {
                &splat_data.means(),
                &splat_data.sh0(),
                &splat_data.shN(),
                &splat_data.scaling_raw(),
                &splat_data.rotation_raw(),
                &splat_data.opacity_raw(),
                &splat_data.appearance_features()};

            std::array<torch::Tensor, kNumParamGroups> new_params;
            std::array<std::unique_ptr<torch::optim::OptimizerParamState>, kNumParamGroups> saved_states;
            std::vector<void*> old_param_keys;

            // 步骤1：生成新参数，并由旧Adam状态推导新状态
            for (auto i : param_idxs) {
                auto new_param = param_fn(static_cast<int>(i), *params[i]);
                new_params[i] = new_param;

                auto& old_param = optimizer.param_groups()[i].params()[0];
                void* old_param_key = old_param.unsafeGetTensorImpl();
                old_param_keys.push_back(old_param_key);

                auto state_it = optimizer.state().find(old_param_key);
                if (state_it != optimizer.state().end()) {
                    if (auto* adam_state = dynamic_cast<torch::optim::AdamParamState*>(state_it->second.get())) {
                        saved_states[i] = optimizer_fn(*adam_state, new_param);
                    }
                }
            }

            // 步骤2：移除旧状态
            for (auto key : old_param_keys) {
                optimizer.state().erase(key);
            }

            // 步骤3：替换优化器中的参数并挂上新状态
            for (auto i : param_idxs) {
                optimizer.param_groups()[i].params()[0] = new_params[i];
                if (saved_states[i]) {
                    optimizer.state()[new_params[i].unsafeGetTensorImpl()] = std::move(saved_states[i]);
                }
                *params[i] = new_params[i];
            }
        }

    } // namespace strategy

    namespace {
        /// 按行选择Adam状态，extra_rows>0时在末尾追加零行
        std::unique_ptr<torch::optim::OptimizerParamState> select_adam_state(
            torch::optim::OptimizerParamState& state,
            const torch::Tensor& rows,
            int64_t extra_rows) {

            auto* adam_state = dynamic_cast<torch::optim::AdamParamState*>(&state);
            if (!adam_state) {
                return nullptr;
            }

            const auto extend = [&](const torch::Tensor& t) {
                auto kept = t.index_select(0, rows);
                if (extra_rows == 0) {
                    return kept;
                }
                auto zero_shape = t.sizes().vec();
                zero_shape[0] = extra_rows;
                return torch::cat({kept, torch::zeros(zero_shape, t.options())}, 0);
            };

            auto new_state = std::make_unique<torch::optim::AdamParamState>();
            new_state->step(adam_state->step());
            new_state->exp_avg(extend(adam_state->exp_avg()));
            new_state->exp_avg_sq(extend(adam_state->exp_avg_sq()));
            if (adam_state->max_exp_avg_sq().defined()) {
                new_state->max_exp_avg_sq(extend(adam_state->max_exp_avg_sq()));
            }
            return new_state;
        }

        torch::Tensor all_rows(int64_t n, const torch::Device& device) {
            return torch::arange(n, torch::TensorOptions().dtype(torch::kLong).device(device));
        }
    } // namespace

    DensityControl::DensityControl(SplatData&& splat_data)
        : _splat_data(std::move(splat_data)) {
    }

    void DensityControl::initialize(const param::OptimizationParameters& params) {
        _params = std::make_unique<const param::OptimizationParameters>(params);

        strategy::initialize_gaussians(_splat_data, torch::Device(_params->device));
        _optimizer = strategy::create_optimizer(_splat_data, *_params);

        const double extent = _splat_data.get_scene_scale();
        _position_lr = PositionLRSchedule(_params->means_lr * extent,
                                          _params->means_lr_final * extent,
                                          static_cast<int64_t>(_params->means_lr_max_steps),
                                          _params->means_lr_delay_mult);
        reset_statistics();
    }

    void DensityControl::reset_statistics() {
        const auto n = _splat_data.size();
        const auto options = torch::TensorOptions().dtype(torch::kFloat32).device(_splat_data.means().device());
        _max_radii2D = torch::zeros({n}, options);
        _xyz_gradient_accum = torch::zeros({n, 1}, options);
        _denom = torch::zeros({n, 1}, options);
    }

    void DensityControl::update_max_radii(const torch::Tensor& radii, const torch::Tensor& visibility) {
        torch::NoGradGuard no_grad;
        const auto idx = visibility.nonzero().squeeze(-1);
        const auto r = radii.index_select(0, idx).to(_max_radii2D.scalar_type());
        _max_radii2D.index_put_({idx}, torch::max(_max_radii2D.index_select(0, idx), r));
    }

    void DensityControl::add_densification_stats(const torch::Tensor& means2d_grad,
                                                 const torch::Tensor& visibility,
                                                 int width,
                                                 int height) {
        torch::NoGradGuard no_grad;
        TORCH_CHECK(means2d_grad.defined(), "means2d has no gradient; call after backward");

        const auto idx = visibility.nonzero().squeeze(-1);
        auto grads = means2d_grad.index_select(0, idx).slice(-1, 0, 2).clone();
        grads.select(-1, 0).mul_(width / 2.0f);
        grads.select(-1, 1).mul_(height / 2.0f);

        _xyz_gradient_accum.index_add_(0, idx, grads.norm(2, -1, true));
        _denom.index_add_(0, idx, torch::ones({idx.size(0), 1}, _denom.options()));
    }

    void DensityControl::duplicate(const torch::Tensor& is_duplicated) {
        torch::NoGradGuard no_grad;

        const auto sampled_idxs = is_duplicated.nonzero().squeeze(-1);
        const auto num_new = sampled_idxs.size(0);
        const auto keep = all_rows(_splat_data.size(), sampled_idxs.device());

        const auto param_fn = [&sampled_idxs](const int, const torch::Tensor param) {
            return torch::cat({param, param.index_select(0, sampled_idxs)}).set_requires_grad(param.requires_grad());
        };
        const auto optimizer_fn = [&keep, num_new](torch::optim::OptimizerParamState& state,
                                                   const torch::Tensor) {
            return select_adam_state(state, keep, num_new);
        };
        strategy::update_param_with_optimizer(param_fn, optimizer_fn, *_optimizer, _splat_data);

        _xyz_gradient_accum = torch::cat({_xyz_gradient_accum, _xyz_gradient_accum.index_select(0, sampled_idxs)});
        _denom = torch::cat({_denom, _denom.index_select(0, sampled_idxs)});
        _max_radii2D = torch::cat({_max_radii2D, _max_radii2D.index_select(0, sampled_idxs)});
    }

    void DensityControl::split(const torch::Tensor& is_split) {
        torch::NoGradGuard no_grad;

        const auto sampled_idxs = is_split.nonzero().squeeze(-1);
        const auto rest_idxs = is_split.logical_not().nonzero().squeeze(-1);
        const int64_t split_size = _params->split_count;
        const int64_t num_split = sampled_idxs.size(0);

        const auto sampled_scales = _splat_data.get_scaling().index_select(0, sampled_idxs);   // [M, 3]
        const auto rotmats = quaternion_to_rotation_matrix(
            _splat_data.get_rotation().index_select(0, sampled_idxs));                           // [M, 3, 3]

        // 以原高斯为中心、自身尺度为标准差采样子高斯位置
        const auto samples = torch::einsum(
            "nij,nj,bnj->bni",
            {rotmats,
             sampled_scales,
             torch::randn({split_size, num_split, 3}, sampled_scales.options())}); // [split_size, M, 3]

        const float shrink = 0.8f * static_cast<float>(split_size);

        const auto param_fn = [&](const int i, const torch::Tensor param) {
            std::vector<int64_t> repeats(param.dim(), 1);
            repeats[0] = split_size;

            const auto sampled_param = param.index_select(0, sampled_idxs);
            torch::Tensor split_param;
            if (i == static_cast<int>(strategy::kMeansGroup)) {
                split_param = (sampled_param.unsqueeze(0) + samples).reshape({-1, 3});
            } else if (i == static_cast<int>(strategy::kScalingGroup)) {
                split_param = torch::log(sampled_scales / shrink).repeat({split_size, 1});
            } else {
                split_param = sampled_param.repeat(repeats);
            }
            const auto rest_param = param.index_select(0, rest_idxs);
            return torch::cat({rest_param, split_param}, 0).set_requires_grad(param.requires_grad());
        };
        const auto optimizer_fn = [&rest_idxs, num_split, split_size](torch::optim::OptimizerParamState& state,
                                                                      const torch::Tensor) {
            return select_adam_state(state, rest_idxs, num_split * split_size);
        };
        strategy::update_param_with_optimizer(param_fn, optimizer_fn, *_optimizer, _splat_data);

        const auto split_stats = [&](const torch::Tensor& t) {
            std::vector<int64_t> repeats(t.dim(), 1);
            repeats[0] = split_size;
            return torch::cat({t.index_select(0, rest_idxs), t.index_select(0, sampled_idxs).repeat(repeats)});
        };
        _xyz_gradient_accum = split_stats(_xyz_gradient_accum);
        _denom = split_stats(_denom);
        _max_radii2D = split_stats(_max_radii2D);
    }

    void DensityControl::remove(const torch::Tensor& is_prune) {
        torch::NoGradGuard no_grad;

        const auto kept_idxs = is_prune.logical_not().nonzero().squeeze(-1);

        const auto param_fn = [&kept_idxs](const int, const torch::Tensor param) {
            return param.index_select(0, kept_idxs).set_requires_grad(param.requires_grad());
        };
        const auto optimizer_fn = [&kept_idxs](torch::optim::OptimizerParamState& state,
                                               const torch::Tensor) {
            return select_adam_state(state, kept_idxs, 0);
        };
        strategy::update_param_with_optimizer(param_fn, optimizer_fn, *_optimizer, _splat_data);

        _xyz_gradient_accum = _xyz_gradient_accum.index_select(0, kept_idxs);
        _denom = _denom.index_select(0, kept_idxs);
        _max_radii2D = _max_radii2D.index_select(0, kept_idxs);
    }

    DensifyResult DensityControl::densify_and_prune(float grad_threshold,
                                                    float min_opacity,
                                                    float extent,
                                                    std::optional<float> max_screen_size) {
        torch::NoGradGuard no_grad;
        DensifyResult result;

        // 步骤1：平均视空间梯度，未被看到过的高斯为0
        auto grads = _xyz_gradient_accum / _denom;
        grads.index_put_({grads.isnan()}, 0.0f);
        grads = grads.squeeze(-1);
        const auto is_grad_high = grads >= grad_threshold;

        const auto max_scale = std::get<0>(torch::max(_splat_data.get_scaling(), -1));
        const auto is_small = max_scale <= _params->percent_dense * extent;

        // 步骤2：克隆小而梯度大的高斯
        const auto is_duplicated = is_grad_high & is_small;
        result.num_cloned = is_duplicated.sum().item<int64_t>();
        if (result.num_cloned > 0) {
            duplicate(is_duplicated);
        }

        // 步骤3：分裂大而梯度大的高斯；新克隆出的高斯不参与分裂
        auto is_split = is_grad_high & is_small.logical_not();
        result.num_split = is_split.sum().item<int64_t>();
        if (result.num_split > 0) {
            is_split = torch::cat({is_split,
                                   torch::zeros({result.num_cloned}, is_split.options())});
            split(is_split);
        }

        // 步骤4：修剪
        auto is_prune = _splat_data.get_opacity() < min_opacity;
        if (max_screen_size.has_value()) {
            const auto big_points_vs = _max_radii2D > *max_screen_size;
            const auto big_points_ws =
                std::get<0>(torch::max(_splat_data.get_scaling(), -1)) > _params->max_world_size_factor * extent;
            is_prune = is_prune | big_points_vs | big_points_ws;
        }
        result.num_pruned = is_prune.sum().item<int64_t>();
        if (result.num_pruned == _splat_data.size()) {
            throw std::runtime_error(std::format(
                "Density control would remove all {} Gaussians", result.num_pruned));
        }
        if (result.num_pruned > 0) {
            remove(is_prune);
        }

        reset_statistics();
        check_statistics_invariant();

        LOG_DEBUG("Densify: cloned {}, split {}, pruned {}, total {}",
                  result.num_cloned, result.num_split, result.num_pruned, _splat_data.size());
        return result;
    }

    void DensityControl::reset_opacity() {
        torch::NoGradGuard no_grad;

        const float reset_logit = std::log(_params->opacity_reset_value / (1.0f - _params->opacity_reset_value));

        const auto param_fn = [reset_logit](const int i, const torch::Tensor param) {
            if (i != static_cast<int>(strategy::kOpacityGroup)) {
                throw std::runtime_error(std::format("Invalid parameter index for reset_opacity: {}", i));
            }
            return torch::full_like(param, reset_logit).set_requires_grad(param.requires_grad());
        };
        const auto optimizer_fn = [](torch::optim::OptimizerParamState& state,
                                     const torch::Tensor) -> std::unique_ptr<torch::optim::OptimizerParamState> {
            auto* adam_state = dynamic_cast<torch::optim::AdamParamState*>(&state);
            if (!adam_state) {
                return nullptr;
            }
            auto new_state = std::make_unique<torch::optim::AdamParamState>();
            new_state->step(adam_state->step());
            new_state->exp_avg(torch::zeros_like(adam_state->exp_avg()));
            new_state->exp_avg_sq(torch::zeros_like(adam_state->exp_avg_sq()));
            if (adam_state->max_exp_avg_sq().defined()) {
                new_state->max_exp_avg_sq(torch::zeros_like(adam_state->max_exp_avg_sq()));
            }
            return new_state;
        };
        strategy::update_param_with_optimizer(param_fn, optimizer_fn, *_optimizer, _splat_data,
                                              {strategy::kOpacityGroup});
    }

    double DensityControl::update_learning_rate(int step) {
        const double lr = _position_lr(step);
        auto& group = _optimizer->param_groups()[strategy::kMeansGroup];
        static_cast<torch::optim::AdamOptions&>(group.options()).lr(lr);
        return lr;
    }

    void DensityControl::check_statistics_invariant() const {
        const auto n = _splat_data.size();
        if (_max_radii2D.size(0) != n || _xyz_gradient_accum.size(0) != n || _denom.size(0) != n) {
            throw std::logic_error(std::format(
                "Densification statistics out of sync: {} Gaussians, max_radii2D {}, xyz_gradient_accum {}, denom {}",
                n, _max_radii2D.size(0), _xyz_gradient_accum.size(0), _denom.size(0)));
        }
        for (size_t i = 0; i < strategy::kNumParamGroups; ++i) {
            const auto& p = _optimizer->param_groups()[i].params()[0];
            if (p.size(0) != n) {
                throw std::logic_error(std::format(
                    "Optimizer group '{}' has {} rows, expected {}", strategy::kParamGroupNames[i], p.size(0), n));
            }
        }
    }

} // namespace appsplat::training
