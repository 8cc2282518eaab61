#include "trainer.hpp"
#include "appsplat/logger.hpp"
#include "training/rasterization/color_stage.hpp"
#include "training/rasterization/torch_rasterizer.hpp"
#include <algorithm>
#include <format>
#include <print>

namespace appsplat::training {

    std::string_view to_string(const TrainingPhase phase) {
        switch (phase) {
        case TrainingPhase::WarmUp: return "warm-up";
        case TrainingPhase::ActiveTraining: return "active training";
        case TrainingPhase::DensificationEnded: return "densification ended";
        case TrainingPhase::Converged: return "converged";
        }
        return "unknown";
    }

    TrainingPhase phase_for_step(const int step, const param::TrainingParameters& params) {
        if (step >= static_cast<int>(params.optimization.iterations)) {
            return TrainingPhase::Converged;
        }
        if (step < params.appearance_optimization.warm_up) {
            return TrainingPhase::WarmUp;
        }
        if (step < static_cast<int>(params.optimization.densify_until_iter)) {
            return TrainingPhase::ActiveTraining;
        }
        return TrainingPhase::DensificationEnded;
    }

    namespace {
        bool contains_step(const std::vector<size_t>& steps, const int step) {
            return std::find(steps.cbegin(), steps.cend(), static_cast<size_t>(step)) != steps.cend();
        }
    } // namespace

    /**
     * [功能描述]：训练器构造函数，初始化密度控制器、外观优化器与调度器、渲染器和评估器。
     * @param train_dataset [参数说明]：训练集。
     * @param val_dataset [参数说明]：验证集，可为空。
     * @param strategy [参数说明]：密度控制器，持有高斯数据。
     * @param appearance_model [参数说明]：已分配参数的外观模型。
     * @param params [参数说明]：训练参数。
     */
    Trainer::Trainer(std::shared_ptr<CameraDataset> train_dataset,
                     std::shared_ptr<CameraDataset> val_dataset,
                     std::unique_ptr<DensityControl> strategy,
                     std::shared_ptr<AppearanceModel> appearance_model,
                     const param::TrainingParameters& params)
        : train_dataset_(std::move(train_dataset)),
          val_dataset_(std::move(val_dataset)),
          strategy_(std::move(strategy)),
          appearance_model_(std::move(appearance_model)),
          params_(params),
          device_(params.optimization.device) {

        if (!train_dataset_ || train_dataset_->size().value() == 0) {
            throw std::invalid_argument("Trainer requires a non-empty training dataset");
        }
        if (!strategy_) {
            throw std::invalid_argument("Trainer requires a density controller");
        }
        if (!appearance_model_ || !appearance_model_->is_allocated()) {
            throw std::invalid_argument("Trainer requires an allocated appearance model");
        }
        if (device_.is_cuda() && !torch::cuda::is_available()) {
            throw std::runtime_error("CUDA is not available – use --device cpu.");
        }

        // 步骤1：高斯优化器与位置学习率调度
        strategy_->initialize(params_.optimization);

        // 步骤2：外观优化器，两个参数组各自调度
        const auto& app_opt = params_.appearance_optimization;
        using torch::optim::AdamOptions;
        std::vector<torch::optim::OptimizerParamGroup> groups;
        groups.emplace_back(appearance_model_->embedding_parameters(),
                            std::make_unique<AdamOptions>(AdamOptions(app_opt.embedding_lr_init).eps(app_opt.eps)));
        groups.emplace_back(appearance_model_->network_parameters(),
                            std::make_unique<AdamOptions>(AdamOptions(app_opt.lr_init).eps(app_opt.eps)));
        appearance_optimizer_ = std::make_unique<torch::optim::Adam>(groups, AdamOptions(app_opt.lr_init).eps(app_opt.eps));

        embedding_scheduler_ = std::make_unique<WarmupExponentialLR>(
            *appearance_optimizer_, app_opt.embedding_lr_init, app_opt.lr_final_factor,
            app_opt.warm_up, app_opt.max_steps, /*param_group_index=*/0);
        network_scheduler_ = std::make_unique<WarmupExponentialLR>(
            *appearance_optimizer_, app_opt.lr_init, app_opt.lr_final_factor,
            app_opt.warm_up, app_opt.max_steps, /*param_group_index=*/1);

        // 步骤3：渲染器 = 光栅化器 + 外观着色
        TorchRasterizerSettings raster_settings;
        raster_settings.antialiased = params_.optimization.antialiased;
        raster_settings.filter_2d_kernel_size = params_.optimization.filter_2d_kernel_size;
        renderer_ = std::make_unique<Renderer>(
            std::make_shared<TorchRasterizer>(raster_settings),
            std::make_shared<AppearanceColorStage>(std::make_shared<SHColorStage>(), appearance_model_));

        background_ = params_.optimization.white_background
                          ? torch::ones({3}, torch::TensorOptions().dtype(torch::kFloat32).device(device_))
                          : torch::zeros({3}, torch::TensorOptions().dtype(torch::kFloat32).device(device_));

        evaluator_ = std::make_unique<MetricsEvaluator>(params_);

        std::vector<std::string> gaussian_groups;
        for (const auto name : strategy::kParamGroupNames) {
            gaussian_groups.emplace_back(name);
        }
        add_step_hook(std::make_shared<StepTimerHook>());
        add_step_hook(std::make_shared<LearningRateLoggerHook>(std::vector<NamedOptimizer>{
            {"gaussians", &strategy_->optimizer(), gaussian_groups},
            {"appearance", appearance_optimizer_.get(), {"embedding", "embedding_network"}}}));

        std::println("Training on {} images ({} validation), {} Gaussians, {} appearances",
                     train_dataset_->size().value(),
                     val_dataset_ ? val_dataset_->size().value() : 0,
                     strategy_->get_model().size(),
                     appearance_model_->n_appearances());
    }

    Trainer::~Trainer() {
        if (strategy_) {
            strategy_->get_model().wait_for_saves();
        }
    }

    void Trainer::add_step_hook(std::shared_ptr<IStepHook> hook) {
        if (hook) {
            hooks_.push_back(std::move(hook));
        }
    }

    void Trainer::save_checkpoint(const std::filesystem::path& root, const int step, const bool join_threads) {
        strategy_->get_model().save_ply(root, step, join_threads);
        appearance_model_->save_embedding(
            root / "point_cloud" / std::format("iteration_{}", step) / "appearance_embedding.pt");
        LOG_INFO("Saved checkpoint for step {} to {}", step, root.string());
    }

    void Trainer::update_phase(const int step) {
        const auto phase = phase_for_step(step, params_);
        if (!phase_logged_ || phase != phase_) {
            phase_ = phase;
            phase_logged_ = true;
            LOG_INFO("Step {}: entering {} phase", step, to_string(phase));
        }
    }

    /**
     * [功能描述]：密度控制：统计可见高斯的屏幕半径与视空间梯度，按间隔执行克隆/分裂/修剪和不透明度重置。
     * 必须在反向传播之后、优化器更新之前调用。
     */
    void Trainer::run_density_control(const int step, const RenderOutput& output) {
        const auto& opt = params_.optimization;
        if (step >= static_cast<int>(opt.densify_until_iter)) {
            return;
        }

        strategy_->update_max_radii(output.radii, output.visibility);
        const auto means2d_grad = output.means2d.grad();
        if (means2d_grad.defined()) {
            strategy_->add_densification_stats(means2d_grad, output.visibility, output.width, output.height);
        }

        if (step > static_cast<int>(opt.densify_from_iter) && step % static_cast<int>(opt.densification_interval) == 0) {
            std::optional<float> size_threshold;
            if (step > static_cast<int>(opt.opacity_reset_interval)) {
                size_threshold = opt.max_screen_size;
            }
            const auto result = strategy_->densify_and_prune(opt.densify_grad_threshold,
                                                             opt.min_opacity,
                                                             strategy_->get_model().get_scene_scale(),
                                                             size_threshold);
            LOG_INFO("Step {}: densified (+{} cloned, +{} split, -{} pruned), {} Gaussians",
                     step, result.num_cloned, result.num_split, result.num_pruned,
                     strategy_->get_model().size());
        }

        const bool white_background = background_.eq(1.0f).all().item<bool>();
        if (step % static_cast<int>(opt.opacity_reset_interval) == 0 ||
            (white_background && step == static_cast<int>(opt.densify_from_iter))) {
            strategy_->reset_opacity();
            LOG_DEBUG("Step {}: opacity reset", step);
        }
    }

    /**
     * [功能描述]：执行单个训练步骤：球谐升阶、渲染、损失、反向传播、保存、密度控制和优化器更新。
     * @param step [参数说明]：当前迭代次数，从1开始。
     * @param cam [参数说明]：当前训练使用的相机对象。
     * @param gt_image [参数说明]：真实图像 [3, H, W]。
     * @param mask [参数说明]：可选的掩码 [H, W]，true的像素不参与监督。
     * @param stop_token [参数说明]：停止令牌，只在步与步之间响应。
     * @return [返回值说明]：返回StepResult枚举值（Continue或Stop），失败时返回错误字符串。
     */
    std::expected<Trainer::StepResult, std::string> Trainer::train_step(
        const int step,
        Camera* cam,
        torch::Tensor gt_image,
        torch::Tensor mask,
        std::stop_token stop_token) {
        if (stop_token.stop_requested()) {
            return StepResult::Stop;
        }
        if (cam == nullptr) {
            return std::unexpected("Training step received a null camera");
        }

        try {
            current_iteration_ = step;
            update_phase(step);
            auto& model = strategy_->get_model();
            const auto& opt = params_.optimization;

            // 步骤1：球谐度数升阶
            if (step % static_cast<int>(opt.sh_degree_interval) == 0) {
                model.increment_sh_degree();
            }

            // 步骤2：渲染
            const bool warm_up = step < params_.appearance_optimization.warm_up;
            auto output = renderer_->render(*cam, model, background_, 1.0f, warm_up);

            // 步骤3：损失
            gt_image = gt_image.to(device_);
            if (mask.defined()) {
                mask = mask.to(device_);
            }
            const auto terms = compute_photometric_loss(output.image, gt_image, mask, opt.lambda_dssim);

            // 步骤4：清零梯度并反向传播
            strategy_->optimizer().zero_grad(true);
            appearance_optimizer_->zero_grad(true);
            terms.loss.backward();

            last_stats_ = StepStats{
                .loss = terms.loss.item<float>(),
                .l1 = terms.l1.item<float>(),
                .ssim = terms.ssim.item<float>(),
                .num_gaussians = model.size()};

            // 步骤5：保存点，快照在密度控制之前获取
            if (contains_step(opt.save_steps, step)) {
                save_checkpoint(params_.dataset.output_path, step, /*join_threads=*/false);
            }

            // 步骤6：密度控制
            {
                torch::NoGradGuard no_grad;
                run_density_control(step, output);
            }

            // 步骤7：优化器与调度器
            for (auto& hook : hooks_) {
                hook->before_step(step);
            }
            strategy_->optimizer().step();
            appearance_optimizer_->step();
            embedding_scheduler_->step();
            network_scheduler_->step();
            strategy_->update_learning_rate(step);
            for (auto& hook : hooks_) {
                hook->after_step(step);
            }

            if (evaluator_->should_evaluate(step) && val_dataset_) {
                validation_history_.push_back(
                    evaluator_->evaluate(step, *renderer_, model, val_dataset_, background_));
            }

            return StepResult::Continue;
        } catch (const std::exception& e) {
            return std::unexpected(std::format("Training step {} failed: {}", step, e.what()));
        }
    }

    /**
     * [功能描述]：训练主循环，从无限随机数据加载器取样本，直到达到总迭代次数或收到停止请求。
     * @param stop_token [参数说明]：停止令牌。
     * @return [返回值说明]：成功返回空，失败返回错误信息。
     */
    std::expected<void, std::string> Trainer::train(std::stop_token stop_token) {
        try {
            int step = 1;
            const int num_workers = params_.optimization.num_workers;
            const int iterations = static_cast<int>(params_.optimization.iterations);

            auto train_dataloader = create_infinite_dataloader_from_dataset(train_dataset_, num_workers);
            auto loader = train_dataloader->begin();

            while (step <= iterations) {
                if (stop_token.stop_requested()) {
                    break;
                }

                auto& batch = *loader;
                auto camera_with_image = batch[0].data;

                auto step_result = train_step(step,
                                              camera_with_image.camera,
                                              std::move(camera_with_image.image),
                                              std::move(camera_with_image.mask),
                                              stop_token);
                if (!step_result) {
                    return std::unexpected(step_result.error());
                }
                if (*step_result == StepResult::Stop) {
                    break;
                }

                if (step % 100 == 0 || step == 1) {
                    std::println("[{:>6}/{}] loss {:.5f}  #GS {}",
                                 step, iterations, last_stats_.loss, last_stats_.num_gaussians);
                }

                ++step;
                ++loader;
            }

            const int last_step = step - 1;
            update_phase(last_step + 1);
            if (last_step > 0 && !contains_step(params_.optimization.save_steps, last_step)) {
                save_checkpoint(params_.dataset.output_path, last_step, /*join_threads=*/true);
            }
            strategy_->get_model().wait_for_saves();
            evaluator_->save_report();

            std::println("Training finished at step {} with {} Gaussians", last_step, strategy_->get_model().size());
            return {};
        } catch (const std::exception& e) {
            return std::unexpected(std::format("Training failed: {}", e.what()));
        }
    }

} // namespace appsplat::training
