#include <filesystem>
#include <gtest/gtest.h>
#include <numbers>
#include <torch/torch.h>

#include "test_utils.hpp"
#include "training/trainer.hpp"

namespace fs = std::filesystem;
using namespace appsplat::training;

namespace {

    constexpr int kFeatureDims = 8;

    /**
     * 四个CPU相机、随机目标图像的小场景
     */
    class TrainerTest : public ::testing::Test {
    protected:
        void SetUp() override {
            torch::manual_seed(3);
            _output = fs::temp_directory_path() / "appsplat_trainer_test";
            fs::remove_all(_output);

            auto& opt = _params.optimization;
            opt.device = "cpu";
            opt.iterations = 8;
            opt.sh_degree = 0;
            opt.sh_degree_interval = 1'000;
            opt.densify_from_iter = 4;
            opt.densify_until_iter = 6;
            opt.densification_interval = 100;
            opt.opacity_reset_interval = 1'000;
            opt.white_background = true;
            opt.save_steps = {5};
            opt.eval_steps = {};
            opt.num_workers = 0;

            _params.dataset.output_path = _output;

            auto& model = _params.appearance_model;
            model.n_gaussian_feature_dims = kFeatureDims;
            model.n_appearance_embedding_dims = 4;
            model.n_neurons = 16;
            model.n_layers = 2;

            _params.appearance_optimization.warm_up = 3;
            _params.appearance_optimization.max_steps = 100;
        }

        void TearDown() override {
            fs::remove_all(_output);
        }

        std::unique_ptr<Trainer> make_trainer(int64_t num_gaussians = 64) {
            std::vector<std::shared_ptr<appsplat::Camera>> cameras;
            std::vector<torch::Tensor> images;
            for (int i = 0; i < 4; ++i) {
                cameras.push_back(appsplat::test::make_camera(32, 24, i % 2, 3.0f, i));
                images.push_back(torch::rand({3, 24, 32}));
            }
            auto dataset = std::make_shared<CameraDataset>(std::move(cameras), std::move(images));

            auto appearance = std::make_shared<AppearanceModel>(_params.appearance_model);
            appearance->configure(AppearanceDatasetStats{.max_appearance_id = 1});
            appearance->allocate_parameters(torch::kCPU);

            auto strategy = std::make_unique<DensityControl>(
                appsplat::test::make_splats(num_gaussians, 0, kFeatureDims));
            return std::make_unique<Trainer>(dataset, nullptr, std::move(strategy), appearance, _params);
        }

        std::expected<Trainer::StepResult, std::string> run_step(Trainer& trainer, int step) {
            auto& cam = *trainer_cameras_[step % trainer_cameras_.size()];
            return trainer.train_step(step, &cam, torch::rand({3, 24, 32}));
        }

        appsplat::param::TrainingParameters _params;
        fs::path _output;
        std::vector<std::shared_ptr<appsplat::Camera>> trainer_cameras_ = {
            appsplat::test::make_camera(32, 24, 0, 3.0f, 0),
            appsplat::test::make_camera(32, 24, 1, 3.0f, 1)};
    };

} // namespace

TEST(TrainingPhaseTest, PhaseDependsOnlyOnStep) {
    appsplat::param::TrainingParameters params;
    params.optimization.iterations = 100;
    params.optimization.densify_until_iter = 50;
    params.appearance_optimization.warm_up = 10;

    EXPECT_EQ(phase_for_step(1, params), TrainingPhase::WarmUp);
    EXPECT_EQ(phase_for_step(9, params), TrainingPhase::WarmUp);
    EXPECT_EQ(phase_for_step(10, params), TrainingPhase::ActiveTraining);
    EXPECT_EQ(phase_for_step(50, params), TrainingPhase::DensificationEnded);
    EXPECT_EQ(phase_for_step(100, params), TrainingPhase::Converged);
    EXPECT_EQ(to_string(TrainingPhase::ActiveTraining), "active training");
}

TEST(LearningRateLoggerHookTest, LogsEveryGroupOnSchedule) {
    std::vector<torch::optim::OptimizerParamGroup> groups;
    groups.emplace_back(std::vector<torch::Tensor>{torch::zeros({2}, torch::requires_grad())},
                        std::make_unique<torch::optim::AdamOptions>(0.5));
    groups.emplace_back(std::vector<torch::Tensor>{torch::zeros({2}, torch::requires_grad())},
                        std::make_unique<torch::optim::AdamOptions>(0.25));
    torch::optim::Adam adam(groups, torch::optim::AdamOptions(1.0));

    LearningRateLoggerHook hook({{"appearance", &adam, {"embedding", "embedding_network"}}}, 10);
    hook.before_step(2);
    EXPECT_TRUE(hook.last_logged().empty());

    hook.before_step(11);
    ASSERT_EQ(hook.last_logged().size(), 2u);
    EXPECT_EQ(hook.last_logged()[0].first, "appearance/embedding");
    EXPECT_DOUBLE_EQ(hook.last_logged()[0].second, 0.5);
    EXPECT_EQ(hook.last_logged()[1].first, "appearance/embedding_network");
    EXPECT_DOUBLE_EQ(hook.last_logged()[1].second, 0.25);
}

TEST_F(TrainerTest, RejectsEmptyDatasetAndUnallocatedModel) {
    auto empty = std::make_shared<CameraDataset>(std::vector<std::shared_ptr<appsplat::Camera>>{},
                                                 std::vector<torch::Tensor>{});
    auto appearance = std::make_shared<AppearanceModel>(_params.appearance_model);
    appearance->configure(AppearanceDatasetStats{.max_appearance_id = 0});
    appearance->allocate_parameters(torch::kCPU);
    EXPECT_THROW(Trainer(empty, nullptr,
                         std::make_unique<DensityControl>(appsplat::test::make_splats(4, 0, kFeatureDims)),
                         appearance, _params),
                 std::invalid_argument);

    auto cameras = std::vector<std::shared_ptr<appsplat::Camera>>{appsplat::test::make_camera()};
    auto dataset = std::make_shared<CameraDataset>(cameras, std::vector<torch::Tensor>{torch::rand({3, 24, 32})});
    auto unallocated = std::make_shared<AppearanceModel>(_params.appearance_model);
    EXPECT_THROW(Trainer(dataset, nullptr,
                         std::make_unique<DensityControl>(appsplat::test::make_splats(4, 0, kFeatureDims)),
                         unallocated, _params),
                 std::invalid_argument);
}

TEST_F(TrainerTest, WhiteBackgroundAndAppearanceOptimizer) {
    auto trainer = make_trainer();
    EXPECT_TRUE(torch::equal(trainer->background(), torch::ones({3})));

    auto& groups = trainer->appearance_optimizer().param_groups();
    ASSERT_EQ(groups.size(), 2u);
    EXPECT_EQ(groups[0].params().size(), 1u);
    EXPECT_GT(groups[1].params().size(), 1u);
    EXPECT_EQ(trainer->embedding_scheduler().param_group_index(), 0);
    EXPECT_EQ(trainer->network_scheduler().param_group_index(), 1);
}

TEST_F(TrainerTest, AppearanceModelIsFrozenDuringWarmUp) {
    auto trainer = make_trainer();
    const auto embedding_before = trainer->appearance_model().embedding_parameters()[0].detach().clone();

    for (int step = 1; step < 3; ++step) {
        ASSERT_TRUE(run_step(*trainer, step).has_value());
        EXPECT_EQ(trainer->phase(), TrainingPhase::WarmUp);
        EXPECT_FALSE(trainer->appearance_model().embedding_parameters()[0].grad().defined());
    }
    EXPECT_TRUE(torch::equal(trainer->appearance_model().embedding_parameters()[0], embedding_before));

    // 第3步起使用外观残差
    ASSERT_TRUE(run_step(*trainer, 3).has_value());
    EXPECT_EQ(trainer->phase(), TrainingPhase::ActiveTraining);
    EXPECT_TRUE(trainer->appearance_model().embedding_parameters()[0].grad().defined());
    EXPECT_FALSE(torch::equal(trainer->appearance_model().embedding_parameters()[0], embedding_before));
}

TEST_F(TrainerTest, WhiteBackgroundResetsOpacityAtDensifyStart) {
    auto trainer = make_trainer();
    for (int step = 1; step <= 3; ++step) {
        ASSERT_TRUE(run_step(*trainer, step).has_value());
    }
    const auto before = trainer->strategy().get_model().get_opacity();
    EXPECT_FALSE(torch::allclose(before, torch::full_like(before, 0.01f)));

    ASSERT_TRUE(run_step(*trainer, 4).has_value());
    const auto after = trainer->strategy().get_model().get_opacity();
    EXPECT_TRUE(torch::allclose(after, torch::full_like(after, 0.01f), 1e-5, 1e-6));
    EXPECT_NO_THROW(trainer->strategy().check_statistics_invariant());
}

TEST_F(TrainerTest, StatisticsTrackVisibleGaussians) {
    auto trainer = make_trainer();
    ASSERT_TRUE(run_step(*trainer, 1).has_value());

    const auto& control = trainer->strategy();
    EXPECT_GT(control.denom().sum().item<float>(), 0.f);
    EXPECT_GT(control.max_radii2D().max().item<float>(), 0.f);
    EXPECT_EQ(trainer->last_step_stats().num_gaussians, 64);
    EXPECT_GT(trainer->last_step_stats().loss, 0.f);
}

TEST_F(TrainerTest, FullRunWritesCheckpoints) {
    auto trainer = make_trainer();
    const auto result = trainer->train();
    ASSERT_TRUE(result.has_value()) << result.error();

    EXPECT_EQ(trainer->current_iteration(), 8);
    EXPECT_EQ(trainer->phase(), TrainingPhase::Converged);
    for (int step : {5, 8}) {
        const auto dir = _output / "point_cloud" / std::format("iteration_{}", step);
        EXPECT_TRUE(fs::exists(dir / "point_cloud.ply")) << dir;
        EXPECT_TRUE(fs::exists(dir / "appearance_embedding.pt")) << dir;
    }
}

TEST_F(TrainerTest, CheckpointHoldsParametersBeforeOptimizerStep) {
    auto trainer = make_trainer();
    for (int step = 1; step <= 4; ++step) {
        ASSERT_TRUE(run_step(*trainer, step).has_value());
    }
    const auto means_before = trainer->strategy().get_model().means().detach().clone();

    // 第5步在优化器更新之前保存
    ASSERT_TRUE(run_step(*trainer, 5).has_value());
    trainer->strategy().get_model().wait_for_saves();

    const auto ply = _output / "point_cloud" / "iteration_5" / "point_cloud.ply";
    ASSERT_TRUE(fs::exists(ply));
    const auto saved = appsplat::test::read_ply_properties(ply, {"x", "y", "z"});
    EXPECT_TRUE(torch::equal(saved, means_before));
    EXPECT_FALSE(torch::equal(saved, trainer->strategy().get_model().means().detach()));
}

TEST_F(TrainerTest, TransparentGaussianSeenFromFourSidesGetsOpacityFloor) {
    std::vector<std::shared_ptr<appsplat::Camera>> cameras;
    std::vector<torch::Tensor> images;
    for (int i = 0; i < 4; ++i) {
        cameras.push_back(appsplat::test::make_orbit_camera(static_cast<float>(i) * 0.5f * std::numbers::pi_v<float>,
                                                            3.0f, 32, 24, 0, i));
        images.push_back(torch::ones({3, 24, 32}));
    }
    // 四个相机等距环绕原点
    for (int i = 0; i < 4; ++i) {
        EXPECT_NEAR(cameras[i]->camera_center().norm().item<float>(), 3.f, 1e-5f);
    }
    EXPECT_TRUE(torch::allclose(cameras[0]->camera_center(), torch::tensor({0.f, 0.f, -3.f}), 1e-5, 1e-6));
    EXPECT_TRUE(torch::allclose(cameras[2]->camera_center(), torch::tensor({0.f, 0.f, 3.f}), 1e-5, 1e-5));
    auto dataset = std::make_shared<CameraDataset>(cameras, images);

    auto appearance = std::make_shared<AppearanceModel>(_params.appearance_model);
    appearance->configure(AppearanceDatasetStats{.max_appearance_id = 0});
    appearance->allocate_parameters(torch::kCPU);

    auto splats = appsplat::test::make_splats(1, 0, kFeatureDims, 0.5f, 1.0f, /*opacity=*/0.f);
    splats.means().zero_();
    Trainer trainer(dataset, nullptr, std::make_unique<DensityControl>(std::move(splats)), appearance, _params);
    ASSERT_TRUE(torch::equal(trainer.background(), torch::ones({3})));
    EXPECT_EQ(trainer.strategy().get_model().get_opacity().item<float>(), 0.f);

    for (int step = 1; step <= 4; ++step) {
        auto& cam = *cameras[step % 4];
        const auto result = trainer.train_step(step, &cam, images[step % 4]);
        ASSERT_TRUE(result.has_value()) << result.error();
    }

    const auto& model = trainer.strategy().get_model();
    ASSERT_EQ(model.size(), 1);
    EXPECT_NEAR(model.get_opacity().item<float>(), 0.01f, 1e-6f);
    EXPECT_TRUE(torch::equal(model.means().detach(), torch::zeros({1, 3})));
}

TEST_F(TrainerTest, PruningEverythingFailsTheStep) {
    _params.optimization.white_background = false;
    _params.optimization.densify_from_iter = 1;
    _params.optimization.densification_interval = 2;
    _params.optimization.min_opacity = 0.99f;
    auto trainer = make_trainer();

    ASSERT_TRUE(run_step(*trainer, 1).has_value());
    const auto result = run_step(*trainer, 2);
    ASSERT_FALSE(result.has_value());
    EXPECT_NE(result.error().find("Training step 2 failed"), std::string::npos);
}

TEST_F(TrainerTest, StopRequestEndsStep) {
    auto trainer = make_trainer();
    std::stop_source source;
    source.request_stop();
    auto& cam = *trainer_cameras_[0];
    const auto result = trainer->train_step(1, &cam, torch::rand({3, 24, 32}), {}, source.get_token());
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, Trainer::StepResult::Stop);
}
