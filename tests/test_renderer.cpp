#include <gtest/gtest.h>
#include <torch/torch.h>

#include "test_utils.hpp"
#include "training/components/appearance_model.hpp"
#include "training/rasterization/color_stage.hpp"
#include "training/rasterization/renderer.hpp"
#include "training/rasterization/spherical_harmonics.hpp"
#include "training/rasterization/torch_rasterizer.hpp"

using namespace appsplat::training;

namespace {

    constexpr float SH_C0 = 0.28209479177387814f;

    std::shared_ptr<AppearanceModel> make_appearance_model(int feature_dims, int max_id) {
        appsplat::param::AppearanceModelParameters config;
        config.n_gaussian_feature_dims = feature_dims;
        config.n_appearance_embedding_dims = 4;
        config.n_neurons = 8;
        config.n_layers = 2;
        auto model = std::make_shared<AppearanceModel>(config);
        model->configure(AppearanceDatasetStats{.max_appearance_id = max_id});
        model->allocate_parameters(torch::kCPU);
        return model;
    }

    class RendererTest : public ::testing::Test {
    protected:
        void SetUp() override {
            torch::manual_seed(7);
            splats_ = std::make_unique<appsplat::SplatData>(appsplat::test::make_splats(32));
            camera_ = appsplat::test::make_camera(32, 24, 1);
            model_ = make_appearance_model(8, 2);
            color_stage_ = std::make_shared<AppearanceColorStage>(std::make_shared<SHColorStage>(), model_);
            renderer_ = std::make_unique<Renderer>(std::make_shared<TorchRasterizer>(), color_stage_);
        }

        std::unique_ptr<appsplat::SplatData> splats_;
        std::shared_ptr<appsplat::Camera> camera_;
        std::shared_ptr<AppearanceModel> model_;
        std::shared_ptr<AppearanceColorStage> color_stage_;
        std::unique_ptr<Renderer> renderer_;
    };

} // namespace

TEST(SphericalHarmonicsTest, DegreeZeroIsConstant) {
    const auto coeffs = torch::rand({6, 4, 3});
    const auto dirs = torch::nn::functional::normalize(torch::randn({6, 3}),
                                                       torch::nn::functional::NormalizeFuncOptions().dim(-1));
    const auto rgb = spherical_harmonics(0, dirs, coeffs);
    using torch::indexing::Slice;
    EXPECT_TRUE(torch::allclose(rgb, SH_C0 * coeffs.index({Slice(), 0})));
}

TEST(SphericalHarmonicsTest, RejectsTooFewCoefficients) {
    EXPECT_THROW(spherical_harmonics(1, torch::randn({2, 3}), torch::rand({2, 1, 3})), c10::Error);
}

TEST_F(RendererTest, OutputShapes) {
    const auto background = torch::zeros({3});
    const auto out = renderer_->render(*camera_, *splats_, background, 1.0f, /*warm_up=*/true);

    EXPECT_EQ(out.image.sizes(), (std::vector<int64_t>{3, 24, 32}));
    EXPECT_EQ(out.means2d.sizes(), (std::vector<int64_t>{32, 2}));
    EXPECT_EQ(out.radii.size(0), 32);
    EXPECT_EQ(out.visibility.scalar_type(), torch::kBool);
    EXPECT_GT(out.visibility.sum().item<int64_t>(), 0);
    EXPECT_EQ(out.width, 32);
    EXPECT_EQ(out.height, 24);
}

TEST_F(RendererTest, EmptyGaussiansShowBackground) {
    // 不透明度极低时图像等于背景
    auto transparent = appsplat::test::make_splats(8, 0, 8, 0.5f, 1.0f, 1e-4f);
    const auto background = torch::tensor({0.2f, 0.4f, 0.6f});
    const auto out = renderer_->render(*camera_, transparent, background, 1.0f, true);
    EXPECT_TRUE(torch::allclose(out.image, background.view({3, 1, 1}).expand_as(out.image), 1e-4, 1e-4));
}

TEST_F(RendererTest, WarmUpSkipsAppearanceModel) {
    const auto background = torch::zeros({3});
    renderer_->render(*camera_, *splats_, background, 1.0f, /*warm_up=*/true);
    EXPECT_EQ(color_stage_->residual_calls(), 0);

    renderer_->render(*camera_, *splats_, background, 1.0f, /*warm_up=*/false);
    EXPECT_EQ(color_stage_->residual_calls(), 1);
}

TEST_F(RendererTest, WarmUpColorsEqualShBase) {
    const auto visibility = torch::ones({splats_->size()}, torch::kBool);
    SHColorStage sh_stage;
    const auto base = sh_stage.compute_colors(*camera_, *splats_, visibility, false);
    const auto warm = color_stage_->compute_colors(*camera_, *splats_, visibility, true);
    EXPECT_TRUE(torch::allclose(base, warm));

    // 0阶：颜色 = C0·sh0 + 0.5
    const auto expected = torch::clamp_min(SH_C0 * splats_->sh0().squeeze(1) + 0.5f, 0.f);
    EXPECT_TRUE(torch::allclose(base, expected, 1e-5, 1e-6));
}

TEST_F(RendererTest, InvisibleRowsAreZero) {
    auto visibility = torch::ones({splats_->size()}, torch::kBool);
    visibility.index_put_({torch::indexing::Slice(0, 4)}, false);

    const auto colors = color_stage_->compute_colors(*camera_, *splats_, visibility, false);
    using torch::indexing::Slice;
    EXPECT_EQ(colors.index({Slice(0, 4)}).abs().sum().item<float>(), 0.f);
    EXPECT_GE(colors.min().item<float>(), 0.f);
    EXPECT_LE(colors.max().item<float>(), 1.f);
}

TEST_F(RendererTest, GradientsReachMeans2dAndAppearance) {
    splats_->means().set_requires_grad(true);
    splats_->sh0().set_requires_grad(true);
    splats_->appearance_features().set_requires_grad(true);

    const auto background = torch::zeros({3});
    auto out = renderer_->render(*camera_, *splats_, background, 1.0f, false);
    out.image.mean().backward();

    ASSERT_TRUE(out.means2d.grad().defined());
    EXPECT_EQ(out.means2d.grad().sizes(), out.means2d.sizes());
    EXPECT_TRUE(splats_->sh0().grad().defined());
    EXPECT_TRUE(splats_->appearance_features().grad().defined());
    EXPECT_TRUE(model_->embedding_parameters()[0].grad().defined());
}

TEST_F(RendererTest, WarmUpLeavesAppearanceWithoutGradient) {
    splats_->appearance_features().set_requires_grad(true);
    splats_->sh0().set_requires_grad(true);

    auto out = renderer_->render(*camera_, *splats_, torch::zeros({3}), 1.0f, true);
    out.image.mean().backward();

    EXPECT_TRUE(splats_->sh0().grad().defined());
    EXPECT_FALSE(splats_->appearance_features().grad().defined());
    EXPECT_FALSE(model_->embedding_parameters()[0].grad().defined());
}

TEST(TorchRasterizerTest, PointsBehindCameraAreCulled) {
    auto splats = appsplat::test::make_splats(4);
    {
        torch::NoGradGuard no_grad;
        splats.means().index_put_({0, 2}, -10.f);
    }
    const auto camera = appsplat::test::make_camera();
    TorchRasterizer rasterizer;
    const auto proj = rasterizer.project(*camera, splats.get_means(), splats.get_scaling(), splats.get_rotation(), 1.0f);
    EXPECT_FALSE(proj.visibility[0].item<bool>());
    EXPECT_EQ(proj.radii[0].item<float>(), 0.f);
}

TEST(TorchRasterizerTest, IdentityQuaternionGivesIdentityMatrix) {
    const auto q = torch::tensor({{1.f, 0.f, 0.f, 0.f}});
    EXPECT_TRUE(torch::allclose(quaternion_to_rotation_matrix(q)[0], torch::eye(3)));
}
