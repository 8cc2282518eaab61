#include <cmath>
#include <gtest/gtest.h>
#include <numbers>
#include <torch/torch.h>

#include "appsplat/camera.hpp"

namespace {

    constexpr float FLOAT_TOLERANCE = 1e-4f;

    torch::Tensor rotation_about_y(float angle) {
        const float c = std::cos(angle);
        const float s = std::sin(angle);
        return torch::tensor({{c, 0.f, s}, {0.f, 1.f, 0.f}, {-s, 0.f, c}});
    }

    appsplat::Camera make_camera(const torch::Tensor& R, const torch::Tensor& T) {
        return appsplat::Camera(R, T, 100.f, 120.f, 32.f, 24.f, 64, 48, 3);
    }

} // namespace

TEST(CameraTest, FullProjectionIsWorldToCameraTimesProjection) {
    const auto cam = make_camera(rotation_about_y(0.3f), torch::tensor({0.5f, -0.2f, 2.0f}));

    const auto expected = cam.world_view_transform().matmul(cam.projection_matrix());
    EXPECT_TRUE(torch::allclose(cam.full_proj_transform(), expected, 1e-5, 1e-6));
}

TEST(CameraTest, CameraCenterIsTranslationRowOfInverse) {
    const auto R = rotation_about_y(0.7f);
    const auto T = torch::tensor({1.0f, 2.0f, -3.0f});
    const auto cam = make_camera(R, T);

    const auto inv = torch::inverse(cam.world_view_transform());
    EXPECT_TRUE(torch::allclose(cam.camera_center(), inv.index({3, torch::indexing::Slice(0, 3)}), 1e-5, 1e-5));

    // 对正交旋转，相机中心为 -Rᵀ·T
    const auto analytic = -R.t().matmul(T);
    EXPECT_TRUE(torch::allclose(cam.camera_center(), analytic, 1e-4, 1e-4));
}

TEST(CameraTest, WorldToCameraIsTransposedRt) {
    const auto R = rotation_about_y(0.2f);
    const auto T = torch::tensor({0.1f, 0.2f, 0.3f});
    const auto cam = make_camera(R, T);

    const auto w2c = cam.world_view_transform().t();
    using torch::indexing::Slice;
    EXPECT_TRUE(torch::allclose(w2c.index({Slice(0, 3), Slice(0, 3)}), R));
    EXPECT_TRUE(torch::allclose(w2c.index({Slice(0, 3), 3}), T));
    EXPECT_FLOAT_EQ(w2c[3][3].item<float>(), 1.f);
}

TEST(CameraTest, ProjectionMatrixEntries) {
    const auto cam = make_camera(torch::eye(3), torch::zeros({3}));
    const auto P = cam.projection_matrix().t();

    const float znear = 0.01f;
    const float zfar = 100.f;
    const float tan_x = std::tan(cam.FoVx() / 2.f);
    const float tan_y = std::tan(cam.FoVy() / 2.f);

    EXPECT_NEAR(P[0][0].item<float>(), 1.f / tan_x, 1e-3f);
    EXPECT_NEAR(P[1][1].item<float>(), 1.f / tan_y, 1e-3f);
    EXPECT_NEAR(P[0][2].item<float>(), 0.f, FLOAT_TOLERANCE);
    EXPECT_NEAR(P[3][2].item<float>(), 1.f, FLOAT_TOLERANCE);
    EXPECT_NEAR(P[2][2].item<float>(), zfar / (zfar - znear), FLOAT_TOLERANCE);
    EXPECT_NEAR(P[2][3].item<float>(), -(zfar * znear) / (zfar - znear), FLOAT_TOLERANCE);
}

TEST(CameraTest, FovFocalRoundTrip) {
    for (const float focal : {50.f, 300.f, 1234.5f}) {
        for (const int pixels : {64, 800, 1920}) {
            const float fov = appsplat::focal2fov(focal, pixels);
            EXPECT_NEAR(appsplat::fov2focal(fov, pixels), focal, focal * 1e-5f);
        }
    }
    EXPECT_NEAR(appsplat::focal2fov(50.f, 100), std::numbers::pi_v<float> / 2.f, 1e-5f);
}

TEST(CameraTest, SettersRecomputeDerivedMatrices) {
    auto cam = make_camera(torch::eye(3), torch::zeros({3}));
    const auto before = cam.full_proj_transform().clone();

    cam.set_pose(rotation_about_y(0.5f), torch::tensor({0.f, 0.f, 1.f}));
    EXPECT_FALSE(torch::allclose(before, cam.full_proj_transform()));
    EXPECT_TRUE(torch::allclose(cam.full_proj_transform(),
                                cam.world_view_transform().matmul(cam.projection_matrix()), 1e-5, 1e-6));

    const float fov_before = cam.FoVx();
    cam.set_intrinsics(200.f, 120.f, 32.f, 24.f);
    EXPECT_LT(cam.FoVx(), fov_before);
}

TEST(CameraTest, DistortionDefaultsToZeros) {
    const auto cam = make_camera(torch::eye(3), torch::zeros({3}));
    ASSERT_EQ(cam.distortion().numel(), 6);
    EXPECT_EQ(cam.distortion().abs().sum().item<float>(), 0.f);
    EXPECT_EQ(cam.appearance_id(), 3);
}

TEST(CameraTest, RejectsMalformedInputs) {
    EXPECT_THROW(appsplat::Camera(torch::eye(2), torch::zeros({3}), 10.f, 10.f, 5.f, 5.f, 10, 10),
                 std::invalid_argument);
    EXPECT_THROW(appsplat::Camera(torch::eye(3), torch::zeros({4}), 10.f, 10.f, 5.f, 5.f, 10, 10),
                 std::invalid_argument);
    EXPECT_THROW(appsplat::Camera(torch::eye(3), torch::zeros({3}), 10.f, 10.f, 5.f, 5.f, 10, 10, 0, torch::zeros({5})),
                 std::invalid_argument);
    EXPECT_THROW(appsplat::Camera(torch::eye(3), torch::zeros({3}), 0.f, 10.f, 5.f, 5.f, 10, 10),
                 std::invalid_argument);
}

TEST(CameraBatchTest, DimensionMismatchThrows) {
    const auto R = torch::eye(3).expand({3, 3, 3}).clone();
    const auto T = torch::zeros({3, 3});
    const auto ones = torch::ones({3});
    EXPECT_THROW(appsplat::CameraBatch(R, torch::zeros({2, 3}), ones, ones, ones, ones,
                                       ones * 8, ones * 8, torch::zeros({3})),
                 std::invalid_argument);
    EXPECT_THROW(appsplat::CameraBatch(R, T, torch::ones({2}), ones, ones, ones,
                                       ones * 8, ones * 8, torch::zeros({3})),
                 std::invalid_argument);
}

TEST(CameraBatchTest, BatchMatchesSingleCameras) {
    const int64_t n = 4;
    auto R = torch::stack({rotation_about_y(0.f), rotation_about_y(0.2f),
                           rotation_about_y(0.4f), rotation_about_y(0.6f)});
    auto T = torch::randn({n, 3});
    const auto fx = torch::full({n}, 100.f);
    const auto cxy = torch::full({n}, 16.f);
    const auto size = torch::full({n}, 32);
    const auto ids = torch::tensor({0, 1, 2, 4});

    appsplat::CameraBatch batch(R, T, fx, fx, cxy, cxy, size, size, ids);
    ASSERT_EQ(batch.size(), 4u);
    EXPECT_EQ(batch.max_appearance_id(), 4);

    for (size_t i = 0; i < batch.size(); ++i) {
        const auto cam = batch[i];
        EXPECT_TRUE(torch::allclose(cam.full_proj_transform(),
                                    batch.transforms().full_projection[static_cast<int64_t>(i)], 1e-5, 1e-6));
        EXPECT_TRUE(torch::allclose(cam.camera_center(),
                                    batch.transforms().camera_center[static_cast<int64_t>(i)], 1e-4, 1e-4));
    }
    EXPECT_NEAR(batch[3].normalized_appearance(), 1.f, FLOAT_TOLERANCE);
    EXPECT_NEAR(batch[1].normalized_appearance(), 0.25f, FLOAT_TOLERANCE);

    const auto sub = batch.select({1, 3});
    ASSERT_EQ(sub.size(), 2u);
    EXPECT_EQ(sub[1].appearance_id(), 4);
    EXPECT_NEAR(sub[0].normalized_appearance(), 0.25f, FLOAT_TOLERANCE);

    EXPECT_THROW(batch.at(4), std::out_of_range);
}
