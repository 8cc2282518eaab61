#include <filesystem>
#include <gtest/gtest.h>
#include <torch/torch.h>

#include "test_utils.hpp"

namespace fs = std::filesystem;

namespace {

    class SplatDataTest : public ::testing::Test {
    protected:
        void SetUp() override {
            torch::manual_seed(11);
            _root = fs::temp_directory_path() / "appsplat_splat_data_test";
            fs::remove_all(_root);
        }

        void TearDown() override {
            fs::remove_all(_root);
        }

        fs::path ply_path(int iteration) const {
            return _root / "point_cloud" / std::format("iteration_{}", iteration) / "point_cloud.ply";
        }

        fs::path _root;
    };

} // namespace

TEST_F(SplatDataTest, ShAccessorsSplitDcAndRest) {
    auto splats = appsplat::test::make_splats(5, 2);
    splats.shN().normal_();

    ASSERT_EQ(splats.get_shs_dc().sizes(), (torch::IntArrayRef{5, 1, 3}));
    ASSERT_EQ(splats.get_shs_rest().sizes(), (torch::IntArrayRef{5, 8, 3}));
    EXPECT_TRUE(torch::equal(splats.get_shs(),
                             torch::cat({splats.get_shs_dc(), splats.get_shs_rest()}, 1)));
}

TEST_F(SplatDataTest, SynchronousSaveWritesAttributes) {
    auto splats = appsplat::test::make_splats(7, 1, 4);
    splats.save_ply(_root, 3, /*join_thread=*/true);

    ASSERT_TRUE(fs::exists(ply_path(3)));
    EXPECT_FALSE(fs::exists(ply_path(3).string() + ".tmp"));

    const auto xyz = appsplat::test::read_ply_properties(ply_path(3), {"x", "y", "z"});
    EXPECT_TRUE(torch::equal(xyz, splats.means().detach()));

    const auto rot = appsplat::test::read_ply_properties(ply_path(3), {"rot_0", "rot_1", "rot_2", "rot_3"});
    EXPECT_TRUE(torch::equal(rot, splats.rotation_raw().detach()));

    const auto app = appsplat::test::read_ply_properties(ply_path(3), {"f_app_0", "f_app_1", "f_app_2", "f_app_3"});
    EXPECT_TRUE(torch::equal(app, splats.appearance_features().detach()));
}

TEST_F(SplatDataTest, BackgroundSaveIgnoresLaterUpdates) {
    auto splats = appsplat::test::make_splats(32);
    const auto means_at_save = splats.means().detach().clone();
    const auto opacity_at_save = splats.opacity_raw().detach().clone();

    splats.save_ply(_root, 1, /*join_thread=*/false);
    {
        // 与优化器一样原地更新参数
        torch::NoGradGuard no_grad;
        splats.means().add_(1.f);
        splats.opacity_raw().add_(0.5f);
    }
    splats.wait_for_saves();

    const auto xyz = appsplat::test::read_ply_properties(ply_path(1), {"x", "y", "z"});
    EXPECT_TRUE(torch::equal(xyz, means_at_save));
    const auto opacity = appsplat::test::read_ply_properties(ply_path(1), {"opacity"});
    EXPECT_TRUE(torch::equal(opacity, opacity_at_save));
    EXPECT_FALSE(torch::equal(xyz, splats.means().detach()));
}
