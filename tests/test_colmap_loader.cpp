#include <cmath>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <string>
#include <torch/torch.h>
#include <vector>

#include "loader/colmap_loader.hpp"

namespace fs = std::filesystem;
using namespace appsplat::loader;

namespace {

    class BinaryWriter {
    public:
        explicit BinaryWriter(const fs::path& path) : _out(path, std::ios::binary) {}

        template <typename T>
        BinaryWriter& put(T value) {
            _out.write(reinterpret_cast<const char*>(&value), sizeof(T));
            return *this;
        }

        BinaryWriter& put_string(const std::string& s) {
            _out.write(s.c_str(), static_cast<std::streamsize>(s.size() + 1));
            return *this;
        }

    private:
        std::ofstream _out;
    };

    struct SyntheticImage {
        uint32_t image_id;
        double tx;
        uint32_t camera_id;
        std::string name;
    };

    /**
     * 在临时目录下生成 sparse/0 中的三个二进制文件
     */
    class ColmapLoaderTest : public ::testing::Test {
    protected:
        void SetUp() override {
            _root = fs::temp_directory_path() / "appsplat_colmap_test";
            fs::remove_all(_root);
            _sparse = _root / "sparse" / "0";
            fs::create_directories(_sparse);
        }

        void TearDown() override {
            fs::remove_all(_root);
        }

        void write_cameras(int32_t model_id, const std::vector<double>& params) {
            BinaryWriter w(_sparse / "cameras.bin");
            w.put<uint64_t>(2);
            for (uint32_t id : {1u, 3u}) {
                w.put<uint32_t>(id).put<int32_t>(model_id).put<uint64_t>(64).put<uint64_t>(48);
                for (double p : params)
                    w.put<double>(p);
            }
        }

        void write_images(const std::vector<SyntheticImage>& images) {
            BinaryWriter w(_sparse / "images.bin");
            w.put<uint64_t>(images.size());
            for (const auto& img : images) {
                w.put<uint32_t>(img.image_id);
                w.put<double>(1.0).put<double>(0.0).put<double>(0.0).put<double>(0.0);
                w.put<double>(img.tx).put<double>(0.0).put<double>(0.0);
                w.put<uint32_t>(img.camera_id);
                w.put_string(img.name);
                // 一个2D观测
                w.put<uint64_t>(1).put<double>(10.0).put<double>(12.0).put<int64_t>(-1);
            }
        }

        void write_points(uint64_t n) {
            BinaryWriter w(_sparse / "points3D.bin");
            w.put<uint64_t>(n);
            for (uint64_t i = 0; i < n; ++i) {
                w.put<uint64_t>(i + 1);
                w.put<double>(0.1 * i).put<double>(-0.2).put<double>(1.0 + i);
                w.put<uint8_t>(10).put<uint8_t>(static_cast<uint8_t>(20 + i)).put<uint8_t>(250);
                w.put<double>(0.5);
                w.put<uint64_t>(2);
                w.put<int32_t>(1).put<int32_t>(0).put<int32_t>(2).put<int32_t>(0);
            }
        }

        void write_scene(int32_t model_id = 1, std::vector<double> params = {50.0, 52.0, 32.0, 24.0}) {
            write_cameras(model_id, params);
            // 图像编号故意乱序写入
            write_images({{4, 3.0, 3, "d.png"},
                          {1, 0.0, 1, "a.png"},
                          {3, 2.0, 3, "c.png"},
                          {2, 1.0, 1, "b.png"}});
            write_points(5);
        }

        appsplat::param::DatasetConfig config(int eval_step = -1) const {
            appsplat::param::DatasetConfig cfg;
            cfg.data_path = _root;
            cfg.eval_step = eval_step;
            return cfg;
        }

        fs::path _root;
        fs::path _sparse;
    };

} // namespace

TEST(ColmapHelpersTest, SplitEveryNthImageToValidation) {
    const auto [train, val] = split_indices(10, 3);
    EXPECT_EQ(val, (std::vector<int64_t>{0, 3, 6, 9}));
    EXPECT_EQ(train, (std::vector<int64_t>{1, 2, 4, 5, 7, 8}));
}

TEST(ColmapHelpersTest, SplitDisabledKeepsAllForTraining) {
    for (int step : {-1, 0, 1}) {
        const auto [train, val] = split_indices(4, step);
        EXPECT_EQ(train.size(), 4u);
        EXPECT_EQ(val, (std::vector<int64_t>{0}));
    }
}

TEST(ColmapHelpersTest, QuaternionToRotation) {
    EXPECT_TRUE(torch::allclose(qvec2rotmat({1.0, 0.0, 0.0, 0.0}), torch::eye(3)));

    // 绕z轴90度
    const double h = std::sqrt(0.5);
    const auto R = qvec2rotmat({h, 0.0, 0.0, h});
    const auto expected = torch::tensor({{0.f, -1.f, 0.f}, {1.f, 0.f, 0.f}, {0.f, 0.f, 1.f}});
    EXPECT_TRUE(torch::allclose(R, expected, 1e-5, 1e-6));
}

TEST(ColmapHelpersTest, NerfppNormalization) {
    const auto R = torch::eye(3).expand({2, 3, 3}).contiguous();
    const auto T = torch::tensor({{1.f, 0.f, 0.f}, {-1.f, 0.f, 0.f}});
    const auto [center, extent] = compute_nerfpp_norm(R, T);
    EXPECT_TRUE(torch::allclose(center, torch::zeros({3})));
    EXPECT_NEAR(extent, 1.1f, 1e-6f);
}

TEST(ColmapHelpersTest, UnknownModelName) {
    EXPECT_EQ(camera_model_name(1), "PINHOLE");
    EXPECT_EQ(camera_model_name(42), "UNKNOWN(42)");
}

TEST_F(ColmapLoaderTest, ReadsBinaryFiles) {
    write_scene();

    const auto cams = read_cameras_binary(_sparse / "cameras.bin");
    ASSERT_EQ(cams.size(), 2u);
    EXPECT_EQ(cams.at(3).width, 64u);
    EXPECT_DOUBLE_EQ(cams.at(3).params[1], 52.0);

    const auto images = read_images_binary(_sparse / "images.bin");
    ASSERT_EQ(images.size(), 4u);
    EXPECT_EQ(images[0].name, "a.png");
    EXPECT_EQ(images[3].name, "d.png");
    EXPECT_EQ(images[2].camera_id, 3u);

    const auto points = read_points3D_binary(_sparse / "points3D.bin");
    ASSERT_EQ(points.means.size(0), 5);
    EXPECT_NEAR(points.means[4][2].item<float>(), 5.f, 1e-6f);
    EXPECT_EQ(points.colors[2][1].item<uint8_t>(), 22);
}

TEST_F(ColmapLoaderTest, TruncatedFileIsRejected) {
    {
        BinaryWriter w(_sparse / "cameras.bin");
        w.put<uint64_t>(1).put<uint32_t>(1);
    }
    EXPECT_THROW(read_cameras_binary(_sparse / "cameras.bin"), std::runtime_error);
}

TEST_F(ColmapLoaderTest, LoadsSceneAndCachesPointCloud) {
    write_scene();
    ASSERT_FALSE(fs::exists(_sparse / "points3D.ply"));

    auto result = load_colmap(config(2));
    ASSERT_TRUE(result.has_value()) << result.error();
    const auto& scene = *result;

    EXPECT_EQ(scene.train.size(), 2u);
    EXPECT_EQ(scene.validation.size(), 2u);
    EXPECT_EQ(scene.max_appearance_id, 3);
    EXPECT_EQ(scene.point_cloud.size(), 5);
    // 相机中心 x = 0, -1, -2, -3
    EXPECT_NEAR(scene.camera_extent, 1.5f * 1.1f, 1e-5f);
    EXPECT_NEAR(scene.scene_center[0].item<float>(), -1.5f, 1e-5f);

    EXPECT_TRUE(fs::exists(_sparse / "points3D.ply"));
    EXPECT_FALSE(fs::exists(_sparse / "points3D.ply.tmp"));

    // 第二次加载直接读取缓存
    fs::remove(_sparse / "points3D.bin");
    auto cached = load_colmap(config(2));
    ASSERT_TRUE(cached.has_value()) << cached.error();
    EXPECT_TRUE(torch::allclose(cached->point_cloud.means, scene.point_cloud.means));
}

TEST_F(ColmapLoaderTest, UnsupportedCameraModelIsAnError) {
    write_scene(2, {50.0, 32.0, 24.0, 0.01});

    const auto result = load_colmap(config());
    ASSERT_FALSE(result.has_value());
    EXPECT_NE(result.error().find("SIMPLE_RADIAL"), std::string::npos);
}

TEST_F(ColmapLoaderTest, MissingDataPathIsAnError) {
    auto cfg = config();
    cfg.data_path = _root / "does_not_exist";
    const auto result = load_colmap(cfg);
    ASSERT_FALSE(result.has_value());
    EXPECT_NE(result.error().find("does not exist"), std::string::npos);
}
