#pragma once

#include "appsplat/camera.hpp"
#include "appsplat/splat_data.hpp"
#include <cmath>
#include <filesystem>
#include <format>
#include <fstream>
#include <memory>
#include <stdexcept>
#include <string>
#include <torch/torch.h>
#include <tinyply.h>
#include <vector>

namespace appsplat::test {

    /**
     * 在原点附近 [-extent, extent]^3 随机生成高斯，球谐按给定度数分配，外观特征为零
     */
    inline SplatData make_splats(int64_t n,
                                 int sh_degree = 0,
                                 int feature_dims = 8,
                                 float extent = 0.5f,
                                 float scene_scale = 1.0f,
                                 float opacity = 0.5f) {
        const int64_t k = (sh_degree + 1) * (sh_degree + 1) - 1;
        auto means = (torch::rand({n, 3}) * 2.f - 1.f) * extent;
        auto sh0 = torch::rand({n, 1, 3}) * 0.5f;
        auto shN = torch::zeros({n, k, 3});
        auto scaling = torch::full({n, 3}, std::log(0.05f));
        auto rotation = torch::zeros({n, 4});
        rotation.index_put_({torch::indexing::Slice(), 0}, 1.f);
        auto opacity_logit = torch::full({n, 1}, std::log(opacity / (1.f - opacity)));
        auto features = torch::zeros({n, feature_dims});
        return SplatData(sh_degree, means, sh0, shN, scaling, rotation, opacity_logit, features, scene_scale);
    }

    /**
     * 位于 (0, 0, -distance)、朝向 +z 的针孔相机
     */
    inline std::shared_ptr<Camera> make_camera(int width = 32,
                                               int height = 24,
                                               int appearance_id = 0,
                                               float distance = 3.0f,
                                               int uid = 0) {
        const float focal = static_cast<float>(width);
        return std::make_shared<Camera>(torch::eye(3),
                                        torch::tensor({0.f, 0.f, distance}),
                                        focal, focal,
                                        width / 2.f, height / 2.f,
                                        width, height,
                                        appearance_id,
                                        torch::Tensor(),
                                        0,
                                        std::format("view_{}", uid),
                                        "",
                                        "",
                                        uid);
    }

    /**
     * 绕原点的环绕相机：在xz平面内与+z方向夹角为 angle_rad，距离原点 distance，光轴指向原点
     * @details 相机到世界旋转为 R_y(angle)，因此 R = R_y(angle)ᵀ，T = (0, 0, distance)
     */
    inline std::shared_ptr<Camera> make_orbit_camera(float angle_rad,
                                                     float distance = 3.0f,
                                                     int width = 32,
                                                     int height = 24,
                                                     int appearance_id = 0,
                                                     int uid = 0) {
        const float c = std::cos(angle_rad);
        const float s = std::sin(angle_rad);
        const auto R = torch::tensor({{c, 0.f, -s},
                                      {0.f, 1.f, 0.f},
                                      {s, 0.f, c}});
        const float focal = static_cast<float>(width);
        return std::make_shared<Camera>(R,
                                        torch::tensor({0.f, 0.f, distance}),
                                        focal, focal,
                                        width / 2.f, height / 2.f,
                                        width, height,
                                        appearance_id,
                                        torch::Tensor(),
                                        0,
                                        std::format("orbit_{}", uid),
                                        "",
                                        "",
                                        uid);
    }

    /**
     * 读取PLY中vertex元素的若干float属性，返回 [N, names.size()]
     */
    inline torch::Tensor read_ply_properties(const std::filesystem::path& path,
                                             const std::vector<std::string>& names) {
        std::ifstream file(path, std::ios::binary);
        if (!file) {
            throw std::runtime_error(std::format("Failed to open {}", path.string()));
        }
        tinyply::PlyFile ply;
        ply.parse_header(file);
        auto data = ply.request_properties_from_element("vertex", names);
        ply.read(file);
        if (data->t != tinyply::Type::FLOAT32) {
            throw std::runtime_error(std::format("{}: expected float properties", path.string()));
        }
        const auto n = static_cast<int64_t>(data->count);
        return torch::from_blob(data->buffer.get(), {n, static_cast<int64_t>(names.size())}, torch::kFloat32).clone();
    }

} // namespace appsplat::test
