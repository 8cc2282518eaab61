#include "torch_rasterizer.hpp"

#include <algorithm>
#include <cmath>

namespace appsplat::training {
    using torch::indexing::Slice;

    torch::Tensor quaternion_to_rotation_matrix(const torch::Tensor& quats) {
        TORCH_CHECK(quats.dim() == 2 && quats.size(1) == 4, "quaternions must be [N, 4], got ", quats.sizes());
        const auto q = torch::nn::functional::normalize(quats, torch::nn::functional::NormalizeFuncOptions().dim(-1));
        const auto w = q.index({Slice(), 0});
        const auto x = q.index({Slice(), 1});
        const auto y = q.index({Slice(), 2});
        const auto z = q.index({Slice(), 3});

        const auto r0 = torch::stack({1 - 2 * (y * y + z * z), 2 * (x * y - w * z), 2 * (x * z + w * y)}, -1);
        const auto r1 = torch::stack({2 * (x * y + w * z), 1 - 2 * (x * x + z * z), 2 * (y * z - w * x)}, -1);
        const auto r2 = torch::stack({2 * (x * z - w * y), 2 * (y * z + w * x), 1 - 2 * (x * x + y * y)}, -1);
        return torch::stack({r0, r1, r2}, 1);
    }

    TorchRasterizer::TorchRasterizer(TorchRasterizerSettings settings)
        : settings_(settings) {
    }

    /**
     * [功能描述]：EWA投影
     * @details 步骤：
     *          1. 位置变换到相机空间和NDC，NDC转像素坐标
     *          2. 由缩放和四元数构造3D协方差 Σ = (RS)(RS)^T
     *          3. 透视雅可比（视锥外的x/z、y/z截断到1.3倍半视场）得到2D协方差
     *          4. 协方差膨胀、求逆得到conic，最大特征值的3倍标准差作为半径
     *          5. 近平面、行列式和屏幕范围剔除
     */
    Projection TorchRasterizer::project(const Camera& camera,
                                        const torch::Tensor& means,
                                        const torch::Tensor& scales,
                                        const torch::Tensor& rotations,
                                        float scaling_modifier) {
        const int64_t n = means.size(0);
        TORCH_CHECK(means.dim() == 2 && means.size(1) == 3, "means must be [N, 3], got ", means.sizes());
        TORCH_CHECK(scales.dim() == 2 && scales.size(0) == n && scales.size(1) == 3,
                    "scales must be [N, 3], got ", scales.sizes());
        TORCH_CHECK(rotations.dim() == 2 && rotations.size(0) == n && rotations.size(1) == 4,
                    "rotations must be [N, 4], got ", rotations.sizes());

        const auto device = means.device();
        const auto opts = means.options();
        const float width = static_cast<float>(camera.image_width());
        const float height = static_cast<float>(camera.image_height());

        const auto w2c = camera.world_view_transform().to(device, means.scalar_type());
        const auto full = camera.full_proj_transform().to(device, means.scalar_type());

        // 步骤1：相机空间与NDC
        const auto means_h = torch::cat({means, torch::ones({n, 1}, opts)}, 1);
        const auto p_view = means_h.matmul(w2c);
        const auto p_hom = means_h.matmul(full);
        const auto p_w = 1.0f / (p_hom.index({Slice(), 3}) + 1e-7f);
        const auto ndc_x = p_hom.index({Slice(), 0}) * p_w;
        const auto ndc_y = p_hom.index({Slice(), 1}) * p_w;

        const auto depths = p_view.index({Slice(), 2});
        const auto in_front = depths > settings_.near_plane;
        const auto z = torch::where(in_front, depths, torch::ones_like(depths));
        const auto tx = p_view.index({Slice(), 0});
        const auto ty = p_view.index({Slice(), 1});

        // 步骤2：3D协方差
        const auto R = quaternion_to_rotation_matrix(rotations);
        const auto M = R * (scales * scaling_modifier).unsqueeze(1);
        const auto cov3d = M.bmm(M.transpose(1, 2));

        // 步骤3：雅可比和2D协方差
        const float tan_fovx = std::tan(camera.FoVx() * 0.5f);
        const float tan_fovy = std::tan(camera.FoVy() * 0.5f);
        const float focal_x = width / (2.0f * tan_fovx);
        const float focal_y = height / (2.0f * tan_fovy);
        const float lim_x = 1.3f * tan_fovx;
        const float lim_y = 1.3f * tan_fovy;

        const auto txz = torch::clamp(tx / z, -lim_x, lim_x) * z;
        const auto tyz = torch::clamp(ty / z, -lim_y, lim_y) * z;
        const auto zeros = torch::zeros_like(z);
        const auto J = torch::stack({torch::stack({focal_x / z, zeros, -focal_x * txz / (z * z)}, -1),
                                     torch::stack({zeros, focal_y / z, -focal_y * tyz / (z * z)}, -1)},
                                    1); // [N, 2, 3]

        // world_view_transform 以转置形式存储，左上3x3转置后是旋转R
        const auto W = w2c.index({Slice(0, 3), Slice(0, 3)}).transpose(0, 1);
        const auto T = J.matmul(W);
        const auto cov2d = T.bmm(cov3d).bmm(T.transpose(1, 2));

        // 步骤4：膨胀、conic、半径
        const float dilation = settings_.antialiased ? settings_.filter_2d_kernel_size : settings_.eps2d;
        const auto a_raw = cov2d.index({Slice(), 0, 0});
        const auto b = cov2d.index({Slice(), 0, 1});
        const auto c_raw = cov2d.index({Slice(), 1, 1});
        const auto det_raw = a_raw * c_raw - b * b;
        const auto a = a_raw + dilation;
        const auto c = c_raw + dilation;
        const auto det = a * c - b * b;
        const auto valid_det = det > 0;
        const auto det_safe = torch::where(valid_det, det, torch::ones_like(det));

        torch::Tensor compensations;
        if (settings_.antialiased) {
            compensations = torch::sqrt(torch::clamp_min(det_raw / det_safe, 1e-12f));
        } else {
            compensations = torch::ones({n}, opts);
        }

        const auto conics = torch::stack({c / det_safe, -b / det_safe, a / det_safe}, -1);

        const auto means2d = torch::stack({((ndc_x + 1.0f) * width - 1.0f) * 0.5f,
                                           ((ndc_y + 1.0f) * height - 1.0f) * 0.5f},
                                          -1);

        torch::Tensor radii;
        torch::Tensor visibility;
        {
            torch::NoGradGuard no_grad;
            const auto mid = 0.5f * (a + c);
            const auto lambda1 = mid + torch::sqrt(torch::clamp_min(mid * mid - det, 0.1f));
            const auto radius = torch::ceil(3.0f * torch::sqrt(lambda1));

            // 步骤5：剔除
            const auto mx = means2d.index({Slice(), 0});
            const auto my = means2d.index({Slice(), 1});
            const auto on_screen = (mx + radius > 0) & (mx - radius < width) &
                                   (my + radius > 0) & (my - radius < height);
            visibility = in_front & valid_det & on_screen & (radius > 0);
            radii = torch::where(visibility, radius, torch::zeros_like(radius));
        }

        if (means2d.requires_grad()) {
            means2d.retain_grad();
        }

        return Projection{means2d, depths, conics, radii, visibility, compensations};
    }

    /**
     * [功能描述]：从前到后的alpha合成
     * @details alpha = min(0.99, o·exp(power))，power > 0 或 alpha < 1/255 的贡献被丢弃；
     *          透射率为 1 − alpha 的前缀积，剩余透射率乘以背景色。
     */
    torch::Tensor TorchRasterizer::composite(const Projection& projection,
                                             const torch::Tensor& colors,
                                             const torch::Tensor& opacities,
                                             const torch::Tensor& background,
                                             int width,
                                             int height) {
        const int64_t n = projection.means2d.size(0);
        TORCH_CHECK(colors.dim() == 2 && colors.size(0) == n && colors.size(1) == 3,
                    "colors must be [", n, ", 3], got ", colors.sizes());
        TORCH_CHECK(opacities.dim() == 1 && opacities.size(0) == n,
                    "opacities must be [", n, "], got ", opacities.sizes());
        TORCH_CHECK(background.numel() == 3, "background must have 3 elements, got ", background.sizes());
        TORCH_CHECK(width > 0 && height > 0, "image size must be positive");

        const auto device = colors.device();
        const auto opts = colors.options();
        const auto bg = background.to(device, colors.scalar_type()).reshape({1, 3});

        // 可见高斯按深度排序
        const auto visible_idx = projection.visibility.nonzero().squeeze(-1);
        const auto order = std::get<1>(projection.depths.index_select(0, visible_idx).sort());
        const auto idx = visible_idx.index_select(0, order);

        const auto m2d = projection.means2d.index_select(0, idx);
        const auto con = projection.conics.index_select(0, idx);
        const auto col = colors.index_select(0, idx);
        const auto op = (opacities * projection.compensations).index_select(0, idx);
        const int64_t m = idx.size(0);

        const auto ys = torch::arange(height, opts);
        const auto xs = torch::arange(width, opts);
        const auto grid = torch::meshgrid({ys, xs}, "ij");
        const auto pixels = torch::stack({grid[1].reshape({-1}), grid[0].reshape({-1})}, -1); // [P, 2] (x, y)
        const int64_t num_pixels = pixels.size(0);

        const int64_t chunk = std::max<int64_t>(1, settings_.max_chunk_elements / std::max<int64_t>(m, 1));

        const auto con_a = con.index({Slice(), 0});
        const auto con_b = con.index({Slice(), 1});
        const auto con_c = con.index({Slice(), 2});

        std::vector<torch::Tensor> chunks;
        chunks.reserve(static_cast<size_t>((num_pixels + chunk - 1) / chunk));
        for (int64_t start = 0; start < num_pixels; start += chunk) {
            const int64_t end = std::min(num_pixels, start + chunk);
            const auto pix = pixels.index({Slice(start, end)});

            const auto d = m2d.unsqueeze(0) - pix.unsqueeze(1); // [C, M, 2]
            const auto dx = d.index({"...", 0});
            const auto dy = d.index({"...", 1});
            const auto power = -0.5f * (con_a * dx * dx + con_c * dy * dy) - con_b * dx * dy;

            auto alpha = torch::clamp_max(op * torch::exp(torch::clamp_max(power, 0.0f)), settings_.max_alpha);
            const auto keep = (power <= 0) & (alpha >= settings_.min_alpha);
            alpha = torch::where(keep, alpha, torch::zeros_like(alpha));

            const auto one_minus = 1.0f - alpha; // >= 0.01
            const auto transmittance = torch::cumprod(one_minus, 1) / one_minus;
            const auto weights = alpha * transmittance;
            const auto final_t = torch::prod(one_minus, 1, /*keepdim=*/true);

            chunks.push_back(weights.matmul(col) + final_t * bg);
        }

        return torch::cat(chunks, 0).reshape({height, width, 3}).permute({2, 0, 1}).contiguous();
    }

} // namespace appsplat::training
