#include "color_stage.hpp"
#include "spherical_harmonics.hpp"
#include "training/components/appearance_model.hpp"

namespace appsplat::training {
    namespace F = torch::nn::functional;

    torch::Tensor SHColorStage::base_colors(const Camera& camera,
                                            const SplatData& splats,
                                            const torch::Tensor& indices,
                                            torch::Tensor& view_dirs) const {
        const auto means = splats.get_means();
        const auto center = camera.camera_center().to(means.device(), means.scalar_type());

        // 位置不通过视线方向接收梯度
        const auto dirs = means.detach().index_select(0, indices) - center.unsqueeze(0);
        view_dirs = F::normalize(dirs, F::NormalizeFuncOptions().dim(-1));

        const auto coeffs = splats.get_shs().index_select(0, indices);
        return spherical_harmonics(splats.get_active_sh_degree(), view_dirs, coeffs) + 0.5f;
    }

    torch::Tensor SHColorStage::compute_colors(const Camera& camera,
                                               const SplatData& splats,
                                               const torch::Tensor& visibility,
                                               [[maybe_unused]] bool warm_up) {
        const auto n = splats.size();
        TORCH_CHECK(visibility.dim() == 1 && visibility.size(0) == n,
                    "visibility must be [", n, "], got ", visibility.sizes());

        const auto visible_idx = visibility.nonzero().squeeze(-1);
        torch::Tensor view_dirs;
        const auto rgb = torch::clamp_min(base_colors(camera, splats, visible_idx, view_dirs), 0.0f);

        auto colors = torch::zeros({n, 3}, splats.get_means().options());
        colors.index_put_({visible_idx}, rgb);
        return colors;
    }

    AppearanceColorStage::AppearanceColorStage(std::shared_ptr<SHColorStage> base,
                                               std::shared_ptr<AppearanceModel> model)
        : base_(std::move(base)),
          model_(std::move(model)) {
        TORCH_CHECK(base_ != nullptr, "AppearanceColorStage requires a base color stage");
        TORCH_CHECK(model_ != nullptr, "AppearanceColorStage requires an appearance model");
    }

    torch::Tensor AppearanceColorStage::compute_colors(const Camera& camera,
                                                       const SplatData& splats,
                                                       const torch::Tensor& visibility,
                                                       bool warm_up) {
        if (warm_up) {
            return base_->compute_colors(camera, splats, visibility, warm_up);
        }

        const auto n = splats.size();
        TORCH_CHECK(visibility.dim() == 1 && visibility.size(0) == n,
                    "visibility must be [", n, "], got ", visibility.sizes());

        const auto visible_idx = visibility.nonzero().squeeze(-1);
        torch::Tensor view_dirs;
        const auto base_rgb = base_->base_colors(camera, splats, visible_idx, view_dirs);

        const auto features = splats.get_appearance_features().index_select(0, visible_idx);
        const auto rgb_offsets = model_->forward(features, camera.appearance_id(), view_dirs) * 2.0f - 1.0f;
        ++residual_calls_;

        const auto rgb = torch::clamp(base_rgb + rgb_offsets, 0.0f, 1.0f);
        auto colors = torch::zeros({n, 3}, splats.get_means().options());
        colors.index_put_({visible_idx}, rgb);
        return colors;
    }

} // namespace appsplat::training
