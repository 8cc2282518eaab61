#include "renderer.hpp"

namespace appsplat::training {

    Renderer::Renderer(std::shared_ptr<IRasterizer> rasterizer,
                       std::shared_ptr<IColorStage> color_stage)
        : rasterizer_(std::move(rasterizer)),
          color_stage_(std::move(color_stage)) {
        TORCH_CHECK(rasterizer_ != nullptr, "Renderer requires a rasterizer");
        TORCH_CHECK(color_stage_ != nullptr, "Renderer requires a color stage");
    }

    RenderOutput Renderer::render(const Camera& camera,
                                  const SplatData& splats,
                                  const torch::Tensor& background,
                                  float scaling_modifier,
                                  bool warm_up) {
        TORCH_CHECK(splats.size() > 0, "Cannot render an empty Gaussian set");

        const int width = camera.image_width();
        const int height = camera.image_height();

        auto projection = rasterizer_->project(camera,
                                               splats.get_means(),
                                               splats.get_scaling(),
                                               splats.get_rotation(),
                                               scaling_modifier);

        const auto colors = color_stage_->compute_colors(camera, splats, projection.visibility, warm_up);
        auto image = rasterizer_->composite(projection,
                                            colors,
                                            splats.get_opacity(),
                                            background,
                                            width,
                                            height);

        return RenderOutput{
            .image = image,
            .means2d = projection.means2d,
            .radii = projection.radii,
            .visibility = projection.visibility,
            .width = width,
            .height = height};
    }

} // namespace appsplat::training
