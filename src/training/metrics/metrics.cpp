#include "metrics.hpp"
#include "appsplat/logger.hpp"
#include "training/rasterization/renderer.hpp"
#include <algorithm>
#include <chrono>
#include <cmath>
#include <fstream>
#include <numeric>
#include <print>

namespace appsplat::training {
    namespace F = torch::nn::functional;

    namespace {
        constexpr float C1 = 0.01f * 0.01f;
        constexpr float C2 = 0.03f * 0.03f;
    } // namespace

    torch::Tensor gaussian(const int window_size, const float sigma) {
        auto x = torch::arange(window_size, torch::kFloat32) - static_cast<float>(window_size / 2);
        auto g = torch::exp(-(x * x) / (2.0f * sigma * sigma));
        return g / g.sum();
    }

    torch::Tensor create_window(const int window_size, const int channel) {
        const auto w1d = gaussian(window_size, 1.5f).unsqueeze(1);  // [ws, 1]
        const auto w2d = w1d.mm(w1d.t()).unsqueeze(0).unsqueeze(0); // [1, 1, ws, ws]
        return w2d.expand({channel, 1, window_size, window_size}).contiguous();
    }

    torch::Tensor l1_loss(const torch::Tensor& pred, const torch::Tensor& target) {
        return torch::abs(pred - target).mean();
    }

    torch::Tensor ssim(const torch::Tensor& pred, const torch::Tensor& target, int window_size) {
        TORCH_CHECK(pred.sizes() == target.sizes(),
                    "ssim inputs must have the same shape, got ", pred.sizes(), " and ", target.sizes());

        const auto img1 = pred.dim() == 3 ? pred.unsqueeze(0) : pred;
        const auto img2 = target.dim() == 3 ? target.unsqueeze(0) : target;
        const int channel = static_cast<int>(img1.size(1));
        const auto window = create_window(window_size, channel).to(img1.device(), img1.scalar_type());

        const auto conv = [&](const torch::Tensor& x) {
            return F::conv2d(x, window, F::Conv2dFuncOptions().padding(window_size / 2).groups(channel));
        };

        const auto mu1 = conv(img1);
        const auto mu2 = conv(img2);
        const auto mu1_sq = mu1.pow(2);
        const auto mu2_sq = mu2.pow(2);
        const auto mu1_mu2 = mu1 * mu2;

        const auto sigma1_sq = conv(img1 * img1) - mu1_sq;
        const auto sigma2_sq = conv(img2 * img2) - mu2_sq;
        const auto sigma12 = conv(img1 * img2) - mu1_mu2;

        const auto ssim_map = ((2.0f * mu1_mu2 + C1) * (2.0f * sigma12 + C2)) /
                              ((mu1_sq + mu2_sq + C1) * (sigma1_sq + sigma2_sq + C2));
        return ssim_map.mean();
    }

    PhotometricLoss compute_photometric_loss(const torch::Tensor& rendered,
                                             const torch::Tensor& gt,
                                             const torch::Tensor& mask,
                                             float lambda_dssim) {
        TORCH_CHECK(rendered.sizes() == gt.sizes(),
                    "rendered and ground truth differ in shape: ", rendered.sizes(), " vs ", gt.sizes());

        auto target = gt;
        if (mask.defined()) {
            TORCH_CHECK(mask.dim() == 2 && mask.size(0) == gt.size(1) && mask.size(1) == gt.size(2),
                        "mask must be [H, W] matching the image, got ", mask.sizes());
            // 被遮挡像素的监督值取渲染结果本身，不产生梯度
            const auto m = mask.to(gt.device()).unsqueeze(0).expand_as(gt);
            target = torch::where(m, rendered.detach(), gt);
        }

        PhotometricLoss result;
        result.l1 = l1_loss(rendered, target);
        result.ssim = ssim(rendered, target);
        result.loss = (1.f - lambda_dssim) * result.l1 + lambda_dssim * (1.f - result.ssim);
        return result;
    }

    float PSNR::compute(const torch::Tensor& pred, const torch::Tensor& target) const {
        TORCH_CHECK(pred.sizes() == target.sizes(),
                    "Prediction and target must have the same shape");

        const auto mse = torch::mean(torch::pow(pred.detach() - target.detach(), 2)).item<float>();
        return 20.0f * std::log10(data_range_ / std::sqrt(mse));
    }

    MetricsReporter::MetricsReporter(const std::filesystem::path& output_dir)
        : output_dir_(output_dir),
          csv_path_(output_dir_ / "metrics.csv"),
          txt_path_(output_dir_ / "metrics_report.txt") {
    }

    void MetricsReporter::add_metrics(const EvalMetrics& metrics) {
        all_metrics_.push_back(metrics);
    }

    void MetricsReporter::save_report() const {
        std::filesystem::create_directories(output_dir_);

        std::ofstream csv_file(csv_path_);
        if (!csv_file) {
            LOG_ERROR("Cannot open {} for writing", csv_path_.string());
            return;
        }
        csv_file << EvalMetrics::to_csv_header() << "\n";
        for (const auto& m : all_metrics_) {
            csv_file << m.to_csv_row() << "\n";
        }

        std::ofstream txt_file(txt_path_);
        if (!txt_file) {
            LOG_ERROR("Cannot open {} for writing", txt_path_.string());
            return;
        }
        txt_file << "Validation report\n";
        txt_file << "=================\n\n";
        for (const auto& m : all_metrics_) {
            txt_file << "Iteration " << m.iteration << ": " << m.to_string() << "\n";
        }

        LOG_INFO("Saved validation report to {}", output_dir_.string());
    }

    MetricsEvaluator::MetricsEvaluator(const param::TrainingParameters& params)
        : _params(params),
          _psnr_metric(std::make_unique<PSNR>(1.0f)) {
        if (!_params.optimization.enable_eval) {
            return;
        }
        _reporter = std::make_unique<MetricsReporter>(_params.dataset.output_path);
    }

    bool MetricsEvaluator::should_evaluate(const int iteration) const {
        if (!_params.optimization.enable_eval) {
            return false;
        }
        const auto& steps = _params.optimization.eval_steps;
        return std::find(steps.cbegin(), steps.cend(), static_cast<size_t>(iteration)) != steps.cend();
    }

    EvalMetrics MetricsEvaluator::evaluate(const int iteration,
                                           Renderer& renderer,
                                           const SplatData& splatData,
                                           std::shared_ptr<CameraDataset> val_dataset,
                                           const torch::Tensor& background) {
        torch::NoGradGuard no_grad;
        LOG_TIMER("Validation");

        std::vector<float> l1s, ssims, losses, psnrs;
        const auto start = std::chrono::steady_clock::now();

        const size_t n = val_dataset->size().value();
        for (size_t i = 0; i < n; ++i) {
            auto example = val_dataset->get(i);
            auto& cam = *example.data.camera;
            const auto gt = example.data.image.to(background.device());

            auto output = renderer.render(cam, splatData, background, 1.0f, false);
            const auto image = output.image.clamp(0.0f, 1.0f);

            const auto terms = compute_photometric_loss(image, gt, torch::Tensor(), _params.optimization.lambda_dssim);
            l1s.push_back(terms.l1.item<float>());
            ssims.push_back(terms.ssim.item<float>());
            losses.push_back(terms.loss.item<float>());
            psnrs.push_back(_psnr_metric->compute(image, gt));
        }

        const auto elapsed = std::chrono::duration<float>(std::chrono::steady_clock::now() - start).count();
        const auto mean = [](const std::vector<float>& v) {
            return v.empty() ? 0.f : std::accumulate(v.begin(), v.end(), 0.f) / static_cast<float>(v.size());
        };

        EvalMetrics result{
            .l1 = mean(l1s),
            .ssim = mean(ssims),
            .loss = mean(losses),
            .psnr = mean(psnrs),
            .elapsed_time = n > 0 ? elapsed / static_cast<float>(n) : 0.f,
            .num_gaussians = static_cast<int>(splatData.size()),
            .iteration = iteration};

        if (_reporter) {
            _reporter->add_metrics(result);
        }
        std::println("[Validation at step {}] {}", iteration, result.to_string());
        return result;
    }
} // namespace appsplat::training
