#pragma once

#include "appsplat/parameters.hpp"
#include "appsplat/splat_data.hpp"
#include "training/dataset.hpp"
#include <filesystem>
#include <iomanip>
#include <memory>
#include <sstream>
#include <string>
#include <torch/torch.h>
#include <vector>

namespace appsplat::training {
    class Renderer;

    /**
     * [功能描述]：创建一维高斯核，用于SSIM计算。
     * @param window_size [参数说明]：窗口大小，必须是奇数。
     * @param sigma [参数说明]：高斯分布的标准差。
     * @return [返回值说明]：归一化的 [window_size] 张量。
     */
    torch::Tensor gaussian(const int window_size, const float sigma);

    /**
     * [功能描述]：创建SSIM计算窗口。
     * @return [返回值说明]：形状为 [channel, 1, window_size, window_size] 的卷积核。
     */
    torch::Tensor create_window(const int window_size, const int channel);

    /// 平均绝对误差
    torch::Tensor l1_loss(const torch::Tensor& pred, const torch::Tensor& target);

    /**
     * [功能描述]：可微的结构相似性，窗口11、σ=1.5，same填充后取全图平均。
     * @param pred, target [参数说明]：[C, H, W] 或 [B, C, H, W]
     */
    torch::Tensor ssim(const torch::Tensor& pred, const torch::Tensor& target, int window_size = 11);

    /**
     * @struct PhotometricLoss
     * @brief 光度损失及其组成部分
     */
    struct PhotometricLoss {
        torch::Tensor loss;  ///< (1−λ)·L1 + λ·(1−SSIM)
        torch::Tensor l1;
        torch::Tensor ssim;
    };

    /**
     * [功能描述]：计算光度损失。
     * @param rendered [参数说明]：渲染图像 [3, H, W]
     * @param gt [参数说明]：真实图像 [3, H, W]
     * @param mask [参数说明]：[H, W] bool，true的像素用分离梯度的渲染值替换真实值；未定义时不使用掩码
     * @param lambda_dssim [参数说明]：SSIM项权重
     */
    PhotometricLoss compute_photometric_loss(const torch::Tensor& rendered,
                                             const torch::Tensor& gt,
                                             const torch::Tensor& mask,
                                             float lambda_dssim);

    /**
     * [功能描述]：峰值信噪比（PSNR）指标类。
     */
    class PSNR {
    public:
        explicit PSNR(const float data_range = 1.0f) : data_range_(data_range) {
        }

        /// 返回PSNR值，单位为dB
        float compute(const torch::Tensor& pred, const torch::Tensor& target) const;

    private:
        const float data_range_;
    };

    /**
     * [功能描述]：评估指标结果结构体。
     */
    struct EvalMetrics {
        float l1;
        float ssim;
        float loss;
        float psnr;
        float elapsed_time;   ///< 单张图像处理时间（秒）
        int num_gaussians;
        int iteration;

        [[nodiscard]] std::string to_string() const {
            std::stringstream ss;
            ss << std::fixed << std::setprecision(4);
            ss << "PSNR: " << psnr
               << ", SSIM: " << ssim
               << ", L1: " << l1
               << ", Loss: " << loss
               << ", Time: " << elapsed_time << "s/image"
               << ", #GS: " << num_gaussians;
            return ss.str();
        }

        static std::string to_csv_header() {
            return "iteration,psnr,ssim,l1,loss,time_per_image,num_gaussians";
        }

        [[nodiscard]] std::string to_csv_row() const {
            std::stringstream ss;
            ss << iteration << ","
               << std::fixed << std::setprecision(6)
               << psnr << ","
               << ssim << ","
               << l1 << ","
               << loss << ","
               << elapsed_time << ","
               << num_gaussians;
            return ss.str();
        }
    };

    /**
     * [功能描述]：指标报告器类，将所有验证结果写入CSV和文本文件。
     */
    class MetricsReporter {
    public:
        explicit MetricsReporter(const std::filesystem::path& output_dir);

        void add_metrics(const EvalMetrics& metrics);

        void save_report() const;

    private:
        const std::filesystem::path output_dir_;
        std::vector<EvalMetrics> all_metrics_;
        const std::filesystem::path csv_path_;
        const std::filesystem::path txt_path_;
    };

    /**
     * [功能描述]：验证集评估器。
     * 在评估步数点渲染全部验证相机，计算平均L1、SSIM、损失和PSNR。
     */
    class MetricsEvaluator {
    public:
        explicit MetricsEvaluator(const param::TrainingParameters& params);

        bool is_enabled() const { return _params.optimization.enable_eval; }

        bool should_evaluate(const int iteration) const;

        /**
         * [功能描述]：在验证集上评估当前模型。
         * @param renderer [参数说明]：训练使用的渲染器，验证时总是启用外观残差。
         */
        EvalMetrics evaluate(const int iteration,
                             Renderer& renderer,
                             const SplatData& splatData,
                             std::shared_ptr<CameraDataset> val_dataset,
                             const torch::Tensor& background);

        void save_report() const {
            if (_reporter)
                _reporter->save_report();
        }

    private:
        const param::TrainingParameters _params;
        std::unique_ptr<PSNR> _psnr_metric;
        std::unique_ptr<MetricsReporter> _reporter;
    };
} // namespace appsplat::training
