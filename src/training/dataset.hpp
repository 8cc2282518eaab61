#pragma once

#include "appsplat/camera.hpp"
#include "appsplat/parameters.hpp"
#include <format>
#include <memory>
#include <optional>
#include <stdexcept>
#include <torch/torch.h>
#include <vector>

namespace appsplat::training {
    /**
     * @struct CameraWithImage
     * @brief 一个训练样本：相机、真实图像 [3, H, W] 和可选掩码 [H, W]（true表示不参与监督）
     */
    struct CameraWithImage {
        Camera* camera;
        torch::Tensor image;
        torch::Tensor mask;
    };

    using CameraExample = torch::data::Example<CameraWithImage, torch::Tensor>;

    /**
     * @class CameraDataset
     * @brief 相机数据集，按需从磁盘读取图像，也可以持有预先给定的图像
     */
    class CameraDataset : public torch::data::Dataset<CameraDataset, CameraExample> {
    public:
        CameraDataset(std::vector<std::shared_ptr<Camera>> cameras,
                      const param::DatasetConfig& params)
            : _cameras(std::move(cameras)),
              _datasetConfig(params) {
        }

        /**
         * @param images 与相机一一对应的图像 [3, H, W]，值域[0, 1]
         * @param masks 可为空，或与相机一一对应（元素可为未定义张量）
         */
        CameraDataset(std::vector<std::shared_ptr<Camera>> cameras,
                      std::vector<torch::Tensor> images,
                      std::vector<torch::Tensor> masks = {})
            : _cameras(std::move(cameras)),
              _images(std::move(images)),
              _masks(std::move(masks)) {
            if (_images.size() != _cameras.size()) {
                throw std::invalid_argument(std::format(
                    "dimension mismatch: {} cameras but {} images", _cameras.size(), _images.size()));
            }
            if (!_masks.empty() && _masks.size() != _cameras.size()) {
                throw std::invalid_argument(std::format(
                    "dimension mismatch: {} cameras but {} masks", _cameras.size(), _masks.size()));
            }
        }

        CameraDataset(const CameraDataset&) = default;
        CameraDataset(CameraDataset&&) noexcept = default;
        CameraDataset& operator=(CameraDataset&&) noexcept = default;
        CameraDataset& operator=(const CameraDataset&) = default;

        CameraExample get(size_t index) override {
            if (index >= _cameras.size()) {
                throw std::out_of_range("Dataset index out of range");
            }

            auto& cam = _cameras[index];
            if (!_images.empty()) {
                torch::Tensor mask = _masks.empty() ? torch::Tensor() : _masks[index];
                return {{cam.get(), _images[index], mask}, torch::empty({})};
            }

            torch::Tensor image = cam->load_and_get_image(_datasetConfig.resize_factor);
            torch::Tensor mask = cam->load_mask(_datasetConfig.resize_factor);
            return {{cam.get(), std::move(image), std::move(mask)}, torch::empty({})};
        }

        torch::optional<size_t> size() const override {
            return _cameras.size();
        }

        const std::vector<std::shared_ptr<Camera>>& get_cameras() const {
            return _cameras;
        }

        [[nodiscard]] std::optional<Camera*> get_camera_by_filename(const std::string& filename) const {
            for (const auto& cam : _cameras) {
                if (cam->image_name() == filename) {
                    return cam.get();
                }
            }
            return std::nullopt;
        }

    private:
        std::vector<std::shared_ptr<Camera>> _cameras;
        param::DatasetConfig _datasetConfig;
        std::vector<torch::Tensor> _images;
        std::vector<torch::Tensor> _masks;
    };

    /**
     * @class InfiniteRandomSampler
     * @brief 无限随机采样器，遍历完毕后自动重置
     */
    class InfiniteRandomSampler : public torch::data::samplers::RandomSampler {
    public:
        using super = torch::data::samplers::RandomSampler;

        explicit InfiniteRandomSampler(size_t dataset_size)
            : super(dataset_size) {
        }

        std::optional<std::vector<size_t>> next(size_t batch_size) override {
            auto indices = super::next(batch_size);
            if (!indices) {
                super::reset();
                indices = super::next(batch_size);
            }
            return indices;
        }
    };

    /// 验证集按顺序遍历一次
    inline auto create_dataloader_from_dataset(
        std::shared_ptr<CameraDataset> dataset,
        int num_workers = 1) {
        const size_t dataset_size = dataset->size().value();

        return torch::data::make_data_loader(
            *dataset,
            torch::data::samplers::SequentialSampler(dataset_size),
            torch::data::DataLoaderOptions()
                .batch_size(1)
                .workers(num_workers)
                .enforce_ordering(true));
    }

    /**
     * @brief 从数据集创建无限循环的数据加载器
     * @param num_workers 工作线程数，0时在训练线程内读取
     */
    inline auto create_infinite_dataloader_from_dataset(
        std::shared_ptr<CameraDataset> dataset,
        int num_workers = 4) {
        const size_t dataset_size = dataset->size().value();

        return torch::data::make_data_loader(
            *dataset,
            InfiniteRandomSampler(dataset_size),
            torch::data::DataLoaderOptions()
                .batch_size(1)
                .workers(num_workers)
                .enforce_ordering(false));
    }
} // namespace appsplat::training
