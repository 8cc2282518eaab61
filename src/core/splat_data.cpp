#include "appsplat/splat_data.hpp"
#include "appsplat/logger.hpp"
#include "appsplat/parameters.hpp"

#include <algorithm>
#include <cmath>
#include <expected>
#include <filesystem>
#include <format>
#include <fstream>
#include <nanoflann.hpp>
#include <print>
#include <sstream>
#include <string>
#include <thread>
#include <tinyply.h>
#include <torch/torch.h>
#include <vector>

namespace {
    std::string tensor_sizes_to_string(const c10::ArrayRef<int64_t>& sizes) {
        std::ostringstream oss;
        oss << "[";
        for (size_t i = 0; i < sizes.size(); ++i) {
            if (i > 0)
                oss << ", ";
            oss << sizes[i];
        }
        oss << "]";
        return oss.str();
    }

    /**
     * @struct PointCloudAdaptor
     * @brief nanoflann的数据集适配器，直接读取 [N, 3] float 缓冲区
     */
    struct PointCloudAdaptor {
        const float* points;
        size_t num_points;

        PointCloudAdaptor(const float* pts, size_t n) : points(pts),
                                                        num_points(n) {}

        inline size_t kdtree_get_point_count() const { return num_points; }

        inline float kdtree_get_pt(const size_t idx, const size_t dim) const {
            return points[idx * 3 + dim];
        }

        template <class BBOX>
        bool kdtree_get_bbox(BBOX&) const { return false; }
    };

    using KDTree = nanoflann::KDTreeSingleIndexAdaptor<nanoflann::L2_Simple_Adaptor<float, PointCloudAdaptor>, PointCloudAdaptor, 3>;

    /**
     * [功能描述]：计算每个点到3个最近邻的平方距离均值
     * @param points 点云 [N, 3]，float32
     * @return [N]，用于初始化高斯的各向同性缩放
     */
    torch::Tensor compute_mean_squared_neighbor_distances(const torch::Tensor& points) {
        auto cpu_points = points.detach().to(torch::kCPU).contiguous();
        const int num_points = static_cast<int>(cpu_points.size(0));

        TORCH_CHECK(cpu_points.dim() == 2 && cpu_points.size(1) == 3,
                    "Input points must have shape [N, 3]");
        TORCH_CHECK(cpu_points.dtype() == torch::kFloat32,
                    "Input points must be float32");

        if (num_points <= 1) {
            return torch::full({num_points}, 0.01f, torch::kFloat32);
        }

        const float* data = cpu_points.data_ptr<float>();

        PointCloudAdaptor cloud(data, num_points);
        KDTree index(3, cloud, nanoflann::KDTreeSingleIndexAdaptorParams(10));
        index.buildIndex();

        auto result = torch::zeros({num_points}, torch::kFloat32);
        float* result_data = result.data_ptr<float>();

#pragma omp parallel for if (num_points > 1000)
        for (int i = 0; i < num_points; i++) {
            const float query_pt[3] = {data[i * 3 + 0], data[i * 3 + 1], data[i * 3 + 2]};

            // 第一个结果是查询点本身
            const size_t num_results = std::min(4, num_points);
            std::vector<size_t> ret_indices(num_results);
            std::vector<float> out_dists_sqr(num_results);

            nanoflann::KNNResultSet<float> resultSet(num_results);
            resultSet.init(&ret_indices[0], &out_dists_sqr[0]);
            index.findNeighbors(resultSet, &query_pt[0], nanoflann::SearchParameters(10));

            float sum_sq = 0.0f;
            int neighbors = 0;
            for (size_t j = 0; j < num_results && neighbors < 3; j++) {
                if (ret_indices[j] == static_cast<size_t>(i)) {
                    continue;
                }
                sum_sq += out_dists_sqr[j];
                neighbors++;
            }

            result_data[i] = neighbors > 0 ? sum_sq / neighbors : 0.01f;
        }

        return result;
    }

    /**
     * [功能描述]：将点云以二进制PLY格式写入文件
     * @details 先写 point_cloud.ply.tmp，写入成功后重命名为 point_cloud.ply
     */
    void write_ply_impl(const appsplat::PointCloud& pc,
                        const std::filesystem::path& root,
                        int iteration) {
        namespace fs = std::filesystem;
        const fs::path dir = root / "point_cloud" / std::format("iteration_{}", iteration);
        fs::create_directories(dir);

        std::vector<torch::Tensor> tensors;
        tensors.push_back(pc.means);
        if (pc.normals.defined())
            tensors.push_back(pc.normals);
        if (pc.sh0.defined())
            tensors.push_back(pc.sh0);
        if (pc.shN.defined() && pc.shN.size(1) > 0)
            tensors.push_back(pc.shN);
        if (pc.opacity.defined())
            tensors.push_back(pc.opacity);
        if (pc.scaling.defined())
            tensors.push_back(pc.scaling);
        if (pc.rotation.defined())
            tensors.push_back(pc.rotation);
        if (pc.appearance_features.defined() && pc.appearance_features.size(1) > 0)
            tensors.push_back(pc.appearance_features);

        tinyply::PlyFile ply;
        size_t attr_off = 0;
        for (const auto& tensor : tensors) {
            const size_t cols = tensor.size(1);
            std::vector<std::string> attrs(pc.attribute_names.begin() + attr_off,
                                           pc.attribute_names.begin() + attr_off + cols);

            ply.add_properties_to_element(
                "vertex",
                attrs,
                tinyply::Type::FLOAT32,
                tensor.size(0),
                reinterpret_cast<uint8_t*>(tensor.data_ptr<float>()),
                tinyply::Type::INVALID, 0);

            attr_off += cols;
        }

        const fs::path final_path = dir / "point_cloud.ply";
        const fs::path tmp_path = dir / "point_cloud.ply.tmp";
        {
            std::filebuf fb;
            if (!fb.open(tmp_path, std::ios::out | std::ios::binary)) {
                throw std::runtime_error(std::format("Failed to open {} for writing", tmp_path.string()));
            }
            std::ostream out_stream(&fb);
            ply.write(out_stream, /*binary=*/true);
            out_stream.flush();
            if (!out_stream) {
                throw std::runtime_error(std::format("Failed to write {}", tmp_path.string()));
            }
        }
        fs::rename(tmp_path, final_path);
        LOG_DEBUG("Saved {} Gaussians to {}", pc.size(), final_path.string());
    }

    void write_ply_logged(const appsplat::PointCloud& pc,
                          const std::filesystem::path& root,
                          int iteration) {
        try {
            write_ply_impl(pc, root, iteration);
        } catch (const std::exception& e) {
            LOG_ERROR("Failed to save PLY for iteration {}: {}", iteration, e.what());
        }
    }
} // namespace

namespace appsplat {

    SplatData::~SplatData() {
        wait_for_saves();
    }

    SplatData::SplatData(SplatData&& other) noexcept
        : _active_sh_degree(other._active_sh_degree),
          _max_sh_degree(other._max_sh_degree),
          _scene_scale(other._scene_scale),
          _means(std::move(other._means)),
          _sh0(std::move(other._sh0)),
          _shN(std::move(other._shN)),
          _scaling(std::move(other._scaling)),
          _rotation(std::move(other._rotation)),
          _opacity(std::move(other._opacity)),
          _appearance_features(std::move(other._appearance_features)) {
        std::lock_guard<std::mutex> lock(other._threads_mutex);
        _save_threads = std::move(other._save_threads);
    }

    SplatData& SplatData::operator=(SplatData&& other) noexcept {
        if (this != &other) {
            wait_for_saves();

            _active_sh_degree = other._active_sh_degree;
            _max_sh_degree = other._max_sh_degree;
            _scene_scale = other._scene_scale;

            _means = std::move(other._means);
            _sh0 = std::move(other._sh0);
            _shN = std::move(other._shN);
            _scaling = std::move(other._scaling);
            _rotation = std::move(other._rotation);
            _opacity = std::move(other._opacity);
            _appearance_features = std::move(other._appearance_features);

            std::lock_guard<std::mutex> lock(other._threads_mutex);
            _save_threads = std::move(other._save_threads);
        }
        return *this;
    }

    SplatData::SplatData(int sh_degree,
                         torch::Tensor means,
                         torch::Tensor sh0,
                         torch::Tensor shN,
                         torch::Tensor scaling,
                         torch::Tensor rotation,
                         torch::Tensor opacity,
                         torch::Tensor appearance_features,
                         float scene_scale)
        : _active_sh_degree{0},
          _max_sh_degree{sh_degree},
          _scene_scale{scene_scale},
          _means{std::move(means)},
          _sh0{std::move(sh0)},
          _shN{std::move(shN)},
          _scaling{std::move(scaling)},
          _rotation{std::move(rotation)},
          _opacity{std::move(opacity)},
          _appearance_features{std::move(appearance_features)} {
        // 所有属性的第一维必须是高斯数量
        const auto n = _means.size(0);
        TORCH_CHECK(_means.dim() == 2 && _means.size(1) == 3, "means must be [N, 3], got ", _means.sizes());
        TORCH_CHECK(_sh0.size(0) == n && _shN.size(0) == n && _scaling.size(0) == n &&
                        _rotation.size(0) == n && _opacity.size(0) == n && _appearance_features.size(0) == n,
                    "dimension mismatch: all Gaussian attributes must have ", n, " rows");
        TORCH_CHECK(_shN.size(1) == (sh_degree + 1) * (sh_degree + 1) - 1,
                    "shN must hold ", (sh_degree + 1) * (sh_degree + 1) - 1, " coefficients for degree ", sh_degree);
    }

    torch::Tensor SplatData::get_means() const {
        return _means;
    }

    torch::Tensor SplatData::get_opacity() const {
        return torch::sigmoid(_opacity).squeeze(-1);
    }

    torch::Tensor SplatData::get_rotation() const {
        return torch::nn::functional::normalize(_rotation,
                                                torch::nn::functional::NormalizeFuncOptions().dim(-1));
    }

    torch::Tensor SplatData::get_scaling() const {
        return torch::exp(_scaling);
    }

    torch::Tensor SplatData::get_shs() const {
        return torch::cat({_sh0, _shN}, 1);
    }

    torch::Tensor SplatData::get_shs_dc() const {
        return _sh0;
    }

    torch::Tensor SplatData::get_shs_rest() const {
        return _shN;
    }

    torch::Tensor SplatData::get_appearance_features() const {
        return _appearance_features;
    }

    void SplatData::increment_sh_degree() {
        if (_active_sh_degree < _max_sh_degree) {
            _active_sh_degree++;
            LOG_DEBUG("Active SH degree increased to {}", _active_sh_degree);
        }
    }

    std::vector<std::string> SplatData::get_attribute_names() const {
        std::vector<std::string> a{"x", "y", "z", "nx", "ny", "nz"};

        for (int i = 0; i < _sh0.size(1) * _sh0.size(2); ++i)
            a.emplace_back("f_dc_" + std::to_string(i));
        for (int i = 0; i < _shN.size(1) * _shN.size(2); ++i)
            a.emplace_back("f_rest_" + std::to_string(i));

        a.emplace_back("opacity");

        for (int i = 0; i < _scaling.size(1); ++i)
            a.emplace_back("scale_" + std::to_string(i));
        for (int i = 0; i < _rotation.size(1); ++i)
            a.emplace_back("rot_" + std::to_string(i));
        for (int i = 0; i < _appearance_features.size(1); ++i)
            a.emplace_back("f_app_" + std::to_string(i));

        return a;
    }

    void SplatData::wait_for_saves() const {
        std::lock_guard<std::mutex> lock(_threads_mutex);
        for (auto& t : _save_threads) {
            if (t.joinable()) {
                t.join();
            }
        }
        _save_threads.clear();
    }

    void SplatData::save_ply(const std::filesystem::path& root, int iteration, bool join_thread) const {
        // 快照在调用线程中生成，后续参数更新不影响写入内容
        auto pc = to_point_cloud();

        if (join_thread) {
            write_ply_impl(pc, root, iteration);
        } else {
            std::lock_guard<std::mutex> lock(_threads_mutex);
            _save_threads.emplace_back([pc = std::move(pc), root, iteration]() {
                write_ply_logged(pc, root, iteration);
            });
        }
    }

    PointCloud SplatData::to_point_cloud() const {
        torch::NoGradGuard no_grad;
        PointCloud pc;

        // 强制拷贝：参数已在CPU上时 to() 返回同一存储
        const auto snapshot = [](const torch::Tensor& t) {
            return t.detach().to(torch::kCPU, torch::kFloat32, /*non_blocking=*/false, /*copy=*/true).contiguous();
        };

        pc.means = snapshot(_means);
        pc.normals = torch::zeros_like(pc.means);

        pc.sh0 = snapshot(_sh0.transpose(1, 2).flatten(1));
        pc.shN = snapshot(_shN.transpose(1, 2).flatten(1));
        pc.opacity = snapshot(_opacity);
        pc.scaling = snapshot(_scaling);
        pc.rotation = snapshot(_rotation);
        pc.appearance_features = snapshot(_appearance_features);

        pc.attribute_names = get_attribute_names();
        return pc;
    }

    std::expected<SplatData, std::string> SplatData::init_model_from_pointcloud(
        const param::TrainingParameters& params,
        const PointCloud& pcd,
        float scene_scale) {

        try {
            if (pcd.size() == 0) {
                return std::unexpected("Point cloud is empty");
            }

            const torch::Device device(params.optimization.device);
            const auto f32 = torch::TensorOptions().dtype(torch::kFloat32).device(device);

            const auto positions = pcd.means.to(torch::kFloat32);
            const auto colors = pcd.colors.defined()
                                    ? pcd.colors.to(torch::kFloat32) / 255.0f
                                    : torch::full({positions.size(0), 3}, 0.5f);

            auto rgb_to_sh = [](const torch::Tensor& rgb) {
                constexpr float kInvSH = 0.28209479177387814f;
                return (rgb - 0.5f) / kInvSH;
            };

            const int64_t n = positions.size(0);

            // 步骤1：位置
            auto means = positions.to(f32).contiguous();

            // 步骤2：缩放，取3近邻平方距离均值的平方根
            auto dist2 = torch::clamp_min(compute_mean_squared_neighbor_distances(positions), 1e-7);
            auto scaling = torch::log(torch::sqrt(dist2))
                               .unsqueeze(-1)
                               .repeat({1, 3})
                               .to(f32)
                               .contiguous();

            // 步骤3：单位四元数
            auto rotation = torch::zeros({n, 4}, f32);
            rotation.index_put_({torch::indexing::Slice(), 0}, 1);

            // 步骤4：不透明度
            auto opacity = torch::logit(params.optimization.init_opacity * torch::ones({n, 1}, f32));

            // 步骤5：球谐系数
            const int64_t feature_shape = static_cast<int64_t>(std::pow(params.optimization.sh_degree + 1, 2));
            auto sh0 = rgb_to_sh(colors).to(f32).unsqueeze(1).contiguous();        // [N, 1, 3]
            auto shN = torch::zeros({n, feature_shape - 1, 3}, f32);               // [N, K, 3]

            // 步骤6：外观特征
            auto appearance_features = torch::zeros({n, params.appearance_model.n_gaussian_feature_dims}, f32);

            std::println("Scene scale: {}", scene_scale);
            std::println("Initialized SplatData with:");
            std::println("  - {} points", n);
            std::println("  - Max SH degree: {}", params.optimization.sh_degree);
            std::println("  - Total SH coefficients: {}", feature_shape);
            std::println("  - sh0 shape: {}", tensor_sizes_to_string(sh0.sizes()));
            std::println("  - shN shape: {}", tensor_sizes_to_string(shN.sizes()));
            std::println("  - appearance feature dims: {}", appearance_features.size(1));

            return SplatData(
                params.optimization.sh_degree,
                means.set_requires_grad(true),
                sh0.set_requires_grad(true),
                shN.set_requires_grad(true),
                scaling.set_requires_grad(true),
                rotation.set_requires_grad(true),
                opacity.set_requires_grad(true),
                appearance_features.set_requires_grad(true),
                scene_scale);

        } catch (const std::exception& e) {
            return std::unexpected(std::format("Failed to initialize SplatData: {}", e.what()));
        }
    }
} // namespace appsplat
