#pragma once

#include "appsplat/camera.hpp"
#include "appsplat/parameters.hpp"
#include "appsplat/point_cloud.hpp"
#include <array>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace appsplat::loader {

    /**
     * @struct LoadedScene
     * @brief COLMAP场景加载结果
     */
    struct LoadedScene {
        CameraBatch train;           ///< 训练相机
        CameraBatch validation;      ///< 验证相机
        PointCloud point_cloud;      ///< 稀疏点云（位置+颜色0-255）
        float camera_extent = 0.f;   ///< 相机中心到其均值最大距离的1.1倍
        torch::Tensor scene_center;  ///< [3] 相机中心均值
        int max_appearance_id = 0;   ///< 所有图像中最大的外观编号
    };

    /// COLMAP相机模型，只有两种针孔模型可用于训练
    enum class CameraModel : int32_t {
        SIMPLE_PINHOLE = 0,
        PINHOLE = 1,
        SIMPLE_RADIAL = 2,
        RADIAL = 3,
        OPENCV = 4,
        OPENCV_FISHEYE = 5,
        FULL_OPENCV = 6,
        FOV = 7,
        SIMPLE_RADIAL_FISHEYE = 8,
        RADIAL_FISHEYE = 9,
        THIN_PRISM_FISHEYE = 10
    };

    std::string camera_model_name(int32_t model_id);

    struct ColmapCamera {
        uint32_t camera_id = 0;
        int32_t model_id = 0;
        uint64_t width = 0;
        uint64_t height = 0;
        std::vector<double> params;
    };

    struct ColmapImage {
        uint32_t image_id = 0;
        std::array<double, 4> qvec = {1.0, 0.0, 0.0, 0.0};  ///< w, x, y, z
        std::array<double, 3> tvec = {0.0, 0.0, 0.0};
        uint32_t camera_id = 0;
        std::string name;
    };

    /**
     * [功能描述]：读取 cameras.bin
     * @throws std::runtime_error 文件无法读取、未知模型编号或长度不符
     */
    std::unordered_map<uint32_t, ColmapCamera> read_cameras_binary(const std::filesystem::path& file_path);

    /**
     * [功能描述]：读取 images.bin，结果按图像编号升序排列
     * @throws std::runtime_error 文件无法读取或长度不符
     */
    std::vector<ColmapImage> read_images_binary(const std::filesystem::path& file_path);

    /**
     * [功能描述]：读取 points3D.bin，每条记录为 id(u64) xyz(f64×3) rgb(u8×3) error(f64) + track
     * @return 位置 [N, 3] float 与颜色 [N, 3] uint8
     */
    PointCloud read_points3D_binary(const std::filesystem::path& file_path);

    /// 写出 x y z nx ny nz red green blue 格式的点云PLY
    void write_point_cloud_ply(const std::filesystem::path& file_path, const PointCloud& point_cloud);

    /// 读取由 write_point_cloud_ply 写出的点云PLY
    PointCloud read_point_cloud_ply(const std::filesystem::path& file_path);

    /// 单位化四元数 (w, x, y, z) 转旋转矩阵 [3, 3]
    torch::Tensor qvec2rotmat(const std::array<double, 4>& qvec);

    /// sparse/0 存在时优先，否则为 sparse
    std::filesystem::path detect_sparse_model_dir(const std::filesystem::path& data_path);

    /**
     * [功能描述]：NeRF++ 归一化：相机中心均值及最大距离的1.1倍
     * @param R [N, 3, 3] 世界到相机旋转
     * @param T [N, 3] 世界到相机平移
     */
    std::pair<torch::Tensor, float> compute_nerfpp_norm(const torch::Tensor& R, const torch::Tensor& T);

    /**
     * [功能描述]：训练/验证划分
     * @details eval_step > 1 时 i % eval_step == 0 的图像进入验证集；否则全部训练，验证集为 {0}
     */
    std::pair<std::vector<int64_t>, std::vector<int64_t>> split_indices(size_t num_images, int eval_step);

    /**
     * [功能描述]：加载COLMAP稀疏重建
     * @details 首次加载时将 points3D.bin 转换为 points3D.ply 缓存（写 .tmp 后重命名）
     */
    std::expected<LoadedScene, std::string> load_colmap(const param::DatasetConfig& config);

} // namespace appsplat::loader
