#pragma once

#include <filesystem>
#include <string>
#include <torch/torch.h>
#include <vector>

namespace appsplat {

    /**
     * @struct CameraTransforms
     * @brief 由位姿和内参推导出的相机矩阵（批量形式，第一维为相机数）
     * @details 所有4x4矩阵都以转置形式存储，使用行向量右乘：p_view = [p, 1] · world_to_camera
     */
    struct CameraTransforms {
        torch::Tensor fov_x;            ///< [N] 水平视场角（弧度）
        torch::Tensor fov_y;            ///< [N] 垂直视场角（弧度）
        torch::Tensor world_to_camera;  ///< [N, 4, 4] 世界到相机变换（转置）
        torch::Tensor projection;       ///< [N, 4, 4] 透视投影矩阵（转置）
        torch::Tensor full_projection;  ///< [N, 4, 4] world_to_camera · projection
        torch::Tensor camera_center;    ///< [N, 3] 相机中心（世界坐标）
    };

    /**
     * [功能描述]：批量计算相机矩阵
     * @param R [参数说明]：[N, 3, 3] 世界到相机旋转
     * @param T [参数说明]：[N, 3] 世界到相机平移
     * @param fx, fy [参数说明]：[N] 焦距（像素）
     * @param width, height [参数说明]：[N] 图像尺寸（像素）
     * @return [返回值说明]：视场角与全部派生矩阵
     * @details znear = 0.01，zfar = 100，z_sign = 1
     */
    CameraTransforms compute_camera_transforms(const torch::Tensor& R,
                                               const torch::Tensor& T,
                                               const torch::Tensor& fx,
                                               const torch::Tensor& fy,
                                               const torch::Tensor& width,
                                               const torch::Tensor& height);

    float focal2fov(float focal, int pixels);
    float fov2focal(float fov, int pixels);

    /**
     * @class Camera
     * @brief 单张图像的相机
     * @details 派生矩阵是位姿和内参的纯函数，只能通过set_pose/set_intrinsics/set_image_size间接更新
     */
    class Camera {
    public:
        Camera() = default;

        /**
         * [功能描述]：构造相机并计算所有派生矩阵
         * @param R [参数说明]：[3, 3] 世界到相机旋转
         * @param T [参数说明]：[3] 世界到相机平移
         * @param appearance_id [参数说明]：外观组编号，用作外观嵌入表的行号
         * @param distortion [参数说明]：[6] 畸变系数，未定义时填零
         * @throws std::invalid_argument 形状或数值非法
         */
        Camera(const torch::Tensor& R,
               const torch::Tensor& T,
               float fx, float fy,
               float cx, float cy,
               int width, int height,
               int appearance_id = 0,
               torch::Tensor distortion = {},
               int camera_type = 0,
               std::string image_name = "",
               std::filesystem::path image_path = "",
               std::filesystem::path mask_path = "",
               int uid = 0);

        void set_pose(const torch::Tensor& R, const torch::Tensor& T);
        void set_intrinsics(float fx, float fy, float cx, float cy);
        void set_image_size(int width, int height);

        /// 设置归一化外观值（外观编号除以批内最大编号）
        void set_normalized_appearance(float value) { _normalized_appearance = value; }

        /**
         * [功能描述]：读取图像并转换为 [3, H, W] 的float张量，值域[0, 1]
         * @param resize_factor [参数说明]：缩放因子，<=1时保持原尺寸；图像尺寸与相机不一致时同步更新内参
         */
        torch::Tensor load_and_get_image(int resize_factor = -1);

        /**
         * [功能描述]：读取掩码，返回 [H, W] 的bool张量，true表示该像素不参与监督
         * @return [返回值说明]：没有掩码时返回未定义张量
         */
        torch::Tensor load_mask(int resize_factor = -1) const;

        /// 内参矩阵 [3, 3]
        torch::Tensor K() const;

        const torch::Tensor& R() const { return _R; }
        const torch::Tensor& T() const { return _T; }
        float focal_x() const { return _fx; }
        float focal_y() const { return _fy; }
        float center_x() const { return _cx; }
        float center_y() const { return _cy; }
        float FoVx() const { return _fov_x; }
        float FoVy() const { return _fov_y; }
        int image_width() const { return _width; }
        int image_height() const { return _height; }
        int appearance_id() const { return _appearance_id; }
        float normalized_appearance() const { return _normalized_appearance; }
        const torch::Tensor& distortion() const { return _distortion; }
        int camera_type() const { return _camera_type; }
        const std::string& image_name() const { return _image_name; }
        const std::filesystem::path& image_path() const { return _image_path; }
        const std::filesystem::path& mask_path() const { return _mask_path; }
        int uid() const { return _uid; }

        const torch::Tensor& world_view_transform() const { return _world_view_transform; }
        const torch::Tensor& projection_matrix() const { return _projection_matrix; }
        const torch::Tensor& full_proj_transform() const { return _full_proj_transform; }
        const torch::Tensor& camera_center() const { return _camera_center; }

    private:
        void update_transforms();

        torch::Tensor _R = torch::eye(3);
        torch::Tensor _T = torch::zeros({3});
        float _fx = 1.f;
        float _fy = 1.f;
        float _cx = 0.f;
        float _cy = 0.f;
        float _fov_x = 0.f;
        float _fov_y = 0.f;
        int _width = 0;
        int _height = 0;
        int _appearance_id = 0;
        float _normalized_appearance = 0.f;
        torch::Tensor _distortion = torch::zeros({6});
        int _camera_type = 0;
        std::string _image_name;
        std::filesystem::path _image_path;
        std::filesystem::path _mask_path;
        int _uid = 0;

        torch::Tensor _world_view_transform;
        torch::Tensor _projection_matrix;
        torch::Tensor _full_proj_transform;
        torch::Tensor _camera_center;
    };

    /**
     * @class CameraBatch
     * @brief 多张图像相机参数的并行数组
     * @details 所有数组长度必须相同，否则构造时抛出维度不匹配异常；at(i)返回第i个相机
     */
    class CameraBatch {
    public:
        CameraBatch() = default;

        /**
         * @throws std::invalid_argument 数组长度或形状不一致
         */
        CameraBatch(torch::Tensor R,
                    torch::Tensor T,
                    torch::Tensor fx,
                    torch::Tensor fy,
                    torch::Tensor cx,
                    torch::Tensor cy,
                    torch::Tensor width,
                    torch::Tensor height,
                    torch::Tensor appearance_ids,
                    torch::Tensor distortion = {},
                    torch::Tensor camera_types = {},
                    std::vector<std::string> image_names = {},
                    std::vector<std::filesystem::path> image_paths = {},
                    std::vector<std::filesystem::path> mask_paths = {});

        size_t size() const { return _R.defined() ? static_cast<size_t>(_R.size(0)) : 0; }
        bool empty() const { return size() == 0; }

        Camera at(size_t index) const;
        Camera operator[](size_t index) const { return at(index); }

        /// 按下标选出子批次（用于训练/验证划分），归一化外观值保持不变
        CameraBatch select(const std::vector<int64_t>& indices) const;

        /// 所有相机转换为独立对象，uid为批内下标
        std::vector<std::shared_ptr<Camera>> to_cameras() const;

        int max_appearance_id() const;

        const torch::Tensor& R() const { return _R; }
        const torch::Tensor& T() const { return _T; }
        const torch::Tensor& appearance_ids() const { return _appearance_ids; }
        const torch::Tensor& normalized_appearance() const { return _normalized_appearance; }
        const CameraTransforms& transforms() const { return _transforms; }

    private:
        torch::Tensor _R, _T, _fx, _fy, _cx, _cy, _width, _height;
        torch::Tensor _appearance_ids;
        torch::Tensor _normalized_appearance;
        torch::Tensor _distortion;
        torch::Tensor _camera_types;
        std::vector<std::string> _image_names;
        std::vector<std::filesystem::path> _image_paths;
        std::vector<std::filesystem::path> _mask_paths;
        CameraTransforms _transforms;
    };

} // namespace appsplat
