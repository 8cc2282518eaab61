#include "appsplat/camera.hpp"
#include "appsplat/image_io.hpp"
#include "appsplat/logger.hpp"

#include <cmath>
#include <format>
#include <stdexcept>

namespace appsplat {

    namespace {
        constexpr float kZNear = 0.01f;
        constexpr float kZFar = 100.f;
        constexpr float kZSign = 1.f;

        void require(bool condition, const std::string& message) {
            if (!condition) {
                throw std::invalid_argument(message);
            }
        }

        std::string shape_string(const torch::Tensor& t) {
            if (!t.defined()) {
                return "undefined";
            }
            std::string s = "[";
            for (int64_t i = 0; i < t.dim(); ++i) {
                s += std::format("{}{}", i > 0 ? ", " : "", t.size(i));
            }
            return s + "]";
        }
    } // namespace

    float focal2fov(float focal, int pixels) {
        return 2.f * std::atan(static_cast<float>(pixels) / (2.f * focal));
    }

    float fov2focal(float fov, int pixels) {
        return static_cast<float>(pixels) / (2.f * std::tan(fov / 2.f));
    }

    /**
     * [功能描述]：批量计算视场角、世界到相机变换、投影矩阵、组合矩阵和相机中心
     * @details 投影矩阵采用OpenGL风格的视锥体，构造完成后转置；
     *          相机中心取 world_to_camera 逆矩阵的第3行前3个元素。
     */
    CameraTransforms compute_camera_transforms(const torch::Tensor& R,
                                               const torch::Tensor& T,
                                               const torch::Tensor& fx,
                                               const torch::Tensor& fy,
                                               const torch::Tensor& width,
                                               const torch::Tensor& height) {
        require(R.dim() == 3 && R.size(1) == 3 && R.size(2) == 3,
                std::format("dimension mismatch: R must be [N, 3, 3], got {}", shape_string(R)));
        const int64_t n = R.size(0);
        require(T.dim() == 2 && T.size(0) == n && T.size(1) == 3,
                std::format("dimension mismatch: T must be [{}, 3], got {}", n, shape_string(T)));
        for (const auto* t : {&fx, &fy, &width, &height}) {
            require(t->dim() == 1 && t->size(0) == n,
                    std::format("dimension mismatch: intrinsics must be [{}], got {}", n, shape_string(*t)));
        }

        const auto f32 = torch::TensorOptions().dtype(torch::kFloat32);
        const auto Rf = R.to(torch::kFloat32);
        const auto Tf = T.to(torch::kFloat32);
        const auto fxf = fx.to(torch::kFloat32);
        const auto fyf = fy.to(torch::kFloat32);
        const auto wf = width.to(torch::kFloat32);
        const auto hf = height.to(torch::kFloat32);

        CameraTransforms out;

        // ==================== 视场角 ====================
        out.fov_x = 2.f * torch::atan((wf / 2.f) / fxf);
        out.fov_y = 2.f * torch::atan((hf / 2.f) / fyf);

        // ==================== 世界到相机变换 ====================
        using torch::indexing::Slice;
        auto w2c = torch::zeros({n, 4, 4}, f32);
        w2c.index_put_({Slice(), Slice(0, 3), Slice(0, 3)}, Rf);
        w2c.index_put_({Slice(), Slice(0, 3), 3}, Tf);
        w2c.index_put_({Slice(), 3, 3}, 1.f);
        out.world_to_camera = w2c.transpose(1, 2).contiguous();

        // ==================== 投影矩阵 ====================
        const auto tan_half_fov_y = torch::tan(out.fov_y / 2.f);
        const auto tan_half_fov_x = torch::tan(out.fov_x / 2.f);

        const auto top = tan_half_fov_y * kZNear;
        const auto bottom = -top;
        const auto right = tan_half_fov_x * kZNear;
        const auto left = -right;

        auto P = torch::zeros({n, 4, 4}, f32);
        P.index_put_({Slice(), 0, 0}, 2.f * kZNear / (right - left));
        P.index_put_({Slice(), 1, 1}, 2.f * kZNear / (top - bottom));
        P.index_put_({Slice(), 0, 2}, (right + left) / (right - left));
        P.index_put_({Slice(), 1, 2}, (top + bottom) / (top - bottom));
        P.index_put_({Slice(), 3, 2}, kZSign);
        P.index_put_({Slice(), 2, 2}, kZSign * kZFar / (kZFar - kZNear));
        P.index_put_({Slice(), 2, 3}, -(kZFar * kZNear) / (kZFar - kZNear));
        out.projection = P.transpose(1, 2).contiguous();

        out.full_projection = out.world_to_camera.bmm(out.projection);

        // ==================== 相机中心 ====================
        out.camera_center = torch::linalg_inv(out.world_to_camera).index({Slice(), 3, Slice(0, 3)}).contiguous();

        return out;
    }

    Camera::Camera(const torch::Tensor& R,
                   const torch::Tensor& T,
                   float fx, float fy,
                   float cx, float cy,
                   int width, int height,
                   int appearance_id,
                   torch::Tensor distortion,
                   int camera_type,
                   std::string image_name,
                   std::filesystem::path image_path,
                   std::filesystem::path mask_path,
                   int uid)
        : _fx(fx),
          _fy(fy),
          _cx(cx),
          _cy(cy),
          _width(width),
          _height(height),
          _appearance_id(appearance_id),
          _camera_type(camera_type),
          _image_name(std::move(image_name)),
          _image_path(std::move(image_path)),
          _mask_path(std::move(mask_path)),
          _uid(uid) {
        require(R.defined() && R.dim() == 2 && R.size(0) == 3 && R.size(1) == 3,
                std::format("dimension mismatch: R must be [3, 3], got {}", shape_string(R)));
        require(T.defined() && T.numel() == 3,
                std::format("dimension mismatch: T must have 3 elements, got {}", shape_string(T)));
        require(fx > 0.f && fy > 0.f, std::format("focal lengths must be positive, got ({}, {})", fx, fy));
        require(width > 0 && height > 0, std::format("image size must be positive, got {}x{}", width, height));

        if (distortion.defined()) {
            require(distortion.numel() == 6,
                    std::format("dimension mismatch: distortion must have 6 elements, got {}", shape_string(distortion)));
            _distortion = distortion.reshape({6}).to(torch::kFloat32).cpu();
        } else {
            _distortion = torch::zeros({6}, torch::kFloat32);
        }

        _R = R.to(torch::kFloat32).cpu().contiguous();
        _T = T.reshape({3}).to(torch::kFloat32).cpu().contiguous();
        update_transforms();
    }

    void Camera::set_pose(const torch::Tensor& R, const torch::Tensor& T) {
        require(R.dim() == 2 && R.size(0) == 3 && R.size(1) == 3,
                std::format("dimension mismatch: R must be [3, 3], got {}", shape_string(R)));
        require(T.numel() == 3, std::format("dimension mismatch: T must have 3 elements, got {}", shape_string(T)));
        _R = R.to(torch::kFloat32).cpu().contiguous();
        _T = T.reshape({3}).to(torch::kFloat32).cpu().contiguous();
        update_transforms();
    }

    void Camera::set_intrinsics(float fx, float fy, float cx, float cy) {
        require(fx > 0.f && fy > 0.f, std::format("focal lengths must be positive, got ({}, {})", fx, fy));
        _fx = fx;
        _fy = fy;
        _cx = cx;
        _cy = cy;
        update_transforms();
    }

    void Camera::set_image_size(int width, int height) {
        require(width > 0 && height > 0, std::format("image size must be positive, got {}x{}", width, height));
        _width = width;
        _height = height;
        update_transforms();
    }

    void Camera::update_transforms() {
        const auto transforms = compute_camera_transforms(
            _R.unsqueeze(0),
            _T.unsqueeze(0),
            torch::tensor({_fx}),
            torch::tensor({_fy}),
            torch::tensor({static_cast<float>(_width)}),
            torch::tensor({static_cast<float>(_height)}));

        _fov_x = transforms.fov_x[0].item<float>();
        _fov_y = transforms.fov_y[0].item<float>();
        _world_view_transform = transforms.world_to_camera[0];
        _projection_matrix = transforms.projection[0];
        _full_proj_transform = transforms.full_projection[0];
        _camera_center = transforms.camera_center[0];
    }

    torch::Tensor Camera::K() const {
        auto K = torch::zeros({3, 3}, torch::kFloat32);
        K[0][0] = _fx;
        K[1][1] = _fy;
        K[0][2] = _cx;
        K[1][2] = _cy;
        K[2][2] = 1.f;
        return K;
    }

    /**
     * [功能描述]：读取并返回相机对应的图像
     * @details 图像尺寸与相机记录不一致时（缩放或下采样后的数据集），按比例更新内参
     */
    torch::Tensor Camera::load_and_get_image(int resize_factor) {
        auto image = image_io::load_image_tensor(_image_path, resize_factor);
        const int h = static_cast<int>(image.size(1));
        const int w = static_cast<int>(image.size(2));

        if (w != _width || h != _height) {
            const float sx = static_cast<float>(w) / static_cast<float>(_width);
            const float sy = static_cast<float>(h) / static_cast<float>(_height);
            LOG_TRACE("Rescaling camera {} from {}x{} to {}x{}", _image_name, _width, _height, w, h);
            _width = w;
            _height = h;
            set_intrinsics(_fx * sx, _fy * sy, _cx * sx, _cy * sy);
        }
        return image;
    }

    torch::Tensor Camera::load_mask(int resize_factor) const {
        if (_mask_path.empty()) {
            return {};
        }
        auto mask = image_io::load_image_tensor(_mask_path, resize_factor, /*channels=*/1);
        if (mask.size(1) != _height || mask.size(2) != _width) {
            mask = torch::nn::functional::interpolate(
                       mask.unsqueeze(0),
                       torch::nn::functional::InterpolateFuncOptions()
                           .size(std::vector<int64_t>{_height, _width})
                           .mode(torch::kNearest))
                       .squeeze(0);
        }
        // 掩码中值为0的像素不参与监督
        return mask[0] < 0.5f;
    }

    CameraBatch::CameraBatch(torch::Tensor R,
                             torch::Tensor T,
                             torch::Tensor fx,
                             torch::Tensor fy,
                             torch::Tensor cx,
                             torch::Tensor cy,
                             torch::Tensor width,
                             torch::Tensor height,
                             torch::Tensor appearance_ids,
                             torch::Tensor distortion,
                             torch::Tensor camera_types,
                             std::vector<std::string> image_names,
                             std::vector<std::filesystem::path> image_paths,
                             std::vector<std::filesystem::path> mask_paths) {
        // 在任何矩阵运算之前检查所有并行数组的长度
        require(R.defined() && R.dim() == 3 && R.size(1) == 3 && R.size(2) == 3,
                std::format("dimension mismatch: R must be [N, 3, 3], got {}", shape_string(R)));
        const int64_t n = R.size(0);
        const auto check_len = [n](const torch::Tensor& t, const char* name) {
            require(t.defined() && t.dim() >= 1 && t.size(0) == n,
                    std::format("dimension mismatch: {} has {} entries, expected {}", name,
                                t.defined() && t.dim() >= 1 ? t.size(0) : 0, n));
        };
        check_len(T, "T");
        check_len(fx, "fx");
        check_len(fy, "fy");
        check_len(cx, "cx");
        check_len(cy, "cy");
        check_len(width, "width");
        check_len(height, "height");
        check_len(appearance_ids, "appearance_ids");
        if (distortion.defined()) {
            check_len(distortion, "distortion");
            require(distortion.dim() == 2 && distortion.size(1) == 6,
                    std::format("dimension mismatch: distortion must be [{}, 6], got {}", n, shape_string(distortion)));
        } else {
            distortion = torch::zeros({n, 6}, torch::kFloat32);
        }
        if (camera_types.defined()) {
            check_len(camera_types, "camera_types");
        } else {
            camera_types = torch::zeros({n}, torch::kInt32);
        }
        const auto check_list = [n](size_t size, const char* name) {
            require(size == 0 || static_cast<int64_t>(size) == n,
                    std::format("dimension mismatch: {} has {} entries, expected {}", name, size, n));
        };
        check_list(image_names.size(), "image_names");
        check_list(image_paths.size(), "image_paths");
        check_list(mask_paths.size(), "mask_paths");

        _R = R.to(torch::kFloat32).cpu();
        _T = T.to(torch::kFloat32).cpu();
        _fx = fx.to(torch::kFloat32).cpu();
        _fy = fy.to(torch::kFloat32).cpu();
        _cx = cx.to(torch::kFloat32).cpu();
        _cy = cy.to(torch::kFloat32).cpu();
        _width = width.to(torch::kInt32).cpu();
        _height = height.to(torch::kInt32).cpu();
        _appearance_ids = appearance_ids.to(torch::kInt64).cpu();
        _distortion = distortion.to(torch::kFloat32).cpu();
        _camera_types = camera_types.to(torch::kInt32).cpu();
        _image_names = std::move(image_names);
        _image_paths = std::move(image_paths);
        _mask_paths = std::move(mask_paths);

        // 外观编号按最大编号归一化
        const auto ids = _appearance_ids.to(torch::kFloat32);
        const float max_id = n > 0 ? ids.max().item<float>() : 0.f;
        _normalized_appearance = max_id > 0.f ? ids / max_id : torch::zeros_like(ids);

        _transforms = compute_camera_transforms(_R, _T, _fx, _fy, _width, _height);
    }

    Camera CameraBatch::at(size_t index) const {
        if (index >= size()) {
            throw std::out_of_range(std::format("camera index {} out of range ({} cameras)", index, size()));
        }
        const auto i = static_cast<int64_t>(index);
        Camera cam(_R[i],
                   _T[i],
                   _fx[i].item<float>(),
                   _fy[i].item<float>(),
                   _cx[i].item<float>(),
                   _cy[i].item<float>(),
                   _width[i].item<int>(),
                   _height[i].item<int>(),
                   static_cast<int>(_appearance_ids[i].item<int64_t>()),
                   _distortion[i],
                   _camera_types[i].item<int>(),
                   _image_names.empty() ? std::format("{:05d}", index) : _image_names[index],
                   _image_paths.empty() ? std::filesystem::path{} : _image_paths[index],
                   _mask_paths.empty() ? std::filesystem::path{} : _mask_paths[index],
                   static_cast<int>(index));
        cam.set_normalized_appearance(_normalized_appearance[i].item<float>());
        return cam;
    }

    CameraBatch CameraBatch::select(const std::vector<int64_t>& indices) const {
        const auto idx = torch::tensor(indices, torch::kInt64);
        std::vector<std::string> names;
        std::vector<std::filesystem::path> images;
        std::vector<std::filesystem::path> masks;
        for (const auto i : indices) {
            if (!_image_names.empty())
                names.push_back(_image_names[i]);
            if (!_image_paths.empty())
                images.push_back(_image_paths[i]);
            if (!_mask_paths.empty())
                masks.push_back(_mask_paths[i]);
        }

        CameraBatch out(_R.index_select(0, idx),
                        _T.index_select(0, idx),
                        _fx.index_select(0, idx),
                        _fy.index_select(0, idx),
                        _cx.index_select(0, idx),
                        _cy.index_select(0, idx),
                        _width.index_select(0, idx),
                        _height.index_select(0, idx),
                        _appearance_ids.index_select(0, idx),
                        _distortion.index_select(0, idx),
                        _camera_types.index_select(0, idx),
                        std::move(names),
                        std::move(images),
                        std::move(masks));
        // 子批次沿用全集的归一化结果
        out._normalized_appearance = _normalized_appearance.index_select(0, idx);
        return out;
    }

    std::vector<std::shared_ptr<Camera>> CameraBatch::to_cameras() const {
        std::vector<std::shared_ptr<Camera>> cameras;
        cameras.reserve(size());
        for (size_t i = 0; i < size(); ++i) {
            cameras.push_back(std::make_shared<Camera>(at(i)));
        }
        return cameras;
    }

    int CameraBatch::max_appearance_id() const {
        if (empty()) {
            return 0;
        }
        return static_cast<int>(_appearance_ids.max().item<int64_t>());
    }

} // namespace appsplat
