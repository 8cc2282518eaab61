#include "colmap_loader.hpp"
#include "appsplat/logger.hpp"
#include <algorithm>
#include <cmath>
#include <cstring>
#include <format>
#include <fstream>
#include <memory>
#include <print>
#include <stdexcept>
#include <tinyply.h>

namespace appsplat::loader {

    namespace fs = std::filesystem;

    namespace {
        // 各相机模型的参数个数
        const std::unordered_map<int32_t, int32_t> kModelParamCounts = {
            {0, 3}, {1, 4}, {2, 4}, {3, 5}, {4, 8}, {5, 8},
            {6, 12}, {7, 5}, {8, 4}, {9, 5}, {10, 12}};

        /**
         * @class BinaryReader
         * @brief 对整块文件缓冲区的顺序读取，越界时抛出异常
         */
        class BinaryReader {
        public:
            explicit BinaryReader(const fs::path& path)
                : _path(path) {
                LOG_TRACE("Reading binary file: {}", path.string());
                std::ifstream f(path, std::ios::binary | std::ios::ate);
                if (!f) {
                    throw std::runtime_error(std::format("Failed to open {}", path.string()));
                }
                const auto sz = static_cast<std::streamsize>(f.tellg());
                _buffer.resize(static_cast<size_t>(sz));
                f.seekg(0, std::ios::beg);
                f.read(_buffer.data(), sz);
                if (!f) {
                    throw std::runtime_error(std::format("Short read on {}", path.string()));
                }
                _cur = _buffer.data();
                _end = _cur + _buffer.size();
            }

            template <typename T>
            T read() {
                require(sizeof(T));
                T v;
                std::memcpy(&v, _cur, sizeof(T));
                _cur += sizeof(T);
                return v;
            }

            std::string read_string() {
                const char* terminator = static_cast<const char*>(std::memchr(_cur, '\0', _end - _cur));
                if (!terminator) {
                    throw std::runtime_error(std::format("{}: unterminated string", _path.filename().string()));
                }
                std::string s(_cur, terminator);
                _cur = terminator + 1;
                return s;
            }

            void skip(uint64_t bytes) {
                require(bytes);
                _cur += bytes;
            }

            void expect_end() const {
                if (_cur != _end) {
                    throw std::runtime_error(std::format("{}: trailing bytes", _path.filename().string()));
                }
            }

        private:
            void require(uint64_t bytes) const {
                if (static_cast<uint64_t>(_end - _cur) < bytes) {
                    throw std::runtime_error(std::format("{}: unexpected end of file", _path.filename().string()));
                }
            }

            fs::path _path;
            std::vector<char> _buffer;
            const char* _cur = nullptr;
            const char* _end = nullptr;
        };
    } // namespace

    std::string camera_model_name(int32_t model_id) {
        switch (static_cast<CameraModel>(model_id)) {
        case CameraModel::SIMPLE_PINHOLE: return "SIMPLE_PINHOLE";
        case CameraModel::PINHOLE: return "PINHOLE";
        case CameraModel::SIMPLE_RADIAL: return "SIMPLE_RADIAL";
        case CameraModel::RADIAL: return "RADIAL";
        case CameraModel::OPENCV: return "OPENCV";
        case CameraModel::OPENCV_FISHEYE: return "OPENCV_FISHEYE";
        case CameraModel::FULL_OPENCV: return "FULL_OPENCV";
        case CameraModel::FOV: return "FOV";
        case CameraModel::SIMPLE_RADIAL_FISHEYE: return "SIMPLE_RADIAL_FISHEYE";
        case CameraModel::RADIAL_FISHEYE: return "RADIAL_FISHEYE";
        case CameraModel::THIN_PRISM_FISHEYE: return "THIN_PRISM_FISHEYE";
        }
        return std::format("UNKNOWN({})", model_id);
    }

    std::unordered_map<uint32_t, ColmapCamera> read_cameras_binary(const fs::path& file_path) {
        LOG_TIMER_TRACE("Read cameras.bin");
        BinaryReader reader(file_path);

        const auto n_cams = reader.read<uint64_t>();
        LOG_DEBUG("Reading {} cameras from binary file", n_cams);

        std::unordered_map<uint32_t, ColmapCamera> cams;
        cams.reserve(n_cams);
        for (uint64_t i = 0; i < n_cams; ++i) {
            ColmapCamera cam;
            cam.camera_id = reader.read<uint32_t>();
            cam.model_id = reader.read<int32_t>();
            cam.width = reader.read<uint64_t>();
            cam.height = reader.read<uint64_t>();

            const auto it = kModelParamCounts.find(cam.model_id);
            if (it == kModelParamCounts.end()) {
                throw std::runtime_error(std::format("Unsupported camera-model id {}", cam.model_id));
            }
            cam.params.resize(it->second);
            for (auto& p : cam.params) {
                p = reader.read<double>();
            }
            cams.emplace(cam.camera_id, std::move(cam));
        }
        reader.expect_end();
        return cams;
    }

    std::vector<ColmapImage> read_images_binary(const fs::path& file_path) {
        LOG_TIMER_TRACE("Read images.bin");
        BinaryReader reader(file_path);

        const auto n_images = reader.read<uint64_t>();
        LOG_DEBUG("Reading {} images from binary file", n_images);

        std::vector<ColmapImage> images;
        images.reserve(n_images);
        for (uint64_t i = 0; i < n_images; ++i) {
            auto& img = images.emplace_back();
            img.image_id = reader.read<uint32_t>();
            for (auto& q : img.qvec)
                q = reader.read<double>();
            for (auto& t : img.tvec)
                t = reader.read<double>();
            img.camera_id = reader.read<uint32_t>();
            img.name = reader.read_string();

            // 2D观测：x, y (f64) + point3D_id (i64)
            const auto npts = reader.read<uint64_t>();
            reader.skip(npts * (sizeof(double) * 2 + sizeof(int64_t)));
        }
        reader.expect_end();

        std::sort(images.begin(), images.end(),
                  [](const ColmapImage& a, const ColmapImage& b) { return a.image_id < b.image_id; });
        return images;
    }

    PointCloud read_points3D_binary(const fs::path& file_path) {
        LOG_TIMER_TRACE("Read points3D.bin");
        BinaryReader reader(file_path);

        const auto N = reader.read<uint64_t>();
        LOG_DEBUG("Reading {} 3D points from binary file", N);

        std::vector<float> positions(N * 3);
        std::vector<uint8_t> colors(N * 3);
        for (uint64_t i = 0; i < N; ++i) {
            reader.skip(sizeof(uint64_t)); // point id
            for (int k = 0; k < 3; ++k)
                positions[i * 3 + k] = static_cast<float>(reader.read<double>());
            for (int k = 0; k < 3; ++k)
                colors[i * 3 + k] = reader.read<uint8_t>();
            reader.skip(sizeof(double)); // reprojection error
            const auto track_length = reader.read<uint64_t>();
            reader.skip(track_length * sizeof(int32_t) * 2);
        }
        reader.expect_end();

        PointCloud pc;
        const auto n = static_cast<int64_t>(N);
        pc.means = torch::from_blob(positions.data(), {n, 3}, torch::kFloat32).clone();
        pc.colors = torch::from_blob(colors.data(), {n, 3}, torch::kUInt8).clone();
        return pc;
    }

    void write_point_cloud_ply(const fs::path& file_path, const PointCloud& point_cloud) {
        const auto means = point_cloud.means.to(torch::kCPU).to(torch::kFloat32).contiguous();
        const auto normals = torch::zeros_like(means);
        const auto colors = point_cloud.colors.defined()
                                ? point_cloud.colors.to(torch::kCPU).to(torch::kUInt8).contiguous()
                                : torch::full({means.size(0), 3}, 128, torch::kUInt8);
        const auto count = static_cast<size_t>(means.size(0));

        tinyply::PlyFile ply;
        ply.add_properties_to_element("vertex", {"x", "y", "z"}, tinyply::Type::FLOAT32, count,
                                      reinterpret_cast<uint8_t*>(means.data_ptr<float>()),
                                      tinyply::Type::INVALID, 0);
        ply.add_properties_to_element("vertex", {"nx", "ny", "nz"}, tinyply::Type::FLOAT32, count,
                                      reinterpret_cast<uint8_t*>(normals.data_ptr<float>()),
                                      tinyply::Type::INVALID, 0);
        ply.add_properties_to_element("vertex", {"red", "green", "blue"}, tinyply::Type::UINT8, count,
                                      colors.data_ptr<uint8_t>(),
                                      tinyply::Type::INVALID, 0);

        std::filebuf fb;
        if (!fb.open(file_path, std::ios::out | std::ios::binary)) {
            throw std::runtime_error(std::format("Failed to open {} for writing", file_path.string()));
        }
        std::ostream out_stream(&fb);
        ply.write(out_stream, /*binary=*/true);
        out_stream.flush();
        if (!out_stream) {
            throw std::runtime_error(std::format("Failed to write {}", file_path.string()));
        }
    }

    PointCloud read_point_cloud_ply(const fs::path& file_path) {
        std::ifstream file(file_path, std::ios::binary);
        if (!file) {
            throw std::runtime_error(std::format("Failed to open {}", file_path.string()));
        }

        tinyply::PlyFile ply;
        ply.parse_header(file);

        auto vertices = ply.request_properties_from_element("vertex", {"x", "y", "z"});
        auto rgb = ply.request_properties_from_element("vertex", {"red", "green", "blue"});
        ply.read(file);

        if (vertices->t != tinyply::Type::FLOAT32 || rgb->t != tinyply::Type::UINT8) {
            throw std::runtime_error(std::format("{}: expected float xyz and uchar rgb", file_path.string()));
        }

        const auto n = static_cast<int64_t>(vertices->count);
        PointCloud pc;
        pc.means = torch::from_blob(vertices->buffer.get(), {n, 3}, torch::kFloat32).clone();
        pc.colors = torch::from_blob(rgb->buffer.get(), {n, 3}, torch::kUInt8).clone();
        return pc;
    }

    torch::Tensor qvec2rotmat(const std::array<double, 4>& qraw) {
        const double norm = std::sqrt(qraw[0] * qraw[0] + qraw[1] * qraw[1] +
                                      qraw[2] * qraw[2] + qraw[3] * qraw[3]);
        const double w = qraw[0] / norm, x = qraw[1] / norm, y = qraw[2] / norm, z = qraw[3] / norm;

        return torch::tensor({1 - 2 * (y * y + z * z), 2 * (x * y - z * w), 2 * (x * z + y * w),
                              2 * (x * y + z * w), 1 - 2 * (x * x + z * z), 2 * (y * z - x * w),
                              2 * (x * z - y * w), 2 * (y * z + x * w), 1 - 2 * (x * x + y * y)},
                             torch::kFloat64)
            .reshape({3, 3})
            .to(torch::kFloat32);
    }

    fs::path detect_sparse_model_dir(const fs::path& data_path) {
        if (fs::is_directory(data_path / "sparse" / "0")) {
            return data_path / "sparse" / "0";
        }
        return data_path / "sparse";
    }

    std::pair<torch::Tensor, float> compute_nerfpp_norm(const torch::Tensor& R, const torch::Tensor& T) {
        // 相机中心 C = −Rᵀ·T
        const auto centers = -torch::bmm(R.transpose(1, 2), T.unsqueeze(-1)).squeeze(-1); // [N, 3]
        const auto avg = centers.mean(0);
        const auto dist = (centers - avg).norm(2, 1);
        const float diagonal = dist.max().item<float>();
        return {avg, diagonal * 1.1f};
    }

    std::pair<std::vector<int64_t>, std::vector<int64_t>> split_indices(size_t num_images, int eval_step) {
        std::vector<int64_t> train, validation;
        if (eval_step > 1) {
            for (size_t i = 0; i < num_images; ++i) {
                if (i % static_cast<size_t>(eval_step) == 0) {
                    validation.push_back(static_cast<int64_t>(i));
                } else {
                    train.push_back(static_cast<int64_t>(i));
                }
            }
        } else {
            for (size_t i = 0; i < num_images; ++i) {
                train.push_back(static_cast<int64_t>(i));
            }
            validation.push_back(0);
        }
        return {train, validation};
    }

    std::expected<LoadedScene, std::string> load_colmap(const param::DatasetConfig& config) {
        LOG_TIMER("COLMAP loading");
        try {
            if (!fs::exists(config.data_path)) {
                return std::unexpected(std::format("Data path does not exist: {}", config.data_path.string()));
            }

            const auto sparse_dir = detect_sparse_model_dir(config.data_path);
            const auto image_dir = config.data_path / config.images;
            LOG_INFO("Loading COLMAP model from {}", sparse_dir.string());

            const auto cameras = read_cameras_binary(sparse_dir / "cameras.bin");
            const auto images = read_images_binary(sparse_dir / "images.bin");
            if (images.empty()) {
                return std::unexpected(std::format("{} contains no images", (sparse_dir / "images.bin").string()));
            }

            // 点云缓存
            const auto ply_path = sparse_dir / "points3D.ply";
            if (!fs::exists(ply_path)) {
                std::println("Converting points3D.bin to ply format");
                const auto points = read_points3D_binary(sparse_dir / "points3D.bin");
                auto tmp_path = ply_path;
                tmp_path += ".tmp";
                write_point_cloud_ply(tmp_path, points);
                fs::rename(tmp_path, ply_path);
            }

            const auto n = static_cast<int64_t>(images.size());
            auto R = torch::empty({n, 3, 3}, torch::kFloat32);
            auto T = torch::empty({n, 3}, torch::kFloat32);
            std::vector<float> fx(n), fy(n), cx(n), cy(n);
            std::vector<int32_t> width(n), height(n), appearance(n);
            std::vector<std::string> names;
            std::vector<fs::path> image_paths, mask_paths;

            for (int64_t idx = 0; idx < n; ++idx) {
                const auto& extrinsics = images[idx];
                const auto cam_it = cameras.find(extrinsics.camera_id);
                if (cam_it == cameras.end()) {
                    return std::unexpected(std::format("Image {} references unknown camera {}",
                                                       extrinsics.name, extrinsics.camera_id));
                }
                const auto& intrinsics = cam_it->second;

                switch (static_cast<CameraModel>(intrinsics.model_id)) {
                case CameraModel::SIMPLE_PINHOLE:
                    fx[idx] = static_cast<float>(intrinsics.params[0]);
                    fy[idx] = fx[idx];
                    cx[idx] = static_cast<float>(intrinsics.params[1]);
                    cy[idx] = static_cast<float>(intrinsics.params[2]);
                    break;
                case CameraModel::PINHOLE:
                    fx[idx] = static_cast<float>(intrinsics.params[0]);
                    fy[idx] = static_cast<float>(intrinsics.params[1]);
                    cx[idx] = static_cast<float>(intrinsics.params[2]);
                    cy[idx] = static_cast<float>(intrinsics.params[3]);
                    break;
                default:
                    return std::unexpected(std::format(
                        "COLMAP camera model not handled: {} (only undistorted PINHOLE or SIMPLE_PINHOLE datasets are supported)",
                        camera_model_name(intrinsics.model_id)));
                }

                R[idx].copy_(qvec2rotmat(extrinsics.qvec));
                T[idx].copy_(torch::tensor({extrinsics.tvec[0], extrinsics.tvec[1], extrinsics.tvec[2]}, torch::kFloat64));
                width[idx] = static_cast<int32_t>(intrinsics.width);
                height[idx] = static_cast<int32_t>(intrinsics.height);
                appearance[idx] = static_cast<int32_t>(extrinsics.camera_id);

                fs::path mask_path;
                if (!config.mask_dir.empty()) {
                    const auto candidate = config.mask_dir / std::format("{}.png", extrinsics.name);
                    if (fs::exists(candidate)) {
                        mask_path = candidate;
                    }
                }

                names.push_back(extrinsics.name);
                image_paths.push_back(image_dir / extrinsics.name);
                mask_paths.push_back(mask_path);
            }

            const auto [center, extent] = compute_nerfpp_norm(R, T);

            const auto to_tensor = [](auto& v, torch::Dtype dtype) {
                return torch::from_blob(v.data(), {static_cast<int64_t>(v.size())}, dtype).clone();
            };
            CameraBatch all(R, T,
                            to_tensor(fx, torch::kFloat32), to_tensor(fy, torch::kFloat32),
                            to_tensor(cx, torch::kFloat32), to_tensor(cy, torch::kFloat32),
                            to_tensor(width, torch::kInt32), to_tensor(height, torch::kInt32),
                            to_tensor(appearance, torch::kInt32),
                            {}, {},
                            names, image_paths, mask_paths);

            const auto [train_idx, val_idx] = split_indices(images.size(), config.eval_step);

            LoadedScene scene;
            scene.train = all.select(train_idx);
            scene.validation = all.select(val_idx);
            scene.point_cloud = read_point_cloud_ply(ply_path);
            scene.camera_extent = extent;
            scene.scene_center = center;
            scene.max_appearance_id = all.max_appearance_id();

            LOG_INFO("Loaded {} images ({} train, {} validation), {} points, camera extent {:.4f}",
                     n, scene.train.size(), scene.validation.size(), scene.point_cloud.size(), extent);
            return scene;
        } catch (const std::exception& e) {
            return std::unexpected(std::format("Failed to load COLMAP dataset: {}", e.what()));
        }
    }

} // namespace appsplat::loader
