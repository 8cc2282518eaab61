#include "appsplat/image_io.hpp"

#define STB_IMAGE_IMPLEMENTATION
#include <stb_image.h>
#define STB_IMAGE_WRITE_IMPLEMENTATION
#include <stb_image_write.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <format>
#include <stdexcept>

namespace appsplat::image_io {

    std::tuple<unsigned char*, int, int, int> load_image(const std::filesystem::path& path,
                                                         int resize_factor,
                                                         int desired_channels) {
        if (!std::filesystem::exists(path)) {
            throw std::runtime_error(std::format("Image file does not exist: {}", path.string()));
        }

        int w = 0, h = 0, c = 0;
        unsigned char* data = stbi_load(path.string().c_str(), &w, &h, &c, desired_channels);
        if (data == nullptr) {
            throw std::runtime_error(std::format("Failed to load image {}: {}", path.string(), stbi_failure_reason()));
        }
        c = desired_channels;

        if (resize_factor <= 1) {
            return {data, w, h, c};
        }

        // 盒式滤波下采样，每个输出像素取resize_factor x resize_factor块的均值
        const int new_w = std::max(1, w / resize_factor);
        const int new_h = std::max(1, h / resize_factor);
        auto* resized = static_cast<unsigned char*>(std::malloc(static_cast<size_t>(new_w) * new_h * c));
        if (resized == nullptr) {
            stbi_image_free(data);
            throw std::runtime_error(std::format("Out of memory while resizing {}", path.string()));
        }

        for (int y = 0; y < new_h; ++y) {
            for (int x = 0; x < new_w; ++x) {
                for (int ch = 0; ch < c; ++ch) {
                    int sum = 0, count = 0;
                    for (int dy = 0; dy < resize_factor && y * resize_factor + dy < h; ++dy) {
                        for (int dx = 0; dx < resize_factor && x * resize_factor + dx < w; ++dx) {
                            const int sx = x * resize_factor + dx;
                            const int sy = y * resize_factor + dy;
                            sum += data[(static_cast<size_t>(sy) * w + sx) * c + ch];
                            ++count;
                        }
                    }
                    resized[(static_cast<size_t>(y) * new_w + x) * c + ch] =
                        static_cast<unsigned char>(sum / std::max(count, 1));
                }
            }
        }

        stbi_image_free(data);
        return {resized, new_w, new_h, c};
    }

    void free_image(unsigned char* image) {
        stbi_image_free(image);
    }

    torch::Tensor load_image_tensor(const std::filesystem::path& path, int resize_factor, int channels) {
        auto [data, w, h, c] = load_image(path, resize_factor, channels);

        // from_blob不拥有内存，clone后立即释放stb缓冲区
        auto image = torch::from_blob(data, {h, w, c}, {w * c, c, 1}, torch::kUInt8)
                         .permute({2, 0, 1})
                         .to(torch::kFloat32)
                         .div(255.f)
                         .contiguous()
                         .clone();
        free_image(data);
        return image;
    }

    void save_image(const std::filesystem::path& path, torch::Tensor image) {
        image = image.detach().to(torch::kCPU);
        if (image.dim() == 4) {
            image = image.squeeze(0);
        }
        TORCH_CHECK(image.dim() == 3, "save_image expects a 3D tensor, got ", image.dim(), "D");
        if (image.size(0) == 3 || image.size(0) == 1) {
            image = image.permute({1, 2, 0});
        }
        image = (image.clamp(0.f, 1.f) * 255.f).round().to(torch::kUInt8).contiguous();

        const int h = static_cast<int>(image.size(0));
        const int w = static_cast<int>(image.size(1));
        const int c = static_cast<int>(image.size(2));

        if (path.has_parent_path()) {
            std::filesystem::create_directories(path.parent_path());
        }

        auto ext = path.extension().string();
        std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char ch) { return std::tolower(ch); });

        int ok = 0;
        if (ext == ".jpg" || ext == ".jpeg") {
            ok = stbi_write_jpg(path.string().c_str(), w, h, c, image.data_ptr<uint8_t>(), 95);
        } else {
            ok = stbi_write_png(path.string().c_str(), w, h, c, image.data_ptr<uint8_t>(), w * c);
        }
        if (!ok) {
            throw std::runtime_error(std::format("Failed to write image {}", path.string()));
        }
    }

} // namespace appsplat::image_io
