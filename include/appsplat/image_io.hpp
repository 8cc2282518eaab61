#pragma once

#include <filesystem>
#include <torch/torch.h>
#include <tuple>

namespace appsplat::image_io {

    /**
     * [功能描述]：读取图像文件
     * @param path [参数说明]：图像路径
     * @param resize_factor [参数说明]：下采样因子，<=1时保持原尺寸
     * @return [返回值说明]：(像素数据, 宽度, 高度, 通道数)，像素数据需要用free_image释放
     * @throws std::runtime_error 文件不存在或无法解码
     */
    std::tuple<unsigned char*, int, int, int> load_image(const std::filesystem::path& path,
                                                         int resize_factor = -1,
                                                         int desired_channels = 3);

    void free_image(unsigned char* image);

    /**
     * [功能描述]：读取图像并转换为 [C, H, W] 的float张量，值域[0, 1]
     */
    torch::Tensor load_image_tensor(const std::filesystem::path& path,
                                    int resize_factor = -1,
                                    int channels = 3);

    /**
     * [功能描述]：保存 [3, H, W] 或 [H, W, 3] 的float图像，按扩展名选择PNG或JPG
     */
    void save_image(const std::filesystem::path& path, torch::Tensor image);

} // namespace appsplat::image_io
