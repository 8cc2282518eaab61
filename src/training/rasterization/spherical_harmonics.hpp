#pragma once

#include <torch/torch.h>

namespace appsplat::training {

    /**
     * [功能描述]：计算球谐函数颜色（实数SH，最高3阶）
     * @param sh_degree [参数说明]：使用的阶数，0-3
     * @param dirs [参数说明]：[N, 3] 归一化方向
     * @param coeffs [参数说明]：[N, K, 3]，K >= (sh_degree + 1)^2
     * @return [返回值说明]：[N, 3]，未加0.5偏移、未截断
     */
    torch::Tensor spherical_harmonics(int sh_degree,
                                      const torch::Tensor& dirs,
                                      const torch::Tensor& coeffs);

} // namespace appsplat::training
