#include "spherical_harmonics.hpp"

namespace appsplat::training {
    using torch::indexing::Slice;

    namespace {
        constexpr float SH_C0 = 0.28209479177387814f;
        constexpr float SH_C1 = 0.4886025119029199f;
        constexpr float SH_C2[] = {
            1.0925484305920792f,
            -1.0925484305920792f,
            0.31539156525252005f,
            -1.0925484305920792f,
            0.5462742152960396f};
        constexpr float SH_C3[] = {
            -0.5900435899266435f,
            2.890611442640554f,
            -0.4570457994644658f,
            0.3731763325901154f,
            -0.4570457994644658f,
            1.445305721320277f,
            -0.5900435899266435f};
    } // namespace

    torch::Tensor spherical_harmonics(int sh_degree,
                                      const torch::Tensor& dirs,
                                      const torch::Tensor& coeffs) {
        TORCH_CHECK(sh_degree >= 0 && sh_degree <= 3, "SH degree must be in [0, 3], got ", sh_degree);
        TORCH_CHECK((sh_degree + 1) * (sh_degree + 1) <= coeffs.size(-2),
                    "coeffs K dimension must be at least ", (sh_degree + 1) * (sh_degree + 1),
                    ", got ", coeffs.size(-2));
        TORCH_CHECK(dirs.dim() == 2 && dirs.size(-1) == 3, "dirs must be [N, 3], got ", dirs.sizes());
        TORCH_CHECK(coeffs.dim() == 3 && coeffs.size(0) == dirs.size(0) && coeffs.size(-1) == 3,
                    "coeffs must be [", dirs.size(0), ", K, 3], got ", coeffs.sizes());

        auto sh = [&coeffs](int i) { return coeffs.index({Slice(), i}); };

        auto result = SH_C0 * sh(0);
        if (sh_degree == 0) {
            return result;
        }

        const auto x = dirs.index({Slice(), Slice(0, 1)});
        const auto y = dirs.index({Slice(), Slice(1, 2)});
        const auto z = dirs.index({Slice(), Slice(2, 3)});

        result = result - SH_C1 * y * sh(1) + SH_C1 * z * sh(2) - SH_C1 * x * sh(3);
        if (sh_degree == 1) {
            return result;
        }

        const auto xx = x * x, yy = y * y, zz = z * z;
        const auto xy = x * y, yz = y * z, xz = x * z;
        result = result +
                 SH_C2[0] * xy * sh(4) +
                 SH_C2[1] * yz * sh(5) +
                 SH_C2[2] * (2.0f * zz - xx - yy) * sh(6) +
                 SH_C2[3] * xz * sh(7) +
                 SH_C2[4] * (xx - yy) * sh(8);
        if (sh_degree == 2) {
            return result;
        }

        result = result +
                 SH_C3[0] * y * (3.0f * xx - yy) * sh(9) +
                 SH_C3[1] * xy * z * sh(10) +
                 SH_C3[2] * y * (4.0f * zz - xx - yy) * sh(11) +
                 SH_C3[3] * z * (2.0f * zz - 3.0f * xx - 3.0f * yy) * sh(12) +
                 SH_C3[4] * x * (4.0f * zz - xx - yy) * sh(13) +
                 SH_C3[5] * z * (xx - yy) * sh(14) +
                 SH_C3[6] * x * (xx - 3.0f * yy) * sh(15);
        return result;
    }

} // namespace appsplat::training
