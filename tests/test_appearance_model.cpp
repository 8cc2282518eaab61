#include <filesystem>
#include <gtest/gtest.h>
#include <torch/torch.h>

#include "training/components/appearance_model.hpp"

using appsplat::training::AppearanceDatasetStats;
using appsplat::training::AppearanceModel;

namespace {

    appsplat::param::AppearanceModelParameters small_config() {
        appsplat::param::AppearanceModelParameters config;
        config.n_gaussian_feature_dims = 8;
        config.n_appearance_embedding_dims = 4;
        config.n_neurons = 16;
        config.n_layers = 3;
        return config;
    }

} // namespace

TEST(AppearanceModelTest, SizesTableFromMaxAppearanceId) {
    AppearanceModel model(small_config());
    model.configure(AppearanceDatasetStats{.max_appearance_id = 6});
    EXPECT_EQ(model.n_appearances(), 7);

    model.allocate_parameters(torch::kCPU);
    ASSERT_EQ(model.embedding_parameters().size(), 1u);
    EXPECT_EQ(model.embedding_parameters()[0].size(0), 7);
    EXPECT_EQ(model.embedding_parameters()[0].size(1), 4);
}

TEST(AppearanceModelTest, ExplicitCountIsKept) {
    auto config = small_config();
    config.n_appearances = 20;
    AppearanceModel model(config);
    model.configure(AppearanceDatasetStats{.max_appearance_id = 3});
    EXPECT_EQ(model.n_appearances(), 20);
}

TEST(AppearanceModelTest, ConfigureTwiceThrows) {
    AppearanceModel model(small_config());
    model.configure(AppearanceDatasetStats{.max_appearance_id = 1});
    EXPECT_THROW(model.configure(AppearanceDatasetStats{.max_appearance_id = 1}), std::logic_error);
}

TEST(AppearanceModelTest, AllocateBeforeConfigureThrows) {
    AppearanceModel model(small_config());
    EXPECT_THROW(model.allocate_parameters(torch::kCPU), std::logic_error);
}

TEST(AppearanceModelTest, ForwardOutputsUnitRangeColors) {
    AppearanceModel model(small_config());
    model.configure(AppearanceDatasetStats{.max_appearance_id = 2});
    model.allocate_parameters(torch::kCPU);

    const auto features = torch::randn({5, 8});
    const auto out = model.forward(features, 2, torch::Tensor());
    ASSERT_EQ(out.sizes(), (std::vector<int64_t>{5, 3}));
    EXPECT_GE(out.min().item<float>(), 0.f);
    EXPECT_LE(out.max().item<float>(), 1.f);

    EXPECT_THROW(model.forward(features, 3, torch::Tensor()), c10::Error);
    EXPECT_THROW(model.forward(torch::randn({5, 7}), 0, torch::Tensor()), c10::Error);
}

TEST(AppearanceModelTest, ViewDependentWithSkipLayerAndNormalization) {
    auto config = small_config();
    config.is_view_dependent = true;
    config.n_view_direction_frequencies = 2;
    config.skip_layers = {2};
    config.normalize = true;
    AppearanceModel model(config);
    model.configure(AppearanceDatasetStats{.max_appearance_id = 0});
    model.allocate_parameters(torch::kCPU);

    EXPECT_EQ(model.n_input_dims(), 8 + 4 + 3 + 12);

    const auto dirs = torch::nn::functional::normalize(torch::randn({4, 3}),
                                                       torch::nn::functional::NormalizeFuncOptions().dim(-1));
    const auto out = model.forward(torch::randn({4, 8}), 0, dirs);
    EXPECT_EQ(out.size(0), 4);

    EXPECT_THROW(model.forward(torch::randn({4, 8}), 0, torch::Tensor()), c10::Error);
}

TEST(AppearanceModelTest, PositionalEncodingChannels) {
    const auto x = torch::tensor({{0.5f, -1.0f, 0.25f}});
    const auto encoded = appsplat::training::positional_encoding(x, 3);
    ASSERT_EQ(encoded.size(1), 3 + 6 * 3);

    using torch::indexing::Slice;
    EXPECT_TRUE(torch::allclose(encoded.index({Slice(), Slice(0, 3)}), x));
    EXPECT_TRUE(torch::allclose(encoded.index({Slice(), Slice(3, 6)}), torch::sin(x)));
    EXPECT_TRUE(torch::allclose(encoded.index({Slice(), Slice(18, 21)}), torch::cos(x * 4.f)));
}

TEST(AppearanceModelTest, EmbeddingRoundTripsThroughCheckpoint) {
    AppearanceModel model(small_config());
    model.configure(AppearanceDatasetStats{.max_appearance_id = 4});
    model.allocate_parameters(torch::kCPU);

    const auto path = std::filesystem::temp_directory_path() / "appsplat_embedding_roundtrip" / "appearance_embedding.pt";
    model.save_embedding(path);
    ASSERT_TRUE(std::filesystem::exists(path));
    EXPECT_FALSE(std::filesystem::exists(path.string() + ".tmp"));

    auto config = small_config();
    config.n_appearances = 2;
    AppearanceModel restored(config);
    restored.load_embedding(path, torch::kCPU);

    EXPECT_EQ(restored.n_appearances(), 5);
    EXPECT_TRUE(torch::equal(restored.embedding_parameters()[0], model.embedding_parameters()[0]));

    const auto features = torch::randn({3, 8});
    EXPECT_TRUE(torch::allclose(restored.forward(features, 4, torch::Tensor()),
                                model.forward(features, 4, torch::Tensor())));

    std::filesystem::remove_all(path.parent_path());
}
