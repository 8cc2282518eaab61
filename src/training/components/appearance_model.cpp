#include "appearance_model.hpp"
#include "appsplat/logger.hpp"

#include <algorithm>
#include <format>
#include <stdexcept>

namespace appsplat::training {
    namespace F = torch::nn::functional;

    torch::Tensor positional_encoding(const torch::Tensor& x, int n_frequencies) {
        std::vector<torch::Tensor> encoded{x};
        encoded.reserve(1 + 2 * n_frequencies);
        for (int i = 0; i < n_frequencies; ++i) {
            const float freq = static_cast<float>(1 << i);
            encoded.push_back(torch::sin(x * freq));
            encoded.push_back(torch::cos(x * freq));
        }
        return torch::cat(encoded, -1);
    }

    AppearanceModel::AppearanceModel(param::AppearanceModelParameters config)
        : config_(std::move(config)) {
    }

    int AppearanceModel::n_input_dims() const {
        int n = config_.n_gaussian_feature_dims + config_.n_appearance_embedding_dims;
        if (config_.is_view_dependent) {
            n += 3 + 6 * config_.n_view_direction_frequencies;
        }
        return n;
    }

    void AppearanceModel::configure(const AppearanceDatasetStats& stats) {
        if (configured_) {
            throw std::logic_error("AppearanceModel::configure() must be called exactly once");
        }
        if (config_.n_appearances <= 0) {
            config_.n_appearances = std::max(stats.max_appearance_id, 0) + 1;
        }
        configured_ = true;
        LOG_DEBUG("Appearance model configured with {} appearance embeddings", config_.n_appearances);
    }

    void AppearanceModel::allocate_parameters(const torch::Device& device) {
        if (!configured_) {
            throw std::logic_error("AppearanceModel::allocate_parameters() called before configure()");
        }
        if (allocated_) {
            throw std::logic_error("AppearanceModel parameters are already allocated");
        }
        build_network(device);
    }

    void AppearanceModel::restore(const torch::Tensor& embedding_table, const torch::Device& device) {
        TORCH_CHECK(embedding_table.dim() == 2 && embedding_table.size(1) == config_.n_appearance_embedding_dims,
                    "embedding table must be [n, ", config_.n_appearance_embedding_dims, "], got ", embedding_table.sizes());
        if (allocated_) {
            throw std::logic_error("AppearanceModel parameters are already allocated");
        }

        // 嵌入表行数以保存的数据为准
        config_.n_appearances = static_cast<int>(embedding_table.size(0));
        configured_ = true;
        build_network(device);

        torch::NoGradGuard no_grad;
        embedding_->weight.copy_(embedding_table.to(device));
    }

    void AppearanceModel::build_network(const torch::Device& device) {
        const int n_in = n_input_dims();
        const int n_neurons = config_.n_neurons;

        embedding_ = register_module("embedding",
                                     torch::nn::Embedding(config_.n_appearances, config_.n_appearance_embedding_dims));

        hidden_layers_ = register_module("hidden_layers", torch::nn::ModuleList());
        for (int i = 0; i < config_.n_layers; ++i) {
            const bool is_skip = std::ranges::find(config_.skip_layers, i) != config_.skip_layers.end();
            int layer_in = n_neurons;
            if (i == 0) {
                layer_in = n_in;
            } else if (is_skip) {
                layer_in = n_neurons + n_in;  // 跳跃连接拼接原始输入
            }
            hidden_layers_->push_back(torch::nn::Linear(layer_in, n_neurons));
        }
        output_layer_ = register_module("output_layer", torch::nn::Linear(n_neurons, 3));

        to(device);
        allocated_ = true;
    }

    torch::Tensor AppearanceModel::forward(const torch::Tensor& gaussian_features,
                                           int64_t appearance_id,
                                           const torch::Tensor& view_dirs) {
        TORCH_CHECK(allocated_, "AppearanceModel::forward() called before parameters were allocated");
        TORCH_CHECK(gaussian_features.dim() == 2 && gaussian_features.size(1) == config_.n_gaussian_feature_dims,
                    "dimension mismatch: gaussian features must be [K, ", config_.n_gaussian_feature_dims,
                    "], got ", gaussian_features.sizes());
        TORCH_CHECK(appearance_id >= 0 && appearance_id < config_.n_appearances,
                    "appearance id ", appearance_id, " out of range [0, ", config_.n_appearances, ")");

        const auto k = gaussian_features.size(0);
        const auto id = torch::tensor({appearance_id},
                                      torch::TensorOptions().dtype(torch::kLong).device(embedding_->weight.device()));

        auto features = gaussian_features;
        auto appearance_embeddings = embedding_->forward(id).expand({k, -1});
        if (config_.normalize) {
            features = F::normalize(features, F::NormalizeFuncOptions().dim(-1));
            appearance_embeddings = F::normalize(appearance_embeddings, F::NormalizeFuncOptions().dim(-1));
        }

        std::vector<torch::Tensor> inputs{features, appearance_embeddings};
        if (config_.is_view_dependent) {
            TORCH_CHECK(view_dirs.defined() && view_dirs.dim() == 2 && view_dirs.size(0) == k && view_dirs.size(1) == 3,
                        "dimension mismatch: view directions must be [", k, ", 3]");
            inputs.push_back(positional_encoding(view_dirs, config_.n_view_direction_frequencies));
        }
        const auto network_input = torch::cat(inputs, -1);

        auto x = network_input;
        for (size_t i = 0; i < hidden_layers_->size(); ++i) {
            const bool is_skip = i > 0 &&
                                 std::ranges::find(config_.skip_layers, static_cast<int>(i)) != config_.skip_layers.end();
            if (is_skip) {
                x = torch::cat({x, network_input}, -1);
            }
            x = torch::relu(hidden_layers_[i]->as<torch::nn::Linear>()->forward(x));
        }
        return torch::sigmoid(output_layer_->forward(x));
    }

    std::vector<torch::Tensor> AppearanceModel::embedding_parameters() const {
        TORCH_CHECK(allocated_, "AppearanceModel parameters are not allocated");
        return embedding_->parameters();
    }

    std::vector<torch::Tensor> AppearanceModel::network_parameters() const {
        TORCH_CHECK(allocated_, "AppearanceModel parameters are not allocated");
        auto params = hidden_layers_->parameters();
        for (const auto& p : output_layer_->parameters()) {
            params.push_back(p);
        }
        return params;
    }

    void AppearanceModel::save_embedding(const std::filesystem::path& path) const {
        TORCH_CHECK(allocated_, "AppearanceModel parameters are not allocated");
        if (path.has_parent_path()) {
            std::filesystem::create_directories(path.parent_path());
        }

        torch::serialize::OutputArchive archive;
        for (const auto& item : named_parameters(/*recurse=*/true)) {
            archive.write(item.key(), item.value().detach().cpu());
        }

        // 先写临时文件再重命名
        const auto tmp = std::filesystem::path(path.string() + ".tmp");
        archive.save_to(tmp.string());
        std::filesystem::rename(tmp, path);
    }

    void AppearanceModel::load_embedding(const std::filesystem::path& path, const torch::Device& device) {
        if (!std::filesystem::exists(path)) {
            throw std::runtime_error(std::format("Appearance checkpoint not found: {}", path.string()));
        }
        torch::serialize::InputArchive archive;
        archive.load_from(path.string());

        torch::Tensor table;
        archive.read("embedding.weight", table);
        restore(table, device);

        torch::NoGradGuard no_grad;
        for (auto& item : named_parameters(/*recurse=*/true)) {
            if (item.key() == "embedding.weight") {
                continue;
            }
            torch::Tensor value;
            archive.read(item.key(), value);
            item.value().copy_(value.to(device));
        }
        LOG_INFO("Restored appearance model with {} embeddings from {}", config_.n_appearances, path.string());
    }

} // namespace appsplat::training
