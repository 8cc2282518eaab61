// Copyright (c) 2023 Janusch Patas.

#include "appsplat/parameters.hpp"
#include "appsplat/logger.hpp"

#include <algorithm>
#include <format>
#include <fstream>
#include <nlohmann/json.hpp>

namespace appsplat {
    namespace param {
        namespace {
            /**
             * [功能描述]：定位默认参数文件
             * @return [返回值说明]：依次在可执行文件目录、其上级目录和当前目录下查找 parameter/optimization_params.json
             */
            std::filesystem::path default_config_path() {
                namespace fs = std::filesystem;
                const fs::path relative = fs::path("parameter") / "optimization_params.json";

                std::vector<fs::path> candidates;
                std::error_code ec;
                const auto exe = fs::read_symlink("/proc/self/exe", ec);
                if (!ec) {
                    candidates.push_back(exe.parent_path() / relative);
                    candidates.push_back(exe.parent_path().parent_path() / relative);
                }
                candidates.push_back(fs::current_path() / relative);

                for (const auto& candidate : candidates) {
                    if (fs::exists(candidate)) {
                        return candidate;
                    }
                }
                return candidates.back();
            }
        } // namespace

        nlohmann::json OptimizationParameters::to_json() const {
            nlohmann::json j;
            j["iterations"] = iterations;
            j["sh_degree"] = sh_degree;
            j["sh_degree_interval"] = sh_degree_interval;
            j["lambda_dssim"] = lambda_dssim;
            j["means_lr"] = means_lr;
            j["means_lr_final"] = means_lr_final;
            j["means_lr_delay_mult"] = means_lr_delay_mult;
            j["means_lr_max_steps"] = means_lr_max_steps;
            j["shs_lr"] = shs_lr;
            j["opacity_lr"] = opacity_lr;
            j["scaling_lr"] = scaling_lr;
            j["rotation_lr"] = rotation_lr;
            j["appearance_features_lr"] = appearance_features_lr;
            j["adam_eps"] = adam_eps;
            j["percent_dense"] = percent_dense;
            j["densification_interval"] = densification_interval;
            j["opacity_reset_interval"] = opacity_reset_interval;
            j["densify_from_iter"] = densify_from_iter;
            j["densify_until_iter"] = densify_until_iter;
            j["densify_grad_threshold"] = densify_grad_threshold;
            j["min_opacity"] = min_opacity;
            j["max_screen_size"] = max_screen_size;
            j["max_world_size_factor"] = max_world_size_factor;
            j["opacity_reset_value"] = opacity_reset_value;
            j["split_count"] = split_count;
            j["init_opacity"] = init_opacity;
            j["white_background"] = white_background;
            j["antialiased"] = antialiased;
            j["filter_2d_kernel_size"] = filter_2d_kernel_size;
            j["eval_steps"] = eval_steps;
            j["save_steps"] = save_steps;
            j["enable_eval"] = enable_eval;
            j["device"] = device;
            j["num_workers"] = num_workers;
            return j;
        }

        OptimizationParameters OptimizationParameters::from_json(const nlohmann::json& j) {
            OptimizationParameters p;
            p.iterations = j.value("iterations", p.iterations);
            p.sh_degree = j.value("sh_degree", p.sh_degree);
            p.sh_degree_interval = j.value("sh_degree_interval", p.sh_degree_interval);
            p.lambda_dssim = j.value("lambda_dssim", p.lambda_dssim);
            p.means_lr = j.value("means_lr", p.means_lr);
            p.means_lr_final = j.value("means_lr_final", p.means_lr_final);
            p.means_lr_delay_mult = j.value("means_lr_delay_mult", p.means_lr_delay_mult);
            p.means_lr_max_steps = j.value("means_lr_max_steps", p.means_lr_max_steps);
            p.shs_lr = j.value("shs_lr", p.shs_lr);
            p.opacity_lr = j.value("opacity_lr", p.opacity_lr);
            p.scaling_lr = j.value("scaling_lr", p.scaling_lr);
            p.rotation_lr = j.value("rotation_lr", p.rotation_lr);
            p.appearance_features_lr = j.value("appearance_features_lr", p.appearance_features_lr);
            p.adam_eps = j.value("adam_eps", p.adam_eps);
            p.percent_dense = j.value("percent_dense", p.percent_dense);
            p.densification_interval = j.value("densification_interval", p.densification_interval);
            p.opacity_reset_interval = j.value("opacity_reset_interval", p.opacity_reset_interval);
            p.densify_from_iter = j.value("densify_from_iter", p.densify_from_iter);
            p.densify_until_iter = j.value("densify_until_iter", p.densify_until_iter);
            p.densify_grad_threshold = j.value("densify_grad_threshold", p.densify_grad_threshold);
            p.min_opacity = j.value("min_opacity", p.min_opacity);
            p.max_screen_size = j.value("max_screen_size", p.max_screen_size);
            p.max_world_size_factor = j.value("max_world_size_factor", p.max_world_size_factor);
            p.opacity_reset_value = j.value("opacity_reset_value", p.opacity_reset_value);
            p.split_count = j.value("split_count", p.split_count);
            p.init_opacity = j.value("init_opacity", p.init_opacity);
            p.white_background = j.value("white_background", p.white_background);
            p.antialiased = j.value("antialiased", p.antialiased);
            p.filter_2d_kernel_size = j.value("filter_2d_kernel_size", p.filter_2d_kernel_size);
            p.eval_steps = j.value("eval_steps", p.eval_steps);
            p.save_steps = j.value("save_steps", p.save_steps);
            p.enable_eval = j.value("enable_eval", p.enable_eval);
            p.device = j.value("device", p.device);
            p.num_workers = j.value("num_workers", p.num_workers);
            return p;
        }

        nlohmann::json AppearanceModelParameters::to_json() const {
            nlohmann::json j;
            j["n_gaussian_feature_dims"] = n_gaussian_feature_dims;
            j["n_appearances"] = n_appearances;
            j["n_appearance_embedding_dims"] = n_appearance_embedding_dims;
            j["is_view_dependent"] = is_view_dependent;
            j["n_view_direction_frequencies"] = n_view_direction_frequencies;
            j["n_neurons"] = n_neurons;
            j["n_layers"] = n_layers;
            j["skip_layers"] = skip_layers;
            j["normalize"] = normalize;
            return j;
        }

        AppearanceModelParameters AppearanceModelParameters::from_json(const nlohmann::json& j) {
            AppearanceModelParameters p;
            p.n_gaussian_feature_dims = j.value("n_gaussian_feature_dims", p.n_gaussian_feature_dims);
            p.n_appearances = j.value("n_appearances", p.n_appearances);
            p.n_appearance_embedding_dims = j.value("n_appearance_embedding_dims", p.n_appearance_embedding_dims);
            p.is_view_dependent = j.value("is_view_dependent", p.is_view_dependent);
            p.n_view_direction_frequencies = j.value("n_view_direction_frequencies", p.n_view_direction_frequencies);
            p.n_neurons = j.value("n_neurons", p.n_neurons);
            p.n_layers = j.value("n_layers", p.n_layers);
            p.skip_layers = j.value("skip_layers", p.skip_layers);
            p.normalize = j.value("normalize", p.normalize);
            return p;
        }

        nlohmann::json AppearanceOptimizationParameters::to_json() const {
            nlohmann::json j;
            j["embedding_lr_init"] = embedding_lr_init;
            j["lr_init"] = lr_init;
            j["lr_final_factor"] = lr_final_factor;
            j["eps"] = eps;
            j["max_steps"] = max_steps;
            j["warm_up"] = warm_up;
            return j;
        }

        AppearanceOptimizationParameters AppearanceOptimizationParameters::from_json(const nlohmann::json& j) {
            AppearanceOptimizationParameters p;
            p.embedding_lr_init = j.value("embedding_lr_init", p.embedding_lr_init);
            p.lr_init = j.value("lr_init", p.lr_init);
            p.lr_final_factor = j.value("lr_final_factor", p.lr_final_factor);
            p.eps = j.value("eps", p.eps);
            p.max_steps = j.value("max_steps", p.max_steps);
            p.warm_up = j.value("warm_up", p.warm_up);
            return p;
        }

        std::expected<TrainingParameters, std::string> read_optim_params_from_json(const std::filesystem::path& path) {
            const auto json_path = path.empty() ? default_config_path() : path;

            if (!std::filesystem::exists(json_path)) {
                return std::unexpected(std::format("Parameter file not found: {}", json_path.string()));
            }

            try {
                std::ifstream file(json_path);
                if (!file.is_open()) {
                    return std::unexpected(std::format("Could not open parameter file: {}", json_path.string()));
                }

                nlohmann::json j;
                file >> j;

                TrainingParameters params;
                if (j.contains("optimization")) {
                    params.optimization = OptimizationParameters::from_json(j["optimization"]);
                }
                if (j.contains("appearance_model")) {
                    params.appearance_model = AppearanceModelParameters::from_json(j["appearance_model"]);
                }
                if (j.contains("appearance_optimization")) {
                    params.appearance_optimization = AppearanceOptimizationParameters::from_json(j["appearance_optimization"]);
                }

                LOG_DEBUG("Loaded training parameters from {}", json_path.string());
                return params;
            } catch (const nlohmann::json::exception& e) {
                return std::unexpected(std::format("JSON parsing error in {}: {}", json_path.string(), e.what()));
            }
        }

        std::expected<void, std::string> save_training_parameters_to_json(
            const TrainingParameters& params,
            const std::filesystem::path& output_path) {

            try {
                std::filesystem::create_directories(output_path);

                nlohmann::json j;
                j["dataset"]["data_path"] = params.dataset.data_path.string();
                j["dataset"]["output_path"] = params.dataset.output_path.string();
                j["dataset"]["images"] = params.dataset.images;
                j["dataset"]["mask_dir"] = params.dataset.mask_dir.string();
                j["dataset"]["eval_step"] = params.dataset.eval_step;
                j["dataset"]["resize_factor"] = params.dataset.resize_factor;
                j["optimization"] = params.optimization.to_json();
                j["appearance_model"] = params.appearance_model.to_json();
                j["appearance_optimization"] = params.appearance_optimization.to_json();

                const auto file_path = output_path / "training_config.json";
                std::ofstream file(file_path);
                if (!file.is_open()) {
                    return std::unexpected(std::format("Could not open file for writing: {}", file_path.string()));
                }
                file << j.dump(4);
                LOG_INFO("Saved training configuration to {}", file_path.string());
                return {};
            } catch (const std::exception& e) {
                return std::unexpected(std::format("Error saving training parameters: {}", e.what()));
            }
        }

        std::expected<void, std::string> validate(const TrainingParameters& params) {
            const auto& opt = params.optimization;
            const auto& app_opt = params.appearance_optimization;
            const auto& app = params.appearance_model;

            if (opt.iterations == 0) {
                return std::unexpected("iterations must be positive");
            }
            if (opt.lambda_dssim < 0.f || opt.lambda_dssim > 1.f) {
                return std::unexpected(std::format("lambda_dssim must lie in [0, 1], got {}", opt.lambda_dssim));
            }
            if (opt.sh_degree < 0 || opt.sh_degree > 3) {
                return std::unexpected(std::format("sh_degree must lie in [0, 3], got {}", opt.sh_degree));
            }
            if (opt.sh_degree_interval == 0 || opt.densification_interval == 0 || opt.opacity_reset_interval == 0) {
                return std::unexpected("sh_degree_interval, densification_interval and opacity_reset_interval must be positive");
            }
            if (opt.means_lr_max_steps == 0) {
                return std::unexpected("means_lr_max_steps must be positive");
            }
            if (opt.densify_from_iter > opt.densify_until_iter) {
                return std::unexpected(std::format("densify_from_iter ({}) must not exceed densify_until_iter ({})",
                                                   opt.densify_from_iter, opt.densify_until_iter));
            }
            if (opt.split_count < 1) {
                return std::unexpected("split_count must be at least 1");
            }
            if (opt.opacity_reset_value <= 0.f || opt.opacity_reset_value >= 1.f) {
                return std::unexpected("opacity_reset_value must lie in (0, 1)");
            }
            if (opt.device != "cuda" && opt.device != "cpu") {
                return std::unexpected(std::format("Unknown device '{}', expected cuda or cpu", opt.device));
            }
            if (app_opt.max_steps <= 0) {
                return std::unexpected(std::format("appearance max_steps must be positive, got {}", app_opt.max_steps));
            }
            if (app_opt.warm_up < 0) {
                return std::unexpected("appearance warm_up must not be negative");
            }
            if (app.n_layers < 1 || app.n_neurons < 1) {
                return std::unexpected("appearance network needs at least one layer and one neuron");
            }
            for (int skip : app.skip_layers) {
                if (skip <= 0 || skip >= app.n_layers) {
                    return std::unexpected(std::format("skip layer {} out of range (1..{})", skip, app.n_layers - 1));
                }
            }
            return {};
        }
    } // namespace param
} // namespace appsplat
