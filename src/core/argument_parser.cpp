// Copyright (c) 2025 Janusch Patas.

#include "appsplat/argument_parser.hpp"
#include "appsplat/logger.hpp"
#include "appsplat/parameters.hpp"
#include <args.hxx>
#include <expected>
#include <filesystem>
#include <format>
#include <functional>
#include <optional>
#include <print>
#include <set>
#include <tuple>
#include <unordered_map>

namespace {

    enum class ParseResult {
        Success,
        Help
    };

    const std::set<std::string> VALID_DEVICES = {"cuda", "cpu"};

    // Parse log level from string
    appsplat::core::LogLevel parse_log_level(const std::string& level_str) {
        if (level_str == "trace")
            return appsplat::core::LogLevel::Trace;
        if (level_str == "debug")
            return appsplat::core::LogLevel::Debug;
        if (level_str == "info")
            return appsplat::core::LogLevel::Info;
        if (level_str == "warn" || level_str == "warning")
            return appsplat::core::LogLevel::Warn;
        if (level_str == "error")
            return appsplat::core::LogLevel::Error;
        if (level_str == "critical")
            return appsplat::core::LogLevel::Critical;
        if (level_str == "off")
            return appsplat::core::LogLevel::Off;
        return appsplat::core::LogLevel::Info; // Default
    }

    /**
     * [功能描述]：解析命令行参数
     * @param args 命令行参数字符串向量
     * @param params 训练参数对象的引用，数据集路径在这里直接填入
     * @param config_path 输出：用户指定的JSON配置文件
     * @return 返回解析结果和覆盖函数的元组，覆盖函数在JSON加载后调用
     */
    std::expected<std::tuple<ParseResult, std::function<void()>>, std::string> parse_arguments(
        const std::vector<std::string>& args,
        appsplat::param::TrainingParameters& params) {

        try {
            ::args::ArgumentParser parser(
                "Appearance-conditioned Gaussian Splatting trainer\n",
                "Trains a Gaussian scene with a learned per-image appearance residual.\n\n"
                "Usage:\n"
                "  appsplat --data-path <path> --output-path <path> [options]\n");

            ::args::HelpFlag help(parser, "help", "Display help menu", {'h', "help"});
            ::args::CompletionFlag completion(parser, {"complete"});

            // 路径
            ::args::ValueFlag<std::string> data_path(parser, "data_path", "Path to the COLMAP dataset", {'d', "data-path"});
            ::args::ValueFlag<std::string> output_path(parser, "output_path", "Path to output", {'o', "output-path"});
            ::args::ValueFlag<std::string> config(parser, "config", "JSON parameter file (default: parameter/optimization_params.json)", {'c', "config"});
            ::args::ValueFlag<std::string> images_folder(parser, "images", "Images folder name", {"images"});
            ::args::ValueFlag<std::string> mask_dir(parser, "mask_dir", "Directory with <image name>.png masks", {"mask-dir"});

            // 训练
            ::args::ValueFlag<uint32_t> iterations(parser, "iterations", "Number of iterations", {'i', "iter"});
            ::args::ValueFlag<int> eval_step(parser, "eval_step", "Use every Nth image for validation", {"eval-step"});
            ::args::ValueFlag<int> sh_degree(parser, "sh_degree", "Max SH degree [0-3]", {"sh-degree"});
            ::args::ValueFlag<int> warm_up(parser, "warm_up", "Steps before the appearance residual is used", {"warm-up"});
            ::args::ValueFlag<std::string> device(parser, "device", "Training device: cuda, cpu", {"device"});
            ::args::ValueFlagList<size_t> save_steps(parser, "save_steps", "Checkpoint step (repeatable)", {"save-steps"});

            // 日志选项
            ::args::ValueFlag<std::string> log_level(parser, "level", "Log level: trace, debug, info, warn, error, critical, off (default: info)", {"log-level"});
            ::args::ValueFlag<std::string> log_file(parser, "file", "Optional log file path", {"log-file"});

            // 可选标志参数
            ::args::Flag white_background(parser, "white_background", "Composite over a white background", {"white-background"});
            ::args::Flag view_dependent(parser, "view_dependent", "Feed view directions to the appearance network", {"view-dependent"});
            ::args::Flag enable_eval(parser, "eval", "Enable evaluation during training", {"eval"});

            // 图像缩放因子参数，支持映射到预定义值
            ::args::MapFlag<std::string, int> resize_factor(parser, "resize_factor",
                                                            "resize resolution by this factor. Options: auto, 1, 2, 4, 8 (default: auto)",
                                                            {'r', "resize-factor"},
                                                            std::unordered_map<std::string, int>{
                                                                {"auto", -1},
                                                                {"1", 1},
                                                                {"2", 2},
                                                                {"4", 4},
                                                                {"8", 8}});

            try {
                parser.Prog(args.front());
                parser.ParseArgs(std::vector<std::string>(args.begin() + 1, args.end()));
            } catch (const ::args::Help&) {
                std::print("{}", parser.Help());
                return std::make_tuple(ParseResult::Help, std::function<void()>{});
            } catch (const ::args::Completion& e) {
                std::print("{}", e.what());
                return std::make_tuple(ParseResult::Help, std::function<void()>{});
            } catch (const ::args::ParseError& e) {
                return std::unexpected(std::format("Parse error: {}\n{}", e.what(), parser.Help()));
            }

            // 根据命令行参数初始化日志记录器
            {
                auto level = appsplat::core::LogLevel::Info;
                std::string log_file_path;

                if (log_level) {
                    level = parse_log_level(::args::get(log_level));
                }
                if (log_file) {
                    log_file_path = ::args::get(log_file);
                }

                appsplat::core::Logger::get().init(level, log_file_path);

                LOG_DEBUG("Logger initialized with level: {}", static_cast<int>(level));
                if (!log_file_path.empty()) {
                    LOG_DEBUG("Logging to file: {}", log_file_path);
                }
            }

            if (help) {
                return std::make_tuple(ParseResult::Help, std::function<void()>{});
            }

            const bool has_data_path = data_path && !::args::get(data_path).empty();
            const bool has_output_path = output_path && !::args::get(output_path).empty();
            if (!has_data_path || !has_output_path) {
                return std::unexpected(std::format(
                    "ERROR: Training requires both --data-path and --output-path\n\n{}",
                    parser.Help()));
            }

            params.dataset.data_path = ::args::get(data_path);
            params.dataset.output_path = ::args::get(output_path);

            std::error_code ec;
            std::filesystem::create_directories(params.dataset.output_path, ec);
            if (ec) {
                return std::unexpected(std::format(
                    "Failed to create output directory '{}': {}",
                    params.dataset.output_path.string(), ec.message()));
            }

            if (config) {
                params.config_path = ::args::get(config);
            }

            if (device) {
                const auto dev = ::args::get(device);
                if (VALID_DEVICES.find(dev) == VALID_DEVICES.end()) {
                    return std::unexpected(std::format(
                        "ERROR: Invalid device '{}'. Valid devices are: cuda, cpu", dev));
                }
            }

            // 创建lambda函数，在JSON加载后应用命令行覆盖
            auto apply_cmd_overrides = [&params,
                                        // 捕获值，而不是引用
                                        iterations_val = iterations ? std::optional<uint32_t>(::args::get(iterations)) : std::optional<uint32_t>(),
                                        resize_factor_val = resize_factor ? std::optional<int>(::args::get(resize_factor)) : std::optional<int>(),
                                        images_folder_val = images_folder ? std::optional<std::string>(::args::get(images_folder)) : std::optional<std::string>(),
                                        mask_dir_val = mask_dir ? std::optional<std::string>(::args::get(mask_dir)) : std::optional<std::string>(),
                                        eval_step_val = eval_step ? std::optional<int>(::args::get(eval_step)) : std::optional<int>(),
                                        sh_degree_val = sh_degree ? std::optional<int>(::args::get(sh_degree)) : std::optional<int>(),
                                        warm_up_val = warm_up ? std::optional<int>(::args::get(warm_up)) : std::optional<int>(),
                                        device_val = device ? std::optional<std::string>(::args::get(device)) : std::optional<std::string>(),
                                        save_steps_val = save_steps ? std::optional<std::vector<size_t>>(::args::get(save_steps)) : std::optional<std::vector<size_t>>(),
                                        // 捕获标志状态
                                        white_background_flag = bool(white_background),
                                        view_dependent_flag = bool(view_dependent),
                                        enable_eval_flag = bool(enable_eval)]() {
                auto& opt = params.optimization;
                auto& ds = params.dataset;

                auto setVal = [](const auto& flag, auto& target) {
                    if (flag)
                        target = *flag;
                };

                auto setFlag = [](bool flag, auto& target) {
                    if (flag)
                        target = true;
                };

                setVal(iterations_val, opt.iterations);
                setVal(resize_factor_val, ds.resize_factor);
                setVal(images_folder_val, ds.images);
                setVal(mask_dir_val, ds.mask_dir);
                setVal(eval_step_val, ds.eval_step);
                setVal(sh_degree_val, opt.sh_degree);
                setVal(warm_up_val, params.appearance_optimization.warm_up);
                setVal(device_val, opt.device);
                setVal(save_steps_val, opt.save_steps);

                setFlag(white_background_flag, opt.white_background);
                setFlag(view_dependent_flag, params.appearance_model.is_view_dependent);
                setFlag(enable_eval_flag, opt.enable_eval);
            };

            return std::make_tuple(ParseResult::Success, apply_cmd_overrides);

        } catch (const std::exception& e) {
            return std::unexpected(std::format("Unexpected error during argument parsing: {}", e.what()));
        }
    }

    std::vector<std::string> convert_args(int argc, const char* const argv[]) {
        return std::vector<std::string>(argv, argv + argc);
    }

} // anonymous namespace

std::expected<std::unique_ptr<appsplat::param::TrainingParameters>, std::string>
appsplat::args::parse_args_and_params(const std::vector<std::string>& args) {
    if (args.empty()) {
        return std::unexpected("Empty argument list");
    }

    auto params = std::make_unique<appsplat::param::TrainingParameters>();

    auto parse_result = parse_arguments(args, *params);
    if (!parse_result) {
        return std::unexpected(parse_result.error());
    }

    auto [result, apply_overrides] = *parse_result;

    if (result == ParseResult::Help) {
        std::exit(0);
    }

    // 先加载JSON，再用命令行覆盖；数据集路径和配置路径不来自JSON
    auto json_result = appsplat::param::read_optim_params_from_json(params->config_path);
    if (!json_result) {
        return std::unexpected(std::format("Failed to load optimization parameters: {}",
                                           json_result.error()));
    }
    params->optimization = json_result->optimization;
    params->appearance_model = json_result->appearance_model;
    params->appearance_optimization = json_result->appearance_optimization;

    if (apply_overrides) {
        apply_overrides();
    }

    if (auto valid = appsplat::param::validate(*params); !valid) {
        return std::unexpected(std::format("Invalid parameters: {}", valid.error()));
    }

    return params;
}

std::expected<std::unique_ptr<appsplat::param::TrainingParameters>, std::string>
appsplat::args::parse_args_and_params(int argc, const char* const argv[]) {
    return parse_args_and_params(convert_args(argc, argv));
}
