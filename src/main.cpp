#include "appsplat/application.hpp"
#include "appsplat/argument_parser.hpp"
#include "appsplat/logger.hpp"
#include <print>

/**
 * [功能描述]：应用程序的主入口函数，负责解析命令行参数并启动训练。
 * @param argc [参数说明]：命令行参数的数量。
 * @param argv [参数说明]：命令行参数字符串数组。
 * @return [返回值说明]：程序退出码，0表示成功，-1表示失败。
 */
int main(int argc, char* argv[]) {
    // 解析命令行参数（这会根据--log-level标志初始化日志记录器）
    auto params_result = appsplat::args::parse_args_and_params(argc, argv);
    if (!params_result) {
        LOG_ERROR("Failed to parse arguments: {}", params_result.error());
        std::println(stderr, "Error: {}", params_result.error());
        return -1;
    }

    LOG_INFO("========================================");
    LOG_INFO("appsplat");
    LOG_INFO("========================================");

    auto params = std::move(*params_result);

    appsplat::Application app;
    return app.run(std::move(params));
}
