#pragma once

#include "appsplat/parameters.hpp"
#include <expected>
#include <memory>
#include <string>
#include <vector>

namespace appsplat::args {

    /**
     * [功能描述]：解析命令行参数和JSON配置文件，创建训练参数对象
     * @details 先读取 --config 指定的（或默认的）JSON文件，再用命令行选项覆盖，最后校验参数。
     *          同时按 --log-level / --log-file 初始化日志系统。请求帮助时输出帮助并退出进程。
     */
    std::expected<std::unique_ptr<param::TrainingParameters>, std::string>
    parse_args_and_params(int argc, const char* const argv[]);

    /// 同上，args[0] 为程序名
    std::expected<std::unique_ptr<param::TrainingParameters>, std::string>
    parse_args_and_params(const std::vector<std::string>& args);

} // namespace appsplat::args
