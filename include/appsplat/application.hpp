#pragma once

#include "appsplat/parameters.hpp"
#include <memory>

namespace appsplat {

    class Application {
    public:
        /**
         * [功能描述]：运行训练
         * @return [返回值说明]：程序退出码，0表示成功，-1表示失败
         */
        int run(std::unique_ptr<param::TrainingParameters> params);
    };

} // namespace appsplat
