#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "appsplat/parameters.hpp"

namespace {

    namespace fs = std::filesystem;

    class ParametersTest : public ::testing::Test {
    protected:
        void SetUp() override {
            dir_ = fs::temp_directory_path() /
                   ("appsplat_params_" + std::to_string(::testing::UnitTest::GetInstance()->random_seed()) +
                    "_" + ::testing::UnitTest::GetInstance()->current_test_info()->name());
            fs::create_directories(dir_);
        }

        void TearDown() override {
            std::error_code ec;
            fs::remove_all(dir_, ec);
        }

        fs::path write_json(const nlohmann::json& j) const {
            const auto path = dir_ / "params.json";
            std::ofstream(path) << j.dump(2);
            return path;
        }

        fs::path dir_;
    };

} // namespace

TEST_F(ParametersTest, MissingKeysKeepDefaults) {
    nlohmann::json j;
    j["optimization"]["iterations"] = 123;
    j["appearance_optimization"]["warm_up"] = 7;

    auto result = appsplat::param::read_optim_params_from_json(write_json(j));
    ASSERT_TRUE(result.has_value()) << result.error();

    EXPECT_EQ(result->optimization.iterations, 123u);
    EXPECT_EQ(result->appearance_optimization.warm_up, 7);
    EXPECT_FLOAT_EQ(result->optimization.lambda_dssim, 0.2f);
    EXPECT_EQ(result->appearance_model.n_gaussian_feature_dims, 64);
    EXPECT_EQ(result->appearance_model.n_appearances, -1);
    EXPECT_FLOAT_EQ(result->appearance_optimization.lr_final_factor, 0.1f);
}

TEST_F(ParametersTest, ShippedDefaultFileMatchesStructDefaults) {
    const auto path = fs::path(APPSPLAT_SOURCE_DIR) / "parameter" / "optimization_params.json";
    auto result = appsplat::param::read_optim_params_from_json(path);
    ASSERT_TRUE(result.has_value()) << result.error();

    const appsplat::param::TrainingParameters defaults;
    EXPECT_EQ(result->optimization.to_json(), defaults.optimization.to_json());
    EXPECT_EQ(result->appearance_model.to_json(), defaults.appearance_model.to_json());
    EXPECT_EQ(result->appearance_optimization.to_json(), defaults.appearance_optimization.to_json());
}

TEST_F(ParametersTest, MissingFileIsAnError) {
    auto result = appsplat::param::read_optim_params_from_json(dir_ / "does_not_exist.json");
    ASSERT_FALSE(result.has_value());
    EXPECT_NE(result.error().find("not found"), std::string::npos);
}

TEST_F(ParametersTest, MalformedJsonIsAnError) {
    const auto path = dir_ / "broken.json";
    std::ofstream(path) << "{ \"optimization\": { \"iterations\": ";
    auto result = appsplat::param::read_optim_params_from_json(path);
    EXPECT_FALSE(result.has_value());
}

TEST_F(ParametersTest, SavedConfigurationReloads) {
    appsplat::param::TrainingParameters params;
    params.optimization.iterations = 42;
    params.optimization.white_background = true;
    params.appearance_model.is_view_dependent = true;
    params.appearance_model.skip_layers = {1};
    params.appearance_optimization.embedding_lr_init = 5e-3f;

    ASSERT_TRUE(appsplat::param::save_training_parameters_to_json(params, dir_).has_value());

    auto reloaded = appsplat::param::read_optim_params_from_json(dir_ / "training_config.json");
    ASSERT_TRUE(reloaded.has_value()) << reloaded.error();
    EXPECT_EQ(reloaded->optimization.iterations, 42u);
    EXPECT_TRUE(reloaded->optimization.white_background);
    EXPECT_TRUE(reloaded->appearance_model.is_view_dependent);
    EXPECT_EQ(reloaded->appearance_model.skip_layers, std::vector<int>{1});
    EXPECT_FLOAT_EQ(reloaded->appearance_optimization.embedding_lr_init, 5e-3f);
}

TEST(ParameterValidationTest, DefaultsAreValid) {
    EXPECT_TRUE(appsplat::param::validate(appsplat::param::TrainingParameters{}).has_value());
}

TEST(ParameterValidationTest, RejectsInconsistentValues) {
    {
        appsplat::param::TrainingParameters p;
        p.appearance_optimization.max_steps = 0;
        EXPECT_FALSE(appsplat::param::validate(p).has_value());
    }
    {
        appsplat::param::TrainingParameters p;
        p.appearance_optimization.warm_up = -1;
        EXPECT_FALSE(appsplat::param::validate(p).has_value());
    }
    {
        appsplat::param::TrainingParameters p;
        p.optimization.lambda_dssim = 1.5f;
        EXPECT_FALSE(appsplat::param::validate(p).has_value());
    }
    {
        appsplat::param::TrainingParameters p;
        p.optimization.densify_from_iter = 20'000;
        EXPECT_FALSE(appsplat::param::validate(p).has_value());
    }
    {
        appsplat::param::TrainingParameters p;
        p.optimization.device = "tpu";
        EXPECT_FALSE(appsplat::param::validate(p).has_value());
    }
    {
        appsplat::param::TrainingParameters p;
        p.appearance_model.skip_layers = {3};
        EXPECT_FALSE(appsplat::param::validate(p).has_value());
    }
}
