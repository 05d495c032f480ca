// test_config_base.cpp
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include "ledger_ngin/core/config_base.hpp"
#include "ledger_ngin/ledger/cost_basis_ledger.hpp"

using namespace ledger_ngin;

class ConfigBaseTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir = std::filesystem::temp_directory_path() / "ledger_config_base_test";
        std::filesystem::create_directories(test_dir);
    }

    void TearDown() override {
        std::filesystem::remove_all(test_dir);
    }

    std::filesystem::path test_dir;
};

class TestConfig : public ConfigBase {
public:
    std::string name = "default";
    int value = 42;
    double ratio = 0.5;

    nlohmann::json to_json() const override {
        nlohmann::json j;
        j["name"] = name;
        j["value"] = value;
        j["ratio"] = ratio;
        return j;
    }

    void from_json(const nlohmann::json& j) override {
        if (j.contains("name"))
            name = j["name"].get<std::string>();
        if (j.contains("value"))
            value = j["value"].get<int>();
        if (j.contains("ratio"))
            ratio = j["ratio"].get<double>();
    }
};

TEST_F(ConfigBaseTest, SaveAndLoadFile) {
    TestConfig config;
    config.name = "test";
    config.value = 100;
    config.ratio = 1.5;

    std::filesystem::path file_path = test_dir / "test_config.json";

    auto save_result = config.save_to_file(file_path.string());
    ASSERT_TRUE(save_result.is_ok())
        << "Failed to save config: "
        << (save_result.error() ? save_result.error()->what() : "unknown error");
    ASSERT_TRUE(std::filesystem::exists(file_path));

    TestConfig loaded_config;
    auto load_result = loaded_config.load_from_file(file_path.string());
    ASSERT_TRUE(load_result.is_ok())
        << "Failed to load config: "
        << (load_result.error() ? load_result.error()->what() : "unknown error");

    EXPECT_EQ(loaded_config.name, "test");
    EXPECT_EQ(loaded_config.value, 100);
    EXPECT_DOUBLE_EQ(loaded_config.ratio, 1.5);
}

TEST_F(ConfigBaseTest, DefaultValuesPreserved) {
    TestConfig config;

    nlohmann::json partial;
    partial["name"] = "partial";
    config.from_json(partial);

    EXPECT_EQ(config.name, "partial");
    EXPECT_EQ(config.value, 42);
    EXPECT_DOUBLE_EQ(config.ratio, 0.5);
}

TEST_F(ConfigBaseTest, MissingFileReportsNotFound) {
    TestConfig config;
    auto result = config.load_from_file((test_dir / "absent.json").string());
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::FILE_NOT_FOUND);
}

TEST_F(ConfigBaseTest, InvalidJsonHandling) {
    TestConfig config;

    std::filesystem::path file_path = test_dir / "invalid.json";
    std::ofstream file(file_path);
    file << "{ this is not valid JSON }";
    file.close();

    auto result = config.load_from_file(file_path.string());
    EXPECT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::JSON_PARSE_ERROR);
}

TEST_F(ConfigBaseTest, LedgerConfigSerialization) {
    LedgerConfig config;
    config.quantity_epsilon = 1e-6;
    config.close_short_on_untagged_buy = true;

    nlohmann::json j = config.to_json();

    LedgerConfig restored;
    restored.from_json(j);

    EXPECT_DOUBLE_EQ(restored.quantity_epsilon, 1e-6);
    EXPECT_TRUE(restored.close_short_on_untagged_buy);
    EXPECT_EQ(restored.version, "1.0.0");
}

TEST_F(ConfigBaseTest, WrongValueTypeIsConfigurationError) {
    TestConfig config;

    std::filesystem::path file_path = test_dir / "typed.json";
    std::ofstream file(file_path);
    file << R"({"name": "typed", "value": "forty-two"})";
    file.close();

    auto result = config.load_from_file(file_path);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::CONFIGURATION_ERROR);

    auto not_object = config.load_from_json(nlohmann::json::array({1, 2}));
    ASSERT_TRUE(not_object.is_error());
    EXPECT_EQ(not_object.error()->code(), ErrorCode::CONFIGURATION_ERROR);
}

TEST_F(ConfigBaseTest, SaveCreatesParentDirectories) {
    TestConfig config;
    std::filesystem::path file_path = test_dir / "nested" / "deeper" / "config.json";

    auto result = config.save_to_file(file_path);
    ASSERT_TRUE(result.is_ok());
    EXPECT_TRUE(std::filesystem::exists(file_path));
}
