#include "test_helpers.hpp"
#include "config.hpp"
#include "logging.hpp"

#include <filesystem>
#include <fstream>

using namespace cosign;
using namespace cosign::test;

////////////////////////////////////////////////////////////////////////////////
class ConfigTest : public ::testing::Test
{
protected:
    void TearDown() override
    {
        if (!path_.empty()) {
            std::filesystem::remove(path_);
        }
    }

    std::string write_file(const std::string& content)
    {
        path_ = (std::filesystem::temp_directory_path() / "cosign_config_test.json").string();
        std::ofstream out(path_);
        out << content;
        return path_;
    }

    std::string path_;
};

TEST_F(ConfigTest, EmptyDocumentKeepsDefaults)
{
    auto config = ServiceConfig::from_json(nlohmann::json::object());
    EXPECT_DOUBLE_EQ(config.size_estimation_margin, 0.01);
    EXPECT_EQ(config.input_size_estimation_margin, 2u);
    EXPECT_EQ(config.max_tx_size_in_kb, 100u);
    EXPECT_EQ(config.min_output_amount, 546u);
    EXPECT_EQ(config.lock_wait_ms, 5000u);
    EXPECT_EQ(config.lock_lease_ms, 40000u);
    EXPECT_DOUBLE_EQ(config.utxo_selection.max_single_utxo, 2);
    EXPECT_DOUBLE_EQ(config.utxo_selection.min_tx_amount_vs_utxo, 0.1);
    EXPECT_DOUBLE_EQ(config.utxo_selection.max_fee_vs_tx_amount, 0.05);
    EXPECT_DOUBLE_EQ(config.utxo_selection.max_fee_vs_single_utxo_fee, 5);
    EXPECT_EQ(config.log_level, "info");
}

TEST_F(ConfigTest, OverridesAndUnknownKeys)
{
    auto config = ServiceConfig::from_json({
        {"maxTxSizeInKb", 1},
        {"minOutputAmount", 1000},
        {"logLevel", "debug"},
        {"utxoSelection", {{"maxSingleUtxoFactor", 3.5}}},
        {"somethingElse", true}
    });
    EXPECT_EQ(config.max_tx_size_in_kb, 1u);
    EXPECT_EQ(config.min_output_amount, 1000u);
    EXPECT_EQ(config.log_level, "debug");
    EXPECT_DOUBLE_EQ(config.utxo_selection.max_single_utxo, 3.5);
    EXPECT_DOUBLE_EQ(config.utxo_selection.max_fee_vs_tx_amount, 0.05);
}

TEST_F(ConfigTest, TypeMismatchesAreRejected)
{
    EXPECT_EQ(error_code_of([] { ServiceConfig::from_json({{"maxTxSizeInKb", "big"}}); }),
              Error::Code::InvalidArgument);
    EXPECT_EQ(error_code_of([] { ServiceConfig::from_json({{"lockWaitMs", true}}); }),
              Error::Code::InvalidArgument);
    EXPECT_EQ(error_code_of([] { ServiceConfig::from_json({{"minOutputAmount", -1}}); }),
              Error::Code::InvalidArgument);
    EXPECT_EQ(error_code_of([] { ServiceConfig::from_json({{"logLevel", 3}}); }),
              Error::Code::InvalidArgument);
    EXPECT_EQ(error_code_of([] { ServiceConfig::from_json({{"utxoSelection", 1}}); }),
              Error::Code::InvalidArgument);
    EXPECT_EQ(error_code_of([] { ServiceConfig::from_json(nlohmann::json::array()); }),
              Error::Code::InvalidArgument);
}

TEST_F(ConfigTest, LoadFromFile)
{
    auto path = write_file(R"({"lockLeaseMs": 250, "sizeEstimationMargin": 0.02})");
    auto config = ServiceConfig::load_from_file(path);
    EXPECT_EQ(config.lock_lease_ms, 250u);
    EXPECT_DOUBLE_EQ(config.size_estimation_margin, 0.02);
}

TEST_F(ConfigTest, BadFiles)
{
    EXPECT_THROW(ServiceConfig::load_from_file("/nonexistent/cosign.json"), Error);
    auto path = write_file("{not json");
    EXPECT_EQ(error_code_of([&] { ServiceConfig::load_from_file(path); }), Error::Code::InvalidArgument);
}

////////////////////////////////////////////////////////////////////////////////
class LoggingTest : public ::testing::Test
{
protected:
    void TearDown() override
    {
        set_log_level("info");
    }
};

TEST_F(LoggingTest, NamedLoggerIsShared)
{
    auto logger = get_logger();
    ASSERT_NE(logger, nullptr);
    EXPECT_EQ(logger->name(), "cosign");
    EXPECT_EQ(logger, get_logger());
}

TEST_F(LoggingTest, LevelByName)
{
    set_log_level("debug");
    EXPECT_EQ(get_logger()->level(), spdlog::level::debug);
    set_log_level("warn");
    EXPECT_EQ(get_logger()->level(), spdlog::level::warn);
    EXPECT_EQ(error_code_of([] { set_log_level("loud"); }), Error::Code::InvalidArgument);
}
