#include <gtest/gtest.h>
#include "trustpath/common.hpp"
#include "trustpath/error.hpp"
#include "trustpath/time_utils.hpp"
#include "utils/config.hpp"
#include "utils/logger.hpp"
#include "core/trust/engine_config.hpp"

using namespace trustpath;

TEST(ErrorTest, OnlyPortFailuresRetry) {
    EXPECT_TRUE(is_retryable(ErrorCode::PortUnavailable));
    for (auto code : {ErrorCode::InvalidArgument, ErrorCode::OutOfRange, ErrorCode::UnknownDomain,
                      ErrorCode::InvalidSignature, ErrorCode::ConfigInvalid}) {
        EXPECT_FALSE(is_retryable(code)) << error_code_to_string(code);
    }

    Error error(ErrorCode::UnknownDomain, "Unknown domain 'x'", "query");
    EXPECT_EQ(error.to_string(), "[Unknown domain] Unknown domain 'x' (query)");
}

TEST(ErrorTest, ResultAccessors) {
    auto ok = Result<int>::Ok(7);
    EXPECT_TRUE(ok.is_ok());
    EXPECT_EQ(ok.value(), 7);

    auto err = Result<int>::Err(ErrorCode::OutOfRange, "too deep");
    EXPECT_TRUE(err.is_err());
    EXPECT_EQ(err.error().code(), ErrorCode::OutOfRange);
    EXPECT_THROW(err.value(), std::runtime_error);
    EXPECT_FALSE(err.ok().has_value());
}

TEST(TimeUtilsTest, Iso8601RoundTrip) {
    EXPECT_EQ(time::timestamp_to_iso8601(1767225600), "2026-01-01T00:00:00.000Z");
    EXPECT_EQ(time::iso8601_to_timestamp("2026-01-01T00:00:00.000Z"), 1767225600u);
    EXPECT_EQ(time::iso8601_to_timestamp("2026-01-01T12:30:05Z"), 1767225600u + 12 * 3600 + 30 * 60 + 5);
    EXPECT_THROW(time::iso8601_to_timestamp("yesterday"), std::runtime_error);
}

TEST(TimeUtilsTest, ZeroBudgetNeverExpires) {
    time::Deadline unlimited(0);
    time::sleep_milliseconds(2);
    EXPECT_FALSE(unlimited.expired());

    time::Deadline tight(1);
    time::sleep_milliseconds(5);
    EXPECT_TRUE(tight.expired());
    EXPECT_EQ(tight.remaining_milliseconds(), 0u);
}

TEST(CommonTest, Base64AndIds) {
    std::string text = "trust";
    bytes data(text.begin(), text.end());
    EXPECT_EQ(base64_encode(data), "dHJ1c3Q=");
    auto decoded = base64_decode("dHJ1c3Q=");
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(*decoded, data);
    EXPECT_FALSE(base64_decode("dHJ1c3Q").has_value());
    EXPECT_FALSE(base64_decode("dHJ1@3Q=").has_value());
    EXPECT_EQ(base64_encode(bytes{}), "");
    EXPECT_EQ(short_id("abcdefghijkl"), "abcdefgh");
    EXPECT_EQ(short_id("abc"), "abc");
    EXPECT_EQ(bytes_to_hex(bytes{0x00, 0xab, 0x10}), "00ab10");
}

TEST(ConfigTest, TypedAccess) {
    auto config = utils::Config::load_from_json(R"({"name": "trustpath", "depth": 4})");
    EXPECT_EQ(config.get_or<std::string>("name", ""), "trustpath");
    EXPECT_EQ(config.get_or<int>("depth", 0), 4);
    EXPECT_FALSE(config.get<std::string>("depth").has_value());
    EXPECT_EQ(config.get_or<int>("missing", 9), 9);
    EXPECT_TRUE(config.has("depth"));

    EXPECT_THROW(utils::Config::load_from_json("{not json"), ConfigException);
    EXPECT_THROW(utils::Config::load_from_json("[1, 2]"), ConfigException);
    EXPECT_THROW(utils::Config::load_from_file("/nonexistent/trustpath.json"), ConfigException);
}

TEST(EngineConfigTest, DefaultsAreValid) {
    core::EngineConfig config;
    EXPECT_TRUE(config.validate().is_ok());
    EXPECT_DOUBLE_EQ(config.decay_factor, 0.9);
    EXPECT_EQ(config.default_max_depth, 4u);
    EXPECT_EQ(config.max_depth_limit, 8u);
}

TEST(EngineConfigTest, ReadsOverrides) {
    auto config = utils::Config::load_from_json(
        R"({"decay_factor": 0.8, "default_max_depth": 3, "parallel_branches": 1, "unrelated": true})");
    auto engine_config = core::EngineConfig::from_config(config);
    ASSERT_TRUE(engine_config.is_ok()) << engine_config.error().to_string();
    EXPECT_DOUBLE_EQ(engine_config.value().decay_factor, 0.8);
    EXPECT_EQ(engine_config.value().default_max_depth, 3u);
    EXPECT_EQ(engine_config.value().parallel_branches, 1u);
    EXPECT_EQ(engine_config.value().max_paths, core::EngineConfig().max_paths);

    auto again = core::EngineConfig::from_config(engine_config.value().to_config());
    ASSERT_TRUE(again.is_ok());
    EXPECT_DOUBLE_EQ(again.value().decay_factor, 0.8);
}

TEST(EngineConfigTest, RejectsBadValues) {
    auto wrong_type = core::EngineConfig::from_config(
        utils::Config::load_from_json(R"({"decay_factor": "fast"})"));
    ASSERT_TRUE(wrong_type.is_err());
    EXPECT_EQ(wrong_type.error().code(), ErrorCode::ConfigInvalid);

    auto out_of_range = core::EngineConfig::from_config(
        utils::Config::load_from_json(R"({"decay_factor": 1.0})"));
    ASSERT_TRUE(out_of_range.is_err());
    EXPECT_EQ(out_of_range.error().code(), ErrorCode::ConfigInvalid);

    auto negative = core::EngineConfig::from_config(
        utils::Config::load_from_json(R"({"max_paths": -1})"));
    ASSERT_TRUE(negative.is_err());
    EXPECT_EQ(negative.error().code(), ErrorCode::ConfigInvalid);

    auto fractional = core::EngineConfig::from_config(
        utils::Config::load_from_json(R"({"default_max_depth": 2.5})"));
    EXPECT_TRUE(fractional.is_err());

    core::EngineConfig deep;
    deep.default_max_depth = deep.max_depth_limit + 1;
    EXPECT_TRUE(deep.validate().is_err());
}

TEST(EngineConfigTest, SybilIndicatorSettings) {
    core::EngineConfig defaults;
    EXPECT_DOUBLE_EQ(defaults.sybil_cluster_weight + defaults.sybil_reciprocity_weight +
                     defaults.sybil_velocity_weight + defaults.sybil_diversity_weight +
                     defaults.sybil_age_weight, 1.0);

    auto tuned = core::EngineConfig::from_config(utils::Config::load_from_json(
        R"({"sybil_cluster_weight": 0.5, "high_reciprocity": 0.6, "rapid_edge_count": 5})"));
    ASSERT_TRUE(tuned.is_ok()) << tuned.error().to_string();
    EXPECT_DOUBLE_EQ(tuned.value().sybil_cluster_weight, 0.5);
    EXPECT_DOUBLE_EQ(tuned.value().high_reciprocity, 0.6);
    EXPECT_EQ(tuned.value().rapid_edge_count, 5u);

    auto again = core::EngineConfig::from_config(tuned.value().to_config());
    ASSERT_TRUE(again.is_ok());
    EXPECT_DOUBLE_EQ(again.value().sybil_cluster_weight, 0.5);
    EXPECT_EQ(again.value().rapid_edge_window_days, 7u);

    EXPECT_TRUE(core::EngineConfig::from_config(utils::Config::load_from_json(
        R"({"sybil_age_weight": -0.1})")).is_err());
    EXPECT_TRUE(core::EngineConfig::from_config(utils::Config::load_from_json(
        R"({"high_cluster_coefficient": 0})")).is_err());

    core::EngineConfig silent;
    silent.sybil_cluster_weight = silent.sybil_reciprocity_weight = silent.sybil_velocity_weight =
        silent.sybil_diversity_weight = silent.sybil_age_weight = 0.0;
    EXPECT_TRUE(silent.validate().is_err());
}

TEST(LoggerTest, LevelNames) {
    utils::Logger::init("debug");
    EXPECT_EQ(utils::Logger::get()->level(), spdlog::level::debug);
    utils::Logger::init("off");
    EXPECT_EQ(utils::Logger::get()->level(), spdlog::level::off);
    utils::Logger::init("chatty");
    EXPECT_EQ(utils::Logger::get()->level(), spdlog::level::info);
    utils::Logger::init("warn");
}
