#include <gtest/gtest.h>
#include <fstream>
#include "cli/args_parser/args_parser.hpp"
#include "infra/config/config.hpp"
#include "test_support.hpp"

using namespace pagesync;
using namespace std::chrono_literals;

namespace {

auto write_config(const fixtures::TempDir& dir, const std::string& text) -> std::filesystem::path {
    const auto path = dir.path() / "config.yaml";
    std::ofstream out(path);
    out << text;
    return path;
}

} // namespace

TEST(ConfigTest, ParsesEverySection)
{
    fixtures::TempDir dir;
    const auto path = write_config(dir,
        "parallelism: 16\n"
        "page_size: 4096\n"
        "chunk_size: 1048576\n"
        "queue_capacity: 8\n"
        "retry:\n"
        "  max_attempts: 3\n"
        "  initial_delay_ms: 50\n"
        "  backoff_factor: 1.5\n"
        "  max_delay_ms: 2000\n"
        "progress:\n"
        "  enabled: false\n"
        "  interval_ms: 250\n"
        "  window: 30\n"
        "overwrite: true\n");

    auto config = infra::load_config_from_file(path);
    ASSERT_TRUE(config.has_value()) << config.error().message;

    EXPECT_EQ(config->parallelism, 16u);
    EXPECT_EQ(config->page_size, 4096u);
    EXPECT_EQ(config->chunk_size, 1048576u);
    EXPECT_EQ(config->queue_capacity, 8u);
    EXPECT_FALSE(config->progress);
    EXPECT_EQ(config->progress_interval, 250ms);
    EXPECT_EQ(config->progress_window, 30u);
    EXPECT_TRUE(config->overwrite);

    const auto policy = config->retry_policy();
    EXPECT_EQ(policy.max_attempts, 3);
    EXPECT_EQ(policy.initial_delay, 50ms);
    EXPECT_DOUBLE_EQ(policy.backoff_factor, 1.5);
    EXPECT_EQ(policy.max_delay, 2000ms);
}

TEST(ConfigTest, ProgressAcceptsPlainBool)
{
    fixtures::TempDir dir;
    auto config = infra::load_config_from_file(write_config(dir, "progress: false\n"));
    ASSERT_TRUE(config.has_value());
    EXPECT_FALSE(config->progress);
}

TEST(ConfigTest, BrokenFileIsConfigError)
{
    fixtures::TempDir dir;
    auto config = infra::load_config_from_file(write_config(dir, "parallelism: [1, 2\n"));
    ASSERT_FALSE(config.has_value());
    EXPECT_EQ(config.error().code, infra::ErrorCode::Config);

    auto negative = infra::load_config_from_file(write_config(dir, "retry:\n  max_attempts: -1\n"));
    ASSERT_FALSE(negative.has_value());
    EXPECT_EQ(negative.error().code, infra::ErrorCode::Config);
}

TEST(ConfigTest, ExplicitMissingFileIsConfigError)
{
    auto config = infra::load_config_from_file("/nonexistent/pagesync.yaml");
    ASSERT_FALSE(config.has_value());
    EXPECT_EQ(config.error().code, infra::ErrorCode::Config);
}

TEST(ConfigTest, CliOverridesFile)
{
    infra::Config file;
    file.parallelism = 4;
    file.chunk_size = 1024;
    file.max_attempts = 7;

    args_parser::CLIArgs args;
    args.parallelism = 32;
    args.overwrite = true;
    args.progress = false;

    file.merge_with(infra::config_from_cli(args));
    EXPECT_EQ(file.effective_parallelism(), 32u);
    EXPECT_EQ(file.chunk_size, 1024u);
    EXPECT_EQ(file.retry_policy().max_attempts, 7);
    EXPECT_TRUE(file.overwrite);
    EXPECT_FALSE(file.progress);
}

TEST(ConfigTest, DefaultsApplyWhenUnset)
{
    infra::Config config;
    EXPECT_GE(config.effective_parallelism(), 8u);
    EXPECT_EQ(config.retry_policy().max_attempts, infra::RetryPolicy{}.max_attempts);
    EXPECT_TRUE(config.progress);
    EXPECT_FALSE(config.overwrite);
}
