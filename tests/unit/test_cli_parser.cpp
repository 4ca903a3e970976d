#include <filesystem>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include "app/cli_parser.hpp"
#include "core/errors/loop_errors.hpp"

namespace {

using storyloop::app::cli::parse_and_validate;
using storyloop::core::errors::ErrorCategory;
using storyloop::core::errors::get_error;
using storyloop::core::errors::get_value;
using storyloop::core::errors::is_error;
using storyloop::protocol::CliCommand;
using storyloop::protocol::CliRequest;

storyloop::core::errors::Result<CliRequest> parse_tokens(
    const std::vector<std::string>& tokens) {
    std::vector<std::string> owned_args;
    owned_args.reserve(tokens.size() + 1);
    owned_args.emplace_back("storyloop");
    for (const auto& token : tokens) {
        owned_args.push_back(token);
    }

    std::vector<char*> argv;
    argv.reserve(owned_args.size());
    for (auto& arg : owned_args) {
        argv.push_back(arg.data());
    }

    return parse_and_validate(static_cast<int>(argv.size()), argv.data());
}

TEST(CliParserTest, FailsWhenCommandMissing) {
    auto result = parse_tokens({});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::Input);
    EXPECT_EQ(get_error(result).code, "missing_command");
}

TEST(CliParserTest, FailsWhenCommandUnknown) {
    auto result = parse_tokens({"deploy"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "unknown_command");
}

TEST(CliParserTest, RecognisesHelpSpellings) {
    for (const std::string token : {"help", "--help", "-h"}) {
        auto result = parse_tokens({token});
        ASSERT_FALSE(is_error(result)) << token;
        EXPECT_EQ(get_value(result).command, CliCommand::Help);
    }
}

TEST(CliParserTest, ParsesRunWithDefaults) {
    auto result = parse_tokens({"run"});
    ASSERT_FALSE(is_error(result));

    const auto& req = get_value(result);
    EXPECT_EQ(req.command, CliCommand::Run);
    EXPECT_FALSE(req.max_iterations.has_value());
    EXPECT_FALSE(req.dry_run);
    EXPECT_FALSE(req.target_item.has_value());
    EXPECT_FALSE(req.config_path.has_value());
    EXPECT_FALSE(req.verbose);
}

TEST(CliParserTest, ParsesFullRunRequest) {
    const auto cwd = std::filesystem::current_path();
    auto result = parse_tokens({"run", "--max-iterations", "42", "--dry-run", "--story",
                                "WI-3", "--config", "loop.json", "--cwd", cwd.string(),
                                "--verbose"});
    ASSERT_FALSE(is_error(result));

    const auto& req = get_value(result);
    EXPECT_EQ(req.max_iterations, 42u);
    EXPECT_TRUE(req.dry_run);
    EXPECT_EQ(req.target_item, "WI-3");
    ASSERT_TRUE(req.config_path.has_value());
    EXPECT_EQ(req.config_path->string(), "loop.json");
    EXPECT_TRUE(req.verbose);
    EXPECT_TRUE(std::filesystem::exists(req.working_directory));
}

TEST(CliParserTest, FailsWhenMaxIterationsNotNumeric) {
    auto result = parse_tokens({"run", "--max-iterations", "abc"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_integer");
}

TEST(CliParserTest, FailsWhenMaxIterationsHasTrailingCharacters) {
    auto result = parse_tokens({"run", "--max-iterations", "12abc"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_integer");
}

TEST(CliParserTest, FailsWhenMaxIterationsOutOfBounds) {
    EXPECT_EQ(get_error(parse_tokens({"run", "--max-iterations", "0"})).code, "bounds_error");
    EXPECT_EQ(get_error(parse_tokens({"run", "--max-iterations", "1001"})).code,
              "bounds_error");
}

TEST(CliParserTest, FailsWhenValueMissing) {
    auto result = parse_tokens({"run", "--story"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "missing_value");
}

TEST(CliParserTest, FailsOnUnknownFlag) {
    auto result = parse_tokens({"run", "--turbo"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "unknown_argument");
}

TEST(CliParserTest, RejectsRunFlagsOnOtherCommands) {
    EXPECT_EQ(get_error(parse_tokens({"status", "--dry-run"})).code, "unsupported_flag");
    EXPECT_EQ(get_error(parse_tokens({"status", "--max-iterations", "3"})).code,
              "unsupported_flag");
    EXPECT_EQ(get_error(parse_tokens({"run", "--force"})).code, "unsupported_flag");
    EXPECT_EQ(get_error(parse_tokens({"reset", "--all"})).code, "unsupported_flag");
}

TEST(CliParserTest, UnblockRequiresItemId) {
    auto missing = parse_tokens({"unblock"});
    ASSERT_TRUE(is_error(missing));
    EXPECT_EQ(get_error(missing).code, "missing_required_argument");

    auto result = parse_tokens({"unblock", "WI-2"});
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).command, CliCommand::Unblock);
    EXPECT_EQ(get_value(result).item_id, "WI-2");
}

TEST(CliParserTest, RollbackNeedsExactlyOneTarget) {
    EXPECT_EQ(get_error(parse_tokens({"rollback"})).code, "missing_required_argument");
    EXPECT_EQ(get_error(parse_tokens({"rollback", "WI-1", "--all"})).code,
              "conflicting_flags");

    auto all = parse_tokens({"rollback", "--all", "--force"});
    ASSERT_FALSE(is_error(all));
    EXPECT_TRUE(get_value(all).rollback_all);
    EXPECT_TRUE(get_value(all).force);
    EXPECT_FALSE(get_value(all).item_id.has_value());

    auto single = parse_tokens({"rollback", "WI-1"});
    ASSERT_FALSE(is_error(single));
    EXPECT_FALSE(get_value(single).rollback_all);
    EXPECT_FALSE(get_value(single).force);
    EXPECT_EQ(get_value(single).item_id, "WI-1");
}

TEST(CliParserTest, RejectsStrayPositionals) {
    EXPECT_EQ(get_error(parse_tokens({"status", "WI-1"})).code, "unknown_argument");
    EXPECT_EQ(get_error(parse_tokens({"unblock", "WI-1", "WI-2"})).code, "unknown_argument");
}

TEST(CliParserTest, ResetAcceptsForce) {
    auto result = parse_tokens({"reset", "--force"});
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).command, CliCommand::Reset);
    EXPECT_TRUE(get_value(result).force);
}

TEST(CliParserTest, FailsWhenCwdInvalid) {
    const auto missing_dir =
        std::filesystem::current_path() / "__definitely_missing_cli_parser_test_dir__";
    auto result = parse_tokens({"status", "--cwd", missing_dir.string()});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_path");
}

}  // namespace
