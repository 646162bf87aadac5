#include "shell/command.hpp"

#include <chrono>
#include <string>
#include <variant>

#include <gtest/gtest.h>

using namespace kvtable::shell;
using namespace std::chrono_literals;

// ── Helpers ───────────────────────────────────────────────────────────────────

static Command parse_ok(std::string_view line) {
    auto result = parse_command(line);
    if (auto* err = std::get_if<ErrorResp>(&result)) {
        ADD_FAILURE() << "unexpected parse error for '" << line << "': " << err->message;
        return HelpCmd{};
    }
    return std::get<Command>(result);
}

static std::string parse_err(std::string_view line) {
    auto result = parse_command(line);
    if (!std::holds_alternative<ErrorResp>(result)) {
        ADD_FAILURE() << "expected parse error for '" << line << "'";
        return {};
    }
    return std::get<ErrorResp>(result).message;
}

// ── Namespace / table commands ────────────────────────────────────────────────

TEST(CommandParseTest, CreateNamespace) {
    auto cmd = parse_ok("create-namespace app");
    ASSERT_TRUE(std::holds_alternative<CreateNamespaceCmd>(cmd));
    EXPECT_EQ(std::get<CreateNamespaceCmd>(cmd).name, "app");
}

TEST(CommandParseTest, UseNamespace) {
    auto cmd = parse_ok("use-namespace app");
    ASSERT_TRUE(std::holds_alternative<UseNamespaceCmd>(cmd));
    EXPECT_EQ(std::get<UseNamespaceCmd>(cmd).name, "app");
}

TEST(CommandParseTest, TableCommands) {
    EXPECT_EQ(std::get<CreateTableCmd>(parse_ok("create-table users")).name, "users");
    EXPECT_EQ(std::get<StatsCmd>(parse_ok("stats users")).table, "users");
    EXPECT_EQ(std::get<FlushCmd>(parse_ok("flush users")).table, "users");
    EXPECT_EQ(std::get<CompactCmd>(parse_ok("compact users")).table, "users");
}

TEST(CommandParseTest, NoArgumentCommands) {
    EXPECT_TRUE(std::holds_alternative<ListNamespacesCmd>(parse_ok("list-namespaces")));
    EXPECT_TRUE(std::holds_alternative<ListTablesCmd>(parse_ok("list-tables")));
    EXPECT_TRUE(std::holds_alternative<HelpCmd>(parse_ok("help")));
    EXPECT_TRUE(std::holds_alternative<ExitCmd>(parse_ok("exit")));
    EXPECT_TRUE(std::holds_alternative<ExitCmd>(parse_ok("quit")));
}

TEST(CommandParseTest, ExtraWhitespaceTolerated) {
    auto cmd = parse_ok("   flush\t users  \r");
    ASSERT_TRUE(std::holds_alternative<FlushCmd>(cmd));
    EXPECT_EQ(std::get<FlushCmd>(cmd).table, "users");
}

TEST(CommandParseTest, ArityErrors) {
    EXPECT_EQ(parse_err("create-namespace"), "usage: create-namespace <namespace>");
    EXPECT_EQ(parse_err("flush a b"), "usage: flush <table>");
    EXPECT_EQ(parse_err("list-tables extra"), "list-tables takes no arguments");
}

TEST(CommandParseTest, EmptyAndUnknown) {
    EXPECT_EQ(parse_err(""), "empty command");
    EXPECT_EQ(parse_err("   "), "empty command");
    EXPECT_EQ(parse_err("drop-table x"), "unknown command: drop-table (try 'help')");
}

// ── Key commands ──────────────────────────────────────────────────────────────

TEST(CommandParseTest, SetWithoutTtl) {
    auto cmd = parse_ok("set users:alice:admin");
    ASSERT_TRUE(std::holds_alternative<SetCmd>(cmd));
    const auto& set = std::get<SetCmd>(cmd);
    EXPECT_EQ(set.table, "users");
    EXPECT_EQ(set.key, "alice");
    EXPECT_EQ(set.value, "admin");
    EXPECT_FALSE(set.ttl.has_value());
}

TEST(CommandParseTest, SetWithTtl) {
    const auto set = std::get<SetCmd>(parse_ok("set users:session:tok 30"));
    ASSERT_TRUE(set.ttl.has_value());
    EXPECT_EQ(*set.ttl, 30s);
}

TEST(CommandParseTest, SetWithFractionalTtl) {
    const auto set = std::get<SetCmd>(parse_ok("set t:k:v 1.5"));
    EXPECT_EQ(*set.ttl, 1500ms);
}

TEST(CommandParseTest, SetValueMayContainColons) {
    const auto set = std::get<SetCmd>(parse_ok("set links:home:https://example.org:443/"));
    EXPECT_EQ(set.key, "home");
    EXPECT_EQ(set.value, "https://example.org:443/");
}

TEST(CommandParseTest, SetErrors) {
    EXPECT_EQ(parse_err("set users:alice"),
              "expected <table:key:value>, got 'users:alice'");
    EXPECT_EQ(parse_err("set"), "usage: set <table:key:value> [ttl-seconds]");
    EXPECT_EQ(parse_err("set t:k:v 0"),
              "invalid TTL '0': expected a positive number of seconds");
    EXPECT_EQ(parse_err("set t:k:v -3"),
              "invalid TTL '-3': expected a positive number of seconds");
    EXPECT_EQ(parse_err("set t:k:v soon"),
              "invalid TTL 'soon': expected a positive number of seconds");
}

TEST(CommandParseTest, GetAndDelete) {
    const auto get = std::get<GetCmd>(parse_ok("get users:alice"));
    EXPECT_EQ(get.table, "users");
    EXPECT_EQ(get.key, "alice");

    const auto del = std::get<DelCmd>(parse_ok("delete users:alice"));
    EXPECT_EQ(del.table, "users");
    EXPECT_EQ(del.key, "alice");
}

TEST(CommandParseTest, GetRejectsUnqualifiedKey) {
    EXPECT_EQ(parse_err("get alice"), "expected <table:key>, got 'alice'");
    EXPECT_EQ(parse_err("delete"), "usage: delete <table:key>");
}

// ── TTL parsing ───────────────────────────────────────────────────────────────

TEST(TtlParseTest, Values) {
    EXPECT_EQ(parse_ttl_seconds("10"), 10s);
    EXPECT_EQ(parse_ttl_seconds("0.25"), 250ms);
    EXPECT_EQ(parse_ttl_seconds("0.0001"), 1ms);
    EXPECT_FALSE(parse_ttl_seconds("0").has_value());
    EXPECT_FALSE(parse_ttl_seconds("").has_value());
    EXPECT_FALSE(parse_ttl_seconds("5s").has_value());
    EXPECT_FALSE(parse_ttl_seconds("nan").has_value());
}

// ── format_response ───────────────────────────────────────────────────────────

TEST(FormatResponseTest, AllVariants) {
    EXPECT_EQ(format_response(OkResp{"done"}), "[OK] done");
    EXPECT_EQ(format_response(WarnResp{"careful"}), "[WARN] careful");
    EXPECT_EQ(format_response(ErrorResp{"broken"}), "[ERROR] broken");
    EXPECT_EQ(format_response(ValueResp{"raw value"}), "raw value");
    EXPECT_EQ(format_response(ListResp{{"a", "b", "c"}}), "a b c");
}
