#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace kvtable::shell {

// ── Commands ──────────────────────────────────────────────────────────────────
//
// Parsed representation of a single shell line.  Each command type is a
// plain struct; the whole thing is wrapped in a std::variant so callers can
// std::visit over it without inheritance.

struct CreateNamespaceCmd {
    std::string name;
};

struct UseNamespaceCmd {
    std::string name;
};

struct ListNamespacesCmd {};

struct CreateTableCmd {
    std::string name;
};

struct ListTablesCmd {};

struct StatsCmd {
    std::string table;
};

// set <table:key:value> [ttl-seconds]
struct SetCmd {
    std::string table;
    std::string key;
    std::string value;
    std::optional<std::chrono::milliseconds> ttl;
};

struct GetCmd {
    std::string table;
    std::string key;
};

struct DelCmd {
    std::string table;
    std::string key;
};

struct FlushCmd {
    std::string table;
};

struct CompactCmd {
    std::string table;
};

struct HelpCmd {};

struct ExitCmd {};

using Command = std::variant<CreateNamespaceCmd, UseNamespaceCmd, ListNamespacesCmd,
                             CreateTableCmd, ListTablesCmd, StatsCmd, SetCmd, GetCmd,
                             DelCmd, FlushCmd, CompactCmd, HelpCmd, ExitCmd>;

// ── Responses ─────────────────────────────────────────────────────────────────

struct OkResp {
    std::string message;
};

struct WarnResp {
    std::string message;
};

struct ErrorResp {
    std::string message;
};

struct ValueResp {
    std::string value;
};

struct ListResp {
    std::vector<std::string> items;
};

using Response = std::variant<OkResp, WarnResp, ErrorResp, ValueResp, ListResp>;

// ── Grammar ───────────────────────────────────────────────────────────────────

// Parse one line (without the trailing '\n') into a Command.
// Malformed input yields an ErrorResp the caller can print as-is.
//
// Thread-safe: pure function, no shared state.
[[nodiscard]] std::variant<Command, ErrorResp> parse_command(std::string_view line);

// Parse a TTL in seconds ("30", "1.5").  nullopt unless strictly positive.
[[nodiscard]] std::optional<std::chrono::milliseconds> parse_ttl_seconds(std::string_view text);

// Render a Response as one output line (no trailing '\n').
[[nodiscard]] std::string format_response(const Response& response);

// One-line command summary for `help`.
[[nodiscard]] std::string help_text();

} // namespace kvtable::shell
