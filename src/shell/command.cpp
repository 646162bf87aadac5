#include "shell/command.hpp"
#include "catalog/catalog.hpp"

#include <charconv>
#include <cmath>
#include <string>
#include <type_traits>

namespace kvtable::shell {

// ── Helpers ───────────────────────────────────────────────────────────────────

namespace {

bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n';
}

std::vector<std::string_view> tokenize(std::string_view line) {
    std::vector<std::string_view> tokens;
    std::size_t i = 0;
    while (i < line.size()) {
        while (i < line.size() && is_space(line[i])) ++i;
        const std::size_t start = i;
        while (i < line.size() && !is_space(line[i])) ++i;
        if (i > start) {
            tokens.push_back(line.substr(start, i - start));
        }
    }
    return tokens;
}

std::string usage(std::string_view verb, std::string_view args) {
    std::string out = "usage: ";
    out += verb;
    if (!args.empty()) {
        out += ' ';
        out += args;
    }
    return out;
}

} // namespace

// ── parse_ttl_seconds ─────────────────────────────────────────────────────────

std::optional<std::chrono::milliseconds> parse_ttl_seconds(std::string_view text) {
    double seconds = 0.0;
    const char* end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(text.data(), end, seconds, std::chars_format::fixed);
    if (ec != std::errc{} || ptr != end || !std::isfinite(seconds) || seconds <= 0.0) {
        return std::nullopt;
    }
    // Anything positive lives for at least one millisecond.
    const double ms = std::ceil(seconds * 1000.0);
    if (ms > 9.0e15) {
        return std::nullopt;
    }
    return std::chrono::milliseconds(static_cast<int64_t>(ms));
}

// ── parse_command ─────────────────────────────────────────────────────────────

std::variant<Command, ErrorResp> parse_command(std::string_view line) {
    const auto tokens = tokenize(line);
    if (tokens.empty()) {
        return ErrorResp{"empty command"};
    }

    const std::string_view verb = tokens[0];
    const std::size_t nargs = tokens.size() - 1;

    // Verbs taking exactly one name-like argument.
    auto one_arg = [&](std::string_view args) -> std::variant<std::string, ErrorResp> {
        if (nargs != 1) {
            return ErrorResp{usage(verb, args)};
        }
        return std::string(tokens[1]);
    };

    // ── no-argument verbs ─────────────────────────────────────────────────────
    if (verb == "list-namespaces" || verb == "list-tables" || verb == "help" ||
        verb == "exit" || verb == "quit") {
        if (nargs != 0) {
            return ErrorResp{std::string(verb) + " takes no arguments"};
        }
        if (verb == "list-namespaces") return ListNamespacesCmd{};
        if (verb == "list-tables") return ListTablesCmd{};
        if (verb == "help") return HelpCmd{};
        return ExitCmd{};
    }

    // ── <verb> <name> ─────────────────────────────────────────────────────────
    if (verb == "create-namespace" || verb == "use-namespace") {
        auto arg = one_arg("<namespace>");
        if (auto* err = std::get_if<ErrorResp>(&arg)) return *err;
        auto name = std::get<std::string>(std::move(arg));
        if (verb == "create-namespace") return CreateNamespaceCmd{std::move(name)};
        return UseNamespaceCmd{std::move(name)};
    }

    if (verb == "create-table" || verb == "stats" || verb == "flush" || verb == "compact") {
        auto arg = one_arg("<table>");
        if (auto* err = std::get_if<ErrorResp>(&arg)) return *err;
        auto name = std::get<std::string>(std::move(arg));
        if (verb == "create-table") return CreateTableCmd{std::move(name)};
        if (verb == "stats") return StatsCmd{std::move(name)};
        if (verb == "flush") return FlushCmd{std::move(name)};
        return CompactCmd{std::move(name)};
    }

    // ── get / delete <table:key> ──────────────────────────────────────────────
    if (verb == "get" || verb == "delete") {
        if (nargs != 1) {
            return ErrorResp{usage(verb, "<table:key>")};
        }
        QualifiedKey qk;
        if (parse_qualified_key(tokens[1], qk)) {
            return ErrorResp{"expected <table:key>, got '" + std::string(tokens[1]) + "'"};
        }
        if (verb == "get") return GetCmd{std::move(qk.table), std::move(qk.key)};
        return DelCmd{std::move(qk.table), std::move(qk.key)};
    }

    // ── set <table:key:value> [ttl] ───────────────────────────────────────────
    //
    // The value is everything after the second ':'; it may contain ':'.
    if (verb == "set") {
        if (nargs != 1 && nargs != 2) {
            return ErrorResp{usage(verb, "<table:key:value> [ttl-seconds]")};
        }
        QualifiedKey qk;
        std::string value;
        if (parse_qualified_set(tokens[1], qk, value)) {
            return ErrorResp{"expected <table:key:value>, got '" + std::string(tokens[1]) + "'"};
        }

        SetCmd cmd{std::move(qk.table), std::move(qk.key), std::move(value), std::nullopt};
        if (nargs == 2) {
            cmd.ttl = parse_ttl_seconds(tokens[2]);
            if (!cmd.ttl) {
                return ErrorResp{"invalid TTL '" + std::string(tokens[2]) +
                                 "': expected a positive number of seconds"};
            }
        }
        return cmd;
    }

    return ErrorResp{"unknown command: " + std::string(verb) + " (try 'help')"};
}

// ── format_response ───────────────────────────────────────────────────────────

std::string format_response(const Response& response) {
    return std::visit(
        [](const auto& r) -> std::string {
            using T = std::decay_t<decltype(r)>;

            if constexpr (std::is_same_v<T, OkResp>) {
                return "[OK] " + r.message;
            } else if constexpr (std::is_same_v<T, WarnResp>) {
                return "[WARN] " + r.message;
            } else if constexpr (std::is_same_v<T, ErrorResp>) {
                return "[ERROR] " + r.message;
            } else if constexpr (std::is_same_v<T, ValueResp>) {
                return r.value;
            } else if constexpr (std::is_same_v<T, ListResp>) {
                std::string out;
                for (const auto& item : r.items) {
                    if (!out.empty()) out += ' ';
                    out += item;
                }
                return out;
            }
        },
        response);
}

std::string help_text() {
    return "commands: create-namespace <ns> | use-namespace <ns> | list-namespaces | "
           "create-table <table> | list-tables | stats <table> | "
           "set <table:key:value> [ttl-seconds] | get <table:key> | delete <table:key> | "
           "flush <table> | compact <table> | help | exit";
}

} // namespace kvtable::shell
