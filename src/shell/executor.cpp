#include "shell/executor.hpp"
#include "common/error.hpp"
#include "persistence/segment.hpp"

#include <spdlog/fmt/fmt.h>
#include <spdlog/fmt/ranges.h>
#include <spdlog/spdlog.h>

#include <exception>
#include <type_traits>

namespace kvtable::shell {

Executor::Executor(Catalog& catalog) : catalog_(catalog) {}

std::string Executor::run_line(std::string_view line) {
    auto parse_result = parse_command(line);
    if (auto* err = std::get_if<ErrorResp>(&parse_result)) {
        return format_response(*err);
    }
    return format_response(execute(std::get<Command>(parse_result)));
}

Response Executor::execute(const Command& cmd) {
    try {
        return dispatch(cmd);
    } catch (const std::exception& ex) {
        // Allocation failure or a filesystem_error from a directory walk.
        spdlog::error("shell: command failed: {}", ex.what());
        return ErrorResp{fmt::format("internal error: {}", ex.what())};
    }
}

// ── error mapping ─────────────────────────────────────────────────────────────

Response Executor::error_response(std::error_code ec, std::string_view name,
                                  std::string_view key) const {
    const std::string ns = session_.current_namespace.value_or("");

    if (ec.category() == error_category()) {
        switch (static_cast<errc>(ec.value())) {
        case errc::namespace_not_found:
            return ErrorResp{fmt::format("Namespace '{}' does not exist.", ns)};
        case errc::table_not_found:
            return ErrorResp{fmt::format("Table '{}' does not exist in namespace '{}'.", name, ns)};
        case errc::table_already_exists:
            return ErrorResp{fmt::format("Table '{}' already exists in namespace '{}'.", name, ns)};
        case errc::key_not_found:
            return WarnResp{fmt::format("Key '{}' not found in table '{}'.", key, name)};
        case errc::no_namespace_selected:
            return ErrorResp{"No namespace selected. Use 'use-namespace' first."};
        case errc::invalid_name:
            return ErrorResp{fmt::format(
                "Invalid name '{}': use 1-255 of [A-Za-z0-9_.-], not '.' or '..'.", name)};
        default:
            break;
        }
    }
    return ErrorResp{ec.message()};
}

// ── dispatch ──────────────────────────────────────────────────────────────────

Response Executor::dispatch(const Command& cmd) {
    return std::visit(
        [&](const auto& c) -> Response {
            using T = std::decay_t<decltype(c)>;

            if constexpr (std::is_same_v<T, CreateNamespaceCmd>) {
                if (auto ec = catalog_.create_namespace(c.name)) {
                    if (ec == errc::namespace_already_exists) {
                        return ErrorResp{fmt::format("Namespace '{}' already exists.", c.name)};
                    }
                    return error_response(ec, c.name);
                }
                return OkResp{fmt::format("Namespace '{}' created successfully.", c.name)};

            } else if constexpr (std::is_same_v<T, UseNamespaceCmd>) {
                if (auto ec = catalog_.use_namespace(session_, c.name)) {
                    return ErrorResp{fmt::format("Namespace '{}' does not exist.", c.name)};
                }
                return OkResp{fmt::format("Using namespace: {}", c.name)};

            } else if constexpr (std::is_same_v<T, ListNamespacesCmd>) {
                std::vector<std::string> names;
                if (auto ec = catalog_.list_namespaces(names)) {
                    return error_response(ec);
                }
                if (names.empty()) {
                    return WarnResp{"No namespaces."};
                }
                return ListResp{std::move(names)};

            } else if constexpr (std::is_same_v<T, CreateTableCmd>) {
                if (!session_.current_namespace) {
                    return error_response(make_error_code(errc::no_namespace_selected));
                }
                const auto& ns = *session_.current_namespace;
                if (auto ec = catalog_.create_table(ns, c.name)) {
                    return error_response(ec, c.name);
                }
                return OkResp{fmt::format("Table '{}' created in namespace '{}'.", c.name, ns)};

            } else if constexpr (std::is_same_v<T, ListTablesCmd>) {
                if (!session_.current_namespace) {
                    return error_response(make_error_code(errc::no_namespace_selected));
                }
                std::vector<std::string> names;
                if (auto ec = catalog_.list_tables(*session_.current_namespace, names)) {
                    return error_response(ec);
                }
                if (names.empty()) {
                    return WarnResp{fmt::format("No tables in namespace '{}'.",
                                                *session_.current_namespace)};
                }
                return ListResp{std::move(names)};

            } else if constexpr (std::is_same_v<T, StatsCmd>) {
                TableStats stats;
                if (auto ec = catalog_.table_stats(session_, c.table, stats)) {
                    return error_response(ec, c.table);
                }
                return OkResp{fmt::format(
                    "Table '{}': memstore {} records ({} bytes), segments [{}], next sequence {}{}",
                    c.table, stats.memstore_records, stats.memstore_bytes,
                    fmt::join(stats.segment_ids, ","), stats.next_sequence,
                    stats.recovered_from_corrupt_wal ? ", recovered from corrupt WAL" : "")};

            } else if constexpr (std::is_same_v<T, SetCmd>) {
                uint64_t version = 0;
                if (auto ec = catalog_.set(session_, c.table + ":" + c.key, c.value, c.ttl,
                                           version)) {
                    return error_response(ec, c.table, c.key);
                }
                return OkResp{fmt::format("Set '{}' in table '{}' (version {}).",
                                          c.key, c.table, version)};

            } else if constexpr (std::is_same_v<T, GetCmd>) {
                std::string value;
                if (auto ec = catalog_.get(session_, c.table + ":" + c.key, value)) {
                    return error_response(ec, c.table, c.key);
                }
                return ValueResp{std::move(value)};

            } else if constexpr (std::is_same_v<T, DelCmd>) {
                uint64_t version = 0;
                if (auto ec = catalog_.del(session_, c.table + ":" + c.key, version)) {
                    return error_response(ec, c.table, c.key);
                }
                return OkResp{fmt::format("Marked key '{}' as deleted in table '{}'.",
                                          c.key, c.table)};

            } else if constexpr (std::is_same_v<T, FlushCmd>) {
                std::optional<uint64_t> segment_id;
                if (auto ec = catalog_.flush(session_, c.table, segment_id)) {
                    return error_response(ec, c.table);
                }
                if (!segment_id) {
                    return WarnResp{"Nothing to flush."};
                }
                return OkResp{fmt::format("Flushed {}:{} to {}", *session_.current_namespace,
                                          c.table, persistence::Segment::filename(*segment_id))};

            } else if constexpr (std::is_same_v<T, CompactCmd>) {
                TableStats before;
                if (auto ec = catalog_.table_stats(session_, c.table, before)) {
                    return error_response(ec, c.table);
                }
                if (before.segment_ids.empty()) {
                    return WarnResp{"No files to compact."};
                }
                std::optional<uint64_t> segment_id;
                if (auto ec = catalog_.compact(session_, c.table, segment_id)) {
                    return error_response(ec, c.table);
                }
                if (!segment_id) {
                    return WarnResp{"No valid data to compact."};
                }
                return OkResp{fmt::format("Table '{}' compacted successfully. New file: {}",
                                          c.table, persistence::Segment::filename(*segment_id))};

            } else if constexpr (std::is_same_v<T, HelpCmd>) {
                return OkResp{help_text()};

            } else if constexpr (std::is_same_v<T, ExitCmd>) {
                exit_requested_ = true;
                return OkResp{"Bye."};
            }
        },
        cmd);
}

} // namespace kvtable::shell
