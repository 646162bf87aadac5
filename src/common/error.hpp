#pragma once

#include <string>
#include <system_error>
#include <type_traits>

namespace kvtable {

// ── Engine error taxonomy ────────────────────────────────────────────────────
//
// Every engine operation reports failure through std::error_code.  Codes in
// this enum belong to kvtable::error_category(); raw POSIX failures keep
// std::system_category() and are logged where they occur.

enum class errc {
    ok = 0,
    namespace_not_found = 1,
    namespace_already_exists,
    table_not_found,
    table_already_exists,
    key_not_found,            // absent, tombstoned or expired
    wal_corruption,           // malformed / truncated WAL tail
    segment_write_failure,    // flush or compaction could not commit
    segment_corruption,       // unreadable segment on table open
    invalid_ttl,              // non-positive or unparseable duration
    invalid_name,             // bad namespace / table name
    invalid_key,              // malformed qualified key
    no_namespace_selected,
};

[[nodiscard]] const std::error_category& error_category() noexcept;

[[nodiscard]] std::error_code make_error_code(errc e) noexcept;

} // namespace kvtable

namespace std {
template <>
struct is_error_code_enum<kvtable::errc> : true_type {};
} // namespace std
