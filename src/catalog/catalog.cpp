#include "catalog/catalog.hpp"
#include "common/error.hpp"
#include "persistence/segment.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

namespace kvtable {

namespace fs = std::filesystem;

// ── Names and qualified keys ─────────────────────────────────────────────────

bool is_valid_name(std::string_view name) {
    if (name.empty() || name.size() > 255) return false;
    if (name == "." || name == "..") return false;
    return std::all_of(name.begin(), name.end(), [](char c) {
        return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
               (c >= '0' && c <= '9') || c == '_' || c == '-' || c == '.';
    });
}

std::error_code parse_qualified_key(std::string_view text, QualifiedKey& out) {
    const auto colon = text.find(':');
    if (colon == std::string_view::npos) {
        return make_error_code(errc::invalid_key);
    }
    auto table = text.substr(0, colon);
    auto key = text.substr(colon + 1);
    if (!is_valid_name(table) || key.empty() || key.find(':') != std::string_view::npos) {
        return make_error_code(errc::invalid_key);
    }
    out.table = std::string(table);
    out.key = std::string(key);
    return {};
}

std::error_code parse_qualified_set(std::string_view text, QualifiedKey& out, std::string& value) {
    const auto first = text.find(':');
    if (first == std::string_view::npos) {
        return make_error_code(errc::invalid_key);
    }
    const auto second = text.find(':', first + 1);
    if (second == std::string_view::npos) {
        return make_error_code(errc::invalid_key);
    }
    if (auto ec = parse_qualified_key(text.substr(0, second), out)) {
        return ec;
    }
    value = std::string(text.substr(second + 1));
    return {};
}

// ── Catalog ──────────────────────────────────────────────────────────────────

Catalog::Catalog(fs::path root, const Clock& clock, TableOptions table_options)
    : root_(std::move(root)), clock_(clock), table_options_(table_options) {}

Catalog::Catalog(const EngineConfig& cfg, const Clock& clock)
    : Catalog(fs::path(cfg.root), clock,
              TableOptions{.memstore_flush_bytes = cfg.memstore_flush_bytes,
                           .compaction_trigger = cfg.compaction_trigger}) {}

std::error_code Catalog::init() {
    std::error_code ec;
    fs::create_directories(root_, ec);
    if (ec) {
        spdlog::error("Catalog: cannot create root {}: {}", root_.string(), ec.message());
        return ec;
    }
    spdlog::info("Catalog: storage root {}", root_.string());
    return {};
}

// ── Namespaces ───────────────────────────────────────────────────────────────

bool Catalog::namespace_exists(const std::string& name) const {
    std::error_code ec;
    return is_valid_name(name) && fs::is_directory(namespace_dir(name), ec);
}

std::error_code Catalog::open_or_create_namespace(const std::string& name, OpenOutcome& outcome) {
    if (!is_valid_name(name)) {
        return make_error_code(errc::invalid_name);
    }

    std::error_code ec;
    const bool created = fs::create_directory(namespace_dir(name), ec);
    if (ec) {
        spdlog::error("Catalog: cannot create namespace '{}': {}", name, ec.message());
        return ec;
    }
    if (!created && !fs::is_directory(namespace_dir(name), ec)) {
        // A plain file is squatting on the name.
        return make_error_code(errc::invalid_name);
    }

    outcome = created ? OpenOutcome::Created : OpenOutcome::OpenedExisting;
    if (created) {
        if (auto sync_ec = persistence::Segment::sync_directory(root_)) {
            spdlog::warn("Catalog: fsync of {} failed: {}", root_.string(), sync_ec.message());
        }
        spdlog::info("Catalog: namespace '{}' created", name);
    }
    return {};
}

std::error_code Catalog::create_namespace(const std::string& name) {
    OpenOutcome outcome{};
    if (auto ec = open_or_create_namespace(name, outcome)) {
        return ec;
    }
    if (outcome == OpenOutcome::OpenedExisting) {
        return make_error_code(errc::namespace_already_exists);
    }
    return {};
}

std::error_code Catalog::use_namespace(Session& session, const std::string& name) const {
    if (!namespace_exists(name)) {
        return make_error_code(errc::namespace_not_found);
    }
    session.current_namespace = name;
    return {};
}

std::error_code Catalog::list_namespaces(std::vector<std::string>& names) const {
    names.clear();
    std::error_code ec;
    fs::directory_iterator it(root_, ec);
    if (ec) return ec;
    for (const auto& entry : it) {
        if (entry.is_directory(ec)) {
            names.push_back(entry.path().filename().string());
        }
    }
    std::sort(names.begin(), names.end());
    return {};
}

// ── Tables ───────────────────────────────────────────────────────────────────

std::error_code Catalog::open_or_create_table(const std::string& ns, const std::string& name,
                                              OpenOutcome& outcome) {
    if (!is_valid_name(ns)) {
        return make_error_code(errc::invalid_name);
    }
    if (!namespace_exists(ns)) {
        return make_error_code(errc::namespace_not_found);
    }
    if (!is_valid_name(name)) {
        return make_error_code(errc::invalid_name);
    }

    const auto dir = namespace_dir(ns) / name;
    std::error_code ec;
    const bool created = fs::create_directory(dir, ec);
    if (ec) {
        spdlog::error("Catalog: cannot create table '{}/{}': {}", ns, name, ec.message());
        return ec;
    }
    if (!created && !fs::is_directory(dir, ec)) {
        return make_error_code(errc::invalid_name);
    }

    outcome = created ? OpenOutcome::Created : OpenOutcome::OpenedExisting;
    if (created) {
        if (auto sync_ec = persistence::Segment::sync_directory(namespace_dir(ns))) {
            spdlog::warn("Catalog: fsync of {} failed: {}", namespace_dir(ns).string(),
                         sync_ec.message());
        }
        spdlog::info("Catalog: table '{}/{}' created", ns, name);
    }
    return {};
}

std::error_code Catalog::create_table(const std::string& ns, const std::string& name) {
    OpenOutcome outcome{};
    if (auto ec = open_or_create_table(ns, name, outcome)) {
        return ec;
    }
    if (outcome == OpenOutcome::OpenedExisting) {
        return make_error_code(errc::table_already_exists);
    }
    return {};
}

std::error_code Catalog::list_tables(const std::string& ns, std::vector<std::string>& names) const {
    names.clear();
    if (!namespace_exists(ns)) {
        return make_error_code(errc::namespace_not_found);
    }
    std::error_code ec;
    fs::directory_iterator it(namespace_dir(ns), ec);
    if (ec) return ec;
    for (const auto& entry : it) {
        if (entry.is_directory(ec)) {
            names.push_back(entry.path().filename().string());
        }
    }
    std::sort(names.begin(), names.end());
    return {};
}

std::error_code Catalog::table(const std::string& ns, const std::string& name,
                               std::shared_ptr<Table>& out) {
    if (!namespace_exists(ns)) {
        return make_error_code(errc::namespace_not_found);
    }
    if (!is_valid_name(name)) {
        return make_error_code(errc::table_not_found);
    }

    std::lock_guard lock(mutex_);
    auto key = std::make_pair(ns, name);
    if (auto it = open_tables_.find(key); it != open_tables_.end()) {
        out = it->second;
        return {};
    }

    const auto dir = namespace_dir(ns) / name;
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        return make_error_code(errc::table_not_found);
    }

    auto tbl = std::make_shared<Table>(ns, name, dir, clock_, table_options_);
    if (auto open_ec = tbl->open()) {
        spdlog::error("Catalog: opening table '{}/{}' failed: {}", ns, name, open_ec.message());
        return open_ec;
    }
    open_tables_.emplace(std::move(key), tbl);
    out = std::move(tbl);
    return {};
}

// ── Key operations ───────────────────────────────────────────────────────────

std::error_code Catalog::resolve(const Session& session, const std::string& table_name,
                                 std::shared_ptr<Table>& out) {
    if (!session.current_namespace) {
        return make_error_code(errc::no_namespace_selected);
    }
    return table(*session.current_namespace, table_name, out);
}

std::error_code Catalog::set(const Session& session, std::string_view qualified_key,
                             std::string value, std::optional<std::chrono::milliseconds> ttl,
                             uint64_t& version) {
    QualifiedKey qk;
    if (auto ec = parse_qualified_key(qualified_key, qk)) return ec;
    if (ttl && ttl->count() <= 0) {
        return make_error_code(errc::invalid_ttl);
    }

    std::shared_ptr<Table> tbl;
    if (auto ec = resolve(session, qk.table, tbl)) return ec;
    return tbl->set(std::move(qk.key), std::move(value), ttl, version);
}

std::error_code Catalog::get(const Session& session, std::string_view qualified_key,
                             std::string& value) {
    QualifiedKey qk;
    if (auto ec = parse_qualified_key(qualified_key, qk)) return ec;

    std::shared_ptr<Table> tbl;
    if (auto ec = resolve(session, qk.table, tbl)) return ec;

    auto rec = tbl->get(qk.key);
    if (!rec) {
        return make_error_code(errc::key_not_found);
    }
    value = std::move(rec->value);
    return {};
}

std::error_code Catalog::del(const Session& session, std::string_view qualified_key,
                             uint64_t& version) {
    QualifiedKey qk;
    if (auto ec = parse_qualified_key(qualified_key, qk)) return ec;

    std::shared_ptr<Table> tbl;
    if (auto ec = resolve(session, qk.table, tbl)) return ec;
    return tbl->del(std::move(qk.key), version);
}

std::error_code Catalog::flush(const Session& session, const std::string& table_name,
                               std::optional<uint64_t>& segment_id) {
    std::shared_ptr<Table> tbl;
    if (auto ec = resolve(session, table_name, tbl)) return ec;
    return tbl->flush(segment_id);
}

std::error_code Catalog::compact(const Session& session, const std::string& table_name,
                                 std::optional<uint64_t>& segment_id) {
    std::shared_ptr<Table> tbl;
    if (auto ec = resolve(session, table_name, tbl)) return ec;
    return tbl->compact(segment_id);
}

std::error_code Catalog::table_stats(const Session& session, const std::string& table_name,
                                     TableStats& stats) {
    std::shared_ptr<Table> tbl;
    if (auto ec = resolve(session, table_name, tbl)) return ec;
    stats = tbl->stats();
    return {};
}

} // namespace kvtable
