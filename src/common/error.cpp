#include "common/error.hpp"

namespace kvtable {

namespace {

class KvTableErrorCategory final : public std::error_category {
public:
    const char* name() const noexcept override { return "kvtable"; }

    std::string message(int ev) const override {
        switch (static_cast<errc>(ev)) {
        case errc::ok:                       return "success";
        case errc::namespace_not_found:      return "namespace not found";
        case errc::namespace_already_exists: return "namespace already exists";
        case errc::table_not_found:          return "table not found";
        case errc::table_already_exists:     return "table already exists";
        case errc::key_not_found:            return "key not found";
        case errc::wal_corruption:           return "WAL corruption";
        case errc::segment_write_failure:    return "segment write failure";
        case errc::segment_corruption:       return "segment corruption";
        case errc::invalid_ttl:              return "invalid TTL";
        case errc::invalid_name:             return "invalid name";
        case errc::invalid_key:              return "invalid key";
        case errc::no_namespace_selected:    return "no namespace selected";
        }
        return "unknown kvtable error";
    }
};

} // anonymous namespace

const std::error_category& error_category() noexcept {
    static const KvTableErrorCategory category;
    return category;
}

std::error_code make_error_code(errc e) noexcept {
    return {static_cast<int>(e), error_category()};
}

} // namespace kvtable
