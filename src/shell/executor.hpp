#pragma once

#include "catalog/catalog.hpp"
#include "shell/command.hpp"

#include <string>
#include <string_view>
#include <system_error>

namespace kvtable::shell {

// Executes shell commands against a Catalog on behalf of one Session.
//
// Every engine failure becomes an ErrorResp (or WarnResp for benign
// outcomes such as "nothing to flush"); execute() never throws for engine
// errors, so a REPL can keep reading after any of them.
class Executor {
public:
    explicit Executor(Catalog& catalog);

    // Parse and execute one input line, returning the line to print.
    [[nodiscard]] std::string run_line(std::string_view line);

    [[nodiscard]] Response execute(const Command& cmd);

    [[nodiscard]] bool exit_requested() const noexcept { return exit_requested_; }
    [[nodiscard]] const Session& session() const noexcept { return session_; }

private:
    [[nodiscard]] Response dispatch(const Command& cmd);

    // Map an engine error to a one-line message in the context of `table`
    // (and `key` for key operations).
    [[nodiscard]] Response error_response(std::error_code ec,
                                          std::string_view name = {},
                                          std::string_view key = {}) const;

    Catalog& catalog_;
    Session session_;
    bool exit_requested_ = false;
};

} // namespace kvtable::shell
