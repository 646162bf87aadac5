#pragma once

#include <chrono>
#include <cstdint>

namespace kvtable {

// ── Clock abstraction ────────────────────────────────────────────────────────
//
// Time source for TTL computation and expiry checks.  Expiry instants are
// persisted, so the clock is wall-clock based (milliseconds since the Unix
// epoch) rather than steady.  Tests use a manually-advanceable clock.

class Clock {
public:
    virtual ~Clock() = default;

    // Milliseconds since the Unix epoch.
    [[nodiscard]] virtual int64_t now_ms() const = 0;
};

// ── SystemClock ──────────────────────────────────────────────────────────────
//
// Production implementation: delegates to std::chrono::system_clock.

class SystemClock final : public Clock {
public:
    [[nodiscard]] int64_t now_ms() const override {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
                   std::chrono::system_clock::now().time_since_epoch())
            .count();
    }

    // Shared process-wide instance.
    static const SystemClock& instance() {
        static const SystemClock clock;
        return clock;
    }
};

// ── ManualClock ──────────────────────────────────────────────────────────────
//
// Test implementation: time only advances via explicit advance() calls.

class ManualClock final : public Clock {
public:
    explicit ManualClock(int64_t start_ms = 1'700'000'000'000) : now_(start_ms) {}

    [[nodiscard]] int64_t now_ms() const override {
        return now_;
    }

    void advance(std::chrono::milliseconds delta) {
        now_ += delta.count();
    }

    void set(int64_t ms) {
        now_ = ms;
    }

private:
    int64_t now_;
};

} // namespace kvtable
