#pragma once

#include "quotaguard/types.hpp"

#include <mutex>

namespace quotaguard {

// Consistent view of the ledger, read under one lock
struct LedgerSnapshot {
    Cost ceiling{0.0};
    Cost total_spent{0.0};
    Cost remaining{0.0};
};

// Process-wide spend against a fixed ceiling.
//
// Every read and write goes through one mutex. Commits are not bounded by
// the ceiling: admission is decided on an estimate, so an admitted request
// can push total_spent past the ceiling by its own actual cost, and
// concurrently admitted requests can overshoot by the sum of theirs.
class BudgetLedger {
public:
    enum class Admission {
        Admitted,
        Exhausted,    // total_spent already >= ceiling
        WouldExceed   // total_spent + estimate >= ceiling
    };

    explicit BudgetLedger(Cost ceiling, Cost initial_spent = 0.0);

    BudgetLedger(const BudgetLedger&) = delete;
    BudgetLedger& operator=(const BudgetLedger&) = delete;

    Cost ceiling() const noexcept;
    Cost total_spent() const;
    Cost remaining() const;

    bool exhausted() const;

    // Non-strict: landing exactly on the ceiling counts as exceeding it
    bool would_exceed(Cost additional_cost) const;

    // Exhaustion and estimate checks in one critical section
    Admission try_admit(Cost estimated_cost) const;

    // Adds delta to total_spent. Throws std::invalid_argument for a negative
    // or non-finite delta.
    void commit(Cost delta);

    LedgerSnapshot snapshot() const;

    // Restores a known state; test harnesses only
    void reset(Cost total_spent = 0.0);

private:
    const Cost ceiling_;
    mutable std::mutex mutex_;
    Cost total_spent_;
};

inline const char* to_string(BudgetLedger::Admission a) {
    switch (a) {
        case BudgetLedger::Admission::Admitted:    return "Admitted";
        case BudgetLedger::Admission::Exhausted:   return "Exhausted";
        case BudgetLedger::Admission::WouldExceed: return "WouldExceed";
    }
    return "Unknown";
}

} // namespace quotaguard
