#include "quotaguard/budget_ledger.hpp"

#include <cmath>
#include <stdexcept>
#include <string>

namespace quotaguard {

BudgetLedger::BudgetLedger(Cost ceiling, Cost initial_spent)
    : ceiling_(ceiling)
    , total_spent_(initial_spent)
{
    if (!std::isfinite(initial_spent) || initial_spent < 0.0) {
        throw std::invalid_argument("BudgetLedger initial spend must be non-negative");
    }
}

Cost BudgetLedger::ceiling() const noexcept { return ceiling_; }

Cost BudgetLedger::total_spent() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return total_spent_;
}

Cost BudgetLedger::remaining() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ceiling_ - total_spent_;
}

bool BudgetLedger::exhausted() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return total_spent_ >= ceiling_;
}

bool BudgetLedger::would_exceed(Cost additional_cost) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return total_spent_ + additional_cost >= ceiling_;
}

BudgetLedger::Admission BudgetLedger::try_admit(Cost estimated_cost) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (total_spent_ >= ceiling_) {
        return Admission::Exhausted;
    }
    if (total_spent_ + estimated_cost >= ceiling_) {
        return Admission::WouldExceed;
    }
    return Admission::Admitted;
}

void BudgetLedger::commit(Cost delta) {
    if (!std::isfinite(delta) || delta < 0.0) {
        throw std::invalid_argument("Cannot commit cost " + std::to_string(delta));
    }
    std::lock_guard<std::mutex> lock(mutex_);
    total_spent_ += delta;
}

LedgerSnapshot BudgetLedger::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return LedgerSnapshot{ceiling_, total_spent_, ceiling_ - total_spent_};
}

void BudgetLedger::reset(Cost total_spent) {
    if (!std::isfinite(total_spent) || total_spent < 0.0) {
        throw std::invalid_argument("BudgetLedger spend must be non-negative");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    total_spent_ = total_spent;
}

} // namespace quotaguard
