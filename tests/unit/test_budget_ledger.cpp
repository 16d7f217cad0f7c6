#include <gtest/gtest.h>
#include <quotaguard/quotaguard.hpp>

#include <limits>
#include <stdexcept>

using namespace quotaguard;

// ===========================================================================
// State and queries
// ===========================================================================

TEST(BudgetLedgerTest, StartsEmpty) {
    BudgetLedger ledger(2.0);
    EXPECT_DOUBLE_EQ(ledger.ceiling(), 2.0);
    EXPECT_DOUBLE_EQ(ledger.total_spent(), 0.0);
    EXPECT_DOUBLE_EQ(ledger.remaining(), 2.0);
    EXPECT_FALSE(ledger.exhausted());
}

TEST(BudgetLedgerTest, InitialSpendIsApplied) {
    BudgetLedger ledger(2.0, 1.5);
    EXPECT_DOUBLE_EQ(ledger.total_spent(), 1.5);
    EXPECT_DOUBLE_EQ(ledger.remaining(), 0.5);
}

TEST(BudgetLedgerTest, NegativeInitialSpendThrows) {
    EXPECT_THROW(BudgetLedger(2.0, -1.0), std::invalid_argument);
}

TEST(BudgetLedgerTest, CommitAccumulates) {
    BudgetLedger ledger(2.0);
    ledger.commit(0.5);
    ledger.commit(0.25);
    EXPECT_DOUBLE_EQ(ledger.total_spent(), 0.75);
    EXPECT_DOUBLE_EQ(ledger.remaining(), 1.25);
}

TEST(BudgetLedgerTest, CommitZeroIsAllowed) {
    BudgetLedger ledger(2.0);
    ledger.commit(0.0);
    EXPECT_DOUBLE_EQ(ledger.total_spent(), 0.0);
}

TEST(BudgetLedgerTest, CommitRejectsNegativeAndNonFinite) {
    BudgetLedger ledger(2.0);
    EXPECT_THROW(ledger.commit(-0.1), std::invalid_argument);
    EXPECT_THROW(ledger.commit(std::numeric_limits<double>::infinity()), std::invalid_argument);
    EXPECT_THROW(ledger.commit(std::numeric_limits<double>::quiet_NaN()), std::invalid_argument);
    EXPECT_DOUBLE_EQ(ledger.total_spent(), 0.0);
}

TEST(BudgetLedgerTest, CommitMayOvershootCeiling) {
    BudgetLedger ledger(1.0);
    ledger.commit(0.9);
    ledger.commit(0.5);
    EXPECT_DOUBLE_EQ(ledger.total_spent(), 1.4);
    EXPECT_LT(ledger.remaining(), 0.0);
    EXPECT_TRUE(ledger.exhausted());
}

// ===========================================================================
// Admission checks
// ===========================================================================

TEST(BudgetLedgerTest, ExhaustedAtExactCeiling) {
    BudgetLedger ledger(1.0);
    ledger.commit(1.0);
    EXPECT_TRUE(ledger.exhausted());
}

TEST(BudgetLedgerTest, WouldExceedIsNonStrict) {
    BudgetLedger ledger(1.0);
    ledger.commit(0.5);
    EXPECT_FALSE(ledger.would_exceed(0.25));
    EXPECT_TRUE(ledger.would_exceed(0.5));
    EXPECT_TRUE(ledger.would_exceed(0.75));
}

TEST(BudgetLedgerTest, TryAdmitOutcomes) {
    BudgetLedger ledger(1.0);
    EXPECT_EQ(ledger.try_admit(0.5), BudgetLedger::Admission::Admitted);
    EXPECT_EQ(ledger.try_admit(1.0), BudgetLedger::Admission::WouldExceed);

    ledger.commit(1.0);
    EXPECT_EQ(ledger.try_admit(0.0), BudgetLedger::Admission::Exhausted);
}

TEST(BudgetLedgerTest, ZeroCeilingRefusesEverything) {
    BudgetLedger ledger(0.0);
    EXPECT_TRUE(ledger.exhausted());
    EXPECT_EQ(ledger.try_admit(0.0), BudgetLedger::Admission::Exhausted);
}

TEST(BudgetLedgerTest, TryAdmitDoesNotReserve) {
    BudgetLedger ledger(1.0);
    EXPECT_EQ(ledger.try_admit(0.6), BudgetLedger::Admission::Admitted);
    EXPECT_EQ(ledger.try_admit(0.6), BudgetLedger::Admission::Admitted);
    EXPECT_DOUBLE_EQ(ledger.total_spent(), 0.0);
}

TEST(BudgetLedgerTest, SnapshotIsConsistent) {
    BudgetLedger ledger(3.0, 1.0);
    auto snap = ledger.snapshot();
    EXPECT_DOUBLE_EQ(snap.ceiling, 3.0);
    EXPECT_DOUBLE_EQ(snap.total_spent, 1.0);
    EXPECT_DOUBLE_EQ(snap.remaining, 2.0);
}

TEST(BudgetLedgerTest, ResetRestoresSpend) {
    BudgetLedger ledger(1.0);
    ledger.commit(0.8);
    ledger.reset();
    EXPECT_DOUBLE_EQ(ledger.total_spent(), 0.0);
    EXPECT_THROW(ledger.reset(-1.0), std::invalid_argument);
}

TEST(BudgetLedgerTest, AdmissionToString) {
    EXPECT_STREQ(to_string(BudgetLedger::Admission::Admitted), "Admitted");
    EXPECT_STREQ(to_string(BudgetLedger::Admission::Exhausted), "Exhausted");
    EXPECT_STREQ(to_string(BudgetLedger::Admission::WouldExceed), "WouldExceed");
}
