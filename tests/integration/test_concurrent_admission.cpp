#include <gtest/gtest.h>
#include <quotaguard/quotaguard.hpp>

#include <atomic>
#include <sstream>
#include <thread>
#include <vector>

using namespace quotaguard;
using namespace std::chrono_literals;

namespace {

// Fixed usage per call, with a short delay so dispatches overlap
class SlowUpstream : public UpstreamClient {
public:
    SlowUpstream(Usage usage, std::chrono::milliseconds delay)
        : usage_(usage), delay_(delay) {}

    std::atomic<int> calls{0};
    std::atomic<int> concurrent{0};
    std::atomic<int> peak_concurrent{0};

    ChatResponse complete(const ChatRequest& request, const std::string&) override {
        calls.fetch_add(1);
        int now = concurrent.fetch_add(1) + 1;
        int peak = peak_concurrent.load();
        while (now > peak && !peak_concurrent.compare_exchange_weak(peak, now)) {}

        std::this_thread::sleep_for(delay_);
        concurrent.fetch_sub(1);

        ChatResponse r;
        r.model = request.model;
        Choice c;
        c.message = {"assistant", "ok", ""};
        r.choices.push_back(c);
        r.usage = usage_;
        return r;
    }

private:
    Usage usage_;
    std::chrono::milliseconds delay_;
};

std::shared_ptr<const PriceCatalog> test_catalog() {
    std::istringstream in(
        "model,version,input,cached_input,output\n"
        "gpt-4o,gpt-4o-2024-08-06,2.5,1.25,10.0\n");
    return std::make_shared<const PriceCatalog>(PriceCatalog::from_csv(in, "test"));
}

ChatRequest hello_request() {
    ChatRequest r;
    r.model = "gpt-4o";
    r.messages = {{"user", "Hello", ""}};
    return r;
}

} // anonymous namespace

// ===========================================================================
// Ledger under contention
// ===========================================================================

TEST(ConcurrentLedgerTest, NoCommitIsLost) {
    constexpr int NUM_THREADS = 8;
    constexpr int COMMITS_PER_THREAD = 1000;

    BudgetLedger ledger(1e9);
    std::vector<std::thread> threads;
    for (int i = 0; i < NUM_THREADS; ++i) {
        threads.emplace_back([&]() {
            for (int k = 0; k < COMMITS_PER_THREAD; ++k) {
                ledger.commit(0.25);
            }
        });
    }
    for (auto& t : threads) t.join();

    // 0.25 is exact in binary, so the sum is exact
    EXPECT_DOUBLE_EQ(ledger.total_spent(), NUM_THREADS * COMMITS_PER_THREAD * 0.25);
}

TEST(ConcurrentLedgerTest, CalculatorIsSharedReadOnly) {
    constexpr int NUM_THREADS = 8;
    CostCalculator calc(test_catalog());
    const Cost expected = calc.calculate_cost(1000, 500, "gpt-4o-2024-11-20");

    std::atomic<int> mismatches{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < NUM_THREADS; ++i) {
        threads.emplace_back([&]() {
            for (int k = 0; k < 2000; ++k) {
                if (calc.calculate_cost(1000, 500, "gpt-4o-2024-11-20") != expected) {
                    mismatches.fetch_add(1);
                }
            }
        });
    }
    for (auto& t : threads) t.join();

    EXPECT_EQ(mismatches.load(), 0);
    EXPECT_NEAR(expected, 0.0075, 1e-12);
}

// ===========================================================================
// Controller under contention
// ===========================================================================

TEST(ConcurrentAdmissionTest, CommittedSpendMatchesAcceptedRequests) {
    constexpr int NUM_THREADS = 10;
    constexpr int REQUESTS_PER_THREAD = 20;

    // Each request costs 1000 * 2.5 / 1e6 + 500 * 10 / 1e6 = 0.0075
    constexpr Cost REQUEST_COST = 0.0075;
    Config cfg;
    auto ledger = std::make_shared<BudgetLedger>(100.0);
    auto upstream = std::make_shared<SlowUpstream>(Usage{1000, 500, 1500}, 1ms);
    AdmissionController ctrl(cfg, test_catalog(), ledger,
                             std::make_shared<ApproximateTokenizer>(), upstream);

    std::atomic<int> accepted{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < NUM_THREADS; ++i) {
        threads.emplace_back([&]() {
            for (int k = 0; k < REQUESTS_PER_THREAD; ++k) {
                auto result = ctrl.handle("Bearer sk-test", hello_request());
                if (result.accepted()) accepted.fetch_add(1);
            }
        });
    }
    for (auto& t : threads) t.join();

    EXPECT_EQ(accepted.load(), NUM_THREADS * REQUESTS_PER_THREAD);
    EXPECT_EQ(upstream->calls.load(), NUM_THREADS * REQUESTS_PER_THREAD);
    EXPECT_NEAR(ledger->total_spent(), accepted.load() * REQUEST_COST, 1e-9);
    EXPECT_EQ(ctrl.in_flight_requests(), 0u);
}

TEST(ConcurrentAdmissionTest, OvershootIsBoundedByInFlightCosts) {
    constexpr int NUM_THREADS = 16;
    constexpr int REQUESTS_PER_THREAD = 10;

    // Estimates are tiny, actual costs are 0.0125 each, so several requests
    // get admitted against a ceiling they collectively blow through
    constexpr Cost REQUEST_COST = 0.0125;
    constexpr Cost CEILING = 0.06;

    Config cfg;
    auto ledger = std::make_shared<BudgetLedger>(CEILING);
    auto upstream = std::make_shared<SlowUpstream>(Usage{1000, 1000, 2000}, 5ms);
    AdmissionController ctrl(cfg, test_catalog(), ledger,
                             std::make_shared<ApproximateTokenizer>(), upstream);

    std::atomic<int> accepted{0};
    std::atomic<int> exhausted{0};
    std::atomic<int> other{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < NUM_THREADS; ++i) {
        threads.emplace_back([&]() {
            for (int k = 0; k < REQUESTS_PER_THREAD; ++k) {
                auto result = ctrl.handle("Bearer sk-test", hello_request());
                if (result.accepted()) {
                    accepted.fetch_add(1);
                } else if (result.reason == RejectReason::BudgetExhausted ||
                           result.reason == RejectReason::BudgetWouldBeExceeded) {
                    exhausted.fetch_add(1);
                } else {
                    other.fetch_add(1);
                }
            }
        });
    }
    for (auto& t : threads) t.join();

    EXPECT_EQ(other.load(), 0);
    EXPECT_EQ(accepted.load() + exhausted.load(), NUM_THREADS * REQUESTS_PER_THREAD);
    EXPECT_GT(exhausted.load(), 0);

    // Every accepted request was charged exactly once
    EXPECT_NEAR(ledger->total_spent(), accepted.load() * REQUEST_COST, 1e-9);

    // Only requests admitted while the ledger was under the ceiling can push
    // past it, and at most NUM_THREADS of them are in flight at once
    EXPECT_LT(ledger->total_spent(), CEILING + NUM_THREADS * REQUEST_COST);
    EXPECT_LE(upstream->peak_concurrent.load(), NUM_THREADS);

    // After the run the gate stays closed
    auto late = ctrl.handle("Bearer sk-test", hello_request());
    EXPECT_EQ(late.reason, RejectReason::BudgetExhausted);
}

TEST(ConcurrentAdmissionTest, RejectedRequestsNeverReachUpstream) {
    constexpr int NUM_THREADS = 8;

    Config cfg;
    auto ledger = std::make_shared<BudgetLedger>(10.0);
    auto upstream = std::make_shared<SlowUpstream>(Usage{10, 10, 20}, 0ms);
    AdmissionController ctrl(cfg, test_catalog(), ledger,
                             std::make_shared<ApproximateTokenizer>(), upstream);

    std::vector<std::thread> threads;
    for (int i = 0; i < NUM_THREADS; ++i) {
        threads.emplace_back([&, i]() {
            ChatRequest req = hello_request();
            if (i % 2 == 0) req.model = "not-a-model";
            for (int k = 0; k < 25; ++k) {
                ctrl.handle(i % 4 == 1 ? "" : "Bearer sk-test", req);
            }
        });
    }
    for (auto& t : threads) t.join();

    // Even threads send an unlisted model, thread 1 and 5 send no credential;
    // only threads 3 and 7 get through
    EXPECT_EQ(upstream->calls.load(), 2 * 25);
    EXPECT_NEAR(ledger->total_spent(), 50 * (10 * 2.5 + 10 * 10.0) / 1e6, 1e-12);
}
