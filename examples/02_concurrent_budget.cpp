// 02_concurrent_budget.cpp
//
// Many workers sharing one budget.
//
// Scenario:
//   - 8 worker threads each send 10 requests through the same gate.
//   - The simulated upstream takes 20ms per call, so requests overlap.
//   - Admission uses a prompt-only estimate, so requests already in flight
//     when the ceiling is reached still get charged: the final spend may
//     exceed the ceiling by at most the cost of those requests.
//   - MetricsMonitor tallies outcomes and raises an alert past 80% spend.

#include <quotaguard/quotaguard.hpp>

#include <algorithm>
#include <atomic>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <thread>
#include <vector>

using namespace quotaguard;
using namespace std::chrono_literals;

namespace {

class SlowUpstream : public UpstreamClient {
public:
    ChatResponse complete(const ChatRequest& request, const std::string&) override {
        std::this_thread::sleep_for(20ms);
        ChatResponse r;
        r.model = request.model;
        Choice c;
        c.message = {"assistant", "Done.", ""};
        r.choices.push_back(c);
        r.usage = {800, 400, 1200};
        return r;
    }
};

} // anonymous namespace

int main() {
    std::cout << "=== QuotaGuard: Concurrent Budget Example ===\n\n";

    constexpr int NUM_WORKERS = 8;
    constexpr int REQUESTS_PER_WORKER = 10;

    Config config;
    config.cost_ceiling = 0.05;
    config.pricing_path = std::string(QUOTAGUARD_SOURCE_DIR) + "/config/model_pricing.csv";

    auto metrics = std::make_shared<MetricsMonitor>();
    auto console = std::make_shared<ConsoleMonitor>(ConsoleMonitor::Verbosity::Normal);
    auto monitors = std::make_shared<CompositeMonitor>();
    monitors->add_monitor(metrics);
    monitors->add_monitor(console);

    std::mutex alert_mutex;
    metrics->set_spend_alert_threshold(0.8, [&](const std::string& msg) {
        std::lock_guard<std::mutex> lock(alert_mutex);
        std::cout << "[ALERT] " << msg << "\n";
    });

    auto catalog = load_price_catalog(config, monitors);
    auto ledger = std::make_shared<BudgetLedger>(config.cost_ceiling);
    AdmissionController gate(config, catalog, ledger,
                             std::make_shared<ApproximateTokenizer>(),
                             std::make_shared<SlowUpstream>());
    gate.set_monitor(monitors);

    std::atomic<int> accepted{0};
    std::vector<std::thread> workers;
    for (int w = 0; w < NUM_WORKERS; ++w) {
        workers.emplace_back([&, w]() {
            ChatRequest req;
            req.model = (w % 2 == 0) ? "gpt-4o" : "gpt-4.1";
            req.messages = {{"user", "Worker " + std::to_string(w) + " checking in", ""}};
            for (int i = 0; i < REQUESTS_PER_WORKER; ++i) {
                if (gate.handle("Bearer sk-worker", req).accepted()) {
                    accepted.fetch_add(1);
                }
            }
        });
    }
    for (auto& t : workers) t.join();

    auto m = metrics->get_metrics();
    auto snap = ledger->snapshot();

    std::cout << "\n=== Summary ===\n";
    std::cout << "Received:  " << m.received_requests << "\n";
    std::cout << "Accepted:  " << accepted.load() << "\n";
    std::cout << "Rejected:  " << m.rejected_requests << "\n";
    std::cout << std::fixed << std::setprecision(6);
    std::cout << "Ceiling:   $" << snap.ceiling << "\n";
    std::cout << "Spent:     $" << snap.total_spent << "\n";
    std::cout << "Overshoot: $" << std::max(0.0, snap.total_spent - snap.ceiling) << "\n";
    std::cout << "Avg cost:  $" << m.average_request_cost << "\n";

    std::cout << "\n=== Done ===\n";
    return 0;
}
