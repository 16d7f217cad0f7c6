// 01_basic_usage.cpp
//
// Minimal QuotaGuard example: one gate, a handful of requests.
// Demonstrates how requests are priced, admitted, charged and refused.
//
// Scenario:
//   - The bundled pricing table is loaded at startup.
//   - A simulated upstream answers every call with fixed usage.
//   - The ceiling is $0.02, so the third gpt-4o call overshoots it and
//     every call after that is refused.
//   - Bad credentials and unlisted models are refused without spending.

#include <quotaguard/quotaguard.hpp>

#include <iomanip>
#include <iostream>
#include <string>

using namespace quotaguard;

namespace {

// Stands in for the metered API
class SimulatedUpstream : public UpstreamClient {
public:
    ChatResponse complete(const ChatRequest& request, const std::string&) override {
        ChatResponse r;
        r.id = "chatcmpl-" + std::to_string(++counter_);
        r.object = "chat.completion";
        r.model = request.model;
        Choice c;
        c.message = {"assistant", "Here is a short answer.", ""};
        c.finish_reason = "stop";
        r.choices.push_back(c);
        r.usage = {1000, 500, 1500};
        return r;
    }

private:
    int counter_{0};
};

ChatRequest make_request(const std::string& model) {
    ChatRequest r;
    r.model = model;
    r.messages = {{"user", "What is the capital of France?", ""}};
    return r;
}

void print_result(const AdmissionResult& result) {
    std::cout << "Result: " << to_string(result.state);
    if (result.reason.has_value()) {
        std::cout << " (" << to_string(result.reason.value())
                  << ", HTTP " << http_status(result.reason.value()) << ")";
    }
    std::cout << " | " << result.message << "\n";
    if (result.response && result.response->proxy_usage) {
        auto& pu = result.response->proxy_usage.value();
        std::cout << "  prompt_tokens=" << pu.prompt_tokens
                  << " completion_tokens=" << pu.completion_tokens
                  << " cost_usd=" << std::fixed << std::setprecision(6) << pu.cost_usd << "\n";
    }
    std::cout << "\n";
}

} // anonymous namespace

int main() {
    std::cout << "=== QuotaGuard: Basic Usage Example ===\n\n";

    // ----------------------------------------------------------------
    // 1. Configure the gate and load pricing.
    // ----------------------------------------------------------------
    Config config;
    config.cost_ceiling = 0.02;
    config.pricing_path = std::string(QUOTAGUARD_SOURCE_DIR) + "/config/model_pricing.csv";

    auto console = std::make_shared<ConsoleMonitor>(ConsoleMonitor::Verbosity::Verbose);
    auto catalog = load_price_catalog(config, console);

    // ----------------------------------------------------------------
    // 2. Wire the controller.
    // ----------------------------------------------------------------
    AdmissionController gate(config, catalog,
                             std::make_shared<BudgetLedger>(config.cost_ceiling),
                             std::make_shared<ApproximateTokenizer>(),
                             std::make_shared<SimulatedUpstream>());
    gate.set_monitor(console);

    // ----------------------------------------------------------------
    // 3. Refusals that never touch the budget.
    // ----------------------------------------------------------------
    std::cout << "--- No credential ---\n";
    print_result(gate.handle("", make_request("gpt-4o")));

    std::cout << "--- Unlisted model ---\n";
    print_result(gate.handle("Bearer sk-demo", make_request("llama-3-70b")));

    // ----------------------------------------------------------------
    // 4. Spend the budget. Each call costs $0.0075.
    // ----------------------------------------------------------------
    for (int i = 1; i <= 4; ++i) {
        std::cout << "--- gpt-4o call " << i << " ---\n";
        print_result(gate.handle("Bearer sk-demo", make_request("gpt-4o")));
    }

    // ----------------------------------------------------------------
    // 5. Final status.
    // ----------------------------------------------------------------
    auto status = gate.status();
    std::cout << "=== Status ===\n";
    std::cout << std::fixed << std::setprecision(6);
    std::cout << "Ceiling:     $" << status.ceiling << "\n";
    std::cout << "Total spent: $" << status.total_spent << "\n";
    std::cout << "Remaining:   $" << status.remaining << "\n";
    std::cout << "Models:      " << status.models_count << "\n";

    std::cout << "\n=== Done ===\n";
    return 0;
}
