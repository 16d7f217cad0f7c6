#pragma once

#include "quotaguard/types.hpp"
#include "quotaguard/config.hpp"
#include "quotaguard/allow_list.hpp"
#include "quotaguard/budget_ledger.hpp"
#include "quotaguard/cost_calculator.hpp"
#include "quotaguard/monitor.hpp"
#include "quotaguard/price_catalog.hpp"
#include "quotaguard/tokenizer.hpp"
#include "quotaguard/upstream.hpp"

#include <atomic>
#include <memory>
#include <optional>
#include <string>

namespace quotaguard {

// Legal lifecycle edges:
//   Received -> Authorized -> Admitted -> Dispatched -> Reconciled
//   Received | Authorized | Admitted -> Rejected
bool is_valid_transition(AdmissionState from, AdmissionState to) noexcept;

// Runs one completion request through the budget gate.
//
// Per request: budget gate, credential check, decode and model check,
// prompt-only cost estimate, admission against the ledger, upstream call
// (outside any lock), reconciliation with the reported usage, and commit of
// the final cost. Only a successful round trip touches the ledger.
//
// handle() may be called concurrently from any number of threads.
class AdmissionController {
public:
    AdmissionController(Config config,
                        std::shared_ptr<const PriceCatalog> catalog,
                        std::shared_ptr<BudgetLedger> ledger,
                        std::shared_ptr<Tokenizer> tokenizer,
                        std::shared_ptr<UpstreamClient> upstream,
                        std::shared_ptr<RequestDecoder> decoder = nullptr);

    AdmissionController(const AdmissionController&) = delete;
    AdmissionController& operator=(const AdmissionController&) = delete;

    // ==================== Request handling ====================

    // authorization is the raw Authorization header value
    AdmissionResult handle(const std::string& authorization,
                           const ChatRequest& request);

    // Decodes body with the configured RequestDecoder after the credential
    // check. Throws InvalidConfigException when no decoder was supplied.
    AdmissionResult handle_raw(const std::string& authorization,
                               const std::string& body);

    // ==================== Queries ====================

    StatusSnapshot status() const;
    PricingTable pricing() const;
    const ModelAllowList& allow_list() const noexcept;
    const CostCalculator& calculator() const noexcept;
    std::shared_ptr<BudgetLedger> ledger() const noexcept;
    std::size_t in_flight_requests() const noexcept;

    // ==================== Configuration ====================

    // Not synchronized with handle(); install before serving requests
    void set_monitor(std::shared_ptr<Monitor> monitor);

private:
    Config config_;
    std::shared_ptr<const PriceCatalog> catalog_;
    std::shared_ptr<BudgetLedger> ledger_;
    std::shared_ptr<Tokenizer> tokenizer_;
    std::shared_ptr<UpstreamClient> upstream_;
    std::shared_ptr<RequestDecoder> decoder_;
    std::shared_ptr<Monitor> monitor_;

    CostCalculator calculator_;
    ModelAllowList allow_list_;
    std::atomic<std::size_t> in_flight_{0};

    class Lifecycle;

    AdmissionResult process(const std::string& authorization,
                            const ChatRequest* request,
                            const std::string* body);

    AdmissionResult reject(Lifecycle& lifecycle, RejectReason reason,
                           std::string message, bool include_ledger);

    void emit_event(MonitorEvent event);
    void emit_snapshot();
};

} // namespace quotaguard
