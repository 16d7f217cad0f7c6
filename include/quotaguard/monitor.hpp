#pragma once

#include "quotaguard/types.hpp"

#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace quotaguard {

enum class EventType {
    // Pricing catalog
    PricingLoaded,
    PricingRowSkipped,
    PricingLoadFailed,
    PricingFallbackUsed,
    // Request lifecycle
    RequestReceived,
    RequestRejected,
    RequestAdmitted,
    UpstreamFailed,
    CostReconciled,
    CostCommitted
};

const char* to_string(EventType t);

struct MonitorEvent {
    EventType type;
    Timestamp timestamp;
    std::string message;

    std::optional<std::string> model;
    std::optional<RejectReason> reason;
    std::optional<TokenCount> prompt_tokens;
    std::optional<TokenCount> completion_tokens;

    // Request cost (estimated or final, depending on the event)
    std::optional<Cost> cost;

    // Ledger state right after the event
    std::optional<Cost> total_spent;
    std::optional<Cost> remaining;

    // Pricing source line, for row-level warnings
    std::optional<std::size_t> line;
};

// Abstract monitor interface
class Monitor {
public:
    virtual ~Monitor() = default;
    virtual void on_event(const MonitorEvent& event) = 0;
    virtual void on_snapshot(const StatusSnapshot& snapshot) = 0;
};

// Console logger
class ConsoleMonitor : public Monitor {
public:
    enum class Verbosity { Quiet, Normal, Verbose, Debug };

    explicit ConsoleMonitor(Verbosity v = Verbosity::Normal);

    void on_event(const MonitorEvent& event) override;
    void on_snapshot(const StatusSnapshot& snapshot) override;

private:
    Verbosity verbosity_;
    mutable std::mutex output_mutex_;
};

// Metrics collector
class MetricsMonitor : public Monitor {
public:
    struct Metrics {
        std::uint64_t received_requests{0};
        std::uint64_t admitted_requests{0};
        std::uint64_t rejected_requests{0};
        std::uint64_t upstream_failures{0};
        std::uint64_t committed_requests{0};
        std::uint64_t pricing_fallbacks{0};
        Cost committed_cost{0.0};
        Cost failed_estimated_cost{0.0};
        Cost average_request_cost{0.0};
        double spend_ratio{0.0};
        std::unordered_map<RejectReason, std::uint64_t> rejections_by_reason;
    };

    MetricsMonitor();

    void on_event(const MonitorEvent& event) override;
    void on_snapshot(const StatusSnapshot& snapshot) override;

    Metrics get_metrics() const;
    void reset_metrics();

    using AlertCallback = std::function<void(const std::string&)>;

    // Fires from on_snapshot when total_spent / ceiling exceeds the ratio
    void set_spend_alert_threshold(double ratio, AlertCallback cb);

private:
    mutable std::mutex metrics_mutex_;
    Metrics metrics_;

    double spend_threshold_{1.0};
    AlertCallback spend_cb_;  // empty means disabled
};

// Fan-out to multiple monitors
class CompositeMonitor : public Monitor {
public:
    void add_monitor(std::shared_ptr<Monitor> monitor);

    void on_event(const MonitorEvent& event) override;
    void on_snapshot(const StatusSnapshot& snapshot) override;

private:
    std::vector<std::shared_ptr<Monitor>> monitors_;
};

} // namespace quotaguard
