#include "quotaguard/monitor.hpp"

#include <iostream>
#include <iomanip>
#include <sstream>

namespace quotaguard {

const char* to_string(EventType t) {
    switch (t) {
        case EventType::PricingLoaded:       return "PricingLoaded";
        case EventType::PricingRowSkipped:   return "PricingRowSkipped";
        case EventType::PricingLoadFailed:   return "PricingLoadFailed";
        case EventType::PricingFallbackUsed: return "PricingFallbackUsed";
        case EventType::RequestReceived:     return "RequestReceived";
        case EventType::RequestRejected:     return "RequestRejected";
        case EventType::RequestAdmitted:     return "RequestAdmitted";
        case EventType::UpstreamFailed:      return "UpstreamFailed";
        case EventType::CostReconciled:      return "CostReconciled";
        case EventType::CostCommitted:       return "CostCommitted";
    }
    return "Unknown";
}

namespace {

bool is_important_event(EventType t) {
    switch (t) {
        case EventType::PricingLoaded:
        case EventType::PricingRowSkipped:
        case EventType::PricingLoadFailed:
        case EventType::PricingFallbackUsed:
        case EventType::RequestRejected:
        case EventType::UpstreamFailed:
        case EventType::CostCommitted:
            return true;
        default:
            return false;
    }
}

} // anonymous namespace

// ========== ConsoleMonitor ==========

ConsoleMonitor::ConsoleMonitor(Verbosity v) : verbosity_(v) {}

void ConsoleMonitor::on_event(const MonitorEvent& event) {
    if (verbosity_ == Verbosity::Quiet) return;
    if (verbosity_ < Verbosity::Debug && !is_important_event(event.type)) return;

    // Format first so concurrent workers do not interleave partial lines
    std::ostringstream out;
    out << "[QuotaGuard] " << to_string(event.type);

    if (event.model.has_value()) {
        out << " model=" << event.model.value();
    }
    if (event.reason.has_value()) {
        out << " reason=" << to_string(event.reason.value());
    }
    if (event.prompt_tokens.has_value()) {
        out << " prompt_tokens=" << event.prompt_tokens.value();
    }
    if (event.completion_tokens.has_value()) {
        out << " completion_tokens=" << event.completion_tokens.value();
    }
    out << std::fixed << std::setprecision(6);
    if (event.cost.has_value()) {
        out << " cost=$" << event.cost.value();
    }
    if (event.total_spent.has_value()) {
        out << " total_cost=$" << event.total_spent.value();
    }
    if (event.remaining.has_value()) {
        out << " remaining=$" << event.remaining.value();
    }
    if (event.line.has_value()) {
        out << " line=" << event.line.value();
    }

    if (!event.message.empty()) {
        out << " | " << event.message;
    }

    std::lock_guard<std::mutex> lock(output_mutex_);
    std::cout << out.str() << "\n";
}

void ConsoleMonitor::on_snapshot(const StatusSnapshot& snapshot) {
    if (verbosity_ < Verbosity::Verbose) return;

    std::ostringstream out;
    out << std::fixed << std::setprecision(6);
    out << "\n[QuotaGuard] === Budget Snapshot ===\n";
    out << "  Ceiling:     $" << snapshot.ceiling << "\n";
    out << "  Total spent: $" << snapshot.total_spent << "\n";
    out << "  Remaining:   $" << snapshot.remaining << "\n";
    out << "  In flight:   " << snapshot.in_flight_requests << "\n";
    out << "  Models:      " << snapshot.models_count << "\n";
    if (verbosity_ == Verbosity::Debug) {
        for (auto& key : snapshot.available_models) {
            out << "    " << key << "\n";
        }
    }
    out << "  ========================\n\n";

    std::lock_guard<std::mutex> lock(output_mutex_);
    std::cout << out.str();
}

// ========== MetricsMonitor ==========

MetricsMonitor::MetricsMonitor() = default;

void MetricsMonitor::on_event(const MonitorEvent& event) {
    std::lock_guard<std::mutex> lock(metrics_mutex_);

    switch (event.type) {
        case EventType::RequestReceived:
            metrics_.received_requests++;
            break;
        case EventType::RequestAdmitted:
            metrics_.admitted_requests++;
            break;
        case EventType::RequestRejected:
            metrics_.rejected_requests++;
            if (event.reason.has_value()) {
                metrics_.rejections_by_reason[event.reason.value()]++;
            }
            break;
        case EventType::UpstreamFailed:
            metrics_.upstream_failures++;
            metrics_.failed_estimated_cost += event.cost.value_or(0.0);
            break;
        case EventType::CostCommitted:
            metrics_.committed_requests++;
            metrics_.committed_cost += event.cost.value_or(0.0);
            metrics_.average_request_cost =
                metrics_.committed_cost / static_cast<double>(metrics_.committed_requests);
            break;
        case EventType::PricingFallbackUsed:
            metrics_.pricing_fallbacks++;
            break;
        default:
            break;
    }
}

void MetricsMonitor::on_snapshot(const StatusSnapshot& snapshot) {
    AlertCallback cb;
    std::string alert;
    {
        std::lock_guard<std::mutex> lock(metrics_mutex_);

        metrics_.spend_ratio = (snapshot.ceiling > 0.0)
                               ? snapshot.total_spent / snapshot.ceiling : 1.0;

        if (spend_cb_ && metrics_.spend_ratio > spend_threshold_) {
            std::ostringstream msg;
            msg << "Spend " << std::fixed << std::setprecision(6) << snapshot.total_spent
                << " is " << std::setprecision(1) << metrics_.spend_ratio * 100.0
                << "% of ceiling " << std::setprecision(6) << snapshot.ceiling;
            alert = msg.str();
            cb = spend_cb_;
        }
    }

    // Invoked unlocked so the callback may read or reset the metrics
    if (cb) {
        cb(alert);
    }
}

MetricsMonitor::Metrics MetricsMonitor::get_metrics() const {
    std::lock_guard<std::mutex> lock(metrics_mutex_);
    return metrics_;
}

void MetricsMonitor::reset_metrics() {
    std::lock_guard<std::mutex> lock(metrics_mutex_);
    metrics_ = Metrics{};
}

void MetricsMonitor::set_spend_alert_threshold(double ratio, AlertCallback cb) {
    std::lock_guard<std::mutex> lock(metrics_mutex_);
    spend_threshold_ = ratio;
    spend_cb_ = std::move(cb);
}

// ========== CompositeMonitor ==========

void CompositeMonitor::add_monitor(std::shared_ptr<Monitor> monitor) {
    monitors_.push_back(std::move(monitor));
}

void CompositeMonitor::on_event(const MonitorEvent& event) {
    for (auto& m : monitors_) {
        m->on_event(event);
    }
}

void CompositeMonitor::on_snapshot(const StatusSnapshot& snapshot) {
    for (auto& m : monitors_) {
        m->on_snapshot(snapshot);
    }
}

} // namespace quotaguard
