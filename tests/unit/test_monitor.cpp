#include <gtest/gtest.h>
#include <quotaguard/quotaguard.hpp>

#include <chrono>
#include <cstdint>
#include <future>
#include <iostream>
#include <memory>
#include <sstream>
#include <vector>

using namespace quotaguard;

namespace {

MonitorEvent make_event(EventType type) {
    MonitorEvent ev{type, Clock::now(), ""};
    return ev;
}

StatusSnapshot make_snapshot(Cost ceiling, Cost spent) {
    StatusSnapshot s;
    s.ceiling = ceiling;
    s.total_spent = spent;
    s.remaining = ceiling - spent;
    return s;
}

// Swaps std::cout for a buffer for the lifetime of the object
class CoutCapture {
public:
    CoutCapture() : old_(std::cout.rdbuf(buffer_.rdbuf())) {}
    ~CoutCapture() { std::cout.rdbuf(old_); }
    std::string str() const { return buffer_.str(); }

private:
    std::ostringstream buffer_;
    std::streambuf* old_;
};

} // anonymous namespace

// ===========================================================================
// MetricsMonitor
// ===========================================================================

TEST(MetricsMonitorTest, CountsLifecycleEvents) {
    MetricsMonitor m;
    m.on_event(make_event(EventType::RequestReceived));
    m.on_event(make_event(EventType::RequestReceived));
    m.on_event(make_event(EventType::RequestAdmitted));

    auto rejected = make_event(EventType::RequestRejected);
    rejected.reason = RejectReason::BudgetExhausted;
    m.on_event(rejected);

    auto metrics = m.get_metrics();
    EXPECT_EQ(metrics.received_requests, 2u);
    EXPECT_EQ(metrics.admitted_requests, 1u);
    EXPECT_EQ(metrics.rejected_requests, 1u);
    EXPECT_EQ(metrics.rejections_by_reason[RejectReason::BudgetExhausted], 1u);
}

TEST(MetricsMonitorTest, AccumulatesCommittedCost) {
    MetricsMonitor m;
    auto a = make_event(EventType::CostCommitted);
    a.cost = 0.25;
    auto b = make_event(EventType::CostCommitted);
    b.cost = 0.75;
    m.on_event(a);
    m.on_event(b);

    auto metrics = m.get_metrics();
    EXPECT_EQ(metrics.committed_requests, 2u);
    EXPECT_DOUBLE_EQ(metrics.committed_cost, 1.0);
    EXPECT_DOUBLE_EQ(metrics.average_request_cost, 0.5);
}

TEST(MetricsMonitorTest, TracksUpstreamFailuresSeparately) {
    MetricsMonitor m;
    auto ev = make_event(EventType::UpstreamFailed);
    ev.cost = 0.01;
    m.on_event(ev);

    auto metrics = m.get_metrics();
    EXPECT_EQ(metrics.upstream_failures, 1u);
    EXPECT_DOUBLE_EQ(metrics.failed_estimated_cost, 0.01);
    EXPECT_DOUBLE_EQ(metrics.committed_cost, 0.0);
}

TEST(MetricsMonitorTest, SpendRatioFromSnapshot) {
    MetricsMonitor m;
    m.on_snapshot(make_snapshot(2.0, 0.5));
    EXPECT_DOUBLE_EQ(m.get_metrics().spend_ratio, 0.25);

    m.on_snapshot(make_snapshot(0.0, 0.0));
    EXPECT_DOUBLE_EQ(m.get_metrics().spend_ratio, 1.0);
}

TEST(MetricsMonitorTest, SpendAlertFiresAboveThreshold) {
    MetricsMonitor m;
    std::vector<std::string> alerts;
    m.set_spend_alert_threshold(0.8, [&](const std::string& msg) { alerts.push_back(msg); });

    m.on_snapshot(make_snapshot(2.0, 1.0));
    EXPECT_TRUE(alerts.empty());

    m.on_snapshot(make_snapshot(2.0, 1.8));
    ASSERT_EQ(alerts.size(), 1u);
    EXPECT_NE(alerts[0].find("90.0%"), std::string::npos) << alerts[0];
}

TEST(MetricsMonitorTest, AlertCallbackCanReadMetrics) {
    auto m = std::make_shared<MetricsMonitor>();
    m->on_event(make_event(EventType::RequestReceived));

    std::uint64_t seen_received = 0;
    double seen_ratio = 0.0;
    m->set_spend_alert_threshold(0.5, [&](const std::string&) {
        auto metrics = m->get_metrics();
        seen_received = metrics.received_requests;
        seen_ratio = metrics.spend_ratio;
    });

    auto done = std::async(std::launch::async,
                           [&] { m->on_snapshot(make_snapshot(1.0, 0.9)); });
    ASSERT_EQ(done.wait_for(std::chrono::seconds(5)), std::future_status::ready);
    EXPECT_EQ(seen_received, 1u);
    EXPECT_DOUBLE_EQ(seen_ratio, 0.9);
}

TEST(MetricsMonitorTest, AlertCallbackCanResetMetrics) {
    MetricsMonitor m;
    m.on_event(make_event(EventType::RequestReceived));
    m.set_spend_alert_threshold(0.5, [&](const std::string&) { m.reset_metrics(); });

    auto done = std::async(std::launch::async,
                           [&] { m.on_snapshot(make_snapshot(1.0, 0.9)); });
    ASSERT_EQ(done.wait_for(std::chrono::seconds(5)), std::future_status::ready);
    EXPECT_EQ(m.get_metrics().received_requests, 0u);
}

TEST(MetricsMonitorTest, NoAlertWithoutCallback) {
    MetricsMonitor m;
    m.on_snapshot(make_snapshot(1.0, 5.0));
    EXPECT_DOUBLE_EQ(m.get_metrics().spend_ratio, 5.0);
}

TEST(MetricsMonitorTest, ResetClearsEverything) {
    MetricsMonitor m;
    m.on_event(make_event(EventType::RequestReceived));
    m.on_event(make_event(EventType::PricingFallbackUsed));
    m.reset_metrics();

    auto metrics = m.get_metrics();
    EXPECT_EQ(metrics.received_requests, 0u);
    EXPECT_EQ(metrics.pricing_fallbacks, 0u);
}

// ===========================================================================
// CompositeMonitor
// ===========================================================================

TEST(CompositeMonitorTest, FansOutToChildren) {
    auto a = std::make_shared<MetricsMonitor>();
    auto b = std::make_shared<MetricsMonitor>();
    CompositeMonitor composite;
    composite.add_monitor(a);
    composite.add_monitor(b);

    composite.on_event(make_event(EventType::RequestReceived));
    composite.on_snapshot(make_snapshot(4.0, 1.0));

    EXPECT_EQ(a->get_metrics().received_requests, 1u);
    EXPECT_EQ(b->get_metrics().received_requests, 1u);
    EXPECT_DOUBLE_EQ(b->get_metrics().spend_ratio, 0.25);
}

// ===========================================================================
// ConsoleMonitor
// ===========================================================================

TEST(ConsoleMonitorTest, NormalPrintsImportantEventsOnly) {
    CoutCapture capture;
    ConsoleMonitor console(ConsoleMonitor::Verbosity::Normal);

    console.on_event(make_event(EventType::RequestReceived));
    auto ev = make_event(EventType::CostCommitted);
    ev.model = "gpt-4o";
    ev.cost = 0.0075;
    console.on_event(ev);

    auto out = capture.str();
    EXPECT_EQ(out.find("RequestReceived"), std::string::npos);
    EXPECT_NE(out.find("[QuotaGuard] CostCommitted model=gpt-4o cost=$0.007500"), std::string::npos)
        << out;
}

TEST(ConsoleMonitorTest, QuietPrintsNothing) {
    CoutCapture capture;
    ConsoleMonitor console(ConsoleMonitor::Verbosity::Quiet);
    console.on_event(make_event(EventType::RequestRejected));
    console.on_snapshot(make_snapshot(1.0, 0.5));
    EXPECT_TRUE(capture.str().empty());
}

TEST(ConsoleMonitorTest, SnapshotsNeedVerbose) {
    {
        CoutCapture capture;
        ConsoleMonitor console(ConsoleMonitor::Verbosity::Normal);
        console.on_snapshot(make_snapshot(1.0, 0.5));
        EXPECT_TRUE(capture.str().empty());
    }
    {
        CoutCapture capture;
        ConsoleMonitor console(ConsoleMonitor::Verbosity::Verbose);
        console.on_snapshot(make_snapshot(1.0, 0.5));
        EXPECT_NE(capture.str().find("Budget Snapshot"), std::string::npos);
    }
}

TEST(ConsoleMonitorTest, SnapshotLeavesCoutFormattingAlone) {
    CoutCapture capture;
    ConsoleMonitor console(ConsoleMonitor::Verbosity::Verbose);
    console.on_snapshot(make_snapshot(1.0, 0.5));
    EXPECT_NE(capture.str().find("Total spent: $0.500000"), std::string::npos) << capture.str();

    std::ostringstream after;
    after.copyfmt(std::cout);
    after << 1.5;
    EXPECT_EQ(after.str(), "1.5");
}

TEST(EventTypeTest, Names) {
    EXPECT_STREQ(to_string(EventType::PricingLoaded), "PricingLoaded");
    EXPECT_STREQ(to_string(EventType::CostCommitted), "CostCommitted");
    EXPECT_STREQ(to_string(EventType::UpstreamFailed), "UpstreamFailed");
}
