#include "bind_forward.hpp"
#include <quotaguard/quotaguard.hpp>
#include <pybind11/stl.h>
#include <pybind11/chrono.h>
#include <pybind11/functional.h>

#include <iomanip>
#include <sstream>

using namespace quotaguard;

// Lets Python code receive admission and pricing events
class PyMonitor : public Monitor {
public:
    using Monitor::Monitor;

    void on_event(const MonitorEvent& event) override {
        py::gil_scoped_acquire acquire;
        PYBIND11_OVERRIDE_PURE(void, Monitor, on_event, event);
    }

    void on_snapshot(const StatusSnapshot& snapshot) override {
        py::gil_scoped_acquire acquire;
        PYBIND11_OVERRIDE_PURE(void, Monitor, on_snapshot, snapshot);
    }
};

namespace {

std::string describe_event(const MonitorEvent& ev) {
    std::ostringstream out;
    out << "<MonitorEvent " << to_string(ev.type);
    if (ev.model) out << " model=" << *ev.model;
    if (ev.reason) out << " reason=" << to_string(*ev.reason);
    out << std::fixed << std::setprecision(6);
    if (ev.cost) out << " cost=" << *ev.cost;
    if (ev.total_spent) out << " total_spent=" << *ev.total_spent;
    if (ev.line) out << " line=" << *ev.line;
    out << ">";
    return out.str();
}

std::string describe_metrics(const MetricsMonitor::Metrics& mt) {
    std::ostringstream out;
    out << "<Metrics received=" << mt.received_requests
        << " admitted=" << mt.admitted_requests
        << " rejected=" << mt.rejected_requests
        << " committed=" << mt.committed_requests
        << " upstream_failures=" << mt.upstream_failures
        << std::fixed << std::setprecision(6)
        << " committed_cost=" << mt.committed_cost
        << " spend_ratio=" << std::setprecision(3) << mt.spend_ratio << ">";
    return out.str();
}

} // anonymous namespace

void bind_monitors(py::module_& m) {
    m.def("event_type_name", [](EventType t) { return std::string(to_string(t)); },
          py::arg("type"));

    // ---- Event and counter records ----------------------------------------

    py::class_<MonitorEvent>(m, "MonitorEvent")
        .def(py::init<>())
        .def_readwrite("type",              &MonitorEvent::type)
        .def_readwrite("timestamp",         &MonitorEvent::timestamp)
        .def_readwrite("message",           &MonitorEvent::message)
        .def_readwrite("model",             &MonitorEvent::model)
        .def_readwrite("reason",            &MonitorEvent::reason)
        .def_readwrite("prompt_tokens",     &MonitorEvent::prompt_tokens)
        .def_readwrite("completion_tokens", &MonitorEvent::completion_tokens)
        .def_readwrite("cost",              &MonitorEvent::cost)
        .def_readwrite("total_spent",       &MonitorEvent::total_spent)
        .def_readwrite("remaining",         &MonitorEvent::remaining)
        .def_readwrite("line",              &MonitorEvent::line)
        .def_property_readonly("type_name",
            [](const MonitorEvent& ev) { return std::string(to_string(ev.type)); })
        .def("__repr__", &describe_event);

    using Metrics = MetricsMonitor::Metrics;
    py::class_<Metrics>(m, "Metrics")
        .def(py::init<>())
        .def_readonly("received_requests",     &Metrics::received_requests)
        .def_readonly("admitted_requests",     &Metrics::admitted_requests)
        .def_readonly("rejected_requests",     &Metrics::rejected_requests)
        .def_readonly("upstream_failures",     &Metrics::upstream_failures)
        .def_readonly("committed_requests",    &Metrics::committed_requests)
        .def_readonly("pricing_fallbacks",     &Metrics::pricing_fallbacks)
        .def_readonly("committed_cost",        &Metrics::committed_cost)
        .def_readonly("failed_estimated_cost", &Metrics::failed_estimated_cost)
        .def_readonly("average_request_cost",  &Metrics::average_request_cost)
        .def_readonly("spend_ratio",           &Metrics::spend_ratio)
        .def_readonly("rejections_by_reason",  &Metrics::rejections_by_reason)
        .def("rejections_for",
            [](const Metrics& mt, RejectReason reason) -> std::uint64_t {
                auto it = mt.rejections_by_reason.find(reason);
                return it == mt.rejections_by_reason.end() ? 0 : it->second;
            },
            py::arg("reason"))
        .def("__repr__", &describe_metrics);

    // ---- Monitors ---------------------------------------------------------

    py::class_<Monitor, PyMonitor, std::shared_ptr<Monitor>>(m, "Monitor")
        .def(py::init<>())
        .def("on_event", &Monitor::on_event, py::arg("event"))
        .def("on_snapshot", &Monitor::on_snapshot, py::arg("snapshot"));

    // Verbosity is bound in bindings.cpp
    py::class_<ConsoleMonitor, Monitor, std::shared_ptr<ConsoleMonitor>>(m, "ConsoleMonitor")
        .def(py::init<ConsoleMonitor::Verbosity>(),
             py::arg("verbosity") = ConsoleMonitor::Verbosity::Normal);

    py::class_<MetricsMonitor, Monitor, std::shared_ptr<MetricsMonitor>>(m, "MetricsMonitor")
        .def(py::init<>())
        .def("get_metrics", &MetricsMonitor::get_metrics)
        .def("reset_metrics", &MetricsMonitor::reset_metrics)
        .def_property_readonly("spend_ratio",
            [](const MetricsMonitor& self) { return self.get_metrics().spend_ratio; })
        .def_property_readonly("committed_cost",
            [](const MetricsMonitor& self) { return self.get_metrics().committed_cost; })
        // The callback runs on the request thread that committed the spend
        .def("set_spend_alert_threshold",
            [](MetricsMonitor& self, double ratio, py::function cb) {
                MetricsMonitor::AlertCallback alert =
                    [cb = py::object(cb)](const std::string& msg) {
                        py::gil_scoped_acquire acquire;
                        cb(msg);
                    };
                self.set_spend_alert_threshold(ratio, std::move(alert));
            },
            py::arg("ratio"), py::arg("callback"));

    py::class_<CompositeMonitor, Monitor, std::shared_ptr<CompositeMonitor>>(m, "CompositeMonitor")
        .def(py::init<>())
        .def("add_monitor", &CompositeMonitor::add_monitor, py::arg("monitor"));
}
