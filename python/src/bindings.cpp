#include "bind_forward.hpp"

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/chrono.h>
#include <pybind11/functional.h>

#include <quotaguard/quotaguard.hpp>

using namespace quotaguard;

// ---------------------------------------------------------------------------
// Module entry point
// ---------------------------------------------------------------------------
PYBIND11_MODULE(_quotaguard, m) {
    m.doc() = "QuotaGuard: cost-budget gate for metered language-model APIs";

    bind_enums_and_structs(m);
    bind_exceptions(m);
    bind_functions(m);
    bind_monitors(m);
    bind_collaborators(m);
    bind_core(m);
}

// ---------------------------------------------------------------------------
// Enums & structs
// ---------------------------------------------------------------------------
void bind_enums_and_structs(py::module_& m) {

    // ---- Enums ------------------------------------------------------------

    py::enum_<AdmissionState>(m, "AdmissionState")
        .value("Received",   AdmissionState::Received)
        .value("Authorized", AdmissionState::Authorized)
        .value("Admitted",   AdmissionState::Admitted)
        .value("Dispatched", AdmissionState::Dispatched)
        .value("Reconciled", AdmissionState::Reconciled)
        .value("Rejected",   AdmissionState::Rejected)
        .export_values();

    py::enum_<RejectReason>(m, "RejectReason")
        .value("Unauthorized",          RejectReason::Unauthorized)
        .value("ModelNotAllowed",       RejectReason::ModelNotAllowed)
        .value("MalformedRequest",      RejectReason::MalformedRequest)
        .value("BudgetExhausted",       RejectReason::BudgetExhausted)
        .value("BudgetWouldBeExceeded", RejectReason::BudgetWouldBeExceeded)
        .value("UpstreamFailure",       RejectReason::UpstreamFailure)
        .export_values();

    py::enum_<EventType>(m, "EventType")
        .value("PricingLoaded",       EventType::PricingLoaded)
        .value("PricingRowSkipped",   EventType::PricingRowSkipped)
        .value("PricingLoadFailed",   EventType::PricingLoadFailed)
        .value("PricingFallbackUsed", EventType::PricingFallbackUsed)
        .value("RequestReceived",     EventType::RequestReceived)
        .value("RequestRejected",     EventType::RequestRejected)
        .value("RequestAdmitted",     EventType::RequestAdmitted)
        .value("UpstreamFailed",      EventType::UpstreamFailed)
        .value("CostReconciled",      EventType::CostReconciled)
        .value("CostCommitted",       EventType::CostCommitted)
        .export_values();

    py::enum_<CredentialError>(m, "CredentialError")
        .value("Missing",    CredentialError::Missing)
        .value("BadScheme",  CredentialError::BadScheme)
        .value("EmptyToken", CredentialError::EmptyToken)
        .export_values();

    // BudgetLedger::Admission is bound as module-level "Admission"
    py::enum_<BudgetLedger::Admission>(m, "Admission")
        .value("Admitted",    BudgetLedger::Admission::Admitted)
        .value("Exhausted",   BudgetLedger::Admission::Exhausted)
        .value("WouldExceed", BudgetLedger::Admission::WouldExceed)
        .export_values();

    py::enum_<ConsoleMonitor::Verbosity>(m, "Verbosity")
        .value("Quiet",   ConsoleMonitor::Verbosity::Quiet)
        .value("Normal",  ConsoleMonitor::Verbosity::Normal)
        .value("Verbose", ConsoleMonitor::Verbosity::Verbose)
        .value("Debug",   ConsoleMonitor::Verbosity::Debug)
        .export_values();

    // ---- Pricing ----------------------------------------------------------

    py::class_<PriceEntry>(m, "PriceEntry")
        .def(py::init<>())
        .def(py::init([](std::string key, std::string version,
                         double input, double cached_input, double output) {
                 return PriceEntry{std::move(key), std::move(version),
                                   input, cached_input, output};
             }),
             py::arg("model_key"), py::arg("version") = "",
             py::arg("input_rate") = 0.0, py::arg("cached_input_rate") = 0.0,
             py::arg("output_rate") = 0.0)
        .def_readwrite("model_key",         &PriceEntry::model_key)
        .def_readwrite("version",           &PriceEntry::version)
        .def_readwrite("input_rate",        &PriceEntry::input_rate)
        .def_readwrite("cached_input_rate", &PriceEntry::cached_input_rate)
        .def_readwrite("output_rate",       &PriceEntry::output_rate)
        .def("__eq__", [](const PriceEntry& a, const PriceEntry& b) { return a == b; })
        .def("__repr__", [](const PriceEntry& e) {
            return "<PriceEntry '" + e.model_key + "' in=" + std::to_string(e.input_rate)
                 + " out=" + std::to_string(e.output_rate) + ">";
        });

    py::class_<SkippedRow>(m, "SkippedRow")
        .def(py::init<>())
        .def_readwrite("line",   &SkippedRow::line)
        .def_readwrite("model",  &SkippedRow::model)
        .def_readwrite("reason", &SkippedRow::reason);

    py::class_<CatalogLoadReport>(m, "CatalogLoadReport")
        .def(py::init<>())
        .def_readwrite("records",     &CatalogLoadReport::records)
        .def_readwrite("rows_loaded", &CatalogLoadReport::rows_loaded)
        .def_readwrite("skipped",     &CatalogLoadReport::skipped);

    py::class_<PriceResolution>(m, "PriceResolution")
        .def(py::init<>())
        .def_readwrite("entry",   &PriceResolution::entry)
        .def_readwrite("matched", &PriceResolution::matched);

    py::class_<CostQuote>(m, "CostQuote")
        .def(py::init<>())
        .def_readwrite("entry",   &CostQuote::entry)
        .def_readwrite("matched", &CostQuote::matched)
        .def_readwrite("cost",    &CostQuote::cost);

    // ---- Chat completion model --------------------------------------------

    py::class_<ChatMessage>(m, "ChatMessage")
        .def(py::init<>())
        .def(py::init([](std::string role, std::string content, std::string name) {
                 return ChatMessage{std::move(role), std::move(content), std::move(name)};
             }),
             py::arg("role"), py::arg("content"), py::arg("name") = "")
        .def_readwrite("role",    &ChatMessage::role)
        .def_readwrite("content", &ChatMessage::content)
        .def_readwrite("name",    &ChatMessage::name);

    py::class_<ChatRequest>(m, "ChatRequest")
        .def(py::init<>())
        .def_readwrite("model",             &ChatRequest::model)
        .def_readwrite("messages",          &ChatRequest::messages)
        .def_readwrite("temperature",       &ChatRequest::temperature)
        .def_readwrite("max_tokens",        &ChatRequest::max_tokens)
        .def_readwrite("n",                 &ChatRequest::n)
        .def_readwrite("stop",              &ChatRequest::stop)
        .def_readwrite("presence_penalty",  &ChatRequest::presence_penalty)
        .def_readwrite("frequency_penalty", &ChatRequest::frequency_penalty);

    py::class_<Usage>(m, "Usage")
        .def(py::init<>())
        .def_readwrite("prompt_tokens",     &Usage::prompt_tokens)
        .def_readwrite("completion_tokens", &Usage::completion_tokens)
        .def_readwrite("total_tokens",      &Usage::total_tokens);

    py::class_<Choice>(m, "Choice")
        .def(py::init<>())
        .def_readwrite("index",         &Choice::index)
        .def_readwrite("message",       &Choice::message)
        .def_readwrite("finish_reason", &Choice::finish_reason);

    py::class_<ProxyUsage>(m, "ProxyUsage")
        .def(py::init<>())
        .def_readwrite("prompt_tokens",     &ProxyUsage::prompt_tokens)
        .def_readwrite("completion_tokens", &ProxyUsage::completion_tokens)
        .def_readwrite("cost_usd",          &ProxyUsage::cost_usd);

    py::class_<ChatResponse>(m, "ChatResponse")
        .def(py::init<>())
        .def_readwrite("id",          &ChatResponse::id)
        .def_readwrite("object",      &ChatResponse::object)
        .def_readwrite("created",     &ChatResponse::created)
        .def_readwrite("model",       &ChatResponse::model)
        .def_readwrite("choices",     &ChatResponse::choices)
        .def_readwrite("usage",       &ChatResponse::usage)
        .def_readwrite("proxy_usage", &ChatResponse::proxy_usage);

    // ---- Admission results ------------------------------------------------

    py::class_<UsageRecord>(m, "UsageRecord")
        .def(py::init<>())
        .def_readwrite("model",             &UsageRecord::model)
        .def_readwrite("prompt_tokens",     &UsageRecord::prompt_tokens)
        .def_readwrite("completion_tokens", &UsageRecord::completion_tokens)
        .def_readwrite("estimated_cost",    &UsageRecord::estimated_cost)
        .def_readwrite("final_cost",        &UsageRecord::final_cost);

    py::class_<AdmissionResult>(m, "AdmissionResult")
        .def(py::init<>())
        .def_readwrite("state",    &AdmissionResult::state)
        .def_readwrite("reason",   &AdmissionResult::reason)
        .def_readwrite("message",  &AdmissionResult::message)
        .def_readwrite("record",   &AdmissionResult::record)
        .def_readwrite("response", &AdmissionResult::response)
        .def_readwrite("trail",    &AdmissionResult::trail)
        .def("accepted", &AdmissionResult::accepted)
        .def("__repr__", [](const AdmissionResult& r) {
            return std::string("<AdmissionResult ") + to_string(r.state)
                 + (r.reason ? std::string(" ") + to_string(*r.reason) : std::string())
                 + ">";
        });

    py::class_<StatusSnapshot>(m, "StatusSnapshot")
        .def(py::init<>())
        .def_readwrite("timestamp",          &StatusSnapshot::timestamp)
        .def_readwrite("ceiling",            &StatusSnapshot::ceiling)
        .def_readwrite("total_spent",        &StatusSnapshot::total_spent)
        .def_readwrite("remaining",          &StatusSnapshot::remaining)
        .def_readwrite("available_models",   &StatusSnapshot::available_models)
        .def_readwrite("models_count",       &StatusSnapshot::models_count)
        .def_readwrite("in_flight_requests", &StatusSnapshot::in_flight_requests);

    py::class_<LedgerSnapshot>(m, "LedgerSnapshot")
        .def(py::init<>())
        .def_readwrite("ceiling",     &LedgerSnapshot::ceiling)
        .def_readwrite("total_spent", &LedgerSnapshot::total_spent)
        .def_readwrite("remaining",   &LedgerSnapshot::remaining);

    py::class_<CredentialCheck>(m, "CredentialCheck")
        .def(py::init<>())
        .def_readwrite("token", &CredentialCheck::token)
        .def_readwrite("error", &CredentialCheck::error)
        .def("ok", &CredentialCheck::ok);

    // ---- Configuration ----------------------------------------------------

    py::class_<Config>(m, "Config")
        .def(py::init<>())
        .def_readwrite("cost_ceiling",                 &Config::cost_ceiling)
        .def_readwrite("pricing_path",                 &Config::pricing_path)
        .def_readwrite("fallback_model_prefixes",      &Config::fallback_model_prefixes)
        .def_readwrite("derive_prefixes_from_catalog", &Config::derive_prefixes_from_catalog)
        .def_readwrite("default_price",                &Config::default_price)
        .def_readwrite("tokens_per_message",           &Config::tokens_per_message)
        .def_readwrite("reply_priming_tokens",         &Config::reply_priming_tokens);

    // MonitorEvent and Metrics are bound in bind_monitors.cpp

    m.attr("TOKENS_PER_PRICING_UNIT") = TOKENS_PER_PRICING_UNIT;
}

// ---------------------------------------------------------------------------
// Exceptions
// ---------------------------------------------------------------------------
void bind_exceptions(py::module_& m) {
    // Base exception -> RuntimeError
    static auto py_QuotaGuardError =
        py::register_exception<QuotaGuardException>(m, "QuotaGuardError", PyExc_RuntimeError);

    // Derived from QuotaGuardError
    static auto py_PricingLoadError =
        py::register_exception<PricingLoadException>(m, "PricingLoadError", py_QuotaGuardError.ptr());
    static auto py_MalformedRequestError =
        py::register_exception<MalformedRequestException>(m, "MalformedRequestError", py_QuotaGuardError.ptr());
    static auto py_UpstreamError =
        py::register_exception<UpstreamException>(m, "UpstreamError", py_QuotaGuardError.ptr());
    static auto py_InvalidTransitionError =
        py::register_exception<InvalidTransitionException>(m, "InvalidTransitionError", py_QuotaGuardError.ptr());
    static auto py_InvalidConfigError =
        py::register_exception<InvalidConfigException>(m, "InvalidConfigError", py_QuotaGuardError.ptr());
}

// ---------------------------------------------------------------------------
// Free functions
// ---------------------------------------------------------------------------
void bind_functions(py::module_& m) {
    m.def("http_status", &http_status, py::arg("reason"),
          "HTTP status a front end answers with for a rejection.");
    m.def("is_valid_transition", &is_valid_transition, py::arg("from_state"), py::arg("to_state"));
    m.def("compute_cost", &compute_cost,
          py::arg("prompt_tokens"), py::arg("completion_tokens"), py::arg("entry"));
    m.def("round_cost", &round_cost, py::arg("cost"));
    m.def("parse_bearer_token", &parse_bearer_token, py::arg("authorization"));
    m.def("credential_error_message",
          [](CredentialError e) { return std::string(to_string(e)); }, py::arg("error"));
    m.def("split_csv_line", &split_csv_line, py::arg("line"));
    m.def("parse_rate", &parse_rate, py::arg("text"));
}
