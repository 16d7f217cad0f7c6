#include "bind_forward.hpp"
#include <quotaguard/quotaguard.hpp>
#include <pybind11/stl.h>
#include <pybind11/chrono.h>
#include <pybind11/functional.h>

#include <sstream>

using namespace quotaguard;

namespace {

// pybind11 holders cannot be shared_ptr<const T>; the catalog is still never
// mutated once it is handed to a calculator or controller.
std::shared_ptr<const PriceCatalog> as_const(const std::shared_ptr<PriceCatalog>& catalog) {
    return catalog;
}

std::shared_ptr<PriceCatalog> as_mutable(std::shared_ptr<const PriceCatalog> catalog) {
    return std::const_pointer_cast<PriceCatalog>(std::move(catalog));
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// bind_core  --  PriceCatalog, CostCalculator, BudgetLedger, ModelAllowList,
//                AdmissionController
// ---------------------------------------------------------------------------
void bind_core(py::module_& m) {

    // ===================================================================
    // PriceCatalog
    // ===================================================================
    py::class_<PriceCatalog, std::shared_ptr<PriceCatalog>>(m, "PriceCatalog")
        .def(py::init<PriceEntry>(), py::arg("default_entry") = Config{}.default_price)
        .def_static("from_csv_text",
            [](const std::string& text, const std::string& source_name,
               const PriceEntry& default_entry) {
                std::istringstream in(text);
                CatalogLoadReport report;
                auto catalog = std::make_shared<PriceCatalog>(
                    PriceCatalog::from_csv(in, source_name, default_entry, &report));
                return std::make_pair(catalog, report);
            },
            py::arg("text"), py::arg("source_name") = "<string>",
            py::arg("default_entry") = Config{}.default_price,
            "Build from CSV text; returns (catalog, report).")
        .def_static("from_csv_file",
            [](const std::string& path, const PriceEntry& default_entry) {
                CatalogLoadReport report;
                auto catalog = std::make_shared<PriceCatalog>(
                    PriceCatalog::from_csv_file(path, default_entry, &report));
                return std::make_pair(catalog, report);
            },
            py::arg("path"), py::arg("default_entry") = Config{}.default_price,
            "Build from a CSV file; returns (catalog, report).")
        .def("insert",        &PriceCatalog::insert, py::arg("entry"))
        .def("resolve",       &PriceCatalog::resolve, py::arg("model"))
        .def("contains",      &PriceCatalog::contains, py::arg("key"))
        .def("size",          &PriceCatalog::size)
        .def("empty",         &PriceCatalog::empty)
        .def("keys",          &PriceCatalog::keys)
        .def("entries",       &PriceCatalog::entries)
        .def("default_entry", &PriceCatalog::default_entry)
        .def("__len__",       &PriceCatalog::size)
        .def("__contains__",  &PriceCatalog::contains);

    m.def("load_price_catalog",
        [](const Config& config, std::shared_ptr<Monitor> monitor) {
            return as_mutable(load_price_catalog(config, monitor));
        },
        py::arg("config"), py::arg("monitor") = nullptr,
        "Load config.pricing_path; on failure returns an empty catalog.");

    // ===================================================================
    // CostCalculator
    // ===================================================================
    py::class_<CostCalculator>(m, "CostCalculator")
        .def(py::init([](const std::shared_ptr<PriceCatalog>& catalog) {
                 return std::make_unique<CostCalculator>(as_const(catalog));
             }),
             py::arg("catalog"))
        .def("calculate_cost", &CostCalculator::calculate_cost,
             py::arg("prompt_tokens"), py::arg("completion_tokens"), py::arg("model"))
        .def("quote", &CostCalculator::quote,
             py::arg("prompt_tokens"), py::arg("completion_tokens"), py::arg("model"));

    // ===================================================================
    // BudgetLedger
    // ===================================================================
    py::class_<BudgetLedger, std::shared_ptr<BudgetLedger>>(m, "BudgetLedger")
        .def(py::init<Cost, Cost>(), py::arg("ceiling"), py::arg("initial_spent") = 0.0)
        .def("ceiling",      &BudgetLedger::ceiling)
        .def("total_spent",  &BudgetLedger::total_spent)
        .def("remaining",    &BudgetLedger::remaining)
        .def("exhausted",    &BudgetLedger::exhausted)
        .def("would_exceed", &BudgetLedger::would_exceed, py::arg("additional_cost"))
        .def("try_admit",    &BudgetLedger::try_admit, py::arg("estimated_cost"))
        .def("commit",       &BudgetLedger::commit, py::arg("delta"))
        .def("snapshot",     &BudgetLedger::snapshot)
        .def("reset",        &BudgetLedger::reset, py::arg("total_spent") = 0.0);

    // ===================================================================
    // ModelAllowList
    // ===================================================================
    py::class_<ModelAllowList>(m, "ModelAllowList")
        .def(py::init<>())
        .def(py::init<std::vector<std::string>>(), py::arg("prefixes"))
        .def_static("from_catalog", &ModelAllowList::from_catalog,
                    py::arg("catalog"), py::arg("config"))
        .def("is_allowed", &ModelAllowList::is_allowed, py::arg("model"))
        .def("prefixes",   &ModelAllowList::prefixes)
        .def("empty",      &ModelAllowList::empty);

    // ===================================================================
    // AdmissionController
    // ===================================================================
    py::class_<AdmissionController>(m, "AdmissionController")
        .def(py::init([](Config config,
                         const std::shared_ptr<PriceCatalog>& catalog,
                         std::shared_ptr<BudgetLedger> ledger,
                         std::shared_ptr<Tokenizer> tokenizer,
                         std::shared_ptr<UpstreamClient> upstream,
                         std::shared_ptr<RequestDecoder> decoder) {
                 return std::make_unique<AdmissionController>(
                     std::move(config), as_const(catalog), std::move(ledger),
                     std::move(tokenizer), std::move(upstream), std::move(decoder));
             }),
             py::arg("config"), py::arg("catalog"), py::arg("ledger"),
             py::arg("tokenizer"), py::arg("upstream"), py::arg("decoder") = nullptr,
             // Python collaborators must outlive the controller
             py::keep_alive<1, 5>(), py::keep_alive<1, 6>(), py::keep_alive<1, 7>())

        // ------------- Request handling -------------
        .def("handle", &AdmissionController::handle,
             py::arg("authorization"), py::arg("request"),
             py::call_guard<py::gil_scoped_release>(),
             "Run one request through the gate (releases the GIL).")
        .def("handle_raw", &AdmissionController::handle_raw,
             py::arg("authorization"), py::arg("body"),
             py::call_guard<py::gil_scoped_release>())

        // ------------- Queries -------------
        .def("status",             &AdmissionController::status)
        .def("pricing",            &AdmissionController::pricing)
        .def("allow_list",         &AdmissionController::allow_list,
             py::return_value_policy::reference_internal)
        .def("ledger",             &AdmissionController::ledger)
        .def("in_flight_requests", &AdmissionController::in_flight_requests)

        // ------------- Configuration -------------
        .def("set_monitor", &AdmissionController::set_monitor, py::arg("monitor"),
             py::keep_alive<1, 2>());
}
