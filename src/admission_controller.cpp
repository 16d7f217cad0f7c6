#include "quotaguard/admission_controller.hpp"
#include "quotaguard/credentials.hpp"
#include "quotaguard/exceptions.hpp"

#include <algorithm>

namespace quotaguard {

bool is_valid_transition(AdmissionState from, AdmissionState to) noexcept {
    switch (to) {
        case AdmissionState::Authorized: return from == AdmissionState::Received;
        case AdmissionState::Admitted:   return from == AdmissionState::Authorized;
        case AdmissionState::Dispatched: return from == AdmissionState::Admitted;
        case AdmissionState::Reconciled: return from == AdmissionState::Dispatched;
        case AdmissionState::Rejected:
            return from == AdmissionState::Received
                || from == AdmissionState::Authorized
                || from == AdmissionState::Admitted;
        case AdmissionState::Received:   return false;
    }
    return false;
}

// Owns the result of one request and enforces the lifecycle edges
class AdmissionController::Lifecycle {
public:
    Lifecycle() {
        result_.state = AdmissionState::Received;
        result_.trail.push_back(AdmissionState::Received);
    }

    void advance(AdmissionState to) {
        if (!is_valid_transition(result_.state, to)) {
            throw InvalidTransitionException(result_.state, to);
        }
        result_.state = to;
        result_.trail.push_back(to);
    }

    AdmissionState state() const noexcept { return result_.state; }
    AdmissionResult& result() noexcept { return result_; }
    AdmissionResult take() { return std::move(result_); }

private:
    AdmissionResult result_;
};

namespace {

// Keeps the in-flight counter exact on every exit path
class InFlightGuard {
public:
    explicit InFlightGuard(std::atomic<std::size_t>& counter) : counter_(counter) {
        counter_.fetch_add(1);
    }
    ~InFlightGuard() { counter_.fetch_sub(1); }

    InFlightGuard(const InFlightGuard&) = delete;
    InFlightGuard& operator=(const InFlightGuard&) = delete;

private:
    std::atomic<std::size_t>& counter_;
};

} // anonymous namespace

AdmissionController::AdmissionController(Config config,
                                         std::shared_ptr<const PriceCatalog> catalog,
                                         std::shared_ptr<BudgetLedger> ledger,
                                         std::shared_ptr<Tokenizer> tokenizer,
                                         std::shared_ptr<UpstreamClient> upstream,
                                         std::shared_ptr<RequestDecoder> decoder)
    : config_(std::move(config))
    , catalog_(std::move(catalog))
    , ledger_(std::move(ledger))
    , tokenizer_(std::move(tokenizer))
    , upstream_(std::move(upstream))
    , decoder_(std::move(decoder))
    , calculator_(catalog_)
    , allow_list_(ModelAllowList::from_catalog(*catalog_, config_))
{
    if (!ledger_) {
        throw InvalidConfigException("AdmissionController requires a budget ledger");
    }
    if (!tokenizer_) {
        throw InvalidConfigException("AdmissionController requires a tokenizer");
    }
    if (!upstream_) {
        throw InvalidConfigException("AdmissionController requires an upstream client");
    }
}

// ==================== Request handling ====================

AdmissionResult AdmissionController::handle(const std::string& authorization,
                                            const ChatRequest& request)
{
    return process(authorization, &request, nullptr);
}

AdmissionResult AdmissionController::handle_raw(const std::string& authorization,
                                                const std::string& body)
{
    if (!decoder_) {
        throw InvalidConfigException("AdmissionController has no request decoder");
    }
    return process(authorization, nullptr, &body);
}

AdmissionResult AdmissionController::process(const std::string& authorization,
                                             const ChatRequest* request,
                                             const std::string* body)
{
    Lifecycle lifecycle;
    emit_event(MonitorEvent{EventType::RequestReceived, {}, "Request received"});

    // 1. Budget gate, before any per-request work
    if (ledger_->exhausted()) {
        return reject(lifecycle, RejectReason::BudgetExhausted,
                      "Global cost limit exceeded.", true);
    }

    // 2. Credential
    auto credential = parse_bearer_token(authorization);
    if (!credential.ok()) {
        return reject(lifecycle, RejectReason::Unauthorized,
                      to_string(credential.error.value()), false);
    }
    lifecycle.advance(AdmissionState::Authorized);

    // 3. Request shape and model
    ChatRequest decoded;
    if (!request) {
        try {
            decoded = decoder_->decode(*body);
        } catch (const MalformedRequestException& e) {
            return reject(lifecycle, RejectReason::MalformedRequest,
                          std::string("Malformed request: ") + e.what(), false);
        }
        request = &decoded;
    }

    auto& record = lifecycle.result().record;
    record.model = request->model;

    if (!allow_list_.is_allowed(request->model)) {
        return reject(lifecycle, RejectReason::ModelNotAllowed,
                      "Model " + request->model + " is not in the allowed list.", false);
    }

    // 4. Prompt-only estimate
    record.prompt_tokens = count_message_tokens(
        *tokenizer_, request->messages, request->model,
        config_.tokens_per_message, config_.reply_priming_tokens);
    auto estimate = calculator_.quote(record.prompt_tokens, 0, request->model);
    record.estimated_cost = estimate.cost;

    if (!estimate.matched) {
        MonitorEvent ev{EventType::PricingFallbackUsed, {},
                        "Pricing not found, using " + estimate.entry.model_key + " rates"};
        ev.model = request->model;
        emit_event(std::move(ev));
    }

    // 5. Admission against the ledger
    switch (ledger_->try_admit(record.estimated_cost)) {
        case BudgetLedger::Admission::Exhausted:
            return reject(lifecycle, RejectReason::BudgetExhausted,
                          "Global cost limit exceeded.", true);
        case BudgetLedger::Admission::WouldExceed:
            return reject(lifecycle, RejectReason::BudgetWouldBeExceeded,
                          "Request would exceed global cost limit.", true);
        case BudgetLedger::Admission::Admitted:
            break;
    }
    lifecycle.advance(AdmissionState::Admitted);
    std::optional<InFlightGuard> in_flight;
    in_flight.emplace(in_flight_);

    {
        MonitorEvent ev{EventType::RequestAdmitted, {}, "Request admitted"};
        ev.model = record.model;
        ev.prompt_tokens = record.prompt_tokens;
        ev.cost = record.estimated_cost;
        emit_event(std::move(ev));
    }

    // 6. Upstream call, no lock held. Failures are never charged.
    ChatResponse response;
    try {
        response = upstream_->complete(*request, credential.token.value());
    } catch (const std::exception& e) {
        auto snap = ledger_->snapshot();
        MonitorEvent ev{EventType::UpstreamFailed, {}, e.what()};
        ev.model = record.model;
        ev.prompt_tokens = record.prompt_tokens;
        ev.completion_tokens = 0;
        ev.cost = record.estimated_cost;
        ev.total_spent = snap.total_spent;
        ev.remaining = snap.remaining;
        emit_event(std::move(ev));

        lifecycle.advance(AdmissionState::Rejected);
        auto& result = lifecycle.result();
        result.reason = RejectReason::UpstreamFailure;
        result.message = std::string("Upstream API call error: ") + e.what();
        return lifecycle.take();
    }
    lifecycle.advance(AdmissionState::Dispatched);

    // 7. Reconciliation: prefer reported usage, recount locally when a
    // reported count is missing
    TokenCount prompt_tokens = record.prompt_tokens;
    if (response.usage.prompt_tokens > 0) {
        prompt_tokens = response.usage.prompt_tokens;
    }
    TokenCount completion_tokens = std::max<TokenCount>(response.usage.completion_tokens, 0);

    if (prompt_tokens == 0 || completion_tokens == 0) {
        prompt_tokens = count_message_tokens(
            *tokenizer_, request->messages, request->model,
            config_.tokens_per_message, config_.reply_priming_tokens);
        completion_tokens = count_completion_tokens(*tokenizer_, response.choices, request->model);
    }

    record.prompt_tokens = prompt_tokens;
    record.completion_tokens = completion_tokens;
    record.final_cost = calculator_.calculate_cost(prompt_tokens, completion_tokens, request->model);

    {
        MonitorEvent ev{EventType::CostReconciled, {}, "Usage reconciled"};
        ev.model = record.model;
        ev.prompt_tokens = prompt_tokens;
        ev.completion_tokens = completion_tokens;
        ev.cost = record.final_cost;
        emit_event(std::move(ev));
    }

    // 8. Commit
    ledger_->commit(record.final_cost);
    auto snap = ledger_->snapshot();
    lifecycle.advance(AdmissionState::Reconciled);

    {
        MonitorEvent ev{EventType::CostCommitted, {}, "Request completed"};
        ev.model = record.model;
        ev.prompt_tokens = prompt_tokens;
        ev.completion_tokens = completion_tokens;
        ev.cost = record.final_cost;
        ev.total_spent = snap.total_spent;
        ev.remaining = snap.remaining;
        emit_event(std::move(ev));
    }

    response.proxy_usage = ProxyUsage{prompt_tokens, completion_tokens,
                                      round_cost(record.final_cost)};

    auto& result = lifecycle.result();
    result.response = std::move(response);
    result.message = "OK";
    AdmissionResult out = lifecycle.take();
    in_flight.reset();
    emit_snapshot();
    return out;
}

AdmissionResult AdmissionController::reject(Lifecycle& lifecycle, RejectReason reason,
                                            std::string message, bool include_ledger)
{
    lifecycle.advance(AdmissionState::Rejected);
    auto& result = lifecycle.result();
    result.reason = reason;
    result.message = std::move(message);

    MonitorEvent ev{EventType::RequestRejected, {}, result.message};
    ev.reason = reason;
    if (!result.record.model.empty()) {
        ev.model = result.record.model;
    }
    if (result.record.prompt_tokens > 0) {
        ev.prompt_tokens = result.record.prompt_tokens;
        ev.cost = result.record.estimated_cost;
    }
    if (include_ledger) {
        auto snap = ledger_->snapshot();
        ev.total_spent = snap.total_spent;
        ev.remaining = snap.remaining;
    }
    emit_event(std::move(ev));

    return lifecycle.take();
}

// ==================== Queries ====================

StatusSnapshot AdmissionController::status() const {
    auto ledger = ledger_->snapshot();
    StatusSnapshot snap;
    snap.timestamp = Clock::now();
    snap.ceiling = ledger.ceiling;
    snap.total_spent = ledger.total_spent;
    snap.remaining = ledger.remaining;
    snap.available_models = catalog_->keys();
    snap.models_count = catalog_->size();
    snap.in_flight_requests = in_flight_.load();
    return snap;
}

PricingTable AdmissionController::pricing() const {
    return catalog_->entries();
}

const ModelAllowList& AdmissionController::allow_list() const noexcept { return allow_list_; }
const CostCalculator& AdmissionController::calculator() const noexcept { return calculator_; }
std::shared_ptr<BudgetLedger> AdmissionController::ledger() const noexcept { return ledger_; }
std::size_t AdmissionController::in_flight_requests() const noexcept { return in_flight_.load(); }

// ==================== Configuration ====================

void AdmissionController::set_monitor(std::shared_ptr<Monitor> monitor) {
    monitor_ = std::move(monitor);
}

void AdmissionController::emit_event(MonitorEvent event) {
    if (!monitor_) return;
    event.timestamp = Clock::now();
    monitor_->on_event(event);
}

void AdmissionController::emit_snapshot() {
    if (!monitor_) return;
    monitor_->on_snapshot(status());
}

} // namespace quotaguard
