#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace quotaguard {

// Token counts (non-negative by convention)
using TokenCount = std::int64_t;

// Monetary amounts, in the currency of the pricing table (USD)
using Cost = double;

// Time types
using Clock = std::chrono::steady_clock;
using Timestamp = Clock::time_point;
using Duration = Clock::duration;

// Pricing rates are quoted per this many tokens
constexpr double TOKENS_PER_PRICING_UNIT = 1'000'000.0;

// Cost of one model, per million tokens
struct PriceEntry {
    std::string model_key;
    std::string version;
    double input_rate{0.0};
    double cached_input_rate{0.0};  // informational only
    double output_rate{0.0};
};

inline bool operator==(const PriceEntry& a, const PriceEntry& b) {
    return a.model_key == b.model_key
        && a.version == b.version
        && a.input_rate == b.input_rate
        && a.cached_input_rate == b.cached_input_rate
        && a.output_rate == b.output_rate;
}

inline bool operator!=(const PriceEntry& a, const PriceEntry& b) {
    return !(a == b);
}

// Full pricing dump: catalog key -> entry
using PricingTable = std::unordered_map<std::string, PriceEntry>;

// ==================== Chat completion model ====================

struct ChatMessage {
    std::string role;
    std::string content;
    std::string name;
};

struct ChatRequest {
    std::string model;
    std::vector<ChatMessage> messages;
    std::optional<double> temperature;
    std::optional<std::int64_t> max_tokens;
    std::optional<std::int64_t> n;
    std::vector<std::string> stop;
    std::optional<double> presence_penalty;
    std::optional<double> frequency_penalty;
};

struct Usage {
    TokenCount prompt_tokens{0};
    TokenCount completion_tokens{0};
    TokenCount total_tokens{0};
};

struct Choice {
    std::int64_t index{0};
    ChatMessage message;
    std::string finish_reason;
};

// Supplementary usage block attached to every reconciled response
struct ProxyUsage {
    TokenCount prompt_tokens{0};
    TokenCount completion_tokens{0};
    Cost cost_usd{0.0};
};

struct ChatResponse {
    std::string id;
    std::string object;
    std::int64_t created{0};
    std::string model;
    std::vector<Choice> choices;
    Usage usage;
    std::optional<ProxyUsage> proxy_usage;
};

// ==================== Admission lifecycle ====================

enum class AdmissionState {
    Received,
    Authorized,
    Admitted,
    Dispatched,
    Reconciled,
    Rejected
};

enum class RejectReason {
    Unauthorized,
    ModelNotAllowed,
    MalformedRequest,
    BudgetExhausted,
    BudgetWouldBeExceeded,
    UpstreamFailure
};

// Per-request accounting record
struct UsageRecord {
    std::string model;
    TokenCount prompt_tokens{0};
    TokenCount completion_tokens{0};
    Cost estimated_cost{0.0};
    Cost final_cost{0.0};
};

// Outcome of one pass through the admission controller
struct AdmissionResult {
    AdmissionState state{AdmissionState::Received};
    std::optional<RejectReason> reason;
    std::string message;
    UsageRecord record;
    std::optional<ChatResponse> response;
    std::vector<AdmissionState> trail;

    bool accepted() const noexcept { return state == AdmissionState::Reconciled; }
};

// Read-only view of the budget and the catalog
struct StatusSnapshot {
    Timestamp timestamp{};
    Cost ceiling{0.0};
    Cost total_spent{0.0};
    Cost remaining{0.0};
    std::vector<std::string> available_models;
    std::size_t models_count{0};
    std::size_t in_flight_requests{0};
};

inline const char* to_string(AdmissionState s) {
    switch (s) {
        case AdmissionState::Received:   return "Received";
        case AdmissionState::Authorized: return "Authorized";
        case AdmissionState::Admitted:   return "Admitted";
        case AdmissionState::Dispatched: return "Dispatched";
        case AdmissionState::Reconciled: return "Reconciled";
        case AdmissionState::Rejected:   return "Rejected";
    }
    return "Unknown";
}

inline const char* to_string(RejectReason r) {
    switch (r) {
        case RejectReason::Unauthorized:          return "Unauthorized";
        case RejectReason::ModelNotAllowed:       return "ModelNotAllowed";
        case RejectReason::MalformedRequest:      return "MalformedRequest";
        case RejectReason::BudgetExhausted:       return "BudgetExhausted";
        case RejectReason::BudgetWouldBeExceeded: return "BudgetWouldBeExceeded";
        case RejectReason::UpstreamFailure:       return "UpstreamFailure";
    }
    return "Unknown";
}

// HTTP status a front end should answer with for each rejection
inline int http_status(RejectReason r) {
    switch (r) {
        case RejectReason::Unauthorized:          return 401;
        case RejectReason::ModelNotAllowed:       return 400;
        case RejectReason::MalformedRequest:      return 400;
        case RejectReason::BudgetExhausted:       return 429;
        case RejectReason::BudgetWouldBeExceeded: return 429;
        case RejectReason::UpstreamFailure:       return 500;
    }
    return 500;
}

} // namespace quotaguard
