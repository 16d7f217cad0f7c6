#pragma once

#include "quotaguard/types.hpp"
#include "quotaguard/upstream.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <utility>

namespace quotaguard {

// nlohmann ADL hooks for the wire types
void to_json(nlohmann::json& j, const ChatMessage& m);
void from_json(const nlohmann::json& j, ChatMessage& m);
void to_json(nlohmann::json& j, const ChatRequest& r);
void from_json(const nlohmann::json& j, ChatRequest& r);
void to_json(nlohmann::json& j, const Usage& u);
void from_json(const nlohmann::json& j, Usage& u);
void to_json(nlohmann::json& j, const Choice& c);
void from_json(const nlohmann::json& j, Choice& c);
void to_json(nlohmann::json& j, const ProxyUsage& p);
void to_json(nlohmann::json& j, const ChatResponse& r);
void from_json(const nlohmann::json& j, ChatResponse& r);
void to_json(nlohmann::json& j, const PriceEntry& e);

namespace json {

// Throws MalformedRequestException on syntax or shape errors
ChatRequest parse_chat_request(const std::string& body);

// Throws UpstreamException when the upstream body cannot be decoded
ChatResponse parse_chat_response(const std::string& body);

std::string serialize_request(const ChatRequest& request);

// Response with the proxy_usage block when present
nlohmann::json response_body(const ChatResponse& response);

// {"info", "cost_limit", "current_cost", "remaining", "available_models", "models_count"}
nlohmann::json status_body(const StatusSnapshot& status);

// {"pricing": {key: entry, ...}}
nlohmann::json pricing_body(const PricingTable& pricing);

// {"error": message}
nlohmann::json error_body(const std::string& message);

// HTTP status and body a front end returns for an admission result
std::pair<int, nlohmann::json> admission_reply(const AdmissionResult& result);

} // namespace json

class JsonRequestDecoder : public RequestDecoder {
public:
    ChatRequest decode(const std::string& body) const override;
};

} // namespace quotaguard
