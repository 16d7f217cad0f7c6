#include "quotaguard/json/codec.hpp"
#include "quotaguard/exceptions.hpp"

#include <stdexcept>

namespace quotaguard {

using Json = nlohmann::json;

namespace {

// Missing and null both leave the target untouched
template <typename T>
void read_optional(const Json& j, const char* key, std::optional<T>& out) {
    auto it = j.find(key);
    if (it != j.end() && !it->is_null()) {
        out = it->get<T>();
    }
}

template <typename T>
void read_field(const Json& j, const char* key, T& out) {
    auto it = j.find(key);
    if (it != j.end() && !it->is_null()) {
        out = it->get<T>();
    }
}

template <typename T>
void write_optional(Json& j, const char* key, const std::optional<T>& value) {
    if (value.has_value()) {
        j[key] = value.value();
    }
}

// Shape problems that nlohmann's own type checks do not catch
class ShapeError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

void require_object(const Json& j, const char* what) {
    if (!j.is_object()) {
        throw ShapeError(std::string(what) + " must be an object, got " + j.type_name());
    }
}

} // anonymous namespace

// ==================== ADL hooks ====================

void to_json(Json& j, const ChatMessage& m) {
    j = Json{{"role", m.role}, {"content", m.content}};
    if (!m.name.empty()) {
        j["name"] = m.name;
    }
}

void from_json(const Json& j, ChatMessage& m) {
    require_object(j, "message");
    read_field(j, "role", m.role);
    read_field(j, "content", m.content);
    read_field(j, "name", m.name);
}

void to_json(Json& j, const ChatRequest& r) {
    j = Json{{"model", r.model}, {"messages", r.messages}};
    write_optional(j, "temperature", r.temperature);
    write_optional(j, "max_tokens", r.max_tokens);
    write_optional(j, "n", r.n);
    if (!r.stop.empty()) {
        j["stop"] = r.stop;
    }
    write_optional(j, "presence_penalty", r.presence_penalty);
    write_optional(j, "frequency_penalty", r.frequency_penalty);
}

void from_json(const Json& j, ChatRequest& r) {
    require_object(j, "request");
    read_field(j, "model", r.model);
    read_field(j, "messages", r.messages);
    read_optional(j, "temperature", r.temperature);
    read_optional(j, "max_tokens", r.max_tokens);
    read_optional(j, "n", r.n);
    read_optional(j, "presence_penalty", r.presence_penalty);
    read_optional(j, "frequency_penalty", r.frequency_penalty);

    // "stop" is either one string or a list of them
    auto stop = j.find("stop");
    if (stop != j.end() && !stop->is_null()) {
        if (stop->is_string()) {
            r.stop = {stop->get<std::string>()};
        } else {
            r.stop = stop->get<std::vector<std::string>>();
        }
    }
}

void to_json(Json& j, const Usage& u) {
    j = Json{{"prompt_tokens", u.prompt_tokens},
             {"completion_tokens", u.completion_tokens},
             {"total_tokens", u.total_tokens}};
}

void from_json(const Json& j, Usage& u) {
    require_object(j, "usage");
    read_field(j, "prompt_tokens", u.prompt_tokens);
    read_field(j, "completion_tokens", u.completion_tokens);
    read_field(j, "total_tokens", u.total_tokens);
}

void to_json(Json& j, const Choice& c) {
    j = Json{{"index", c.index}, {"message", c.message}, {"finish_reason", c.finish_reason}};
}

void from_json(const Json& j, Choice& c) {
    require_object(j, "choice");
    read_field(j, "index", c.index);
    read_field(j, "message", c.message);
    read_field(j, "finish_reason", c.finish_reason);
}

void to_json(Json& j, const ProxyUsage& p) {
    j = Json{{"prompt_tokens", p.prompt_tokens},
             {"completion_tokens", p.completion_tokens},
             {"cost_usd", p.cost_usd}};
}

void to_json(Json& j, const ChatResponse& r) {
    j = Json{{"id", r.id},
             {"object", r.object},
             {"created", r.created},
             {"model", r.model},
             {"choices", r.choices},
             {"usage", r.usage}};
    if (r.proxy_usage.has_value()) {
        j["proxy_usage"] = r.proxy_usage.value();
    }
}

void from_json(const Json& j, ChatResponse& r) {
    require_object(j, "response");
    read_field(j, "id", r.id);
    read_field(j, "object", r.object);
    read_field(j, "created", r.created);
    read_field(j, "model", r.model);
    read_field(j, "choices", r.choices);
    read_field(j, "usage", r.usage);
}

void to_json(Json& j, const PriceEntry& e) {
    j = Json{{"model", e.model_key},
             {"version", e.version},
             {"input", e.input_rate},
             {"cached_input", e.cached_input_rate},
             {"output", e.output_rate}};
}

// ==================== Codec entry points ====================

namespace json {

ChatRequest parse_chat_request(const std::string& body) {
    if (body.empty()) {
        throw MalformedRequestException("Missing JSON data in request.");
    }
    try {
        return Json::parse(body).get<ChatRequest>();
    } catch (const Json::exception& e) {
        throw MalformedRequestException(e.what());
    } catch (const ShapeError& e) {
        throw MalformedRequestException(e.what());
    }
}

ChatResponse parse_chat_response(const std::string& body) {
    try {
        return Json::parse(body).get<ChatResponse>();
    } catch (const Json::exception& e) {
        throw UpstreamException(std::string("Cannot decode upstream response: ") + e.what());
    } catch (const ShapeError& e) {
        throw UpstreamException(std::string("Cannot decode upstream response: ") + e.what());
    }
}

std::string serialize_request(const ChatRequest& request) {
    return nlohmann::json(request).dump();
}

nlohmann::json response_body(const ChatResponse& response) {
    return nlohmann::json(response);
}

nlohmann::json status_body(const StatusSnapshot& status) {
    return nlohmann::json{
        {"info", "QuotaGuard cost-budget gate. Available method: POST."},
        {"cost_limit", status.ceiling},
        {"current_cost", status.total_spent},
        {"remaining", status.remaining},
        {"available_models", status.available_models},
        {"models_count", status.models_count},
        {"in_flight_requests", status.in_flight_requests}
    };
}

nlohmann::json pricing_body(const PricingTable& pricing) {
    nlohmann::json table = nlohmann::json::object();
    for (auto& [key, entry] : pricing) {
        table[key] = entry;
    }
    return nlohmann::json{{"pricing", table}};
}

nlohmann::json error_body(const std::string& message) {
    return nlohmann::json{{"error", message}};
}

std::pair<int, nlohmann::json> admission_reply(const AdmissionResult& result) {
    if (result.accepted() && result.response.has_value()) {
        return {200, response_body(result.response.value())};
    }
    int status = result.reason.has_value() ? http_status(result.reason.value()) : 500;
    return {status, error_body(result.message)};
}

} // namespace json

ChatRequest JsonRequestDecoder::decode(const std::string& body) const {
    return json::parse_chat_request(body);
}

} // namespace quotaguard
