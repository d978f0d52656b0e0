#include "providers/openai_compat_client.hpp"

#include "httplib.h"
#include "nlohmann/json.hpp"
#include "utils/logging.hpp"

namespace termgate::providers {
namespace {

struct ParsedUrl {
    bool https = true;
    std::string host;
    int port = 443;
    std::string base_path;
};

ParsedUrl ParseUrl(const std::string& url) {
    ParsedUrl parsed{};
    std::string working = url;
    if (working.rfind("https://", 0) == 0) {
        working = working.substr(8);
    } else if (working.rfind("http://", 0) == 0) {
        parsed.https = false;
        parsed.port = 80;
        working = working.substr(7);
    }

    const auto slash_pos = working.find('/');
    std::string host_port = working;
    if (slash_pos != std::string::npos) {
        host_port = working.substr(0, slash_pos);
        parsed.base_path = working.substr(slash_pos);
    }

    const auto colon_pos = host_port.find(':');
    if (colon_pos != std::string::npos) {
        parsed.host = host_port.substr(0, colon_pos);
        try {
            parsed.port = std::stoi(host_port.substr(colon_pos + 1));
        } catch (const std::exception&) {
            throw ModelError("Invalid model api base: " + url);
        }
    } else {
        parsed.host = host_port;
    }

    if (!parsed.base_path.empty() && parsed.base_path.back() == '/') {
        parsed.base_path.pop_back();
    }
    return parsed;
}

std::string MaskKey(const std::string& key) {
    if (key.empty()) {
        return "<none>";
    }
    if (key.size() <= 8) {
        return "****";
    }
    return key.substr(0, 4) + "****" + key.substr(key.size() - 4);
}

}  // namespace

OpenAICompatClient::OpenAICompatClient(config::ModelConfig settings)
    : settings_(std::move(settings)) {}

std::string OpenAICompatClient::Generate(const std::string& prompt,
                                         const std::vector<session::ContextMessage>& context,
                                         const GenerationParams& params) {
    nlohmann::json payload;
    payload["model"] = settings_.model;
    payload["max_tokens"] = params.max_tokens;
    payload["temperature"] = params.temperature;
    payload["top_p"] = params.top_p;
    payload["messages"] = nlohmann::json::array();
    payload["messages"].push_back({{"role", "system"}, {"content", settings_.system_prompt}});
    for (const auto& msg : context) {
        payload["messages"].push_back({{"role", msg.role}, {"content", msg.content}});
    }
    payload["messages"].push_back({{"role", "user"}, {"content", prompt}});

    const auto parsed = ParseUrl(settings_.api_base);
    if (parsed.host.empty()) {
        throw ModelError("Model api base is not configured");
    }
    const std::string endpoint = parsed.base_path + "/chat/completions";
    std::string scheme_host_port = parsed.https ? "https://" : "http://";
    scheme_host_port += parsed.host + ":" + std::to_string(parsed.port);

    httplib::Client client(scheme_host_port);
    client.set_connection_timeout(settings_.timeout_s);
    client.set_read_timeout(settings_.timeout_s);

    utils::Log(utils::LogLevel::kInfo, "model", "POST " + scheme_host_port + endpoint,
               {{"model", settings_.model},
                {"api_key", MaskKey(settings_.api_key)},
                {"messages", std::to_string(payload["messages"].size())}});

    httplib::Headers headers;
    if (!settings_.api_key.empty()) {
        headers.emplace("Authorization", "Bearer " + settings_.api_key);
    }

    const auto body = payload.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    auto response = client.Post(endpoint, headers, body, "application/json");
    if (!response) {
        const auto err = response.error();
        utils::Log(utils::LogLevel::kError, "model", "request failed",
                   {{"error", httplib::to_string(err)}});
        throw ModelError("Model request failed: " + httplib::to_string(err));
    }
    if (response->status >= 400) {
        utils::Log(utils::LogLevel::kError, "model", "HTTP error",
                   {{"status", std::to_string(response->status)}, {"body", response->body}});
        throw ModelError("Model endpoint returned HTTP " + std::to_string(response->status));
    }

    auto json = nlohmann::json::parse(response->body, nullptr, false);
    if (json.is_discarded() || !json.contains("choices") || !json["choices"].is_array()
        || json["choices"].empty()) {
        throw ModelError("Model endpoint returned an invalid response");
    }
    const auto& choice = json["choices"][0];
    if (!choice.contains("message") || !choice["message"].is_object()) {
        throw ModelError("Model endpoint returned an invalid response");
    }
    const auto& message = choice["message"];
    if (!message.contains("content") || !message["content"].is_string()) {
        return std::string();
    }
    return message["content"].get<std::string>();
}

}  // namespace termgate::providers
