#include "server/http_api.hpp"

#include <array>
#include <iomanip>
#include <random>
#include <sstream>

#include "terminal/file_tree_walker.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace termgate::server {
namespace {

constexpr const char* kJsonType = "application/json";

void Reply(httplib::Response& res, int status, const nlohmann::json& json) {
    res.status = status;
    res.set_content(json.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace), kJsonType);
}

void ReplyError(httplib::Response& res, int status, const std::string& message) {
    Reply(res, status, {{"error", message}});
}

// Empty bodies parse as an empty object.
bool ParseObject(const std::string& text, nlohmann::json& body) {
    if (text.empty()) {
        body = nlohmann::json::object();
        return true;
    }
    body = nlohmann::json::parse(text, nullptr, false);
    return !body.is_discarded() && body.is_object();
}

std::string OptionalString(const nlohmann::json& body, const char* key) {
    if (body.contains(key) && body[key].is_string()) {
        return body[key].get<std::string>();
    }
    return std::string();
}

nlohmann::json ToJson(const std::vector<session::ContextMessage>& messages) {
    auto json = nlohmann::json::array();
    for (const auto& msg : messages) {
        json.push_back({{"role", msg.role}, {"content", msg.content}, {"timestamp", msg.timestamp}});
    }
    return json;
}

}  // namespace

int StatusForError(terminal::ErrorKind kind) {
    switch (kind) {
        case terminal::ErrorKind::kNone: return 200;
        case terminal::ErrorKind::kPolicyViolation: return 403;
        case terminal::ErrorKind::kTimeout: return 504;
        case terminal::ErrorKind::kSpawnFailure: return 500;
        case terminal::ErrorKind::kInternal: return 500;
    }
    return 500;
}

nlohmann::json ToJson(const terminal::ExecutionResult& result) {
    return {
        {"success", result.success},
        {"output", result.output},
        {"exit_code", result.exit_code},
        {"stdout", result.stdout_text},
        {"stderr", result.stderr_text},
        {"truncated", result.truncated},
        {"error", result.error ? nlohmann::json(*result.error) : nlohmann::json(nullptr)},
        {"error_kind", terminal::ToString(result.error_kind)}
    };
}

bool ParseCommandRequest(const std::string& body,
                         bool shell_by_default,
                         terminal::CommandRequest& request,
                         std::string& session_id,
                         std::string& error) {
    nlohmann::json json;
    if (!ParseObject(body, json)) {
        error = "Request body must be a JSON object";
        return false;
    }
    if (!json.contains("command") || !json["command"].is_string()) {
        error = "Field 'command' is required";
        return false;
    }
    request = terminal::CommandRequest{};
    request.raw = json["command"].get<std::string>();

    session_id = OptionalString(json, "session_id");
    if (session_id.empty()) {
        session_id = "default";
    }
    if (json.contains("working_dir") && !json["working_dir"].is_null()) {
        if (!json["working_dir"].is_string()) {
            error = "Field 'working_dir' must be a string";
            return false;
        }
        request.working_dir = json["working_dir"].get<std::string>();
    }
    if (json.contains("env") && !json["env"].is_null()) {
        if (!json["env"].is_object()) {
            error = "Field 'env' must be an object";
            return false;
        }
        for (const auto& item : json["env"].items()) {
            if (!item.value().is_string()) {
                error = "Environment value for '" + item.key() + "' must be a string";
                return false;
            }
            request.env[item.key()] = item.value().get<std::string>();
        }
    }
    if (json.contains("timeout") && !json["timeout"].is_null()) {
        if (!json["timeout"].is_number_integer()) {
            error = "Field 'timeout' must be an integer";
            return false;
        }
        request.timeout_s = json["timeout"].get<int>();
    }
    bool use_shell = shell_by_default;
    if (json.contains("shell") && !json["shell"].is_null()) {
        if (!json["shell"].is_boolean()) {
            error = "Field 'shell' must be a boolean";
            return false;
        }
        use_shell = json["shell"].get<bool>();
    }
    request.mode = use_shell ? terminal::ExecMode::kShell : terminal::ExecMode::kArgv;
    return true;
}

// Random version 4 UUID.
std::string GenerateSessionId() {
    std::array<unsigned char, 16> data{};
    std::random_device rd;
    for (auto& b : data) {
        b = static_cast<unsigned char>(rd());
    }
    data[6] = static_cast<unsigned char>((data[6] & 0x0F) | 0x40);
    data[8] = static_cast<unsigned char>((data[8] & 0x3F) | 0x80);

    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (std::size_t i = 0; i < data.size(); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            oss << '-';
        }
        oss << std::setw(2) << static_cast<int>(data[i]);
    }
    return oss.str();
}

HttpApi::HttpApi(const config::Config& config,
                 terminal::OneShotExecutor& executor,
                 terminal::InteractiveSessionManager& sessions,
                 session::ContextStore& context,
                 providers::ModelClient& model)
    : config_(config)
    , executor_(executor)
    , sessions_(sessions)
    , context_(context)
    , model_(model) {}

void HttpApi::Register(httplib::Server& server) {
    server.Post("/api/terminal/execute", [this](const httplib::Request& req, httplib::Response& res) {
        HandleExecute(req, res);
    });
    server.Post("/api/terminal/session/create", [this](const httplib::Request& req, httplib::Response& res) {
        HandleCreateSession(req, res);
    });
    server.Delete(R"(/api/terminal/session/([^/]+))", [this](const httplib::Request& req, httplib::Response& res) {
        HandleKillSession(req, res);
    });
    server.Get("/api/terminal/file-tree", [this](const httplib::Request& req, httplib::Response& res) {
        HandleFileTree(req, res);
    });
    server.Post("/api/chat/generate", [this](const httplib::Request& req, httplib::Response& res) {
        HandleGenerate(req, res);
    });
    server.Post("/api/chat/analyze", [this](const httplib::Request& req, httplib::Response& res) {
        HandleAnalyze(req, res);
    });
    server.Get(R"(/api/chat/sessions/([^/]+)/context)", [this](const httplib::Request& req, httplib::Response& res) {
        HandleGetContext(req, res);
    });
    server.Delete(R"(/api/chat/sessions/([^/]+))", [this](const httplib::Request& req, httplib::Response& res) {
        HandleClearContext(req, res);
    });
    server.Get("/health", [this](const httplib::Request& req, httplib::Response& res) {
        HandleHealth(req, res);
    });
    server.Get("/", [](const httplib::Request&, httplib::Response& res) {
        Reply(res, 200, {{"name", "termgate"}, {"status", "running"}});
    });

    server.set_exception_handler([](const httplib::Request& req, httplib::Response& res, std::exception_ptr ep) {
        std::string message = "Internal server error";
        try {
            std::rethrow_exception(ep);
        } catch (const std::exception& ex) {
            message = ex.what();
        }
        utils::Log(utils::LogLevel::kError, "http", "handler failed", {{"path", req.path}, {"error", message}});
        ReplyError(res, 500, message);
    });
    server.set_logger([](const httplib::Request& req, const httplib::Response& res) {
        utils::Log(utils::LogLevel::kDebug, "http", req.method + " " + req.path,
                   {{"status", std::to_string(res.status)}});
    });
}

void HttpApi::HandleExecute(const httplib::Request& req, httplib::Response& res) {
    terminal::CommandRequest request;
    std::string session_id;
    std::string error;
    if (!ParseCommandRequest(req.body, config_.terminal.shell_by_default, request, session_id, error)) {
        ReplyError(res, 400, error);
        return;
    }
    const auto result = executor_.Execute(request, session_id);
    Reply(res, StatusForError(result.error_kind), ToJson(result));
}

void HttpApi::HandleCreateSession(const httplib::Request& req, httplib::Response& res) {
    std::string session_id = req.get_param_value("session_id");
    if (session_id.empty()) {
        nlohmann::json body;
        if (!ParseObject(req.body, body)) {
            ReplyError(res, 400, "Request body must be a JSON object");
            return;
        }
        session_id = OptionalString(body, "session_id");
    }
    if (session_id.empty()) {
        session_id = GenerateSessionId();
    }

    const auto result = sessions_.Create(session_id);
    if (!result.success) {
        Reply(res, 500, {{"success", false}, {"session_id", session_id}, {"error", result.error}});
        return;
    }
    Reply(res, 200, {{"success", true}, {"session_id", result.session_id}, {"pid", result.pid}});
}

void HttpApi::HandleKillSession(const httplib::Request& req, httplib::Response& res) {
    const std::string session_id = req.matches[1];
    if (!sessions_.Kill(session_id)) {
        ReplyError(res, 404, "Session not found");
        return;
    }
    Reply(res, 200, {{"message", "Session killed"}, {"session_id", session_id}});
}

void HttpApi::HandleFileTree(const httplib::Request& req, httplib::Response& res) {
    const std::string path = req.has_param("path") ? req.get_param_value("path") : ".";
    int max_depth = config_.file_tree.max_depth;
    if (req.has_param("max_depth")) {
        try {
            max_depth = std::stoi(req.get_param_value("max_depth"));
        } catch (const std::exception&) {
            ReplyError(res, 400, "Query parameter 'max_depth' must be an integer");
            return;
        }
    }
    std::vector<std::string> ignore_patterns;
    const auto count = req.get_param_value_count("ignore_patterns");
    for (std::size_t i = 0; i < count; ++i) {
        for (auto& pattern : utils::SplitCsv(req.get_param_value("ignore_patterns", i))) {
            ignore_patterns.push_back(std::move(pattern));
        }
    }
    if (count == 0) {
        ignore_patterns = config_.file_tree.ignore_patterns;
    }

    const auto result = terminal::FileTreeWalker::Walk(path, max_depth, ignore_patterns);
    if (result.error) {
        ReplyError(res, *result.error == "Path does not exist" ? 404 : 500, *result.error);
        return;
    }
    Reply(res, 200, result.tree ? terminal::ToJson(*result.tree) : nlohmann::json(nullptr));
}

void HttpApi::HandleGenerate(const httplib::Request& req, httplib::Response& res) {
    nlohmann::json body;
    if (!ParseObject(req.body, body)) {
        ReplyError(res, 400, "Request body must be a JSON object");
        return;
    }
    const auto message = OptionalString(body, "message");
    if (message.empty()) {
        ReplyError(res, 400, "Field 'message' is required");
        return;
    }
    auto session_id = OptionalString(body, "session_id");
    if (session_id.empty()) {
        session_id = GenerateSessionId();
    }

    providers::GenerationParams params{};
    params.max_tokens = config_.model.max_tokens;
    params.temperature = config_.model.temperature;
    params.top_p = config_.model.top_p;
    if (body.contains("max_tokens") && body["max_tokens"].is_number_integer()) {
        params.max_tokens = body["max_tokens"].get<int>();
    }
    if (body.contains("temperature") && body["temperature"].is_number()) {
        params.temperature = body["temperature"].get<double>();
    }
    if (body.contains("top_p") && body["top_p"].is_number()) {
        params.top_p = body["top_p"].get<double>();
    }

    std::vector<session::ContextMessage> context;
    if (body.contains("context") && body["context"].is_array()) {
        for (const auto& entry : body["context"]) {
            if (entry.is_object()) {
                context.push_back({entry.value("role", "user"), entry.value("content", ""), ""});
            }
        }
    } else {
        context = context_.Fetch(session_id);
    }
    context_.Append(session_id, "user", message);

    std::string reply;
    try {
        reply = model_.Generate(message, context, params);
    } catch (const providers::ModelError& ex) {
        utils::Log(utils::LogLevel::kError, "model", "generate failed",
                   {{"session", session_id}, {"error", ex.what()}});
        ReplyError(res, 502, ex.what());
        return;
    }
    context_.Append(session_id, "assistant", reply);
    Reply(res, 200, {{"response", reply}, {"session_id", session_id}});
}

void HttpApi::HandleAnalyze(const httplib::Request& req, httplib::Response& res) {
    nlohmann::json body;
    if (!ParseObject(req.body, body)) {
        ReplyError(res, 400, "Request body must be a JSON object");
        return;
    }
    if (!body.contains("code") || !body["code"].is_string()) {
        ReplyError(res, 400, "Field 'code' is required");
        return;
    }
    const auto code = body["code"].get<std::string>();
    auto kind = OptionalString(body, "analysis_type");
    if (kind.empty()) {
        kind = "review";
    }

    providers::AnalysisResult analysis;
    try {
        analysis = model_.Analyze(code, kind);
    } catch (const providers::ModelError& ex) {
        utils::Log(utils::LogLevel::kError, "model", "analyze failed", {{"error", ex.what()}});
        ReplyError(res, 502, ex.what());
        return;
    }

    nlohmann::json reply{{"type", analysis.type}, {"analysis", analysis.analysis}, {"code", code}};
    const auto session_id = OptionalString(body, "session_id");
    if (!session_id.empty()) {
        context_.Append(session_id, "user", "Analyze this code (" + kind + "):\n```\n" + code + "\n```");
        context_.Append(session_id, "assistant", analysis.analysis);
        reply["session_id"] = session_id;
    }
    Reply(res, 200, reply);
}

void HttpApi::HandleGetContext(const httplib::Request& req, httplib::Response& res) {
    const std::string session_id = req.matches[1];
    std::optional<std::size_t> limit;
    if (req.has_param("limit")) {
        try {
            const auto value = std::stoi(req.get_param_value("limit"));
            if (value > 0) {
                limit = static_cast<std::size_t>(value);
            }
        } catch (const std::exception&) {
            ReplyError(res, 400, "Query parameter 'limit' must be an integer");
            return;
        }
    }
    const auto messages = context_.Fetch(session_id, limit);
    Reply(res, 200, {{"session_id", session_id}, {"context", ToJson(messages)}, {"count", messages.size()}});
}

void HttpApi::HandleClearContext(const httplib::Request& req, httplib::Response& res) {
    const std::string session_id = req.matches[1];
    if (!context_.Clear(session_id)) {
        ReplyError(res, 404, "Session not found");
        return;
    }
    Reply(res, 200, {{"message", "Session cleared"}, {"session_id", session_id}});
}

void HttpApi::HandleHealth(const httplib::Request&, httplib::Response& res) {
    Reply(res, 200, {
        {"status", "healthy"},
        {"timestamp", utils::NowIso()},
        {"model", model_.ModelName()},
        {"terminal_sessions", sessions_.ActiveCount()},
        {"chat_sessions", context_.ActiveCount()}
    });
}

}  // namespace termgate::server
