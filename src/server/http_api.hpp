#pragma once

#include <string>

#include "config/config_schema.hpp"
#include "httplib.h"
#include "nlohmann/json.hpp"
#include "providers/model_client.hpp"
#include "session/context_store.hpp"
#include "terminal/interactive_session_manager.hpp"
#include "terminal/oneshot_executor.hpp"

namespace termgate::server {

int StatusForError(terminal::ErrorKind kind);
nlohmann::json ToJson(const terminal::ExecutionResult& result);

// Parses an execute request body. Returns false with a message on a
// malformed body or a missing command.
bool ParseCommandRequest(const std::string& body,
                         bool shell_by_default,
                         terminal::CommandRequest& request,
                         std::string& session_id,
                         std::string& error);

std::string GenerateSessionId();

class HttpApi {
public:
    HttpApi(const config::Config& config,
            terminal::OneShotExecutor& executor,
            terminal::InteractiveSessionManager& sessions,
            session::ContextStore& context,
            providers::ModelClient& model);

    void Register(httplib::Server& server);

private:
    void HandleExecute(const httplib::Request& req, httplib::Response& res);
    void HandleCreateSession(const httplib::Request& req, httplib::Response& res);
    void HandleKillSession(const httplib::Request& req, httplib::Response& res);
    void HandleFileTree(const httplib::Request& req, httplib::Response& res);
    void HandleGenerate(const httplib::Request& req, httplib::Response& res);
    void HandleAnalyze(const httplib::Request& req, httplib::Response& res);
    void HandleGetContext(const httplib::Request& req, httplib::Response& res);
    void HandleClearContext(const httplib::Request& req, httplib::Response& res);
    void HandleHealth(const httplib::Request& req, httplib::Response& res);

    const config::Config& config_;
    terminal::OneShotExecutor& executor_;
    terminal::InteractiveSessionManager& sessions_;
    session::ContextStore& context_;
    providers::ModelClient& model_;
};

}  // namespace termgate::server
