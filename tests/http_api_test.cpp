#include <catch2/catch.hpp>

#include <thread>

#include "server/http_api.hpp"
#include "test_helpers.hpp"

using namespace termgate;

namespace {

class FakeModelClient : public providers::ModelClient {
public:
    std::string Generate(const std::string& prompt,
                         const std::vector<session::ContextMessage>& context,
                         const providers::GenerationParams& params) override {
        if (fail) {
            throw providers::ModelError("model offline");
        }
        last_context = context;
        last_params = params;
        return "echo: " + prompt;
    }

    std::string ModelName() const override { return "fake-model"; }

    bool fail = false;
    std::vector<session::ContextMessage> last_context;
    providers::GenerationParams last_params;
};

// Runs the routes on a loopback port for the lifetime of a test.
struct ApiFixture {
    config::Config config;
    terminal::SessionRegistry registry;
    terminal::OneShotExecutor executor;
    terminal::InteractiveSessionManager sessions;
    session::ContextStore context;
    FakeModelClient model;
    server::HttpApi api;
    httplib::Server http;
    std::thread thread;
    int port = 0;

    ApiFixture()
        : executor(registry, MakeExecutorSettings())
        , sessions(registry, terminal::InteractiveSettings{"/bin/sh", std::chrono::milliseconds(300), 4096})
        , context(":memory:", 50)
        , api(config, executor, sessions, context, model) {
        api.Register(http);
        port = http.bind_to_any_port("127.0.0.1");
        thread = std::thread([this] { http.listen_after_bind(); });
        http.wait_until_ready();
    }

    ~ApiFixture() {
        http.stop();
        thread.join();
        sessions.Cleanup();
    }

    static terminal::ExecutorSettings MakeExecutorSettings() {
        terminal::ExecutorSettings settings;
        settings.allowed_commands = {"echo", "ls", "sleep"};
        settings.forbidden_patterns = {"sudo"};
        return settings;
    }

    httplib::Client Client() const {
        httplib::Client client("127.0.0.1", port);
        client.set_read_timeout(10, 0);
        return client;
    }
};

}  // namespace

TEST_CASE("Execute requests parse with argv mode by default", "[http]") {
    terminal::CommandRequest request;
    std::string session_id;
    std::string error;

    REQUIRE(server::ParseCommandRequest(R"({"command": "ls -la"})", false, request, session_id, error));
    REQUIRE(request.raw == "ls -la");
    REQUIRE(request.mode == terminal::ExecMode::kArgv);
    REQUIRE(session_id == "default");
    REQUIRE_FALSE(request.timeout_s);

    REQUIRE(server::ParseCommandRequest(
        R"({"command": "ls | wc", "shell": true, "session_id": "s1", "timeout": 5,
            "working_dir": "/tmp", "env": {"A": "1"}})",
        false, request, session_id, error));
    REQUIRE(request.mode == terminal::ExecMode::kShell);
    REQUIRE(session_id == "s1");
    REQUIRE(request.timeout_s == 5);
    REQUIRE(request.working_dir == "/tmp");
    REQUIRE(request.env.at("A") == "1");

    REQUIRE(server::ParseCommandRequest(R"({"command": "ls"})", true, request, session_id, error));
    REQUIRE(request.mode == terminal::ExecMode::kShell);
}

TEST_CASE("Malformed execute requests are rejected", "[http]") {
    terminal::CommandRequest request;
    std::string session_id;
    std::string error;

    REQUIRE_FALSE(server::ParseCommandRequest("not json", false, request, session_id, error));
    REQUIRE(error == "Request body must be a JSON object");
    REQUIRE_FALSE(server::ParseCommandRequest("{}", false, request, session_id, error));
    REQUIRE(error == "Field 'command' is required");
    REQUIRE_FALSE(server::ParseCommandRequest(R"({"command": "ls", "env": {"A": 1}})", false, request, session_id, error));
    REQUIRE_FALSE(server::ParseCommandRequest(R"({"command": "ls", "timeout": "soon"})", false, request, session_id, error));
    REQUIRE_FALSE(server::ParseCommandRequest(R"({"command": "ls", "shell": "yes"})", false, request, session_id, error));
}

TEST_CASE("Error kinds map to HTTP statuses", "[http]") {
    REQUIRE(server::StatusForError(terminal::ErrorKind::kNone) == 200);
    REQUIRE(server::StatusForError(terminal::ErrorKind::kPolicyViolation) == 403);
    REQUIRE(server::StatusForError(terminal::ErrorKind::kTimeout) == 504);
    REQUIRE(server::StatusForError(terminal::ErrorKind::kSpawnFailure) == 500);
}

TEST_CASE("Execution results serialize every field", "[http]") {
    terminal::ExecutionResult result;
    result.exit_code = 1;
    result.output = "\nSTDERR:\nboom";
    result.stderr_text = "boom";
    const auto json = server::ToJson(result);
    REQUIRE(json["success"] == false);
    REQUIRE(json["exit_code"] == 1);
    REQUIRE(json["stderr"] == "boom");
    REQUIRE(json["error"].is_null());
    REQUIRE(json["truncated"] == false);
    REQUIRE(json.contains("error_kind"));
}

TEST_CASE("Execute endpoint runs allowed commands and blocks the rest", "[http]") {
    ApiFixture fixture;
    auto client = fixture.Client();

    auto ok = client.Post("/api/terminal/execute", R"({"command": "echo hi"})", "application/json");
    REQUIRE(ok);
    REQUIRE(ok->status == 200);
    const auto body = nlohmann::json::parse(ok->body);
    REQUIRE(body["success"] == true);
    REQUIRE(body["stdout"] == "hi\n");

    auto blocked = client.Post("/api/terminal/execute", R"({"command": "rm file"})", "application/json");
    REQUIRE(blocked);
    REQUIRE(blocked->status == 403);
    REQUIRE(nlohmann::json::parse(blocked->body)["success"] == false);

    auto bad = client.Post("/api/terminal/execute", "{}", "application/json");
    REQUIRE(bad);
    REQUIRE(bad->status == 400);
}

TEST_CASE("Sessions can be created and killed over HTTP", "[http]") {
    ApiFixture fixture;
    auto client = fixture.Client();

    auto created = client.Post("/api/terminal/session/create", R"({"session_id": "web-1"})", "application/json");
    REQUIRE(created);
    REQUIRE(created->status == 200);
    const auto body = nlohmann::json::parse(created->body);
    REQUIRE(body["session_id"] == "web-1");
    REQUIRE(body["pid"].get<int>() > 0);
    REQUIRE(fixture.sessions.Exists("web-1"));

    auto duplicate = client.Post("/api/terminal/session/create", R"({"session_id": "web-1"})", "application/json");
    REQUIRE(duplicate);
    REQUIRE(duplicate->status == 500);

    auto killed = client.Delete("/api/terminal/session/web-1");
    REQUIRE(killed);
    REQUIRE(killed->status == 200);
    REQUIRE_FALSE(fixture.sessions.Exists("web-1"));

    auto missing = client.Delete("/api/terminal/session/web-1");
    REQUIRE(missing);
    REQUIRE(missing->status == 404);
}

TEST_CASE("Generated session ids are unique", "[http]") {
    ApiFixture fixture;
    auto client = fixture.Client();

    auto first = client.Post("/api/terminal/session/create", "", "application/json");
    auto second = client.Post("/api/terminal/session/create", "", "application/json");
    REQUIRE(first);
    REQUIRE(second);
    REQUIRE(first->status == 200);
    REQUIRE(second->status == 200);
    REQUIRE(nlohmann::json::parse(first->body)["session_id"]
            != nlohmann::json::parse(second->body)["session_id"]);
    REQUIRE(fixture.sessions.ActiveCount() == 2);
}

TEST_CASE("File tree endpoint reports missing paths", "[http]") {
    ApiFixture fixture;
    termgate::test::TempDir dir("termgate_http_tree");
    std::filesystem::create_directories(dir.path / "src");
    auto client = fixture.Client();

    httplib::Params params{{"path", dir.path.string()}, {"max_depth", "2"}};
    auto tree = client.Get("/api/terminal/file-tree", params, httplib::Headers{});
    REQUIRE(tree);
    REQUIRE(tree->status == 200);
    const auto body = nlohmann::json::parse(tree->body);
    REQUIRE(body["type"] == "directory");
    REQUIRE(body["children"].size() == 1);

    httplib::Params missing_params{{"path", (dir.path / "nope").string()}};
    auto missing = client.Get("/api/terminal/file-tree", missing_params, httplib::Headers{});
    REQUIRE(missing);
    REQUIRE(missing->status == 404);

    httplib::Params bad_params{{"path", dir.path.string()}, {"max_depth", "deep"}};
    auto bad = client.Get("/api/terminal/file-tree", bad_params, httplib::Headers{});
    REQUIRE(bad);
    REQUIRE(bad->status == 400);
}

TEST_CASE("Chat generation keeps per-session context", "[http]") {
    ApiFixture fixture;
    auto client = fixture.Client();

    auto first = client.Post("/api/chat/generate", R"({"message": "hello", "session_id": "c1"})", "application/json");
    REQUIRE(first);
    REQUIRE(first->status == 200);
    REQUIRE(nlohmann::json::parse(first->body)["response"] == "echo: hello");
    REQUIRE(fixture.model.last_context.empty());

    auto second = client.Post("/api/chat/generate",
                              R"({"message": "again", "session_id": "c1", "max_tokens": 64})",
                              "application/json");
    REQUIRE(second);
    REQUIRE(fixture.model.last_context.size() == 2);
    REQUIRE(fixture.model.last_params.max_tokens == 64);

    auto context = client.Get("/api/chat/sessions/c1/context?limit=3");
    REQUIRE(context);
    REQUIRE(context->status == 200);
    const auto body = nlohmann::json::parse(context->body);
    REQUIRE(body["count"] == 3);
    REQUIRE(body["context"][2]["content"] == "echo: again");

    auto cleared = client.Delete("/api/chat/sessions/c1");
    REQUIRE(cleared);
    REQUIRE(cleared->status == 200);
    auto again = client.Delete("/api/chat/sessions/c1");
    REQUIRE(again);
    REQUIRE(again->status == 404);
}

TEST_CASE("Model failures surface as bad gateway", "[http]") {
    ApiFixture fixture;
    fixture.model.fail = true;
    auto client = fixture.Client();

    auto res = client.Post("/api/chat/generate", R"({"message": "hello"})", "application/json");
    REQUIRE(res);
    REQUIRE(res->status == 502);

    auto missing = client.Post("/api/chat/generate", "{}", "application/json");
    REQUIRE(missing);
    REQUIRE(missing->status == 400);
}

TEST_CASE("Health reports counts and the model name", "[http]") {
    ApiFixture fixture;
    auto client = fixture.Client();

    auto res = client.Get("/health");
    REQUIRE(res);
    REQUIRE(res->status == 200);
    const auto body = nlohmann::json::parse(res->body);
    REQUIRE(body["status"] == "healthy");
    REQUIRE(body["model"] == "fake-model");
    REQUIRE(body["terminal_sessions"] == 0);
}

TEST_CASE("Generated session ids look like version 4 UUIDs", "[http]") {
    const auto id = server::GenerateSessionId();
    REQUIRE(id.size() == 36);
    REQUIRE(id[8] == '-');
    REQUIRE(id[14] == '4');
    REQUIRE(id != server::GenerateSessionId());
}
