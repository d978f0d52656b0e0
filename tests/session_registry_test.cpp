#include <catch2/catch.hpp>

#include <csignal>
#include <fstream>

#include "terminal/session_registry.hpp"
#include "test_helpers.hpp"

using namespace termgate::terminal;

namespace {

std::shared_ptr<Session> MakeSession(const std::string& id,
                                     SessionKind kind,
                                     const std::string& executable,
                                     std::vector<std::string> args) {
    SpawnOptions options{};
    options.executable = executable;
    options.args = std::move(args);
    auto session = std::make_shared<Session>();
    session->id = id;
    session->kind = kind;
    session->process = ProcessHandle::Spawn(options);
    return session;
}

bool ProcessAlive(int pid) {
    return ::kill(pid, 0) == 0;
}

// Zombies count as gone: reparented children may never be reaped in a container.
bool ProcessGone(int pid) {
    std::ifstream stat("/proc/" + std::to_string(pid) + "/stat");
    std::string line;
    if (!std::getline(stat, line)) {
        return true;
    }
    const auto close = line.rfind(')');
    return close == std::string::npos || close + 2 >= line.size() || line[close + 2] == 'Z';
}

}  // namespace

TEST_CASE("Terminate kills, reaps and erases", "[registry]") {
    SessionRegistry registry;
    auto session = MakeSession("a", SessionKind::kInteractive, "sleep", {"30"});
    const int pid = session->process->Pid();
    REQUIRE(registry.Insert(session));
    REQUIRE(registry.Contains("a"));

    REQUIRE(registry.Terminate("a"));
    REQUIRE_FALSE(registry.Contains("a"));
    REQUIRE(session->process->HasExited());
    REQUIRE(session->process->ExitCode() == 128 + SIGKILL);
    REQUIRE_FALSE(ProcessAlive(pid));

    REQUIRE_FALSE(registry.Terminate("a"));
}

TEST_CASE("Duplicate ids are refused", "[registry]") {
    SessionRegistry registry;
    auto first = MakeSession("dup", SessionKind::kInteractive, "sleep", {"30"});
    auto second = MakeSession("dup", SessionKind::kInteractive, "sleep", {"30"});
    REQUIRE(registry.Insert(first));
    REQUIRE_FALSE(registry.Insert(second));
    REQUIRE(registry.Size() == 1);
    second->process->Terminate();
    REQUIRE(registry.Find("dup") == first);
}

TEST_CASE("ReapExited removes only finished interactive sessions", "[registry]") {
    SessionRegistry registry;
    REQUIRE(registry.Insert(MakeSession("done", SessionKind::kInteractive, "true", {})));
    REQUIRE(registry.Insert(MakeSession("running", SessionKind::kInteractive, "sleep", {"30"})));
    REQUIRE(registry.Insert(MakeSession("oneshot", SessionKind::kOneShot, "true", {})));

    REQUIRE(termgate::test::WaitUntil([&]() {
        registry.ReapExited();
        return !registry.Contains("done");
    }));
    REQUIRE(registry.Contains("running"));
    REQUIRE(registry.Contains("oneshot"));
    REQUIRE(registry.Count(SessionKind::kInteractive) == 1);
    REQUIRE(registry.Count(SessionKind::kOneShot) == 1);
}

TEST_CASE("RemoveIfExited leaves running sessions alone", "[registry]") {
    SessionRegistry registry;
    REQUIRE(registry.Insert(MakeSession("running", SessionKind::kInteractive, "sleep", {"30"})));
    REQUIRE_FALSE(registry.RemoveIfExited("running"));
    REQUIRE(registry.Contains("running"));
    REQUIRE_FALSE(registry.RemoveIfExited("missing"));
}

TEST_CASE("TerminateAll empties the registry", "[registry]") {
    SessionRegistry registry;
    std::vector<int> pids;
    for (const std::string id : {"x", "y", "z"}) {
        auto session = MakeSession(id, SessionKind::kInteractive, "sleep", {"30"});
        pids.push_back(session->process->Pid());
        REQUIRE(registry.Insert(session));
    }
    const auto listed = registry.List();
    REQUIRE(listed.size() == 3);

    REQUIRE(registry.TerminateAll() == 3);
    REQUIRE(registry.Size() == 0);
    for (const int pid : pids) {
        REQUIRE_FALSE(ProcessAlive(pid));
    }
}

TEST_CASE("Terminate takes down the whole process group", "[registry]") {
    SessionRegistry registry;
    termgate::test::TempDir dir("termgate_group");
    const auto pid_file = (dir.path / "child.pid").string();
    REQUIRE(registry.Insert(MakeSession(
        "group", SessionKind::kInteractive, "/bin/sh", {"-c", "sleep 30 & echo $! > " + pid_file + "; wait"})));

    int child_pid = 0;
    REQUIRE(termgate::test::WaitUntil([&]() {
        std::ifstream input(pid_file);
        return static_cast<bool>(input >> child_pid) && child_pid > 0;
    }));
    REQUIRE(ProcessAlive(child_pid));

    REQUIRE(registry.Terminate("group"));
    REQUIRE(termgate::test::WaitUntil([&]() { return ProcessGone(child_pid); }));
}
