#include "config/config_loader.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>

#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace termgate::config {
namespace {

std::string GetEnv(const char* name) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string();
}

std::string GetEnvFallback(const char* primary, const char* secondary) {
    auto value = GetEnv(primary);
    if (!value.empty()) {
        return value;
    }
    return GetEnv(secondary);
}

bool ParseBool(const std::string& value) {
    std::string lowered = value;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return lowered == "1" || lowered == "true" || lowered == "yes" || lowered == "on";
}

int ParseInt(const std::string& value, int fallback) {
    try {
        return std::stoi(value);
    } catch (const std::exception&) {
        return fallback;
    }
}

double ParseDouble(const std::string& value, double fallback) {
    try {
        return std::stod(value);
    } catch (const std::exception&) {
        return fallback;
    }
}

// Accepts a JSON array (ALLOWED='["ls","cat"]') or a comma separated list.
std::vector<std::string> ParseList(const std::string& value) {
    if (!value.empty() && value.front() == '[') {
        auto parsed = nlohmann::json::parse(value, nullptr, false);
        if (parsed.is_array()) {
            std::vector<std::string> items;
            for (const auto& item : parsed) {
                if (item.is_string()) {
                    items.push_back(item.get<std::string>());
                }
            }
            return items;
        }
    }
    return utils::SplitCsv(value);
}

void ReadString(const nlohmann::json& source, const char* key, std::string& target) {
    if (source.contains(key) && source[key].is_string()) {
        target = source[key].get<std::string>();
    }
}

void ReadInt(const nlohmann::json& source, const char* key, int& target) {
    if (source.contains(key) && source[key].is_number_integer()) {
        target = source[key].get<int>();
    }
}

void ReadDouble(const nlohmann::json& source, const char* key, double& target) {
    if (source.contains(key) && source[key].is_number()) {
        target = source[key].get<double>();
    }
}

void ReadBool(const nlohmann::json& source, const char* key, bool& target) {
    if (source.contains(key) && source[key].is_boolean()) {
        target = source[key].get<bool>();
    }
}

void ReadStringList(const nlohmann::json& source, const char* key, std::vector<std::string>& target) {
    if (!source.contains(key) || !source[key].is_array()) {
        return;
    }
    target.clear();
    for (const auto& item : source[key]) {
        if (item.is_string()) {
            target.push_back(item.get<std::string>());
        }
    }
}

}  // namespace

std::filesystem::path GetHomePath() {
    const char* home = std::getenv("HOME");
    return std::filesystem::path(home ? home : ".");
}

std::filesystem::path GetConfigPath() {
    const auto explicit_path = GetEnv("TERMGATE_CONFIG");
    if (!explicit_path.empty()) {
        return explicit_path;
    }
    return GetHomePath() / ".termgate" / "config.json";
}

void ApplyConfigFromJson(Config& config, const nlohmann::json& data) {
    if (!data.is_object()) {
        return;
    }

    if (data.contains("server") && data["server"].is_object()) {
        const auto& server = data["server"];
        ReadString(server, "host", config.server.host);
        ReadInt(server, "port", config.server.port);
        ReadInt(server, "wsPort", config.server.ws_port);
    }

    if (data.contains("terminal") && data["terminal"].is_object()) {
        const auto& terminal = data["terminal"];
        ReadInt(terminal, "maxOutput", config.terminal.max_output);
        ReadInt(terminal, "timeout", config.terminal.timeout_s);
        ReadStringList(terminal, "allowedCommands", config.terminal.allowed_commands);
        ReadStringList(terminal, "forbiddenPatterns", config.terminal.forbidden_patterns);
        ReadString(terminal, "shell", config.terminal.shell);
        ReadInt(terminal, "readTimeoutMs", config.terminal.read_timeout_ms);
        ReadInt(terminal, "readChunkBytes", config.terminal.read_chunk_bytes);
        ReadBool(terminal, "shellByDefault", config.terminal.shell_by_default);
    }

    if (data.contains("fileTree") && data["fileTree"].is_object()) {
        const auto& tree = data["fileTree"];
        ReadInt(tree, "maxDepth", config.file_tree.max_depth);
        ReadStringList(tree, "ignorePatterns", config.file_tree.ignore_patterns);
    }

    if (data.contains("model") && data["model"].is_object()) {
        const auto& model = data["model"];
        ReadString(model, "apiBase", config.model.api_base);
        ReadString(model, "apiKey", config.model.api_key);
        ReadString(model, "model", config.model.model);
        ReadString(model, "systemPrompt", config.model.system_prompt);
        ReadInt(model, "maxTokens", config.model.max_tokens);
        ReadDouble(model, "temperature", config.model.temperature);
        ReadDouble(model, "topP", config.model.top_p);
        ReadInt(model, "timeoutS", config.model.timeout_s);
    }

    if (data.contains("context") && data["context"].is_object()) {
        const auto& context = data["context"];
        ReadString(context, "dbPath", config.context.db_path);
        ReadInt(context, "maxMessages", config.context.max_messages);
        ReadInt(context, "ttlS", config.context.ttl_s);
        ReadInt(context, "cleanupIntervalS", config.context.cleanup_interval_s);
    }

    if (data.contains("log") && data["log"].is_object()) {
        ReadString(data["log"], "level", config.log.level);
    }
}

void ApplyConfigFromEnv(Config& config) {
    const auto host = GetEnvFallback("TERMGATE_SERVER__HOST", "HOST");
    if (!host.empty()) {
        config.server.host = host;
    }

    const auto port = GetEnvFallback("TERMGATE_SERVER__PORT", "PORT");
    if (!port.empty()) {
        config.server.port = ParseInt(port, config.server.port);
    }

    const auto ws_port = GetEnv("TERMGATE_SERVER__WS_PORT");
    if (!ws_port.empty()) {
        config.server.ws_port = ParseInt(ws_port, config.server.ws_port);
    }

    const auto max_output = GetEnvFallback("TERMGATE_TERMINAL__MAX_OUTPUT", "TERMINAL_MAX_OUTPUT");
    if (!max_output.empty()) {
        config.terminal.max_output = ParseInt(max_output, config.terminal.max_output);
    }

    const auto timeout = GetEnvFallback("TERMGATE_TERMINAL__TIMEOUT", "TERMINAL_TIMEOUT");
    if (!timeout.empty()) {
        config.terminal.timeout_s = ParseInt(timeout, config.terminal.timeout_s);
    }

    // An explicitly empty allow-list disables the restriction.
    const char* allowed = std::getenv("TERMGATE_TERMINAL__ALLOWED_COMMANDS");
    if (!allowed) {
        allowed = std::getenv("TERMINAL_ALLOWED_COMMANDS");
    }
    if (allowed) {
        config.terminal.allowed_commands = ParseList(allowed);
    }

    const auto forbidden = GetEnvFallback(
        "TERMGATE_TERMINAL__FORBIDDEN_PATTERNS",
        "TERMINAL_FORBIDDEN_PATTERNS");
    if (!forbidden.empty()) {
        config.terminal.forbidden_patterns = ParseList(forbidden);
    }

    const auto shell = GetEnv("TERMGATE_TERMINAL__SHELL");
    if (!shell.empty()) {
        config.terminal.shell = shell;
    }

    const auto read_timeout = GetEnv("TERMGATE_TERMINAL__READ_TIMEOUT_MS");
    if (!read_timeout.empty()) {
        config.terminal.read_timeout_ms = ParseInt(read_timeout, config.terminal.read_timeout_ms);
    }

    const auto shell_by_default = GetEnv("TERMGATE_TERMINAL__SHELL_BY_DEFAULT");
    if (!shell_by_default.empty()) {
        config.terminal.shell_by_default = ParseBool(shell_by_default);
    }

    const auto api_base = GetEnv("TERMGATE_MODEL__API_BASE");
    if (!api_base.empty()) {
        config.model.api_base = api_base;
    }

    const auto api_key = GetEnv("TERMGATE_MODEL__API_KEY");
    if (!api_key.empty()) {
        config.model.api_key = api_key;
    }

    const auto model_name = GetEnvFallback("TERMGATE_MODEL__MODEL", "MODEL_NAME");
    if (!model_name.empty()) {
        config.model.model = model_name;
    }

    const auto temperature = GetEnv("TERMGATE_MODEL__TEMPERATURE");
    if (!temperature.empty()) {
        config.model.temperature = ParseDouble(temperature, config.model.temperature);
    }

    const auto db_path = GetEnv("TERMGATE_CONTEXT__DB_PATH");
    if (!db_path.empty()) {
        config.context.db_path = db_path;
    }

    const auto ttl = GetEnv("TERMGATE_CONTEXT__TTL_S");
    if (!ttl.empty()) {
        config.context.ttl_s = ParseInt(ttl, config.context.ttl_s);
    }

    const auto log_level = GetEnvFallback("TERMGATE_LOG__LEVEL", "TERMGATE_LOG_LEVEL");
    if (!log_level.empty()) {
        config.log.level = log_level;
    }
}

Config LoadConfig() {
    Config config{};

    const auto config_path = GetConfigPath();
    if (std::filesystem::exists(config_path)) {
        try {
            std::ifstream input(config_path);
            nlohmann::json data;
            input >> data;
            ApplyConfigFromJson(config, data);
        } catch (const nlohmann::json::exception& ex) {
            utils::Log(utils::LogLevel::kWarn, "config", "keeping defaults, parse failed",
                       {{"path", config_path.string()}, {"error", ex.what()}});
        }
    }

    ApplyConfigFromEnv(config);

    if (config.context.db_path.empty()) {
        config.context.db_path = (GetHomePath() / ".termgate" / "context.db").string();
    }
    return config;
}

}  // namespace termgate::config
