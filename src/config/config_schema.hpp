#pragma once

#include <string>
#include <vector>

namespace termgate::config {

struct ServerConfig {
    std::string host = "0.0.0.0";
    int port = 8000;
    int ws_port = 8001;
};

struct TerminalConfig {
    int max_output = 10000;
    int timeout_s = 30;
    std::vector<std::string> allowed_commands = {
        "ls", "pwd", "cat", "echo", "grep", "find",
        "python", "pip", "npm", "node", "git", "docker"
    };
    std::vector<std::string> forbidden_patterns = {
        "rm -rf /", "sudo", "chmod 777", "curl | bash"
    };
    std::string shell = "/bin/bash";
    int read_timeout_ms = 100;
    int read_chunk_bytes = 4096;
    bool shell_by_default = false;
};

struct FileTreeConfig {
    int max_depth = 3;
    std::vector<std::string> ignore_patterns = {
        "__pycache__", ".git", "node_modules", ".venv", "venv", "build"
    };
};

struct ModelConfig {
    std::string api_base = "http://127.0.0.1:8080/v1";
    std::string api_key;
    std::string model = "Qwen/Qwen2.5-Coder-7B-Instruct";
    std::string system_prompt = "You are Qwen, created by Alibaba Cloud. You are a helpful coding assistant.";
    int max_tokens = 512;
    double temperature = 0.7;
    double top_p = 0.9;
    int timeout_s = 120;
};

struct ContextConfig {
    std::string db_path;
    int max_messages = 50;
    int ttl_s = 24 * 60 * 60;
    int cleanup_interval_s = 60 * 60;
};

struct LogSettings {
    std::string level = "info";
};

struct Config {
    ServerConfig server;
    TerminalConfig terminal;
    FileTreeConfig file_tree;
    ModelConfig model;
    ContextConfig context;
    LogSettings log;
};

}  // namespace termgate::config
