#include "providers/model_client.hpp"

#include "providers/openai_compat_client.hpp"

namespace termgate::providers {

std::string ModelClient::NormalizeAnalysisKind(const std::string& kind) {
    if (kind == "explain" || kind == "optimize" || kind == "debug") {
        return kind;
    }
    return "review";
}

std::string ModelClient::AnalysisPrompt(const std::string& code, const std::string& kind) {
    const auto normalized = NormalizeAnalysisKind(kind);
    std::string lead;
    if (normalized == "explain") {
        lead = "Explain what this code does:";
    } else if (normalized == "optimize") {
        lead = "Suggest optimizations for this code:";
    } else if (normalized == "debug") {
        lead = "Find potential bugs in this code:";
    } else {
        lead = "Review this code and provide feedback on improvements:";
    }
    return lead + "\n\n```\n" + code + "\n```";
}

AnalysisResult ModelClient::Analyze(const std::string& code, const std::string& kind) {
    GenerationParams params{};
    params.max_tokens = 1024;
    AnalysisResult result{};
    result.type = kind.empty() ? "review" : kind;
    result.analysis = Generate(AnalysisPrompt(code, kind), {}, params);
    return result;
}

std::unique_ptr<ModelClient> CreateModelClient(const config::Config& config) {
    return std::make_unique<OpenAICompatClient>(config.model);
}

}  // namespace termgate::providers
