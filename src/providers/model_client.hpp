#pragma once

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "config/config_schema.hpp"
#include "session/context_store.hpp"

namespace termgate::providers {

class ModelError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct GenerationParams {
    int max_tokens = 512;
    double temperature = 0.7;
    double top_p = 0.9;
};

struct AnalysisResult {
    std::string type;
    std::string analysis;
};

class ModelClient {
public:
    virtual ~ModelClient() = default;

    // Throws ModelError when the model cannot produce a reply.
    virtual std::string Generate(const std::string& prompt,
                                 const std::vector<session::ContextMessage>& context,
                                 const GenerationParams& params) = 0;

    virtual std::string ModelName() const = 0;

    // Unknown kinds fall back to "review".
    AnalysisResult Analyze(const std::string& code, const std::string& kind);

    static std::string AnalysisPrompt(const std::string& code, const std::string& kind);
    static std::string NormalizeAnalysisKind(const std::string& kind);
};

std::unique_ptr<ModelClient> CreateModelClient(const config::Config& config);

}  // namespace termgate::providers
