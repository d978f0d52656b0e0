#pragma once

#include <string>
#include <vector>

#include "config/config_schema.hpp"
#include "providers/model_client.hpp"

namespace termgate::providers {

// Talks to any server exposing POST <api_base>/chat/completions.
class OpenAICompatClient : public ModelClient {
public:
    explicit OpenAICompatClient(config::ModelConfig settings);

    std::string Generate(const std::string& prompt,
                         const std::vector<session::ContextMessage>& context,
                         const GenerationParams& params) override;

    std::string ModelName() const override { return settings_.model; }

private:
    config::ModelConfig settings_;
};

}  // namespace termgate::providers
