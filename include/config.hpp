#pragma once
#include "llama_assistant.hpp"
#include "orchestrator.hpp"
#include <string>

struct AppConfig {
  PipelineConfig pipeline;
  LlamaOptions llm;
};

// Overlays a JSON document on `base`. Unknown keys are ignored; a value of
// the wrong type raises FormatError naming the key.
AppConfig apply_config_json(const std::string& json_text, AppConfig base = AppConfig());

// Reads and applies a config file; std::runtime_error if it cannot be read.
AppConfig load_config(const std::string& path, AppConfig base = AppConfig());
