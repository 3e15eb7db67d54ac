#pragma once
#include "collaborators.hpp"
#include <string>

struct LlamaOptions {
  int n_ctx = 4096;
  int max_new_tokens = 512;
  int timeout_seconds = 120;   // per request, wall clock
};

// One instruction-tuned GGUF model serving all three text roles. Greedy
// decoding, CPU only. Failures raise CollaboratorError.
class LlamaAssistant : public Summarizer, public Drafter, public Grader {
public:
  LlamaAssistant(const std::string& model_path, const LlamaOptions& opts = LlamaOptions());
  ~LlamaAssistant() override;

  LlamaAssistant(const LlamaAssistant&) = delete;
  LlamaAssistant& operator=(const LlamaAssistant&) = delete;

  SummaryResult summarize(const std::string& text, const std::string& instructions) override;
  std::string draft(const std::string& prompt, const std::vector<std::string>& evidence_blocks) override;
  GradeResult grade(const std::string& claim_text, const std::string& evidence_text) override;

private:
  struct Impl;
  Impl* impl_;
};
