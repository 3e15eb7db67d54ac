#pragma once
#include "models.hpp"
#include <string>
#include <vector>

// Narrow interfaces to the model-backed helpers. Implementations may block;
// they report transport failures and timeouts as CollaboratorError.

struct SummaryResult {
  std::string text;
  double confidence = 0.5;
  std::vector<std::string> citations;
};

struct GradeResult {
  ClaimStatus status = ClaimStatus::Uncertain;  // supported, contradicted or uncertain
  std::string rationale;
};

class Summarizer {
public:
  virtual ~Summarizer() = default;
  virtual SummaryResult summarize(const std::string& text, const std::string& instructions) = 0;
};

class Drafter {
public:
  virtual ~Drafter() = default;
  virtual std::string draft(const std::string& prompt, const std::vector<std::string>& evidence_blocks) = 0;
};

class Grader {
public:
  virtual ~Grader() = default;
  virtual GradeResult grade(const std::string& claim_text, const std::string& evidence_text) = 0;
};

// Fixed-dimension text embeddings, L2-normalised.
class TextEncoder {
public:
  virtual ~TextEncoder() = default;
  virtual std::vector<float> encode(const std::string& text) = 0;
  virtual int dim() const = 0;
};
