#pragma once
#include "models.hpp"
#include <stdexcept>
#include <string>

// Malformed citation strings and out-of-range line numbers.
struct FormatError : std::runtime_error {
  using std::runtime_error::runtime_error;
};

enum class CitationFailure { UnknownFile, UnknownRange };

struct CitationError : std::runtime_error {
  CitationError(CitationFailure reason, const std::string& citation);
  CitationFailure reason;
  std::string citation;
};

// A write that would break a foreign-key-like constraint. The write is undone.
struct IntegrityError : std::runtime_error {
  using std::runtime_error::runtime_error;
};

struct StoreError : std::runtime_error {
  using std::runtime_error::runtime_error;
};

struct EvidenceError : std::runtime_error {
  using std::runtime_error::runtime_error;
};

struct CollaboratorError : std::runtime_error {
  using std::runtime_error::runtime_error;
};

struct GateExhaustedError : std::runtime_error {
  GateExhaustedError(int max_iters, const IterationMetrics& last);
  IterationMetrics metrics;
};

struct CancelledError : std::runtime_error {
  using std::runtime_error::runtime_error;
};
