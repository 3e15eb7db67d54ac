#pragma once
#include "collaborators.hpp"
#include <string>
#include <vector>

// GGUF embedding model through llama.cpp. Vectors are L2-normalised.
class Embedder : public TextEncoder {
public:
  explicit Embedder(const std::string& embed_model_path, int n_ctx = 1024);
  ~Embedder() override;

  Embedder(const Embedder&) = delete;
  Embedder& operator=(const Embedder&) = delete;

  std::vector<float> encode(const std::string& text) override;
  int dim() const override { return dim_; }

private:
  struct Impl;
  Impl* impl_;
  int dim_;
};
