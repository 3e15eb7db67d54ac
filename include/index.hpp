#pragma once
#include <cstdint>
#include <memory>
#include <utility>
#include <vector>

// In-memory HNSW index over L2-normalised vectors; scores are cosine similarity.
class VectorIndex {
public:
  VectorIndex(int dim, size_t capacity, int M=16, int efC=200, int efS=64);
  ~VectorIndex();

  void add(int64_t label, const std::vector<float>& vec);
  // (label, cosine) pairs, most similar first
  std::vector<std::pair<int64_t, float>> search(const std::vector<float>& q, int k) const;

  int dim() const { return dim_; }
  size_t size() const;

private:
  int dim_;
  // pimpl so headers stay light
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

std::vector<float> l2_normalize(std::vector<float> v);
