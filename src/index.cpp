#include "index.hpp"
#include <hnswlib/hnswlib.h>
#include <algorithm>
#include <cmath>
#include <stdexcept>

struct VectorIndex::Impl {
  std::unique_ptr<hnswlib::InnerProductSpace> space;  // inputs are normalised, so IP == cosine
  std::unique_ptr<hnswlib::HierarchicalNSW<float>> hnsw;
};

VectorIndex::VectorIndex(int dim, size_t capacity, int M, int efC, int efS)
  : dim_(dim), impl_(new Impl) {
  if (dim <= 0) throw std::runtime_error("VectorIndex: dimension must be positive");
  impl_->space.reset(new hnswlib::InnerProductSpace(dim_));
  impl_->hnsw.reset(new hnswlib::HierarchicalNSW<float>(impl_->space.get(), std::max<size_t>(capacity, 1), M, efC));
  impl_->hnsw->setEf(efS);
}

VectorIndex::~VectorIndex() = default;

void VectorIndex::add(int64_t label, const std::vector<float>& vec) {
  if ((int)vec.size() != dim_) throw std::runtime_error("VectorIndex::add dimension mismatch");
  impl_->hnsw->addPoint((void*)vec.data(), (hnswlib::labeltype)label);
}

std::vector<std::pair<int64_t, float>> VectorIndex::search(const std::vector<float>& q, int k) const {
  if ((int)q.size() != dim_) throw std::runtime_error("VectorIndex::search dimension mismatch");
  std::vector<std::pair<int64_t, float>> out;
  size_t n = size();
  if (n == 0 || k <= 0) return out;
  auto res = impl_->hnsw->searchKnn((void*)q.data(), std::min<size_t>((size_t)k, n));
  // farthest sits on top of the queue
  while (!res.empty()) {
    out.emplace_back((int64_t)res.top().second, 1.0f - res.top().first);
    res.pop();
  }
  std::reverse(out.begin(), out.end());
  return out;
}

size_t VectorIndex::size() const {
  return impl_->hnsw->cur_element_count;
}

std::vector<float> l2_normalize(std::vector<float> v) {
  double s = 0.0;
  for (float x : v) s += (double)x * (double)x;
  float norm = (float)std::sqrt(std::max(s, 1e-12));
  for (auto& x : v) x /= norm;
  return v;
}
