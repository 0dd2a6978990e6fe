#pragma once
#include <memory>
#include <string>
#include <utility>
#include <vector>

// Exact inner-product search over L2-normalized vectors (so scores are
// cosine similarities). Built per query from sidecar embeddings.
class VectorIndex {
public:
  VectorIndex(int dim, size_t capacity);
  ~VectorIndex();

  void add(const std::vector<float>& vec, size_t label);

  // (label, similarity) pairs, best first. k is clamped to size().
  std::vector<std::pair<size_t, float>> search(const std::vector<float>& q, size_t k) const;

  int dim() const { return dim_; }
  size_t size() const;

private:
  int dim_;
  // pimpl so headers stay light
  struct Impl;
  std::unique_ptr<Impl> impl_;
};
