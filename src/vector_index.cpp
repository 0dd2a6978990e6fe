#include "vector_index.hpp"
#include <hnswlib/hnswlib.h>
#include <algorithm>
#include <stdexcept>

struct VectorIndex::Impl {
  std::unique_ptr<hnswlib::InnerProductSpace> space;
  std::unique_ptr<hnswlib::BruteforceSearch<float>> flat;
};

VectorIndex::VectorIndex(int dim, size_t capacity) : dim_(dim), impl_(new Impl) {
  if (dim <= 0) throw std::runtime_error("VectorIndex: dimension must be positive");
  impl_->space.reset(new hnswlib::InnerProductSpace(dim));
  impl_->flat.reset(new hnswlib::BruteforceSearch<float>(impl_->space.get(), std::max<size_t>(1, capacity)));
}

VectorIndex::~VectorIndex() = default;

void VectorIndex::add(const std::vector<float>& vec, size_t label) {
  if ((int)vec.size() != dim_) throw std::runtime_error("VectorIndex::add dimension mismatch");
  impl_->flat->addPoint((void*)vec.data(), label);
}

std::vector<std::pair<size_t, float>> VectorIndex::search(const std::vector<float>& q, size_t k) const {
  if ((int)q.size() != dim_) throw std::runtime_error("VectorIndex::search dimension mismatch");
  k = std::min(k, size());
  std::vector<std::pair<size_t, float>> out;
  if (k == 0) return out;
  auto res = impl_->flat->searchKnn((void*)q.data(), k);
  out.reserve(res.size());
  // InnerProductSpace distance is 1 - dot; the queue pops farthest first
  while (!res.empty()) {
    out.emplace_back((size_t)res.top().second, 1.0f - res.top().first);
    res.pop();
  }
  std::reverse(out.begin(), out.end());
  return out;
}

size_t VectorIndex::size() const {
  return impl_->flat->cur_element_count;
}
