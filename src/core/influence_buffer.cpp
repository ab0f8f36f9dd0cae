#include "canopy/core/influence_buffer.h"

#include <algorithm>
#include <stdexcept>
#include <string>

namespace canopy {

InfluenceBuffer InfluenceBuffer::with_len(std::size_t len) {
  InfluenceBuffer b;
  b.ensure_len(len);
  return b;
}

void InfluenceBuffer::ensure_len(std::size_t len) {
  sum_.resize(len);
  count_.resize(len);
  clear();
}

void InfluenceBuffer::clear() {
  std::fill(sum_.begin(), sum_.end(), Vec2{});
  std::fill(count_.begin(), count_.end(), 0u);
}

void InfluenceBuffer::add(NodeId id, Vec2 dir) {
  if (id >= count_.size()) {
    throw std::out_of_range("InfluenceBuffer::add: node id " + std::to_string(id) + " out of range (size " +
                            std::to_string(count_.size()) + ")");
  }
  sum_[id] += dir;
  ++count_[id];
}

Vec2 InfluenceBuffer::avg_dir(NodeId id) const {
  if (!is_influenced(id)) return {};
  return sum_[id] / static_cast<float>(count_[id]);
}

std::vector<NodeId> InfluenceBuffer::influenced_indices() const {
  std::vector<NodeId> out;
  for (NodeId id = 0; id < count_.size(); ++id) {
    if (count_[id] > 0) out.push_back(id);
  }
  return out;
}

void InfluenceBuffer::merge_from(const InfluenceBuffer& other) {
  if (other.size() != size()) {
    throw std::invalid_argument("InfluenceBuffer::merge_from: size mismatch (" + std::to_string(size()) + " vs " +
                                std::to_string(other.size()) + ")");
  }
  for (std::size_t i = 0; i < count_.size(); ++i) {
    sum_[i] += other.sum_[i];
    count_[i] += other.count_[i];
  }
}

} // namespace canopy
