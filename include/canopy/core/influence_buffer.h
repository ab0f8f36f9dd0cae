#pragma once

#include <cstdint>
#include <vector>

#include "canopy/core/ids.h"
#include "canopy/core/vec2.h"

namespace canopy {

// Per-node scratch accumulator for one attraction phase.
//
// Slot i holds the sum of unit directions pulling node i and the number of
// attractors that contributed. Contents only mean something between an
// attraction_phase() and the growth_phase() that consumes it.
class InfluenceBuffer {
 public:
  InfluenceBuffer() = default;

  static InfluenceBuffer with_len(std::size_t len);

  // Resize to `len` slots and zero every slot (even when the size already matches).
  void ensure_len(std::size_t len);

  void clear();

  // Add one contribution for `id`. Throws std::out_of_range for ids past size().
  void add(NodeId id, Vec2 dir);

  // Sum / count, or zero when nothing contributed.
  Vec2 avg_dir(NodeId id) const;

  bool is_influenced(NodeId id) const { return id < count_.size() && count_[id] > 0; }
  std::uint32_t count(NodeId id) const { return id < count_.size() ? count_[id] : 0; }
  Vec2 sum(NodeId id) const { return id < sum_.size() ? sum_[id] : Vec2{}; }

  // Ids with at least one contribution, ascending.
  std::vector<NodeId> influenced_indices() const;

  // Slot-wise add of another buffer (reduction step after accumulating into
  // several buffers in parallel). Throws std::invalid_argument on size mismatch.
  void merge_from(const InfluenceBuffer& other);

  std::size_t size() const { return count_.size(); }

 private:
  std::vector<Vec2> sum_;
  std::vector<std::uint32_t> count_;
};

} // namespace canopy
