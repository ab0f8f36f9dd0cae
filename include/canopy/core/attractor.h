#pragma once

#include <optional>
#include <vector>

#include "canopy/core/ids.h"
#include "canopy/core/vec2.h"

namespace canopy {

struct Attractor {
  Vec2 pos;

  // Monotonic: once false it stays false.
  bool alive{true};

  // Node that satisfied the k-th nearest + influence radius test in the most
  // recent attraction phase. Recomputed every phase; carries no meaning across ticks.
  std::optional<NodeId> owner;
};

// Insertion-ordered attractor storage.
//
// Killed attractors are tombstoned (alive = false) and kept in place so that
// indices held by the viewer stay valid. Mutation goes through the methods
// below so the alive flag can never be revived.
class AttractorSet {
 public:
  AttractorSet() = default;

  static AttractorSet from_positions(const std::vector<Vec2>& positions);

  AttractorIndex append(Vec2 pos);
  void extend(const std::vector<Vec2>& positions);

  // Mark dead. Returns true if the attractor was alive before the call.
  // Index checks throw std::out_of_range.
  bool kill(AttractorIndex i);
  void set_owner(AttractorIndex i, std::optional<NodeId> owner);

  // Direct position write for drag-to-move between ticks.
  void set_position(AttractorIndex i, Vec2 pos);

  const Attractor& at(AttractorIndex i) const;
  const std::vector<Attractor>& points() const { return points_; }

  bool any_alive() const;
  std::size_t alive_count() const;
  std::size_t size() const { return points_.size(); }
  bool empty() const { return points_.empty(); }

  void clear() { points_.clear(); }

 private:
  Attractor& mut_at(AttractorIndex i);

  std::vector<Attractor> points_;
};

} // namespace canopy
