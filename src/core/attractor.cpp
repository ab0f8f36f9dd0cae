#include "canopy/core/attractor.h"

#include <algorithm>
#include <stdexcept>
#include <string>

namespace canopy {

AttractorSet AttractorSet::from_positions(const std::vector<Vec2>& positions) {
  AttractorSet set;
  set.extend(positions);
  return set;
}

AttractorIndex AttractorSet::append(Vec2 pos) {
  Attractor a;
  a.pos = pos;
  points_.push_back(a);
  return points_.size() - 1;
}

void AttractorSet::extend(const std::vector<Vec2>& positions) {
  points_.reserve(points_.size() + positions.size());
  for (const Vec2& p : positions) append(p);
}

bool AttractorSet::kill(AttractorIndex i) {
  Attractor& a = mut_at(i);
  const bool was_alive = a.alive;
  a.alive = false;
  a.owner.reset();
  return was_alive;
}

void AttractorSet::set_owner(AttractorIndex i, std::optional<NodeId> owner) { mut_at(i).owner = owner; }

void AttractorSet::set_position(AttractorIndex i, Vec2 pos) { mut_at(i).pos = pos; }

const Attractor& AttractorSet::at(AttractorIndex i) const {
  if (i >= points_.size()) {
    throw std::out_of_range("unknown attractor index " + std::to_string(i) + " (set has " +
                            std::to_string(points_.size()) + ")");
  }
  return points_[i];
}

Attractor& AttractorSet::mut_at(AttractorIndex i) { return const_cast<Attractor&>(at(i)); }

bool AttractorSet::any_alive() const {
  return std::any_of(points_.begin(), points_.end(), [](const Attractor& a) { return a.alive; });
}

std::size_t AttractorSet::alive_count() const {
  return static_cast<std::size_t>(
      std::count_if(points_.begin(), points_.end(), [](const Attractor& a) { return a.alive; }));
}

} // namespace canopy
