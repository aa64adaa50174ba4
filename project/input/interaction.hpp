#pragma once
#include <optional>
#include "../core/common/types.hpp"

class Simulator;

// What a windowing layer forwards to the simulation. Coordinates are in
// simulation space.
class ISimulationDriver {
public:
  virtual ~ISimulationDriver() = default;
  virtual void on_tick() = 0;
  virtual void on_pointer_down(const Vec2d& point) = 0;
  virtual void on_pointer_drag(const Vec2d& point) = 0;
  virtual void on_pointer_up() = 0;
};

struct InputState {
  bool mouse_down{false};
  Vec2d mouse{0.0};
  std::optional<u32> selected;
};

// Drag and drop of single particles.
class ClothInteraction : public ISimulationDriver {
public:
  ClothInteraction(Simulator& sim, f64 pick_radius);

  void on_tick() override;
  void on_pointer_down(const Vec2d& point) override;
  void on_pointer_drag(const Vec2d& point) override;
  void on_pointer_up() override;

  const InputState& state() const { return state_; }

private:
  Simulator& sim_;
  f64 pick_radius_;
  InputState state_;
};
