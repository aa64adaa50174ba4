#pragma once
#include <string>
#include "types.hpp"
#include "result.hpp"

struct ClothPresetCfg {
  i32 rows{20}, cols{30};
  f64 spacing{20.0};
  f64 origin_x{100.0}, origin_y{50.0};
  bool pin_top_edge{true};
};
struct PhysicsCfg {
  f64 gravity{980.0};   // px / s^2, applied along +y
  f64 damping{0.99};
  i32 iterations{5};
};
struct InteractionCfg { f64 pick_radius{20.0}; };
// Scripted pointer drag for headless runs.
struct DragCfg {
  bool enabled{false};
  f64 from_x{0.0}, from_y{0.0};
  f64 to_x{0.0}, to_y{0.0};
  i32 start_tick{0};
  i32 duration_ticks{1};
};
struct RunCfg {
  i32 ticks{300};
  bool ascii_frame{true};
  i32 ascii_width{80}, ascii_height{30};
  DragCfg drag;
};
struct AppCfg {
  ClothPresetCfg cloth;
  PhysicsCfg physics;
  InteractionCfg interaction;
  RunCfg run;
  f64 dt{0.016};
};
AppCfg default_app_config();
Result<AppCfg> load_app_config(const std::string& path);
Result<AppCfg> parse_app_config(const std::string& json_text);
Result<AppCfg> validate_app_config(const AppCfg& cfg);
