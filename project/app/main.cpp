// app/main.cpp
#include <algorithm>
#include <cstdint>
#include <iostream>
#include <memory>
#include <string>

#include "../core/common/config.hpp"
#include "../core/common/log.hpp"
#include "../core/common/timer.hpp"
#include "../input/interaction.hpp"
#include "../physics/constraint_solver.hpp"
#include "../physics/cpu/cpu_solver.hpp"
#include "../render/text_renderer.hpp"
#include "../sim/simulator.hpp"

// viewport the cloth was laid out for, in pixels
static constexpr f64 kViewWidth  = 800.0;
static constexpr f64 kViewHeight = 600.0;

struct CmdLine {
    std::string config_path;
    std::string log_spec;
    bool ok{true};
};

static CmdLine parse_cmdline(int argc, char** argv)
{
    CmdLine cl;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--log" && i + 1 < argc) {
            cl.log_spec = argv[++i];
        } else if (!arg.empty() && arg[0] != '-' && cl.config_path.empty()) {
            cl.config_path = arg;
        } else {
            std::cerr << "usage: clothsim [config.json] [--log channel:level,...]\n";
            cl.ok = false;
        }
    }
    return cl;
}

static Scene make_scene(const AppCfg& cfg)
{
    ClothBuildParams params;
    params.rows    = static_cast<u32>(cfg.cloth.rows);
    params.cols    = static_cast<u32>(cfg.cloth.cols);
    params.spacing = cfg.cloth.spacing;
    params.origin  = Vec2d(cfg.cloth.origin_x, cfg.cloth.origin_y);
    params.pin_top_edge = cfg.cloth.pin_top_edge;

    return make_hanging_cloth_scene(params, cfg.physics.gravity);
}

// Feeds the scripted drag into the driver the way a window's pointer
// callbacks would.
static void drive_scripted_drag(const DragCfg& drag, i32 tick, ISimulationDriver& driver)
{
    if (!drag.enabled) return;

    const std::int64_t end_tick = std::int64_t(drag.start_tick) + drag.duration_ticks;
    const Vec2d from(drag.from_x, drag.from_y);
    const Vec2d to(drag.to_x, drag.to_y);

    if (tick == drag.start_tick) {
        driver.on_pointer_down(from);
    }
    if (tick >= drag.start_tick && tick < end_tick) {
        f64 t = f64(tick - drag.start_tick + 1) / f64(drag.duration_ticks);
        driver.on_pointer_drag(from + (to - from) * t);
    }
    if (tick == end_tick - 1) {
        driver.on_pointer_up();
    }
}

int main(int argc, char** argv)
{
    CmdLine cl = parse_cmdline(argc, argv);
    if (!cl.ok) return 2;

    logging::init();
    logging::configure_from_string(cl.log_spec);

    Result<AppCfg> cfg_result = cl.config_path.empty()
        ? validate_app_config(default_app_config())
        : load_app_config(cl.config_path);
    if (!cfg_result) {
        logging::config()->error("{}", cfg_result.err);
        return 1;
    }
    const AppCfg& cfg = cfg_result.value;

    SolverParams sp;
    sp.damping    = cfg.physics.damping;
    sp.iterations = static_cast<u32>(cfg.physics.iterations);

    Simulator sim(std::make_unique<CpuSolver>(sp), cfg.dt);
    sim.init_scene(make_scene(cfg));

    ClothInteraction interaction(sim, cfg.interaction.pick_radius);

    {
        ScopedTimer timer("simulation");
        for (i32 tick = 0; tick < cfg.run.ticks; ++tick) {
            drive_scripted_drag(cfg.run.drag, tick, interaction);
            interaction.on_tick();
        }
    }

    const ClothModel& cloth = sim.cloth();
    f64 lowest = cloth.particles.empty() ? 0.0 : cloth.particles[0].pos.y;
    for (const auto& pt : cloth.particles) {
        lowest = std::max(lowest, pt.pos.y);
    }

    logging::app()->info("{} ticks done, lowest particle y = {:.3f}, max stretch = {:.4f}, finite = {}",
                         sim.tick_count(), lowest, max_constraint_stretch(cloth),
                         sim.is_finite());

    if (cfg.run.ascii_frame) {
        Bounds area{ Vec2d(0.0), Vec2d(kViewWidth, kViewHeight) };
        TextRenderer renderer(std::cout,
                              static_cast<u32>(cfg.run.ascii_width),
                              static_cast<u32>(cfg.run.ascii_height),
                              area);
        renderer.draw_frame(make_render_view(cloth));
    }

    return sim.is_finite() ? 0 : 3;
}
