/// @file main.cpp
/// @brief Sandbox: drops a player and a car onto a planet
///
/// Loads a scene file when one is given on the command line, otherwise builds
/// a small two-planet scene in code, then steps the world for a few seconds
/// and logs state transitions and contacts.

#include <gravwell/physics/physics.hpp>

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <string>

namespace {

namespace gm = gravwell_math;
namespace gp = gravwell_physics;

/// Built-in scene used when no file is given
gp::SceneConfig default_scene() {
    gp::SceneConfig scene;

    scene.celestials.push_back(gp::CelestialDesc{"terra", 200.0f, gm::Vec3{0.0f}, 0.6f});
    scene.celestials.push_back(gp::CelestialDesc{"luna", 50.0f, gm::Vec3{1000.0f, 0.0f, 0.0f}, 0.3f});

    gp::SceneObstacle crate;
    crate.name = "crate";
    crate.placement.surface = gp::SurfacePlacement{"terra", 0.0f, 5.0f, 1.0f};
    crate.half_extents = gm::Vec3{2.0f, 1.0f, 2.0f};
    scene.obstacles.push_back(crate);

    gp::SceneSpawn player;
    player.kind = gp::SpawnKind::Player;
    player.name = "player";
    player.placement.position = gm::Vec3{0.0f, 260.0f, 0.0f};
    scene.spawns.push_back(player);

    gp::SceneSpawn car;
    car.kind = gp::SpawnKind::Vehicle;
    car.name = "car";
    car.placement.position = gm::Vec3{0.0f, 0.0f, 240.0f};
    car.velocity = gm::Vec3{5.0f, 0.0f, 0.0f};
    scene.spawns.push_back(car);

    return scene;
}

} // anonymous namespace

int main(int argc, char** argv) {
    gravwell_core::init_logging();
    gravwell_core::LogConfig log_config;
    log_config.level = spdlog::level::info;
    if (const char* level = std::getenv("GRAVWELL_LOG_LEVEL")) {
        if (auto parsed = gravwell_core::parse_log_level(level)) {
            log_config.level = *parsed;
        }
    }
    gravwell_core::configure_logging(log_config);

    gp::SceneConfig scene;
    if (argc > 1) {
        auto loaded = gp::load_scene_file(argv[1]);
        if (!loaded) {
            GRAVWELL_LOG_ERROR("{}", gravwell_core::build_error_chain(loaded.error()));
            return EXIT_FAILURE;
        }
        scene = std::move(*loaded);
    } else {
        scene = default_scene();
    }

    gp::World world(scene.physics);
    auto spawned = world.load_scene(scene);
    if (!spawned) {
        GRAVWELL_LOG_ERROR("{}", gravwell_core::build_error_chain(spawned.error()));
        return EXIT_FAILURE;
    }

    for (gp::BodyId id : *spawned) {
        const std::string name = world.body(id)->name;
        auto landed = world.on_landing(id, [name](gp::BodyId, const gm::Vec3& normal) {
            GRAVWELL_LOG_INFO("{} landed (normal {:.2f} {:.2f} {:.2f})", name, normal.x, normal.y, normal.z);
        });
        auto lifted = world.on_liftoff(id, [name](gp::BodyId, const gm::Vec3&) {
            GRAVWELL_LOG_INFO("{} lifted off", name);
        });
        if (!landed || !lifted) {
            GRAVWELL_LOG_WARN("Could not attach callbacks to {}", name);
        }
    }

    world.on_contact([&world](gp::BodyId id, const gp::Contact& contact) {
        GRAVWELL_LOG_DEBUG("{} hit {} ({})", world.body(id)->name, gp::to_string(contact.struck_type),
                           gp::to_string(contact.classification));
    });

    constexpr float dt = 1.0f / 60.0f;
    constexpr int ticks = 60 * 8;
    for (int tick = 0; tick < ticks; ++tick) {
        world.step(dt);

        if (tick % 60 == 59) {
            for (gp::BodyId id : world.bodies()) {
                const gp::DynamicBody* body = world.body(id);
                const gp::CelestialBody& soi = world.resolve_soi(body->position);
                GRAVWELL_LOG_INFO("t={:.1f}s {:>8} {:<16} altitude {:.2f} over {}",
                                  (tick + 1) * dt, body->name, gp::to_string(body->state),
                                  gm::distance(body->position, soi.center) - soi.radius, soi.name);
            }
        }
    }

    GRAVWELL_LOG_INFO("Finished after {} ticks", world.stats().ticks);
    gravwell_core::shutdown_logging();
    return EXIT_SUCCESS;
}
