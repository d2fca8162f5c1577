#include "animation/AnimationPlayback.hpp"
#include "ecs/Components.hpp"
#include "engine/Config.hpp"
#include "engine/Log.hpp"
#include "gameplay/Simulation.hpp"

#include <filesystem>
#include <string>

int main(int argc, char** argv) {
    using namespace emberfall;

    std::string configPath = argc > 1 ? argv[1] : "config.json";

    Config config;
    if (!config.loadFromFile(configPath)) {
        Log::init("", "info");
        LOG_WARN("Could not load config from '{}', using defaults", configPath);
    }

    // Per-machine overrides: "config.json" -> "config.local.json"
    std::filesystem::path base(configPath);
    std::filesystem::path localPath = base.parent_path() / (base.stem().string() + ".local.json");
    if (std::filesystem::exists(localPath) && !config.mergeFromFile(localPath.string())) {
        LOG_WARN("Ignoring unreadable overrides in '{}'", localPath.string());
    }

    Simulation simulation;
    if (!simulation.init(config)) {
        return 1;
    }

    for (const auto& name : config.getStringList("simulation.spawn")) {
        if (simulation.spawn(name) == NullEntity) {
            LOG_ERROR("Failed to spawn '{}'", name);
            return 1;
        }
    }

    int ticks = config.getInt("simulation.ticks", 60);
    for (int i = 0; i < ticks; ++i) {
        simulation.tick(simulation.getTickInterval());
    }

    auto& registry = simulation.getRegistry();
    registry.each<Name, AnimationPlayback>([](Entity /*entity*/, const Name& name,
                                              const AnimationPlayback& playback) {
        LOG_INFO("'{}' in state '{}' at frame {}{}", name.name, playback.getCurrentState(),
                 playback.getFrameIndex(), playback.isFinished() ? " (finished)" : "");
        for (const auto& layer : playback.currentFrame()) {
            LOG_INFO("    {} [{}, {}, {}x{}]", layer.sheet, layer.source.x, layer.source.y,
                     layer.source.width, layer.source.height);
        }
    });

    LOG_INFO("Ran {} ticks ({:.2f}s simulated)", simulation.getTime().tickCount(),
             simulation.getTime().elapsedTime());
    simulation.shutdown();
    return 0;
}
