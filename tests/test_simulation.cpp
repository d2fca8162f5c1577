#include <gtest/gtest.h>

#include "animation/AnimationPlayback.hpp"
#include "gameplay/Simulation.hpp"
#include "TestDocuments.hpp"

#include <cstdio>
#include <fstream>
#include <memory>
#include <string>

using namespace emberfall;
using nlohmann::json;

namespace {

const char* TEST_CONFIG = R"({
    "log": { "level": "warn" },
    "animation": { "default_frame_interval_ms": 50 },
    "simulation": {
        "max_delta": 0.25,
        "tick_rate": 30,
        "mana_tiles": [
            { "x": 0, "y": 0, "mana": { "fire": 10 } }
        ]
    }
})";

Config testConfig() {
    Config config;
    config.loadFromString(TEST_CONFIG);
    return config;
}

class AuraProvider : public ComponentSchemaProvider {
public:
    explicit AuraProvider(std::string group) : m_group(std::move(group)) {}
    std::string getGroup() const override { return m_group; }
    void registerKinds(ComponentSchemaRegistry& registry) override {
        registry.registerKind({.kind = "aura", .defaults = {{"radius", 2}}});
    }

private:
    std::string m_group;
};

class TickCounter : public System {
public:
    explicit TickCounter(int& ticks) : System("tick_counter"), m_ticks(ticks) {}
    void update(float) override { ++m_ticks; }

private:
    int& m_ticks;
};

class CounterProvider : public SystemProvider {
public:
    CounterProvider(std::string group, int& ticks) : m_group(std::move(group)), m_ticks(ticks) {}
    std::string getGroup() const override { return m_group; }
    void registerSystems(SystemScheduler& scheduler, const SystemSettingsLookup&) override {
        scheduler.addSystem<TickCounter>(m_ticks);
    }

private:
    std::string m_group;
    int& m_ticks;
};

json documentUsingAura() {
    json doc = test::entityDocument();
    doc["entities"]["templates"]["shrine"] = {{"components", {{"position", nullptr}, {"aura", nullptr}}}};
    return doc;
}

} // namespace

TEST(SimulationTest, InitWithDocument) {
    Simulation simulation;
    ASSERT_TRUE(simulation.init(testConfig(), test::entityDocument())) << simulation.getLastError();

    EXPECT_TRUE(simulation.isInitialized());
    EXPECT_EQ(simulation.getTemplateStore().templateCount(), 4u);
    EXPECT_EQ(simulation.getResolver().cacheSize(), 4u);
    EXPECT_EQ(simulation.getSchemas().kindCount(), 10u);
    EXPECT_EQ(simulation.getScheduler().getSystemCount(), 7u);

    EXPECT_DOUBLE_EQ(simulation.getTickInterval(), 1.0 / 30.0);
    EXPECT_FLOAT_EQ(simulation.getCompiler().getDefaultFrameInterval(), 0.05f);
    EXPECT_FLOAT_EQ(simulation.getManaField().getMana(0, 0, "fire"), 10.0f);
}

TEST(SimulationTest, SpawnAndTick) {
    Simulation simulation;
    ASSERT_TRUE(simulation.init(testConfig(), test::entityDocument()));

    Entity player = simulation.spawn("player", Vec2(100.0f, 100.0f));
    ASSERT_NE(player, NullEntity);

    auto& registry = simulation.getRegistry();
    registry.get<Input>(player).set(InputAction::MoveRight, true);

    for (int i = 0; i < 10; ++i) {
        simulation.tick(0.1);
    }

    EXPECT_FLOAT_EQ(registry.get<Position>(player).layer.x, 300.0f);
    EXPECT_FLOAT_EQ(registry.get<Position>(player).layer.y, 100.0f);
    EXPECT_EQ(registry.get<Sprite>(player).animationState(), "moving_east");
    EXPECT_EQ(registry.get<AnimationPlayback>(player).getCurrentState(), "moving_east");
    EXPECT_EQ(simulation.getTime().tickCount(), 10u);
}

TEST(SimulationTest, TickClampsDelta) {
    Simulation simulation;
    ASSERT_TRUE(simulation.init(testConfig(), test::entityDocument()));

    simulation.tick(10.0);
    EXPECT_DOUBLE_EQ(simulation.getTime().deltaTime(), 0.25);
}

TEST(SimulationTest, DeathFlowsThroughSystems) {
    Simulation simulation;
    ASSERT_TRUE(simulation.init(testConfig(), test::entityDocument()));

    int deaths = 0;
    simulation.getEventBus().on("entity_death", [&deaths](const EventData&) {
        ++deaths;
        return false;
    });

    Entity guard = simulation.spawn("town_guard");
    simulation.getRegistry().get<EntityState>(guard).kill();
    simulation.tick(0.05);
    simulation.tick(0.05);

    EXPECT_EQ(deaths, 1);
    EXPECT_EQ(simulation.getRegistry().get<AnimationPlayback>(guard).getCurrentState(), "dead_south");
}

TEST(SimulationTest, SpawnFailures) {
    Simulation simulation;
    EXPECT_EQ(simulation.spawn("player"), NullEntity);

    ASSERT_TRUE(simulation.init(testConfig(), test::entityDocument()));
    EXPECT_EQ(simulation.spawn("dragon"), NullEntity);
}

TEST(SimulationTest, CyclicDocumentIsFatal) {
    Simulation simulation;
    json doc = test::documentWithTemplates({
        {"a", {{"parent", "b"}}},
        {"b", {{"parent", "a"}}}
    });
    EXPECT_FALSE(simulation.init(testConfig(), doc));
    EXPECT_FALSE(simulation.isInitialized());
    EXPECT_NE(simulation.getLastError().find("template resolution failed"), std::string::npos);
}

TEST(SimulationTest, MalformedDocumentIsFatal) {
    Simulation simulation;
    EXPECT_FALSE(simulation.init(testConfig(), json::array()));
    EXPECT_FALSE(simulation.isInitialized());
    EXPECT_FALSE(simulation.getLastError().empty());
}

TEST(SimulationTest, MalformedManaTilesAreFatal) {
    Config config = testConfig();
    Simulation simulation;
    config.setString("simulation.mana_tiles", "everywhere");
    EXPECT_FALSE(simulation.init(config, test::entityDocument()));
}

TEST(SimulationTest, ComponentProvidersMatchedByGroup) {
    Simulation simulation;
    simulation.addComponentProvider(std::make_unique<AuraProvider>("emberfall.components"));
    ASSERT_TRUE(simulation.init(testConfig(), documentUsingAura())) << simulation.getLastError();

    Entity shrine = simulation.spawn("shrine");
    ASSERT_NE(shrine, NullEntity);
    const auto* raw = simulation.getRegistry().tryGet<RawComponents>(shrine);
    ASSERT_NE(raw, nullptr);
    ASSERT_NE(raw->find("aura"), nullptr);
    EXPECT_EQ((*raw->find("aura"))["radius"], 2);
}

TEST(SimulationTest, ForeignComponentProvidersIgnored) {
    Simulation simulation;
    simulation.addComponentProvider(std::make_unique<AuraProvider>("someone.else"));
    EXPECT_FALSE(simulation.init(testConfig(), documentUsingAura()));
    EXPECT_NE(simulation.getLastError().find("aura"), std::string::npos);
}

TEST(SimulationTest, SystemProvidersMatchedByGroup) {
    int matched = 0;
    int foreign = 0;

    Simulation simulation;
    simulation.addSystemProvider(std::make_unique<CounterProvider>("emberfall.systems", matched));
    simulation.addSystemProvider(std::make_unique<CounterProvider>("someone.else", foreign));
    ASSERT_TRUE(simulation.init(testConfig(), test::entityDocument()));

    EXPECT_EQ(simulation.getScheduler().getSystemCount(), 8u);
    EXPECT_EQ(simulation.getScheduler().getSystemNames().back(), "tick_counter");

    simulation.tick(0.1);
    simulation.tick(0.1);
    EXPECT_EQ(matched, 2);
    EXPECT_EQ(foreign, 0);
}

TEST(SimulationTest, InitFromConfiguredFile) {
    std::string path = "test_simulation_entities.json";
    {
        std::ofstream out(path);
        out << test::ENTITY_DOCUMENT;
    }

    Config config = testConfig();
    config.setString("content.entities", path);

    Simulation simulation;
    EXPECT_TRUE(simulation.init(config)) << simulation.getLastError();
    EXPECT_EQ(simulation.getTemplateStore().templateCount(), 4u);
    std::remove(path.c_str());

    config.setString("content.entities", "does/not/exist.json");
    EXPECT_FALSE(simulation.init(config));
    EXPECT_FALSE(simulation.isInitialized());
}

TEST(SimulationTest, ReinitStartsClean) {
    Simulation simulation;
    ASSERT_TRUE(simulation.init(testConfig(), test::entityDocument()));
    simulation.spawn("player");
    simulation.spawn("cursor");

    ASSERT_TRUE(simulation.init(testConfig(), test::entityDocument()));
    EXPECT_EQ(simulation.getRegistry().alive(), 0u);
    EXPECT_EQ(simulation.getScheduler().getSystemCount(), 7u);
}

TEST(SimulationTest, Shutdown) {
    Simulation simulation;
    ASSERT_TRUE(simulation.init(testConfig(), test::entityDocument()));
    simulation.spawn("player");

    simulation.shutdown();
    EXPECT_FALSE(simulation.isInitialized());
    EXPECT_EQ(simulation.getScheduler().getSystemCount(), 0u);
    EXPECT_EQ(simulation.getTemplateStore().templateCount(), 0u);

    // Ticking after shutdown is a no-op
    simulation.tick(0.1);
    EXPECT_EQ(simulation.getTime().tickCount(), 0u);
}
