#include <gtest/gtest.h>

#include "content/TemplateStore.hpp"
#include "TestDocuments.hpp"

#include <cstdio>
#include <fstream>
#include <string>
#include <vector>

using namespace emberfall;
using nlohmann::json;

TEST(TemplateStoreTest, LoadsEntityDocument) {
    TemplateStore store;
    ASSERT_EQ(store.loadFromJson(test::entityDocument()), ContentResult::Success);

    EXPECT_EQ(store.templateCount(), 4u);
    EXPECT_EQ(store.getTemplateNames(),
              (std::vector<std::string>{"cursor", "human", "player", "town_guard"}));
    EXPECT_TRUE(store.hasTemplate("town_guard"));
    EXPECT_FALSE(store.hasTemplate("dragon"));
}

TEST(TemplateStoreTest, ParentsAndComponentValues) {
    TemplateStore store;
    ASSERT_EQ(store.loadFromString(test::ENTITY_DOCUMENT), ContentResult::Success);

    const EntityTemplate* human = store.getTemplate("human");
    ASSERT_NE(human, nullptr);
    EXPECT_FALSE(human->parent.has_value());
    EXPECT_EQ(human->getComponent("position").kind, ComponentValueKind::Default);
    EXPECT_EQ(human->getComponent("health").kind, ComponentValueKind::Unset);

    ComponentValue physics = human->getComponent("physics");
    ASSERT_EQ(physics.kind, ComponentValueKind::Override);
    EXPECT_EQ(physics.fields["core_size"], json::array({24, 16}));

    const EntityTemplate* player = store.getTemplate("player");
    ASSERT_NE(player, nullptr);
    ASSERT_TRUE(player->parent.has_value());
    EXPECT_EQ(*player->parent, "town_guard");
    EXPECT_EQ(player->getComponent("player").kind, ComponentValueKind::Default);
    EXPECT_FALSE(player->getComponent("sprite").isSet());
}

TEST(TemplateStoreTest, EntryPointGroupsAndSystemSettings) {
    TemplateStore store;
    EXPECT_EQ(store.getComponentsGroup(), TemplateStore::DEFAULT_COMPONENTS_GROUP);

    ASSERT_EQ(store.loadFromJson(test::entityDocument()), ContentResult::Success);
    EXPECT_EQ(store.getComponentsGroup(), "emberfall.components");
    EXPECT_EQ(store.getSystemsGroup(), "emberfall.systems");

    const json& gathering = store.getSystemSettings("mana_gathering");
    EXPECT_EQ(gathering["default_gather_radius"], 1);
    EXPECT_DOUBLE_EQ(store.getSystemSettings("mana_replenishment")["default_replenishment_amount"].get<double>(),
                     0.01);

    // Unconfigured systems read as an empty object
    EXPECT_TRUE(store.getSystemSettings("velocity").is_object());
    EXPECT_TRUE(store.getSystemSettings("velocity").empty());
}

TEST(TemplateStoreTest, EmptyOrNullParentMeansNone) {
    TemplateStore store;
    json doc = test::documentWithTemplates({
        {"a", {{"parent", ""}}},
        {"b", {{"parent", nullptr}}},
        {"c", nullptr}
    });
    ASSERT_EQ(store.loadFromJson(doc), ContentResult::Success);
    EXPECT_FALSE(store.getTemplate("a")->parent.has_value());
    EXPECT_FALSE(store.getTemplate("b")->parent.has_value());
    EXPECT_TRUE(store.getTemplate("c")->components.empty());
}

TEST(TemplateStoreTest, MissingParentIsNotALoadError) {
    // Dangling parents are reported when the template is resolved
    TemplateStore store;
    json doc = test::documentWithTemplates({{"orphan", {{"parent", "nobody"}}}});
    EXPECT_EQ(store.loadFromJson(doc), ContentResult::Success);
    EXPECT_EQ(*store.getTemplate("orphan")->parent, "nobody");
}

TEST(TemplateStoreTest, MalformedDocumentsRejected) {
    TemplateStore store;
    EXPECT_EQ(store.loadFromString("{ not json"), ContentResult::InvalidDocument);
    EXPECT_FALSE(store.getLastError().empty());

    EXPECT_EQ(store.loadFromJson(json::array()), ContentResult::InvalidDocument);
    EXPECT_EQ(store.loadFromJson({{"templates", json::object()}}), ContentResult::InvalidDocument);
    EXPECT_EQ(store.loadFromJson({{"entities", {{"templates", json::array()}}}}),
              ContentResult::InvalidDocument);

    // Component values must be null or objects
    json badComponent = test::documentWithTemplates({{"x", {{"components", {{"health", 5}}}}}});
    EXPECT_EQ(store.loadFromJson(badComponent), ContentResult::InvalidDocument);

    json badParent = test::documentWithTemplates({{"x", {{"parent", 42}}}});
    EXPECT_EQ(store.loadFromJson(badParent), ContentResult::InvalidDocument);

    json badGroup = {{"entities", {{"components", {{"entry_point_group", 7}}}}}};
    EXPECT_EQ(store.loadFromJson(badGroup), ContentResult::InvalidDocument);

    json badSettings = {{"entities", {{"systems", {{"movement", "fast"}}}}}};
    EXPECT_EQ(store.loadFromJson(badSettings), ContentResult::InvalidDocument);

    EXPECT_EQ(store.templateCount(), 0u);
}

TEST(TemplateStoreTest, FailedLoadLeavesStoreUnchanged) {
    TemplateStore store;
    ASSERT_EQ(store.loadFromJson(test::entityDocument()), ContentResult::Success);

    json doc = test::documentWithTemplates({
        {"valid", {{"components", {{"position", nullptr}}}}},
        {"zzz_invalid", {{"components", {{"position", "here"}}}}}
    });
    EXPECT_EQ(store.loadFromJson(doc), ContentResult::InvalidDocument);
    EXPECT_EQ(store.templateCount(), 4u);
    EXPECT_FALSE(store.hasTemplate("valid"));
}

TEST(TemplateStoreTest, LaterDocumentsAddAndReplace) {
    TemplateStore store;
    ASSERT_EQ(store.loadFromJson(test::entityDocument()), ContentResult::Success);

    json doc = test::documentWithTemplates({
        {"cursor", {{"components", {{"position", nullptr}, {"state", nullptr}}}}},
        {"merchant", {{"parent", "human"}}}
    });
    ASSERT_EQ(store.loadFromJson(doc), ContentResult::Success);
    EXPECT_EQ(store.templateCount(), 5u);
    EXPECT_TRUE(store.getTemplate("cursor")->getComponent("state").isSet());

    // Groups the second document does not mention are kept
    EXPECT_EQ(store.getSystemsGroup(), "emberfall.systems");
}

TEST(TemplateStoreTest, LoadFromFile) {
    std::string path = "test_template_store_entities.json";
    {
        std::ofstream out(path);
        out << test::ENTITY_DOCUMENT;
    }

    TemplateStore store;
    EXPECT_EQ(store.loadFromFile(path), ContentResult::Success);
    EXPECT_EQ(store.templateCount(), 4u);
    std::remove(path.c_str());

    EXPECT_EQ(store.loadFromFile("does/not/exist.json"), ContentResult::InvalidDocument);
}

TEST(TemplateStoreTest, ShippedDeathTimingMatchesTestDocument) {
    TemplateStore shipped;
    ASSERT_EQ(shipped.loadFromFile(std::string(EMBERFALL_DATA_DIR) + "/entities.json"), ContentResult::Success);
    TemplateStore reference;
    ASSERT_EQ(reference.loadFromJson(test::entityDocument()), ContentResult::Success);

    auto deathBlock = [](const TemplateStore& store) {
        ComponentValue sprite = store.getTemplate("town_guard")->getComponent("sprite");
        return sprite.fields.at("animations").at(0);
    };
    json shippedDeath = deathBlock(shipped);
    json referenceDeath = deathBlock(reference);
    EXPECT_EQ(shippedDeath["states"], referenceDeath["states"]);
    EXPECT_EQ(shippedDeath["frame_interval"], referenceDeath["frame_interval"]);
    EXPECT_EQ(shippedDeath["frame_count"], referenceDeath["frame_count"]);
    EXPECT_EQ(shippedDeath["frame_interval"], 30);
}

TEST(TemplateStoreTest, Clear) {
    TemplateStore store;
    ASSERT_EQ(store.loadFromJson(test::entityDocument()), ContentResult::Success);
    store.clear();
    EXPECT_EQ(store.templateCount(), 0u);
    EXPECT_TRUE(store.getSystemSettings("mana_gathering").empty());
    EXPECT_EQ(store.getSystemsGroup(), TemplateStore::DEFAULT_SYSTEMS_GROUP);
}
