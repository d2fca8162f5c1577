#include "ecs/CoreComponents.hpp"
#include "engine/Log.hpp"

#include <optional>

namespace emberfall {

namespace {

std::optional<uint32_t> parseStateFlag(const std::string& name) {
    if (name == "dead")                 return EntityStateFlag::Dead;
    if (name == "stationary")           return EntityStateFlag::Stationary;
    if (name == "can_move")             return EntityStateFlag::CanMove;
    if (name == "can_use_skills")       return EntityStateFlag::CanUseSkills;
    if (name == "can_change_input")     return EntityStateFlag::CanChangeInput;
    if (name == "can_replenish_health") return EntityStateFlag::CanReplenishHealth;
    if (name == "can_be_damaged")       return EntityStateFlag::CanBeDamaged;
    if (name == "normal")               return EntityStateFlag::Normal;
    LOG_WARN("EntityState: unknown state flag '{}'", name);
    return std::nullopt;
}

} // anonymous namespace

Vec2 parseVec2(const nlohmann::json& json) {
    if (json.is_array() && json.size() >= 2) {
        return Vec2(json[0].get<float>(), json[1].get<float>());
    } else if (json.is_object()) {
        return Vec2(json.value("x", 0.0f), json.value("y", 0.0f));
    }
    return Vec2();
}

Position parsePosition(const nlohmann::json& fields) {
    Position position;
    position.screen = parseVec2(fields.value("screen_position", nlohmann::json::array()));
    position.layer = parseVec2(fields.value("layer_position", nlohmann::json::array()));
    position.map = parseVec2(fields.value("map_position", nlohmann::json::array()));

    std::string primary = fields.value("primary", std::string("layer"));
    if (primary == "screen") {
        position.primary = PositionSpace::Screen;
    } else if (primary == "map") {
        position.primary = PositionSpace::Map;
    } else {
        if (primary != "layer") {
            LOG_WARN("Position: unknown primary space '{}', using 'layer'", primary);
        }
        position.primary = PositionSpace::Layer;
    }
    return position;
}

EntityState parseEntityState(const nlohmann::json& fields) {
    EntityState state;
    if (!fields.contains("state")) {
        return state;
    }

    const auto& value = fields["state"];
    if (value.is_number_integer()) {
        state.flags = value.get<uint32_t>();
    } else if (value.is_string()) {
        state.flags = parseStateFlag(value.get<std::string>()).value_or(EntityStateFlag::Normal);
    } else if (value.is_array()) {
        state.flags = EntityStateFlag::Dead;
        for (const auto& flag : value) {
            state.flags |= parseStateFlag(flag.get<std::string>()).value_or(0);
        }
    }
    return state;
}

Physics parsePhysics(const nlohmann::json& fields) {
    Physics physics;
    physics.coreSize = parseVec2(fields.value("core_size", nlohmann::json::array()));
    physics.coreOffset = parseVec2(fields.value("core_offset", nlohmann::json::array()));
    return physics;
}

Sprite parseSprite(const nlohmann::json& fields) {
    Sprite sprite;
    if (fields.contains("sprite_size") && fields["sprite_size"].is_array() &&
        fields["sprite_size"].size() >= 2) {
        sprite.size = PixelSize(fields["sprite_size"][0].get<int>(), fields["sprite_size"][1].get<int>());
    }

    std::string direction = fields.value("direction", std::string("south"));
    if (auto parsed = directionFromString(direction)) {
        sprite.direction = *parsed;
    } else {
        LOG_WARN("Sprite: unknown direction '{}', facing south", direction);
    }

    sprite.action = fields.value("state", std::string("stationary"));
    return sprite;
}

Health parseHealth(const nlohmann::json& fields) {
    Health health;
    health.min = fields.value("min", 0.0f);
    health.max = fields.value("max", 100.0f);
    health.current = fields.value("health", 1.0f);
    return health;
}

Mana parseMana(const nlohmann::json& fields) {
    Mana mana;
    mana.max = fields.value("max", 100.0f);
    if (fields.contains("mana") && fields["mana"].is_object()) {
        for (auto it = fields["mana"].begin(); it != fields["mana"].end(); ++it) {
            mana.stores[it.key()] = it->get<float>();
        }
    }
    return mana;
}

Velocity parseVelocity(const nlohmann::json& fields) {
    Velocity velocity;
    velocity.direction = parseVec2(fields.value("direction", nlohmann::json::array()));
    velocity.speed = fields.value("speed", 200.0f);
    return velocity;
}

void CoreComponentProvider::registerKinds(ComponentSchemaRegistry& registry) {
    using nlohmann::json;

    registry.registerKind({
        .kind = "position",
        .defaults = {{"screen_position", {0, 0}}, {"layer_position", {0, 0}},
                     {"map_position", {0, 0}}, {"primary", "layer"}},
        .attach = [](Registry& reg, Entity entity, const json& fields, const ResolvedComponents&) {
            reg.addOrReplace<Position>(entity, parsePosition(fields));
        }
    });

    registry.registerKind({
        .kind = "state",
        .defaults = {{"state", "normal"}},
        .attach = [](Registry& reg, Entity entity, const json& fields, const ResolvedComponents&) {
            reg.addOrReplace<EntityState>(entity, parseEntityState(fields));
        }
    });

    registry.registerKind({
        .kind = "physics",
        .defaults = {{"core_size", {0, 0}}, {"core_offset", {0, 0}}},
        .attach = [](Registry& reg, Entity entity, const json& fields, const ResolvedComponents&) {
            reg.addOrReplace<Physics>(entity, parsePhysics(fields));
        }
    });

    registry.registerKind({
        .kind = "sprite",
        .defaults = {{"sprite_size", {0, 0}}, {"animations", json::array()},
                     {"direction", "south"}, {"state", "stationary"}},
        .attach = [](Registry& reg, Entity entity, const json& fields, const ResolvedComponents& resolved) {
            Sprite sprite = parseSprite(fields);
            sprite.resolved = resolved.sprite;
            reg.addOrReplace<Sprite>(entity, std::move(sprite));
        }
    });

    registry.registerKind({
        .kind = "health",
        .defaults = {{"min", 0}, {"max", 100}, {"health", 1}},
        .attach = [](Registry& reg, Entity entity, const json& fields, const ResolvedComponents&) {
            reg.addOrReplace<Health>(entity, parseHealth(fields));
        }
    });

    registry.registerKind({
        .kind = "mana",
        .defaults = {{"mana", json::object()}, {"max", 100}},
        .attach = [](Registry& reg, Entity entity, const json& fields, const ResolvedComponents&) {
            reg.addOrReplace<Mana>(entity, parseMana(fields));
        }
    });

    registry.registerKind({
        .kind = "character",
        .defaults = {{"name", ""}},
        .attach = [](Registry& reg, Entity entity, const json& fields, const ResolvedComponents&) {
            reg.addOrReplace<Character>(entity, Character{fields.value("name", std::string())});
        }
    });

    registry.registerKind({
        .kind = "player",
        .defaults = json::object(),
        .attach = [](Registry& reg, Entity entity, const json&, const ResolvedComponents&) {
            reg.addOrReplace<PlayerTag>(entity);
        }
    });

    registry.registerKind({
        .kind = "input",
        .defaults = json::object(),
        .attach = [](Registry& reg, Entity entity, const json&, const ResolvedComponents&) {
            reg.addOrReplace<Input>(entity);
        }
    });

    registry.registerKind({
        .kind = "velocity",
        .defaults = {{"direction", {0, 0}}, {"speed", 200}},
        .attach = [](Registry& reg, Entity entity, const json& fields, const ResolvedComponents&) {
            reg.addOrReplace<Velocity>(entity, parseVelocity(fields));
        }
    });
}

} // namespace emberfall
