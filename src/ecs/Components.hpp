#pragma once

#include "animation/ResolvedSprite.hpp"
#include "engine/Geometry.hpp"

#include <nlohmann/json.hpp>

#include <array>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace emberfall {

/// Facing of a sprite. Names double as the second half of animation states.
enum class Direction {
    North,
    East,
    South,
    West
};

inline const char* directionToString(Direction direction) {
    switch (direction) {
        case Direction::North: return "north";
        case Direction::East:  return "east";
        case Direction::South: return "south";
        case Direction::West:  return "west";
    }
    return "south";
}

/// Parse a lowercase direction name
inline std::optional<Direction> directionFromString(const std::string& name) {
    if (name == "north") return Direction::North;
    if (name == "east")  return Direction::East;
    if (name == "south") return Direction::South;
    if (name == "west")  return Direction::West;
    return std::nullopt;
}

/// Which of an entity's positions the movement system drives
enum class PositionSpace {
    Screen,
    Layer,
    Map
};

/// Position component - the same entity in screen, map-layer and tile coordinates
struct Position {
    Vec2 screen;
    Vec2 layer;
    Vec2 map;                    // Tile units
    PositionSpace primary = PositionSpace::Layer;

    Vec2& primaryPosition() {
        switch (primary) {
            case PositionSpace::Screen: return screen;
            case PositionSpace::Map:    return map;
            case PositionSpace::Layer:  break;
        }
        return layer;
    }
    const Vec2& primaryPosition() const {
        return const_cast<Position*>(this)->primaryPosition();
    }
};

/// Entity state flags (bitmask). Dead is the absence of every flag.
namespace EntityStateFlag {
    constexpr uint32_t Dead               = 0;
    constexpr uint32_t Stationary         = 1 << 0;
    constexpr uint32_t CanMove            = 1 << 1;
    constexpr uint32_t CanUseSkills       = 1 << 2;
    constexpr uint32_t CanChangeInput     = 1 << 3;
    constexpr uint32_t CanReplenishHealth = 1 << 4;
    constexpr uint32_t CanBeDamaged       = 1 << 5;

    constexpr uint32_t Normal = CanMove | CanUseSkills | CanChangeInput |
                                CanReplenishHealth | CanBeDamaged;
}

/// State component - capability flags
struct EntityState {
    uint32_t flags = EntityStateFlag::Normal;

    bool isDead() const { return flags == EntityStateFlag::Dead; }
    bool can(uint32_t flag) const { return (flags & flag) == flag; }
    void kill() { flags = EntityStateFlag::Dead; }
};

/// Physics component - collision core relative to the sprite origin
struct Physics {
    Vec2 coreSize;
    Vec2 coreOffset;

    Rect core(Vec2 origin) const {
        return Rect(origin.x + coreOffset.x, origin.y + coreOffset.y, coreSize.x, coreSize.y);
    }
};

/// Sprite component - visual description shared from the template plus facing
struct Sprite {
    std::shared_ptr<const ResolvedSprite> resolved;
    PixelSize size;
    Direction direction = Direction::South;
    std::string action = "stationary";       // stationary, moving, dead

    /// State name the playback should be in, e.g. "moving_west"
    std::string animationState() const {
        return action + "_" + directionToString(direction);
    }
};

/// Health component
struct Health {
    float min = 0.0f;
    float max = 100.0f;
    float current = 1.0f;

    bool isFull() const { return current >= max; }

    /// Add (or remove) health, staying within [min, max]
    void adjust(float amount) {
        current += amount;
        if (current > max) current = max;
        if (current < min) current = min;
    }
};

/// Mana component - stores indexed by mana type
struct Mana {
    std::map<std::string, float> stores;
    float max = 100.0f;

    float get(const std::string& type) const {
        auto it = stores.find(type);
        return it != stores.end() ? it->second : 0.0f;
    }
};

/// Character component
struct Character {
    std::string name;
};

/// Marks the player-controlled entity
struct PlayerTag {};

/// Discrete inputs an entity can hold
enum class InputAction : uint8_t {
    MoveUp,
    MoveDown,
    MoveLeft,
    MoveRight,
    ManaGather,
    SkillUsage,
    Count
};

/// Input component - held actions, written by whatever drives the entity
struct Input {
    std::array<bool, static_cast<size_t>(InputAction::Count)> held{};
    std::optional<Vec2> targetPoint;

    bool isHeld(InputAction action) const { return held[static_cast<size_t>(action)]; }
    void set(InputAction action, bool value) { held[static_cast<size_t>(action)] = value; }

    void clear() {
        held.fill(false);
        targetPoint.reset();
    }
};

/// Velocity component - unit direction and speed in pixels per second
struct Velocity {
    Vec2 direction;
    float speed = 200.0f;

    Vec2 linear() const { return direction * speed; }
};

/// Name component - display name and originating template
struct Name {
    std::string name;
    std::string type;

    Name() = default;
    Name(const std::string& n) : name(n) {}
    Name(const std::string& n, const std::string& t) : name(n), type(t) {}
};

/// Fields of kinds registered without a typed attach function
struct RawComponents {
    std::map<std::string, nlohmann::json> components;

    const nlohmann::json* find(const std::string& kind) const {
        auto it = components.find(kind);
        return it != components.end() ? &it->second : nullptr;
    }
};

/// Added by the death system once an entity's death has been handled
struct DeathRecord {
    bool despawnPending = false;
};

} // namespace emberfall
