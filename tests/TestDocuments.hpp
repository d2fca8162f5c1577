#pragma once

#include "content/ComponentSchema.hpp"
#include "ecs/CoreComponents.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace emberfall::test {

/// The human / town_guard / player / cursor family used across the tests
inline const char* ENTITY_DOCUMENT = R"({
  "entities": {
    "templates": {
      "human": {
        "components": {
          "position": null,
          "state": null,
          "physics": { "core_offset": [0, 20], "core_size": [24, 16] },
          "sprite": {
            "sprite_size": [192, 192],
            "animations": [
              {
                "layers": ["walkcycle/BODY_male.png"],
                "states": ["stationary_north", "stationary_west", "stationary_south", "stationary_east"],
                "frame_size": [64, 64],
                "frame_count": 1,
                "sheet_columns": 9,
                "state_rows": { "stationary_north": 0, "stationary_west": 1,
                                "stationary_south": 2, "stationary_east": 3 }
              }
            ]
          }
        }
      },
      "town_guard": {
        "parent": "human",
        "components": {
          "health": null,
          "character": { "name": "Town Guard" },
          "sprite": {
            "sprite_size": [192, 192],
            "animations": [
              {
                "sprite_sheet": ["death/BODY_male.png"],
                "states": ["dead_north", "dead_west", "dead_south", "dead_east"],
                "frame_size": [64, 64],
                "frame_interval": 30,
                "frame_count": 6
              },
              {
                "sprite_sheet": ["walkcycle/BODY_male.png", "walkcycle/FEET_shoes_brown.png",
                                 "walkcycle/LEGS_plate_armor_pants.png", "walkcycle/TORSO_plate_armor_torso.png",
                                 "walkcycle/BELT_leather.png", "walkcycle/TORSO_plate_armor_arms_shoulders.png",
                                 "walkcycle/HANDS_plate_armor_gloves.png", "walkcycle/HEAD_hair_blonde.png",
                                 "walkcycle/WEAPON_shield_cutout_body.png"],
                "states": ["stationary_north", "stationary_west", "stationary_south", "stationary_east"],
                "frame_size": [64, 64],
                "frame_count": 1,
                "sheet_columns": 9,
                "state_rows": { "stationary_north": 0, "stationary_west": 1,
                                "stationary_south": 2, "stationary_east": 3 }
              },
              {
                "sprite_sheet": ["walkcycle/BODY_male.png", "walkcycle/FEET_shoes_brown.png",
                                 "walkcycle/LEGS_plate_armor_pants.png", "walkcycle/TORSO_plate_armor_torso.png",
                                 "walkcycle/BELT_leather.png", "walkcycle/TORSO_plate_armor_arms_shoulders.png",
                                 "walkcycle/HANDS_plate_armor_gloves.png", "walkcycle/HEAD_hair_blonde.png",
                                 "walkcycle/WEAPON_shield_cutout_body.png"],
                "states": ["moving_north", "moving_west", "moving_south", "moving_east"],
                "frame_size": [64, 64],
                "frame_count": 8,
                "frame_offset": 1,
                "loop": true,
                "sheet_columns": 9,
                "state_rows": { "moving_north": 0, "moving_west": 1, "moving_south": 2, "moving_east": 3 }
              }
            ]
          }
        }
      },
      "player": {
        "parent": "town_guard",
        "components": {
          "player": null,
          "character": { "name": "The Hero" },
          "velocity": null,
          "health": null,
          "mana": null,
          "input": null
        }
      },
      "cursor": {
        "components": { "position": null }
      }
    },
    "components": { "entry_point_group": "emberfall.components" },
    "systems": {
      "entry_point_group": "emberfall.systems",
      "mana_gathering": {
        "default_regeneration_rate": 1,
        "default_gather_amount": 1,
        "minimum_gather_amount": 0.1,
        "default_gather_radius": 1
      },
      "mana_replenishment": { "default_replenishment_amount": 0.01 },
      "health_regeneration": { "default_regeneration_amount": 1 }
    }
  }
})";

inline nlohmann::json entityDocument() {
    return nlohmann::json::parse(ENTITY_DOCUMENT);
}

/// Wrap templates into a minimal entity document
inline nlohmann::json documentWithTemplates(const nlohmann::json& templates) {
    return {{"entities", {{"templates", templates}}}};
}

/// Schema registry populated with the core component kinds
inline ComponentSchemaRegistry coreSchemas() {
    ComponentSchemaRegistry schemas;
    CoreComponentProvider provider;
    schemas.registerProvider(provider);
    return schemas;
}

/// Layer list of the town guard's walk cycle, in authored order
inline std::vector<std::string> guardLayers() {
    return {
        "walkcycle/BODY_male.png", "walkcycle/FEET_shoes_brown.png",
        "walkcycle/LEGS_plate_armor_pants.png", "walkcycle/TORSO_plate_armor_torso.png",
        "walkcycle/BELT_leather.png", "walkcycle/TORSO_plate_armor_arms_shoulders.png",
        "walkcycle/HANDS_plate_armor_gloves.png", "walkcycle/HEAD_hair_blonde.png",
        "walkcycle/WEAPON_shield_cutout_body.png"
    };
}

} // namespace emberfall::test
