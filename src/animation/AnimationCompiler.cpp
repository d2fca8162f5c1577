#include "animation/AnimationCompiler.hpp"
#include "engine/Log.hpp"

#include <algorithm>

namespace emberfall {

AnimationCompiler::AnimationCompiler(float defaultFrameInterval) {
    setDefaultFrameInterval(defaultFrameInterval);
}

void AnimationCompiler::setDefaultFrameInterval(float seconds) {
    if (seconds <= 0.0f) {
        LOG_WARN("AnimationCompiler: ignoring non-positive default frame interval {}", seconds);
        return;
    }
    m_defaultFrameInterval = seconds;
}

// ---------------------------------------------------------------------------
// Compilation
// ---------------------------------------------------------------------------

ContentResult AnimationCompiler::compile(const nlohmann::json& sprite,
                                         std::shared_ptr<const ResolvedSprite>& out) {
    m_lastError.clear();

    if (!sprite.is_object()) {
        return fail(ContentResult::InvalidAnimationBlock, "sprite component must be an object");
    }

    auto resolved = std::make_shared<ResolvedSprite>();
    if (sprite.contains("sprite_size") && !parseSize(sprite["sprite_size"], resolved->spriteSize)) {
        return fail(ContentResult::InvalidAnimationBlock, "sprite_size must be [width, height]");
    }

    if (sprite.contains("animations")) {
        const auto& animations = sprite["animations"];
        if (!animations.is_array()) {
            return fail(ContentResult::InvalidAnimationBlock, "'animations' must be an array of blocks");
        }

        for (size_t i = 0; i < animations.size(); ++i) {
            AnimationBlock block;
            ContentResult result = ContentResult::Success;
            try {
                result = parseBlock(animations[i], block);
            } catch (const nlohmann::json::exception& e) {
                result = fail(ContentResult::InvalidAnimationBlock, e.what());
            }
            if (result == ContentResult::Success) {
                result = compileBlock(block, resolved->spriteSize, *resolved);
            }
            if (result != ContentResult::Success) {
                m_lastError = "animation block " + std::to_string(i) + ": " + m_lastError;
                return result;
            }
        }
    }

    CONTENT_LOG_TRACE("AnimationCompiler: compiled sprite with {} states", resolved->animations.size());
    out = std::move(resolved);
    return ContentResult::Success;
}

ContentResult AnimationCompiler::compileBlock(const AnimationBlock& block, PixelSize spriteSize,
                                              ResolvedSprite& sprite) {
    PixelSize frameSize = block.frameSize.value_or(spriteSize);
    if (frameSize.isEmpty()) {
        return fail(ContentResult::InvalidAnimationBlock,
                    "frame_size missing and sprite_size is empty");
    }

    // Every layer restating geometry must agree with the block
    for (const auto& layer : block.layers) {
        if ((layer.frameSize && *layer.frameSize != frameSize) ||
            (layer.frameCount && *layer.frameCount != block.frameCount) ||
            (layer.frameOffset && *layer.frameOffset != block.frameOffset)) {
            return fail(ContentResult::DuplicateLayerCountMismatch,
                        "layer '" + layer.sheet + "' declares a frame grid that differs from its block");
        }
    }

    int columns = 0;
    std::optional<PixelSize> sheetSize;
    ContentResult result = resolveColumns(block, frameSize, columns, sheetSize);
    if (result != ContentResult::Success) {
        return result;
    }

    CompiledAnimation animation;
    animation.layers.reserve(block.layers.size());
    for (const auto& layer : block.layers) {
        animation.layers.push_back(layer.sheet);
    }
    animation.frameSize = frameSize;
    animation.frameCount = block.frameCount;
    animation.frameOffset = block.frameOffset;
    animation.frameInterval = block.frameInterval.value_or(m_defaultFrameInterval);
    animation.loop = block.loop;
    animation.sheetColumns = columns;

    for (const auto& [state, row] : block.stateRows) {
        if (std::find(block.states.begin(), block.states.end(), state) == block.states.end()) {
            CONTENT_LOG_WARN("AnimationCompiler: state_rows names '{}' which the block does not claim", state);
        }
    }

    for (const auto& state : block.states) {
        CompiledAnimation compiled = animation;
        auto rowIt = block.stateRows.find(state);
        compiled.row = rowIt != block.stateRows.end() ? rowIt->second : 0;

        if (sheetSize) {
            int lastLinear = compiled.frameOffset + compiled.frameCount - 1;
            int lastRow = compiled.row + lastLinear / columns;
            if ((lastRow + 1) * frameSize.height > sheetSize->height) {
                return fail(ContentResult::FrameOutOfBounds,
                            "state '" + state + "' needs " + std::to_string(lastRow + 1) +
                            " rows but its sheets hold fewer");
            }
        }

        if (sprite.animations.count(state)) {
            CONTENT_LOG_DEBUG("AnimationCompiler: state '{}' claimed again, later block wins", state);
        }
        sprite.animations[state] = std::move(compiled);
    }
    return ContentResult::Success;
}

ContentResult AnimationCompiler::resolveColumns(const AnimationBlock& block, PixelSize frameSize,
                                                int& columns, std::optional<PixelSize>& sheetSize) {
    sheetSize.reset();

    if (m_sheetInfo) {
        std::string firstSheet;
        int gridColumns = 0;
        int gridRows = 0;

        for (const auto& layer : block.layers) {
            auto size = m_sheetInfo->getSheetSize(layer.sheet);
            if (!size) {
                CONTENT_LOG_WARN("AnimationCompiler: no dimensions known for sheet '{}'", layer.sheet);
                continue;
            }

            int layerColumns = size->width / frameSize.width;
            int layerRows = size->height / frameSize.height;
            if (!sheetSize) {
                sheetSize = size;
                firstSheet = layer.sheet;
                gridColumns = layerColumns;
                gridRows = layerRows;
            } else if (layerColumns != gridColumns || layerRows != gridRows) {
                return fail(ContentResult::DuplicateLayerCountMismatch,
                            "sheet '" + layer.sheet + "' is a " + std::to_string(layerColumns) + "x" +
                            std::to_string(layerRows) + " grid but '" + firstSheet + "' is " +
                            std::to_string(gridColumns) + "x" + std::to_string(gridRows));
            }
        }

        if (sheetSize && gridColumns < 1) {
            return fail(ContentResult::FrameOutOfBounds,
                        "frame is wider than sheet '" + firstSheet + "'");
        }
        if (sheetSize && block.sheetColumns && *block.sheetColumns > gridColumns) {
            return fail(ContentResult::FrameOutOfBounds,
                        "sheet_columns exceeds the width of sheet '" + firstSheet + "'");
        }
        if (sheetSize && !block.sheetColumns) {
            columns = gridColumns;
            return ContentResult::Success;
        }
    }

    // Without sheet dimensions a block is one strip holding offset + count frames
    columns = block.sheetColumns.value_or(block.frameOffset + block.frameCount);
    return ContentResult::Success;
}

// ---------------------------------------------------------------------------
// Parsing
// ---------------------------------------------------------------------------

ContentResult AnimationCompiler::parseBlock(const nlohmann::json& json, AnimationBlock& block) {
    if (!json.is_object()) {
        return fail(ContentResult::InvalidAnimationBlock, "block must be an object");
    }

    // Layers ("sprite_sheet" is the older spelling)
    const char* layersKey = json.contains("layers") ? "layers" : "sprite_sheet";
    if (!json.contains(layersKey) || !json[layersKey].is_array() || json[layersKey].empty()) {
        return fail(ContentResult::InvalidAnimationBlock, "block needs a non-empty 'layers' array");
    }

    for (const auto& layerJson : json[layersKey]) {
        LayerDecl layer;
        if (layerJson.is_string()) {
            layer.sheet = layerJson.get<std::string>();
        } else if (layerJson.is_object() && layerJson.contains("sheet") && layerJson["sheet"].is_string()) {
            layer.sheet = layerJson["sheet"].get<std::string>();
            if (layerJson.contains("frame_size")) {
                PixelSize size;
                if (!parseSize(layerJson["frame_size"], size)) {
                    return fail(ContentResult::InvalidAnimationBlock,
                                "layer '" + layer.sheet + "' has a malformed frame_size");
                }
                layer.frameSize = size;
            }
            if (layerJson.contains("frame_count") && layerJson["frame_count"].is_number_integer()) {
                layer.frameCount = layerJson["frame_count"].get<int>();
            }
            if (layerJson.contains("frame_offset") && layerJson["frame_offset"].is_number_integer()) {
                layer.frameOffset = layerJson["frame_offset"].get<int>();
            }
        } else {
            return fail(ContentResult::InvalidAnimationBlock,
                        "layer must be a sheet path or an object with 'sheet'");
        }

        if (layer.sheet.empty()) {
            return fail(ContentResult::InvalidAnimationBlock, "layer sheet path is empty");
        }
        block.layers.push_back(std::move(layer));
    }

    // States
    if (!json.contains("states") || !json["states"].is_array() || json["states"].empty()) {
        return fail(ContentResult::InvalidAnimationBlock, "block needs a non-empty 'states' array");
    }
    for (const auto& stateJson : json["states"]) {
        if (!stateJson.is_string() || stateJson.get<std::string>().empty()) {
            return fail(ContentResult::InvalidAnimationBlock, "state names must be non-empty strings");
        }
        block.states.push_back(stateJson.get<std::string>());
    }

    // Geometry
    if (json.contains("frame_size")) {
        PixelSize size;
        if (!parseSize(json["frame_size"], size) || size.isEmpty()) {
            return fail(ContentResult::InvalidAnimationBlock, "frame_size must be a positive [width, height]");
        }
        block.frameSize = size;
    }

    if (json.contains("frame_count")) {
        if (!json["frame_count"].is_number_integer() || json["frame_count"].get<int>() < 1) {
            return fail(ContentResult::InvalidAnimationBlock, "frame_count must be an integer >= 1");
        }
        block.frameCount = json["frame_count"].get<int>();
    }

    if (json.contains("frame_offset")) {
        if (!json["frame_offset"].is_number_integer() || json["frame_offset"].get<int>() < 0) {
            return fail(ContentResult::InvalidAnimationBlock, "frame_offset must be an integer >= 0");
        }
        block.frameOffset = json["frame_offset"].get<int>();
    }

    // Timing (authored in milliseconds)
    if (json.contains("frame_interval")) {
        if (!json["frame_interval"].is_number() || json["frame_interval"].get<float>() <= 0.0f) {
            return fail(ContentResult::InvalidAnimationBlock, "frame_interval must be a positive number of ms");
        }
        block.frameInterval = json["frame_interval"].get<float>() / 1000.0f;
    }

    if (json.contains("loop")) {
        if (!json["loop"].is_boolean()) {
            return fail(ContentResult::InvalidAnimationBlock, "loop must be a boolean");
        }
        block.loop = json["loop"].get<bool>();
    }

    // Sheet layout
    if (json.contains("sheet_columns")) {
        if (!json["sheet_columns"].is_number_integer() || json["sheet_columns"].get<int>() < 1) {
            return fail(ContentResult::InvalidAnimationBlock, "sheet_columns must be an integer >= 1");
        }
        block.sheetColumns = json["sheet_columns"].get<int>();
    }

    if (json.contains("state_rows")) {
        const auto& rows = json["state_rows"];
        if (!rows.is_object()) {
            return fail(ContentResult::InvalidAnimationBlock, "state_rows must map state names to rows");
        }
        for (auto it = rows.begin(); it != rows.end(); ++it) {
            if (!it->is_number_integer() || it->get<int>() < 0) {
                return fail(ContentResult::InvalidAnimationBlock,
                            "state_rows['" + it.key() + "'] must be an integer >= 0");
            }
            block.stateRows[it.key()] = it->get<int>();
        }
    }

    return ContentResult::Success;
}

bool AnimationCompiler::parseSize(const nlohmann::json& json, PixelSize& out) {
    if (json.is_array() && json.size() >= 2 &&
        json[0].is_number() && json[1].is_number()) {
        out = PixelSize(json[0].get<int>(), json[1].get<int>());
        return out.width >= 0 && out.height >= 0;
    }
    if (json.is_object()) {
        // "width"/"height", or the short "w"/"h"; an absent axis is 0
        auto axis = [&json](const char* name, const char* shortName, int& value) {
            auto it = json.find(name);
            if (it == json.end()) it = json.find(shortName);
            if (it == json.end()) {
                value = 0;
                return true;
            }
            if (!it->is_number()) return false;
            value = it->get<int>();
            return true;
        };
        int width = 0;
        int height = 0;
        if (!axis("width", "w", width) || !axis("height", "h", height)) {
            return false;
        }
        out = PixelSize(width, height);
        return width >= 0 && height >= 0;
    }
    return false;
}

ContentResult AnimationCompiler::fail(ContentResult result, const std::string& message) {
    m_lastError = message;
    CONTENT_LOG_ERROR("AnimationCompiler: {} ({})", message, resultToString(result));
    return result;
}

} // namespace emberfall
