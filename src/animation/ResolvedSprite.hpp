#pragma once

#include "content/ContentResult.hpp"
#include "engine/Geometry.hpp"

#include <string>
#include <vector>
#include <map>

namespace emberfall {

/// Renderer-ready timing and layer data for one animation state.
///
/// Frames are laid out row-major within each layer's sheet: frame i of the
/// animation sits at linear index `frameOffset + i`, which wraps every
/// `sheetColumns` frames onto the next row, starting at `row`.
struct CompiledAnimation {
    std::vector<std::string> layers;   ///< Sheets, back-to-front compositing order
    PixelSize frameSize;
    int frameCount = 1;
    int frameOffset = 0;
    float frameInterval = 0.1f;        ///< Seconds per frame
    bool loop = false;
    int sheetColumns = 1;
    int row = 0;

    /// Source rectangle of frame `frameIndex` (same for every layer)
    Rect frameRect(int frameIndex) const {
        int linear = frameOffset + frameIndex;
        int columns = sheetColumns > 0 ? sheetColumns : 1;
        return frameSize.cell(linear % columns, row + linear / columns);
    }

    bool operator==(const CompiledAnimation& other) const = default;
};

/// Compiled sprite of one template. Shared read-only by all of its entities.
struct ResolvedSprite {
    PixelSize spriteSize;
    std::map<std::string, CompiledAnimation> animations;

    const CompiledAnimation* find(const std::string& state) const {
        auto it = animations.find(state);
        return it != animations.end() ? &it->second : nullptr;
    }

    /// Look up a state requested by gameplay code.
    ContentResult lookup(const std::string& state, const CompiledAnimation*& out) const {
        out = find(state);
        return out ? ContentResult::Success : ContentResult::UnclaimedStateReference;
    }

    bool hasState(const std::string& state) const { return find(state) != nullptr; }

    std::vector<std::string> getStates() const {
        std::vector<std::string> states;
        states.reserve(animations.size());
        for (const auto& [state, animation] : animations) {
            states.push_back(state);
        }
        return states;
    }
};

} // namespace emberfall
