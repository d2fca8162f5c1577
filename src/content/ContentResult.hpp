#pragma once

namespace emberfall {

/// Result of loading, resolving or compiling entity content
enum class ContentResult {
    Success,
    InvalidDocument,             // Malformed entity document or template entry
    UnknownTemplate,             // Template (or a named parent) not in the store
    CyclicInheritance,           // Parent chain revisits a template
    UnknownComponentKind,        // Template uses a kind the schema registry lacks
    InvalidAnimationBlock,       // Missing layers/states or out-of-range geometry
    DuplicateLayerCountMismatch, // Layers of one block disagree on frame grid
    FrameOutOfBounds,            // Block's frames do not fit in the sheet
    UnknownAnimationState,       // setState() with a state the sprite lacks
    UnclaimedStateReference      // Lookup of a state no block claimed
};

/// Convert a ContentResult to a readable name
inline const char* resultToString(ContentResult result) {
    switch (result) {
        case ContentResult::Success:                     return "Success";
        case ContentResult::InvalidDocument:             return "InvalidDocument";
        case ContentResult::UnknownTemplate:             return "UnknownTemplate";
        case ContentResult::CyclicInheritance:           return "CyclicInheritance";
        case ContentResult::UnknownComponentKind:        return "UnknownComponentKind";
        case ContentResult::InvalidAnimationBlock:       return "InvalidAnimationBlock";
        case ContentResult::DuplicateLayerCountMismatch: return "DuplicateLayerCountMismatch";
        case ContentResult::FrameOutOfBounds:            return "FrameOutOfBounds";
        case ContentResult::UnknownAnimationState:       return "UnknownAnimationState";
        case ContentResult::UnclaimedStateReference:     return "UnclaimedStateReference";
    }
    return "Unknown";
}

} // namespace emberfall
