#pragma once

#include "animation/ResolvedSprite.hpp"
#include "content/ContentResult.hpp"
#include "engine/Geometry.hpp"

#include <nlohmann/json.hpp>

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace emberfall {

/// One authored layer of an animation block. Geometry fields are optional
/// restatements of the block's own and must agree with it.
struct LayerDecl {
    std::string sheet;
    std::optional<PixelSize> frameSize;
    std::optional<int> frameCount;
    std::optional<int> frameOffset;
};

/// Authored animation block as found in a sprite component's "animations"
struct AnimationBlock {
    std::vector<LayerDecl> layers;
    std::vector<std::string> states;
    std::optional<PixelSize> frameSize;          // nullopt = sprite_size
    int frameCount = 1;
    int frameOffset = 0;
    std::optional<float> frameInterval;          // Seconds; nullopt = engine default
    bool loop = false;
    std::optional<int> sheetColumns;
    std::map<std::string, int> stateRows;        // State -> first sheet row
};

/// Supplies sheet dimensions so the compiler can validate frame grids.
/// Implemented by the asset layer; the core never decodes images.
class SheetInfoProvider {
public:
    virtual ~SheetInfoProvider() = default;

    /// Pixel size of a sheet, or nullopt if the asset is unknown
    virtual std::optional<PixelSize> getSheetSize(const std::string& sheet) const = 0;
};

/// Compiles a sprite component's animation blocks into a ResolvedSprite
class AnimationCompiler {
public:
    static constexpr float DEFAULT_FRAME_INTERVAL = 0.1f;

    AnimationCompiler() = default;
    explicit AnimationCompiler(float defaultFrameInterval);

    /// Interval (seconds) used by blocks that omit frame_interval
    void setDefaultFrameInterval(float seconds);
    float getDefaultFrameInterval() const { return m_defaultFrameInterval; }

    /// Optional; without it sheet geometry is not validated
    void setSheetInfoProvider(const SheetInfoProvider* provider) { m_sheetInfo = provider; }

    /// Compile a concrete sprite component ({sprite_size, animations, ...}).
    /// Later blocks claiming an already-claimed state replace the earlier claim.
    ContentResult compile(const nlohmann::json& sprite, std::shared_ptr<const ResolvedSprite>& out);

    /// Parse one authored block. Does not check geometry against sheets.
    ContentResult parseBlock(const nlohmann::json& json, AnimationBlock& block);

    const std::string& getLastError() const { return m_lastError; }

private:
    ContentResult compileBlock(const AnimationBlock& block, PixelSize spriteSize,
                               ResolvedSprite& sprite);

    /// Columns per sheet row for a block, validating layer sheets if known
    ContentResult resolveColumns(const AnimationBlock& block, PixelSize frameSize,
                                 int& columns, std::optional<PixelSize>& sheetSize);

    ContentResult fail(ContentResult result, const std::string& message);

    static bool parseSize(const nlohmann::json& json, PixelSize& out);

    float m_defaultFrameInterval = DEFAULT_FRAME_INTERVAL;
    const SheetInfoProvider* m_sheetInfo = nullptr;
    std::string m_lastError;
};

} // namespace emberfall
