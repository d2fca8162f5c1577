#pragma once

#include <nlohmann/json.hpp>

#include <map>
#include <set>
#include <string>
#include <tuple>
#include <utility>

namespace emberfall {

/// Mana held by one tile for one mana type
struct ManaReserve {
    float current = 0.0f;
    float max = 0.0f;

    bool isFull() const { return current >= max; }
};

/// Per-tile mana reserves of the current map.
///
/// Tiles drained by gathering are queued and refilled over time by the
/// replenishment system until they are full again.
class ManaField {
public:
    using TileReserves = std::map<std::string, ManaReserve>;

    /// Set (or replace) a tile's reserve of one mana type
    void setReserve(int x, int y, const std::string& type, float current, float max);
    void setReserve(int x, int y, const std::string& type, float amount) {
        setReserve(x, y, type, amount, amount);
    }

    /// Reserves of a tile, or nullptr for a tile without mana
    TileReserves* getTile(int x, int y);
    const TileReserves* getTile(int x, int y) const;

    /// Current mana of a type on a tile (0 if none)
    float getMana(int x, int y, const std::string& type) const;

    /// Load tiles from [{"x":..,"y":..,"mana":{"<type>": amount | [current, max]}}]
    bool loadFromJson(const nlohmann::json& tiles);

    // ---- Replenishment queue ----

    void queueReplenishment(int x, int y, const std::string& type);
    bool isQueued(int x, int y, const std::string& type) const;
    size_t pendingReplenishment() const { return m_replenishQueue.size(); }

    /// Add `amount` to every queued reserve; full reserves leave the queue.
    /// Returns the number of reserves that became full.
    size_t replenish(float amount);

    size_t tileCount() const { return m_tiles.size(); }
    void clear();

private:
    using TileKey = std::pair<int, int>;
    using QueueKey = std::tuple<int, int, std::string>;

    std::map<TileKey, TileReserves> m_tiles;
    std::set<QueueKey> m_replenishQueue;
};

} // namespace emberfall
