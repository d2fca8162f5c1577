#include "gameplay/ManaField.hpp"
#include "engine/Log.hpp"

#include <algorithm>

namespace emberfall {

void ManaField::setReserve(int x, int y, const std::string& type, float current, float max) {
    ManaReserve& reserve = m_tiles[{x, y}][type];
    reserve.max = std::max(max, 0.0f);
    reserve.current = std::clamp(current, 0.0f, reserve.max);
}

ManaField::TileReserves* ManaField::getTile(int x, int y) {
    auto it = m_tiles.find({x, y});
    return it != m_tiles.end() ? &it->second : nullptr;
}

const ManaField::TileReserves* ManaField::getTile(int x, int y) const {
    auto it = m_tiles.find({x, y});
    return it != m_tiles.end() ? &it->second : nullptr;
}

float ManaField::getMana(int x, int y, const std::string& type) const {
    const TileReserves* tile = getTile(x, y);
    if (!tile) return 0.0f;
    auto it = tile->find(type);
    return it != tile->end() ? it->second.current : 0.0f;
}

bool ManaField::loadFromJson(const nlohmann::json& tiles) {
    if (!tiles.is_array()) {
        GAME_LOG_ERROR("ManaField: tile list must be an array");
        return false;
    }

    try {
        int count = 0;
        for (const auto& tile : tiles) {
            int x = tile.at("x").get<int>();
            int y = tile.at("y").get<int>();
            const auto& mana = tile.at("mana");
            for (auto it = mana.begin(); it != mana.end(); ++it) {
                if (it->is_array() && it->size() >= 2) {
                    setReserve(x, y, it.key(), (*it)[0].get<float>(), (*it)[1].get<float>());
                } else {
                    setReserve(x, y, it.key(), it->get<float>());
                }
            }
            ++count;
        }
        GAME_LOG_INFO("ManaField: loaded {} tiles", count);
        return true;
    } catch (const nlohmann::json::exception& e) {
        GAME_LOG_ERROR("ManaField: invalid tile list: {}", e.what());
        return false;
    }
}

void ManaField::queueReplenishment(int x, int y, const std::string& type) {
    m_replenishQueue.emplace(x, y, type);
}

bool ManaField::isQueued(int x, int y, const std::string& type) const {
    return m_replenishQueue.count({x, y, type}) > 0;
}

size_t ManaField::replenish(float amount) {
    size_t refilled = 0;
    for (auto it = m_replenishQueue.begin(); it != m_replenishQueue.end();) {
        const auto& [x, y, type] = *it;

        ManaReserve* reserve = nullptr;
        if (TileReserves* tile = getTile(x, y)) {
            auto found = tile->find(type);
            if (found != tile->end()) reserve = &found->second;
        }

        // Reserve vanished (map reloaded); nothing left to refill
        if (!reserve) {
            it = m_replenishQueue.erase(it);
            continue;
        }

        reserve->current += amount;
        if (reserve->current >= reserve->max) {
            reserve->current = reserve->max;
            it = m_replenishQueue.erase(it);
            ++refilled;
        } else {
            ++it;
        }
    }
    return refilled;
}

void ManaField::clear() {
    m_tiles.clear();
    m_replenishQueue.clear();
}

} // namespace emberfall
