#pragma once

/// @file status_effect_system.hpp
/// @brief Applies ongoing status effects on location changes.
///
/// A tick happens on every move, whether or not the move spawns or skips
/// an encounter. Nothing else (inspecting, fighting) ticks effects.

#include <cstdint>
#include <optional>

#include "dcr/game/character.hpp"
#include "dcr/game/game_context.hpp"

namespace dcr::game {

/// Outcome of one tick.
struct StatusTick {
    StatusEffect effect = StatusEffect::Burn;
    int32_t damage = 0;
    bool lethal = false;
};

class StatusEffectSystem {
public:
    explicit StatusEffectSystem(const GameContext& ctx) : ctx_(ctx) {}

    /// Apply the character's effect once. nullopt when unaffected.
    /// A lethal tick leaves health at zero; settling the death is the
    /// caller's job.
    std::optional<StatusTick> Apply(Character& character);

    /// Damage of one tick: max_hp / divisor, at least 1.
    [[nodiscard]] static int32_t TickDamage(StatusEffect effect, int32_t maxHealth,
                                            const GameRules& rules) noexcept;

private:
    GameContext ctx_;
};

}  // namespace dcr::game
