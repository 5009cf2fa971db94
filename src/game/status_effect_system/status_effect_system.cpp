/// @file status_effect_system.cpp
/// @brief StatusEffectSystem implementation.

#include "dcr/game/status_effect_system.hpp"

#include <algorithm>

#include "dcr/foundation/game_logger.hpp"

namespace dcr::game {

using foundation::LogCategory;

int32_t StatusEffectSystem::TickDamage(StatusEffect effect, int32_t maxHealth,
                                       const GameRules& rules) noexcept {
    int32_t divisor = effect == StatusEffect::Burn ? rules.burnDivisor : rules.poisonDivisor;
    return std::max(maxHealth / divisor, 1);
}

std::optional<StatusTick> StatusEffectSystem::Apply(Character& character) {
    if (!character.Status()) {
        return std::nullopt;
    }
    StatusTick tick;
    tick.effect = *character.Status();
    tick.damage = TickDamage(tick.effect, character.MaxHealth(), ctx_.rules);
    tick.lethal = character.ReceiveDamage(tick.damage);

    DCR_LOG_DEBUG(LogCategory::Character,
                  character.Name() + " suffers " + std::to_string(tick.damage) +
                  " " + std::string(statusEffectName(tick.effect)) + " damage");
    return tick;
}

}  // namespace dcr::game
