#pragma once

#include <optional>

namespace game::gameplay
{
/// Run-wide gameplay multipliers resolved from the selected echo seeds.
struct Modifiers
{
    static constexpr float kBaselineWindPush = 0.24F;

    float speedMultiplier = 1.0F;
    float gravityMultiplier = 1.0F;
    float jumpMultiplier = 1.0F;
    float waterDragMultiplier = 1.0F;
    float windPush = kBaselineWindPush;
    float iceSlip = 1.0F;
    bool brittleThorns = false;
    bool slowCycle = false;
};

/// What one echo seed does to Modifiers. Factors of 1 and unset overrides are no-ops.
struct EchoSeedEffect
{
    float speedFactor = 1.0F;
    float gravityFactor = 1.0F;
    float jumpFactor = 1.0F;
    float waterDragFactor = 1.0F;
    float iceSlipFactor = 1.0F;
    std::optional<float> windPushOverride;
    bool brittleThorns = false;
    bool slowCycle = false;
};

/// Folds echo seed effects into a Modifiers value.
///
/// Every operation is commutative, so seeds may be applied in any order:
/// numeric fields are only ever multiplied, the flags are only ever set
/// (logical OR), and competing wind-push overrides resolve to the largest.
/// Applying the same effect twice compounds its factors; callers reject
/// duplicate seeds before folding.
class ModifiersBuilder
{
public:
    ModifiersBuilder& Apply(const EchoSeedEffect& effect);
    [[nodiscard]] Modifiers Build() const;

private:
    Modifiers m_value;
    std::optional<float> m_windPushOverride;
};
} // namespace game::gameplay
