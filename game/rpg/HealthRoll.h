// Health roll tokens ("1d6+1") and the comparator used to pick between them.
// Tokens are never rolled here; only their expected values are compared.
#pragma once

#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace Forge::RPG {

struct DiceExpression {
    int count{1};
    int sides{0};
    int bonus{0};
};

// Accepts NdM, NdM+K, NdM-K and dM (count defaults to 1). 'd' is case-insensitive.
std::optional<DiceExpression> parseDiceExpression(std::string_view token);

// N*(M+1)/2 + K.
std::optional<double> expectedRollValue(std::string_view token);
// N*M + K; nullopt when the token does not parse or the result overflows int.
std::optional<int> maxRollValue(std::string_view token);

// True when lhs is strictly lower than rhs. Equal or incomparable tokens
// must return false so callers keep their first candidate.
using RollComparator = std::function<bool(const std::string& lhs, const std::string& rhs)>;

// Default comparator: lower expected value. Unparsable tokens never compare lower.
bool lowerExpectedRoll(const std::string& lhs, const std::string& rhs);

}  // namespace Forge::RPG
