#include "HealthRoll.h"

#include <cctype>
#include <limits>

namespace Forge::RPG {

namespace {
// Reads a run of digits starting at pos; advances pos past it.
std::optional<int> readNumber(std::string_view text, std::size_t& pos) {
    const std::size_t start = pos;
    long long value = 0;
    while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
        value = value * 10 + (text[pos] - '0');
        if (value > std::numeric_limits<int>::max()) return std::nullopt;
        ++pos;
    }
    if (pos == start) return std::nullopt;
    return static_cast<int>(value);
}
}  // namespace

std::optional<DiceExpression> parseDiceExpression(std::string_view token) {
    DiceExpression out{};
    std::size_t pos = 0;
    if (pos < token.size() && std::isdigit(static_cast<unsigned char>(token[pos]))) {
        auto count = readNumber(token, pos);
        if (!count.has_value()) return std::nullopt;
        out.count = *count;
    }
    if (pos >= token.size() || (token[pos] != 'd' && token[pos] != 'D')) return std::nullopt;
    ++pos;
    auto sides = readNumber(token, pos);
    if (!sides.has_value()) return std::nullopt;
    out.sides = *sides;
    if (pos < token.size()) {
        const char sign = token[pos];
        if (sign != '+' && sign != '-') return std::nullopt;
        ++pos;
        auto bonus = readNumber(token, pos);
        if (!bonus.has_value() || pos != token.size()) return std::nullopt;
        out.bonus = sign == '-' ? -*bonus : *bonus;
    }
    if (out.count <= 0 || out.sides <= 0) return std::nullopt;
    return out;
}

std::optional<double> expectedRollValue(std::string_view token) {
    auto dice = parseDiceExpression(token);
    if (!dice.has_value()) return std::nullopt;
    return static_cast<double>(dice->count) * (static_cast<double>(dice->sides) + 1.0) / 2.0 +
           static_cast<double>(dice->bonus);
}

std::optional<int> maxRollValue(std::string_view token) {
    auto dice = parseDiceExpression(token);
    if (!dice.has_value()) return std::nullopt;
    const long long value = static_cast<long long>(dice->count) * dice->sides + dice->bonus;
    if (value > std::numeric_limits<int>::max() || value < std::numeric_limits<int>::min()) return std::nullopt;
    return static_cast<int>(value);
}

bool lowerExpectedRoll(const std::string& lhs, const std::string& rhs) {
    auto l = expectedRollValue(lhs);
    auto r = expectedRollValue(rhs);
    if (!l.has_value() || !r.has_value()) return false;
    return *l < *r;
}

}  // namespace Forge::RPG
