#pragma once

#include <QJsonValue>
#include <QtGlobal>

#include <cmath>
#include <optional>

namespace quire::merge {

// Largest magnitude below 2^63 that a double represents exactly.
inline constexpr double kMaxJsonInteger = 9223372036854774784.0;

/**
 * Reads a JSON number as qint64. Fractional, non-finite and out-of-range
 * numbers yield std::nullopt rather than a truncated value.
 */
[[nodiscard]] inline std::optional<qint64> json_integer(const QJsonValue& value) {
    if (!value.isDouble()) return std::nullopt;
    const double d = value.toDouble();
    if (!std::isfinite(d) || std::abs(d) > kMaxJsonInteger || std::trunc(d) != d) {
        return std::nullopt;
    }
    return static_cast<qint64>(d);
}

} // namespace quire::merge
