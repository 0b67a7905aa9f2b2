#include "tx_ledger/core/fixed_decimal.h"

#include <algorithm>
#include <cctype>
#include <limits>

namespace tx_ledger {
namespace {

constexpr int kMaxScale = 18;

std::int64_t Pow10(int scale) {
    if (scale <= 0) {
        return 1;
    }
    std::int64_t value = 1;
    for (int i = 0; i < scale; ++i) {
        if (value > std::numeric_limits<std::int64_t>::max() / 10) {
            return std::numeric_limits<std::int64_t>::max();
        }
        value *= 10;
    }
    return value;
}

bool AppendDigit(std::int64_t* magnitude, int digit) {
    constexpr auto kMax = std::numeric_limits<std::int64_t>::max();
    if (*magnitude > (kMax - digit) / 10) {
        return false;
    }
    *magnitude = *magnitude * 10 + digit;
    return true;
}

// Adjusts a truncated magnitude for the digits that were dropped.
bool RoundMagnitude(std::int64_t* magnitude,
                    bool negative,
                    int first_dropped_digit,
                    bool any_dropped_nonzero,
                    FixedRoundingMode mode) {
    bool bump = false;
    switch (mode) {
        case FixedRoundingMode::kDown:
            bump = negative && any_dropped_nonzero;
            break;
        case FixedRoundingMode::kUp:
            bump = !negative && any_dropped_nonzero;
            break;
        case FixedRoundingMode::kHalfUp:
        default:
            bump = first_dropped_digit >= 5;
            break;
    }
    if (!bump) {
        return true;
    }
    if (*magnitude == std::numeric_limits<std::int64_t>::max()) {
        return false;
    }
    ++(*magnitude);
    return true;
}

}  // namespace

bool FixedDecimal::Parse(const std::string& text,
                         int scale,
                         FixedRoundingMode mode,
                         std::int64_t* scaled_value) {
    return TryParse(text, scale, mode, scaled_value) == FixedParseStatus::kOk;
}

FixedParseStatus FixedDecimal::TryParse(const std::string& text,
                                        int scale,
                                        FixedRoundingMode mode,
                                        std::int64_t* scaled_value) {
    if (scaled_value == nullptr || scale < 0 || scale > kMaxScale) {
        return FixedParseStatus::kMalformed;
    }

    std::size_t pos = 0;
    bool negative = false;
    if (pos < text.size() && (text[pos] == '+' || text[pos] == '-')) {
        negative = text[pos] == '-';
        ++pos;
    }

    // Overflow is remembered rather than returned so that trailing garbage still reads as
    // malformed text.
    std::int64_t magnitude = 0;
    bool overflow = false;
    int digits_seen = 0;
    while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos])) != 0) {
        overflow = overflow || !AppendDigit(&magnitude, text[pos] - '0');
        ++digits_seen;
        ++pos;
    }

    int fraction_digits = 0;
    int first_dropped_digit = 0;
    bool any_dropped_nonzero = false;
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos])) != 0) {
            const int digit = text[pos] - '0';
            if (fraction_digits < scale) {
                overflow = overflow || !AppendDigit(&magnitude, digit);
            } else {
                if (fraction_digits == scale) {
                    first_dropped_digit = digit;
                }
                any_dropped_nonzero = any_dropped_nonzero || digit != 0;
            }
            ++fraction_digits;
            ++digits_seen;
            ++pos;
        }
    }

    if (pos != text.size() || digits_seen == 0) {
        return FixedParseStatus::kMalformed;
    }

    for (int i = fraction_digits; i < scale && !overflow; ++i) {
        overflow = !AppendDigit(&magnitude, 0);
    }
    if (overflow ||
        !RoundMagnitude(&magnitude, negative, first_dropped_digit, any_dropped_nonzero, mode)) {
        return FixedParseStatus::kOutOfRange;
    }

    *scaled_value = negative ? -magnitude : magnitude;
    return FixedParseStatus::kOk;
}

std::string FixedDecimal::Format(std::int64_t scaled_value, int scale) {
    const int safe_scale = std::clamp(scale, 0, kMaxScale);
    const bool negative = scaled_value < 0;
    // Unsigned arithmetic keeps INT64_MIN representable.
    const std::uint64_t magnitude =
        negative ? static_cast<std::uint64_t>(0) - static_cast<std::uint64_t>(scaled_value)
                 : static_cast<std::uint64_t>(scaled_value);
    const auto divisor = static_cast<std::uint64_t>(Pow10(safe_scale));

    std::string out;
    if (negative) {
        out.push_back('-');
    }
    out += std::to_string(magnitude / divisor);
    if (safe_scale > 0) {
        std::string fraction = std::to_string(magnitude % divisor);
        out.push_back('.');
        out.append(static_cast<std::size_t>(safe_scale) - fraction.size(), '0');
        out += fraction;
    }
    return out;
}

bool FixedDecimal::Rescale(std::int64_t scaled_value,
                           int from_scale,
                           int to_scale,
                           FixedRoundingMode mode,
                           std::int64_t* out) {
    if (out == nullptr) {
        return false;
    }
    const int safe_from = std::clamp(from_scale, 0, kMaxScale);
    const int safe_to = std::clamp(to_scale, 0, kMaxScale);
    if (safe_from == safe_to) {
        *out = scaled_value;
        return true;
    }

    if (safe_to > safe_from) {
        const auto factor = Pow10(safe_to - safe_from);
        if (scaled_value > std::numeric_limits<std::int64_t>::max() / factor ||
            scaled_value < std::numeric_limits<std::int64_t>::min() / factor) {
            return false;
        }
        *out = scaled_value * factor;
        return true;
    }

    const auto divisor = Pow10(safe_from - safe_to);
    std::int64_t quotient = scaled_value / divisor;
    const std::int64_t remainder = scaled_value % divisor;
    switch (mode) {
        case FixedRoundingMode::kDown:
            if (remainder < 0) {
                --quotient;
            }
            break;
        case FixedRoundingMode::kUp:
            if (remainder > 0) {
                ++quotient;
            }
            break;
        case FixedRoundingMode::kHalfUp:
        default: {
            const std::int64_t abs_remainder = remainder < 0 ? -remainder : remainder;
            if (abs_remainder >= divisor - abs_remainder) {
                quotient += scaled_value < 0 ? -1 : 1;
            }
            break;
        }
    }
    *out = quotient;
    return true;
}

long double FixedDecimal::ToLongDouble(std::int64_t scaled_value, int scale) {
    const int safe_scale = std::clamp(scale, 0, kMaxScale);
    const auto divisor = static_cast<long double>(Pow10(safe_scale));
    return static_cast<long double>(scaled_value) / divisor;
}

bool FixedDecimal::CheckedAdd(std::int64_t lhs, std::int64_t rhs, std::int64_t* out) {
    std::int64_t sum = 0;
    if (out == nullptr || __builtin_add_overflow(lhs, rhs, &sum)) {
        return false;
    }
    *out = sum;
    return true;
}

bool FixedDecimal::CheckedSub(std::int64_t lhs, std::int64_t rhs, std::int64_t* out) {
    std::int64_t difference = 0;
    if (out == nullptr || __builtin_sub_overflow(lhs, rhs, &difference)) {
        return false;
    }
    *out = difference;
    return true;
}

}  // namespace tx_ledger
