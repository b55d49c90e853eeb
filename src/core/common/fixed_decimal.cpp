#include "tally_reports/core/fixed_decimal.h"

#include <algorithm>
#include <cctype>
#include <limits>

namespace tally_reports {
namespace {

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

bool AccumulateDigit(std::uint64_t* magnitude, int digit) {
    constexpr std::uint64_t kLimit =
        static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max());
    if (*magnitude > (kLimit - static_cast<std::uint64_t>(digit)) / 10) {
        return false;
    }
    *magnitude = *magnitude * 10 + static_cast<std::uint64_t>(digit);
    return true;
}

void SetError(std::string* error, const std::string& message) {
    if (error != nullptr) {
        *error = message;
    }
}

}  // namespace

bool FixedDecimal::ParseScaled(const std::string& text,
                               int scale,
                               FixedRoundingMode mode,
                               std::int64_t* out,
                               std::string* error) {
    if (out == nullptr) {
        SetError(error, "output pointer is null");
        return false;
    }
    const int safe_scale = std::max(0, scale);
    const auto begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        SetError(error, "empty decimal text");
        return false;
    }
    const auto end = text.find_last_not_of(" \t\r\n") + 1;

    std::size_t pos = begin;
    bool negative = false;
    if (text[pos] == '-' || text[pos] == '+') {
        negative = text[pos] == '-';
        ++pos;
    }

    std::uint64_t magnitude = 0;
    bool has_digit = false;
    while (pos < end && (std::isdigit(static_cast<unsigned char>(text[pos])) != 0 ||
                         text[pos] == ',')) {
        if (text[pos] != ',') {
            has_digit = true;
            if (!AccumulateDigit(&magnitude, text[pos] - '0')) {
                SetError(error, "decimal out of range: " + text);
                return false;
            }
        }
        ++pos;
    }

    int fraction_digits = 0;
    int first_dropped = -1;
    bool dropped_nonzero = false;
    if (pos < end && text[pos] == '.') {
        ++pos;
        while (pos < end && std::isdigit(static_cast<unsigned char>(text[pos])) != 0) {
            has_digit = true;
            const int digit = text[pos] - '0';
            if (fraction_digits < safe_scale) {
                if (!AccumulateDigit(&magnitude, digit)) {
                    SetError(error, "decimal out of range: " + text);
                    return false;
                }
                ++fraction_digits;
            } else {
                if (first_dropped < 0) {
                    first_dropped = digit;
                }
                dropped_nonzero = dropped_nonzero || digit != 0;
            }
            ++pos;
        }
    }
    if (!has_digit || pos != end) {
        SetError(error, "invalid decimal text: " + text);
        return false;
    }
    for (; fraction_digits < safe_scale; ++fraction_digits) {
        if (!AccumulateDigit(&magnitude, 0)) {
            SetError(error, "decimal out of range: " + text);
            return false;
        }
    }

    bool bump = false;
    switch (mode) {
        case FixedRoundingMode::kDown:
            bump = negative && dropped_nonzero;
            break;
        case FixedRoundingMode::kUp:
            bump = !negative && dropped_nonzero;
            break;
        case FixedRoundingMode::kHalfUp:
        default:
            bump = first_dropped >= 5;
            break;
    }
    if (bump) {
        if (magnitude >= static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
            SetError(error, "decimal out of range: " + text);
            return false;
        }
        ++magnitude;
    }

    const auto value = static_cast<std::int64_t>(magnitude);
    *out = negative ? -value : value;
    return true;
}

std::int64_t FixedDecimal::Rescale(std::int64_t scaled_value,
                                   int from_scale,
                                   int to_scale,
                                   FixedRoundingMode mode) {
    const int safe_from = std::max(0, from_scale);
    const int safe_to = std::max(0, to_scale);
    if (safe_from == safe_to) {
        return scaled_value;
    }
    if (safe_to > safe_from) {
        const std::int64_t factor = Pow10(safe_to - safe_from);
        if (scaled_value > std::numeric_limits<std::int64_t>::max() / factor) {
            return std::numeric_limits<std::int64_t>::max();
        }
        if (scaled_value < std::numeric_limits<std::int64_t>::min() / factor) {
            return std::numeric_limits<std::int64_t>::min();
        }
        return scaled_value * factor;
    }

    const std::int64_t divisor = Pow10(safe_from - safe_to);
    std::int64_t quotient = scaled_value / divisor;
    const std::int64_t remainder = scaled_value % divisor;
    if (remainder == 0) {
        return quotient;
    }
    switch (mode) {
        case FixedRoundingMode::kDown:
            if (scaled_value < 0) {
                --quotient;
            }
            break;
        case FixedRoundingMode::kUp:
            if (scaled_value > 0) {
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
    return quotient;
}

std::string FixedDecimal::FormatScaled(std::int64_t scaled_value, int scale) {
    const int safe_scale = std::max(0, scale);
    const bool negative = scaled_value < 0;
    const std::uint64_t magnitude =
        negative ? static_cast<std::uint64_t>(-(scaled_value + 1)) + 1
                 : static_cast<std::uint64_t>(scaled_value);
    const auto divisor = static_cast<std::uint64_t>(Pow10(safe_scale));

    std::string out = negative ? "-" : "";
    out += std::to_string(magnitude / divisor);
    if (safe_scale > 0) {
        const std::string fraction = std::to_string(magnitude % divisor);
        out += ".";
        out.append(static_cast<std::size_t>(safe_scale) - fraction.size(), '0');
        out += fraction;
    }
    return out;
}

}  // namespace tally_reports
