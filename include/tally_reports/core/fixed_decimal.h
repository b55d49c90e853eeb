#pragma once

#include <cstdint>
#include <string>

namespace tally_reports {

enum class FixedRoundingMode {
    kHalfUp = 0,
    kDown = 1,
    kUp = 2,
};

class FixedDecimal {
public:
    // Parses plain decimal text ("-1234.50", "+7", ".5") into a scaled integer without
    // passing through floating point. Digits beyond `scale` are rounded with `mode`.
    static bool ParseScaled(const std::string& text,
                            int scale,
                            FixedRoundingMode mode,
                            std::int64_t* out,
                            std::string* error);
    static std::int64_t Rescale(std::int64_t scaled_value,
                                int from_scale,
                                int to_scale,
                                FixedRoundingMode mode);
    static std::string FormatScaled(std::int64_t scaled_value, int scale);
};

}  // namespace tally_reports
