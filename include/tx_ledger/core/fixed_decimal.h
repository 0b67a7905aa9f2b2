#pragma once

#include <cstdint>
#include <string>

namespace tx_ledger {

enum class FixedRoundingMode {
    kHalfUp = 0,
    kDown = 1,
    kUp = 2,
};

enum class FixedParseStatus {
    kOk = 0,
    kMalformed = 1,
    kOutOfRange = 2,
};

class FixedDecimal {
public:
    // Parses plain decimal text ("-12.3456", "7", ".5") into a value scaled by 10^scale.
    // Extra fractional digits are rounded with `mode`. Fails on empty, malformed or
    // out-of-range input.
    static bool Parse(const std::string& text,
                      int scale,
                      FixedRoundingMode mode,
                      std::int64_t* scaled_value);
    // Same as Parse, but tells well-formed values that do not fit int64 apart from bad text.
    static FixedParseStatus TryParse(const std::string& text,
                                     int scale,
                                     FixedRoundingMode mode,
                                     std::int64_t* scaled_value);
    static std::string Format(std::int64_t scaled_value, int scale);
    static bool Rescale(std::int64_t scaled_value,
                        int from_scale,
                        int to_scale,
                        FixedRoundingMode mode,
                        std::int64_t* out);
    static long double ToLongDouble(std::int64_t scaled_value, int scale);

    // Overflow-checked arithmetic on scaled values; `out` is untouched on failure.
    static bool CheckedAdd(std::int64_t lhs, std::int64_t rhs, std::int64_t* out);
    static bool CheckedSub(std::int64_t lhs, std::int64_t rhs, std::int64_t* out);
};

}  // namespace tx_ledger
