#pragma once
#include <cstdint>
#include <string>

namespace em {

// Rational rate / time representation to avoid floating drift.
struct TimeRational {
    int64_t num{0}; // numerator
    int32_t den{1}; // denominator ( >0 )

    // Comparison operators (value equality, 48/2 == 24/1)
    bool operator==(const TimeRational& other) const {
        return num * other.den == other.num * den;
    }
    bool operator!=(const TimeRational& other) const { return !(*this == other); }
    bool operator<(const TimeRational& other) const {
        return num * other.den < other.num * den;
    }
    bool operator<=(const TimeRational& other) const { return *this < other || *this == other; }
    bool operator>(const TimeRational& other) const { return !(*this <= other); }
    bool operator>=(const TimeRational& other) const { return !(*this < other); }
};

TimeRational make_time(int64_t num, int32_t den) noexcept;

// GCD reduction with a positive denominator. Zero maps to 0/1.
TimeRational normalize(const TimeRational& in) noexcept;

// A frame rate is usable when it is strictly positive.
bool is_valid_rate(const TimeRational& rate) noexcept;

// Whole frames per second used to label timecode components.
// Integral rates map to themselves, 24000/1001 maps to 24 (non-drop labelling).
int64_t nominal_fps(const TimeRational& rate) noexcept;

// Re-express a frame count at another rate, preserving elapsed time.
// Rounds half away from zero. Both rates must be valid.
// Returns false (out untouched) when the result does not fit in int64.
bool rescale_frames(int64_t frames, const TimeRational& from, const TimeRational& to, int64_t& out) noexcept;

// Three-way compare of two instants given as frame counts at their own rates.
// Exact (no rounding), hence symmetric.
int compare_frames(int64_t a_frames, const TimeRational& a_rate,
                   int64_t b_frames, const TimeRational& b_rate) noexcept;

// "24" or "24000/1001"
std::string rate_to_string(const TimeRational& rate);

} // namespace em
