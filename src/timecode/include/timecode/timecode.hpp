#pragma once
#include "timecode/errors.hpp"
#include <core/expected.hpp>
#include <core/time.hpp>
#include <cstdint>
#include <iosfwd>
#include <string>
#include <string_view>

namespace em::timecode {

/**
 * @brief A position in a frame sequence, HH:MM:SS:FF at a fixed frame rate
 *
 * Stores only the absolute frame count and the rate. Hours, minutes, seconds
 * and frames are derived on demand; setting one of them rewrites the frame
 * count with the other three held.
 *
 * Arithmetic between different rates rescales the right operand into the
 * left operand's rate (round half away from zero); the left rate is kept.
 * Comparisons are exact across rates.
 */
class Timecode {
public:
    /// 00:00:00:00 at 24 fps
    Timecode() = default;

    /**
     * @brief Parse "HH:MM:SS:FF"
     * @throws ParseError when the text does not have four colon separated numeric fields
     * @throws RangeError when a component or the rate is out of range
     */
    static Timecode parse(std::string_view text, TimeRational rate);

    /**
     * @brief Build from an absolute frame count
     * @throws RangeError when total_frames < 0 or the rate is not positive
     */
    static Timecode from_total_frames(int64_t total_frames, TimeRational rate);

    // Exception-free variants
    static expected<Timecode, TimecodeError> try_parse(std::string_view text, TimeRational rate);
    static expected<Timecode, TimecodeError> try_from_total_frames(int64_t total_frames, TimeRational rate);

    int64_t hours() const noexcept;
    int64_t minutes() const noexcept;
    int64_t seconds() const noexcept;
    int64_t frames() const noexcept;

    // Each setter validates first; on RangeError the timecode is unchanged.
    void set_hours(int64_t hours);
    void set_minutes(int64_t minutes);
    void set_seconds(int64_t seconds);
    void set_frames(int64_t frames);

    /// Re-parse at this timecode's own rate (strong guarantee)
    void set_timecode(std::string_view text);

    int64_t total_frames() const noexcept { return total_frames_; }
    const TimeRational& rate() const noexcept { return rate_; }
    /// Whole frames per second used for the FF field
    int64_t fps() const noexcept { return nominal_fps(rate_); }

    /// Canonical "HH:MM:SS:FF"
    std::string timecode() const;

    /// Constructor echo for diagnostics: Timecode('01:00:00:00', fps=24)
    std::string to_string() const;

    /// Same instant expressed at another rate
    Timecode converted_to(TimeRational rate) const;

    Timecode& operator+=(const Timecode& other);
    Timecode& operator-=(const Timecode& other);
    Timecode& operator*=(double factor);

private:
    Timecode(int64_t total_frames, TimeRational rate) : total_frames_(total_frames), rate_(rate) {}

    void set_component(int64_t hours, int64_t minutes, int64_t seconds, int64_t frames);

    int64_t total_frames_{0};
    TimeRational rate_{24, 1};
};

Timecode operator+(const Timecode& lhs, const Timecode& rhs);
/// @throws RangeError when the result would be negative
Timecode operator-(const Timecode& lhs, const Timecode& rhs);
/// @throws RangeError when factor is negative or not finite
Timecode operator*(const Timecode& tc, double factor);
Timecode operator*(double factor, const Timecode& tc);

bool operator==(const Timecode& lhs, const Timecode& rhs) noexcept;
bool operator!=(const Timecode& lhs, const Timecode& rhs) noexcept;
bool operator<(const Timecode& lhs, const Timecode& rhs) noexcept;
bool operator<=(const Timecode& lhs, const Timecode& rhs) noexcept;
bool operator>(const Timecode& lhs, const Timecode& rhs) noexcept;
bool operator>=(const Timecode& lhs, const Timecode& rhs) noexcept;

std::ostream& operator<<(std::ostream& os, const Timecode& tc);

} // namespace em::timecode
