#include "timecode/timecode.hpp"
#include "core/log_config.hpp"
#include <charconv>
#include <cmath>
#include <iomanip>
#include <limits>
#include <ostream>
#include <sstream>

namespace em::timecode {

const char* to_string(TimecodeError err) noexcept {
    switch(err) {
        case TimecodeError::None: return "none";
        case TimecodeError::Parse: return "parse error";
        case TimecodeError::Range: return "range error";
    }
    return "unknown";
}

namespace {

constexpr int64_t kInt64Max = std::numeric_limits<int64_t>::max();
constexpr size_t kMaxHourDigits = 9;

struct Outcome {
    TimecodeError error{TimecodeError::None};
    std::string message;
    int64_t total_frames{0};
};

Outcome fail(TimecodeError err, std::string message) {
    EM_TC_DEBUG("[Timecode] " + message);
    return Outcome{err, std::move(message), 0};
}

// ((h*60+m)*60+s)*fps + f, false on int64 overflow. Components must be non-negative.
bool compose(int64_t hours, int64_t minutes, int64_t seconds, int64_t frames, int64_t fps, int64_t& out) {
    if(fps > kInt64Max / 3600) return false;
    int64_t fph = fps * 3600;
    if(hours != 0 && hours > kInt64Max / fph) return false;
    int64_t total = hours * fph;
    int64_t rest = (minutes * 60 + seconds) * fps + frames;
    if(total > kInt64Max - rest) return false;
    out = total + rest;
    return true;
}

Outcome check_rate(const TimeRational& rate) {
    if(!is_valid_rate(rate)) {
        return fail(TimecodeError::Range, "frame rate must be positive, got " +
                    std::to_string(rate.num) + "/" + std::to_string(rate.den));
    }
    if(nominal_fps(rate) > kInt64Max / 3600) {
        return fail(TimecodeError::Range, "frame rate too large: " + rate_to_string(rate));
    }
    return {};
}

// FF is as wide as the largest frame number, at least two digits
size_t frame_width(int64_t fps) {
    size_t width = 2;
    for(int64_t top = fps - 1; top >= 100; top /= 10) ++width;
    return width;
}

// rescale into `to`, RangeError when the frame count does not fit
int64_t rescale_or_throw(int64_t frames, const TimeRational& from, const TimeRational& to) {
    int64_t out = 0;
    if(!rescale_frames(frames, from, to, out)) {
        throw RangeError(std::to_string(frames) + " frames at " + rate_to_string(from) +
                         " fps overflow the frame counter at " + rate_to_string(to) + " fps");
    }
    return out;
}

bool parse_field(std::string_view field, size_t min_digits, size_t max_digits, int64_t& out) {
    if(field.size() < min_digits || field.size() > max_digits) return false;
    for(char c : field) {
        if(c < '0' || c > '9') return false;
    }
    auto [ptr, ec] = std::from_chars(field.data(), field.data() + field.size(), out);
    return ec == std::errc() && ptr == field.data() + field.size();
}

Outcome parse_text(std::string_view text, const TimeRational& rate) {
    if(auto r = check_rate(rate); r.error != TimecodeError::None) return r;

    std::string_view fields[4];
    size_t count = 0;
    size_t start = 0;
    for(size_t i = 0; i <= text.size(); ++i) {
        if(i == text.size() || text[i] == ':') {
            if(count == 4) return fail(TimecodeError::Parse, "expected HH:MM:SS:FF, too many fields in '" + std::string(text) + "'");
            fields[count++] = text.substr(start, i - start);
            start = i + 1;
        }
    }
    if(count != 4) {
        return fail(TimecodeError::Parse, "expected HH:MM:SS:FF, got '" + std::string(text) + "'");
    }

    // Canonical form only: no zero padding past two hour digits, FF exactly as wide as timecode() writes it
    const int64_t fps = nominal_fps(rate);
    const size_t ff_width = frame_width(fps);
    int64_t h = 0, m = 0, s = 0, f = 0;
    if(!parse_field(fields[0], 2, kMaxHourDigits, h) ||
       (fields[0].size() > 2 && fields[0][0] == '0') ||
       !parse_field(fields[1], 2, 2, m) ||
       !parse_field(fields[2], 2, 2, s) ||
       !parse_field(fields[3], ff_width, ff_width, f)) {
        return fail(TimecodeError::Parse, "malformed timecode field in '" + std::string(text) + "'");
    }

    if(m >= 60) return fail(TimecodeError::Range, "minutes out of range in '" + std::string(text) + "'");
    if(s >= 60) return fail(TimecodeError::Range, "seconds out of range in '" + std::string(text) + "'");
    if(f >= fps) {
        return fail(TimecodeError::Range, "frames out of range in '" + std::string(text) +
                    "' (fps " + std::to_string(fps) + ")");
    }

    Outcome ok;
    if(!compose(h, m, s, f, fps, ok.total_frames)) {
        return fail(TimecodeError::Range, "timecode '" + std::string(text) + "' overflows the frame counter");
    }
    return ok;
}

[[noreturn]] void raise(const Outcome& o) {
    if(o.error == TimecodeError::Parse) throw ParseError(o.message);
    throw RangeError(o.message);
}

void check_component(bool in_range, const char* name, int64_t value) {
    if(!in_range) {
        EM_TC_DEBUG(std::string("[Timecode] rejected ") + name + "=" + std::to_string(value));
        throw RangeError(std::string(name) + " out of range: " + std::to_string(value));
    }
}

} // namespace

Timecode Timecode::parse(std::string_view text, TimeRational rate) {
    auto o = parse_text(text, rate);
    if(o.error != TimecodeError::None) raise(o);
    return Timecode(o.total_frames, normalize(rate));
}

Timecode Timecode::from_total_frames(int64_t total_frames, TimeRational rate) {
    if(auto r = check_rate(rate); r.error != TimecodeError::None) raise(r);
    if(total_frames < 0) {
        throw RangeError("total frames must not be negative, got " + std::to_string(total_frames));
    }
    return Timecode(total_frames, normalize(rate));
}

expected<Timecode, TimecodeError> Timecode::try_parse(std::string_view text, TimeRational rate) {
    auto o = parse_text(text, rate);
    if(o.error != TimecodeError::None) return make_unexpected(o.error);
    return Timecode(o.total_frames, normalize(rate));
}

expected<Timecode, TimecodeError> Timecode::try_from_total_frames(int64_t total_frames, TimeRational rate) {
    if(check_rate(rate).error != TimecodeError::None || total_frames < 0) {
        return make_unexpected(TimecodeError::Range);
    }
    return Timecode(total_frames, normalize(rate));
}

int64_t Timecode::hours() const noexcept {
    return total_frames_ / (fps() * 3600);
}

int64_t Timecode::minutes() const noexcept {
    const int64_t f = fps();
    return (total_frames_ % (f * 3600)) / (f * 60);
}

int64_t Timecode::seconds() const noexcept {
    const int64_t f = fps();
    return (total_frames_ % (f * 60)) / f;
}

int64_t Timecode::frames() const noexcept {
    return total_frames_ % fps();
}

void Timecode::set_component(int64_t hours, int64_t minutes, int64_t seconds, int64_t frames) {
    int64_t total = 0;
    if(!compose(hours, minutes, seconds, frames, fps(), total)) {
        throw RangeError("timecode overflows the frame counter at " + std::to_string(hours) + " hours");
    }
    total_frames_ = total;
}

void Timecode::set_hours(int64_t hours) {
    check_component(hours >= 0, "hours", hours);
    set_component(hours, minutes(), seconds(), frames());
}

void Timecode::set_minutes(int64_t minutes) {
    check_component(minutes >= 0 && minutes < 60, "minutes", minutes);
    set_component(hours(), minutes, seconds(), frames());
}

void Timecode::set_seconds(int64_t seconds) {
    check_component(seconds >= 0 && seconds < 60, "seconds", seconds);
    set_component(hours(), minutes(), seconds, frames());
}

void Timecode::set_frames(int64_t frames) {
    check_component(frames >= 0 && frames < fps(), "frames", frames);
    set_component(hours(), minutes(), seconds(), frames);
}

void Timecode::set_timecode(std::string_view text) {
    total_frames_ = parse(text, rate_).total_frames_;
}

std::string Timecode::timecode() const {
    std::ostringstream oss;
    oss << std::setfill('0') << std::setw(2) << hours() << ':'
        << std::setw(2) << minutes() << ':'
        << std::setw(2) << seconds() << ':'
        << std::setw(static_cast<int>(frame_width(fps()))) << frames();
    return oss.str();
}

std::string Timecode::to_string() const {
    return "Timecode('" + timecode() + "', fps=" + rate_to_string(rate_) + ")";
}

Timecode Timecode::converted_to(TimeRational rate) const {
    if(auto r = check_rate(rate); r.error != TimecodeError::None) raise(r);
    return Timecode(rescale_or_throw(total_frames_, rate_, rate), normalize(rate));
}

Timecode& Timecode::operator+=(const Timecode& other) {
    int64_t add = rescale_or_throw(other.total_frames_, other.rate_, rate_);
    if(total_frames_ > kInt64Max - add) {
        throw RangeError("sum of " + to_string() + " and " + other.to_string() + " overflows the frame counter");
    }
    total_frames_ += add;
    return *this;
}

Timecode& Timecode::operator-=(const Timecode& other) {
    int64_t sub = 0;
    if(!rescale_frames(other.total_frames_, other.rate_, rate_, sub) || sub > total_frames_) {
        EM_TC_DEBUG("[Timecode] negative difference " + to_string() + " - " + other.to_string());
        throw RangeError("difference of " + to_string() + " and " + other.to_string() + " would be negative");
    }
    total_frames_ -= sub;
    return *this;
}

Timecode& Timecode::operator*=(double factor) {
    if(!std::isfinite(factor) || factor < 0.0) {
        throw RangeError("scale factor must be finite and non-negative, got " + std::to_string(factor));
    }
    long double scaled = static_cast<long double>(total_frames_) * static_cast<long double>(factor);
    if(scaled >= static_cast<long double>(kInt64Max)) {
        throw RangeError(to_string() + " scaled by " + std::to_string(factor) + " overflows the frame counter");
    }
    total_frames_ = static_cast<int64_t>(std::llround(scaled));
    return *this;
}

Timecode operator+(const Timecode& lhs, const Timecode& rhs) {
    Timecode result = lhs;
    result += rhs;
    return result;
}

Timecode operator-(const Timecode& lhs, const Timecode& rhs) {
    Timecode result = lhs;
    result -= rhs;
    return result;
}

Timecode operator*(const Timecode& tc, double factor) {
    Timecode result = tc;
    result *= factor;
    return result;
}

Timecode operator*(double factor, const Timecode& tc) { return tc * factor; }

bool operator==(const Timecode& lhs, const Timecode& rhs) noexcept {
    return compare_frames(lhs.total_frames(), lhs.rate(), rhs.total_frames(), rhs.rate()) == 0;
}
bool operator!=(const Timecode& lhs, const Timecode& rhs) noexcept { return !(lhs == rhs); }
bool operator<(const Timecode& lhs, const Timecode& rhs) noexcept {
    return compare_frames(lhs.total_frames(), lhs.rate(), rhs.total_frames(), rhs.rate()) < 0;
}
bool operator<=(const Timecode& lhs, const Timecode& rhs) noexcept { return !(rhs < lhs); }
bool operator>(const Timecode& lhs, const Timecode& rhs) noexcept { return rhs < lhs; }
bool operator>=(const Timecode& lhs, const Timecode& rhs) noexcept { return !(lhs < rhs); }

std::ostream& operator<<(std::ostream& os, const Timecode& tc) {
    return os << tc.to_string();
}

} // namespace em::timecode
