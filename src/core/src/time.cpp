#include "core/time.hpp"
#include <cmath>
#include <limits>
#include <numeric>

namespace em {

namespace {

constexpr int64_t kInt64Max = std::numeric_limits<int64_t>::max();

// a*b for non-negative operands; false on overflow.
bool mul_non_negative(int64_t a, int64_t b, int64_t& out) noexcept {
    if(a != 0 && b > kInt64Max / a) return false;
    out = a * b;
    return true;
}

} // namespace

TimeRational make_time(int64_t num, int32_t den) noexcept {
    if(den == 0) den = 1;
    return normalize(TimeRational{num, den});
}

TimeRational normalize(const TimeRational& in) noexcept {
    if(in.den == 0) return TimeRational{0,1};
    int64_t num = in.num;
    int32_t den = in.den;
    if(den < 0) { den = -den; num = -num; }
    if(num == 0) return TimeRational{0,1};
    auto g = std::gcd(num < 0 ? -num : num, static_cast<int64_t>(den));
    if(g <= 1) return TimeRational{num, den};
    num /= g;
    den = static_cast<int32_t>(den / g);
    return TimeRational{num, den};
}

bool is_valid_rate(const TimeRational& rate) noexcept {
    if(rate.den == 0) return false;
    auto n = normalize(rate);
    return n.num > 0;
}

int64_t nominal_fps(const TimeRational& rate) noexcept {
    auto n = normalize(rate);
    if(n.num <= 0) return 0;
    if(n.num > kInt64Max - n.den / 2) return n.num / n.den;
    int64_t fps = (n.num + n.den / 2) / n.den;
    return fps > 0 ? fps : 1;
}

bool rescale_frames(int64_t frames, const TimeRational& from, const TimeRational& to, int64_t& out) noexcept {
    auto f = normalize(from);
    auto t = normalize(to);
    if(frames == 0 || (f.num == t.num && f.den == t.den)) { out = frames; return true; }
    if(frames == std::numeric_limits<int64_t>::min()) return false;

    // frames * (t.num / t.den) / (f.num / f.den) == frames * (t.num * f.den) / (t.den * f.num)
    int64_t p = 0;
    int64_t q = 0;
    if(mul_non_negative(t.num, f.den, p) && mul_non_negative(t.den, f.num, q)) {
        auto g = std::gcd(p, q);
        p /= g;
        q /= g;
        int64_t magnitude = frames < 0 ? -frames : frames;
        int64_t product = 0;
        if(mul_non_negative(magnitude, p, product) && product <= kInt64Max - q / 2) {
            int64_t rounded = (product + q / 2) / q; // ties away from zero
            out = frames < 0 ? -rounded : rounded;
            return true;
        }
    }
    // Large values: same policy through llround, once the result is known to fit.
    long double v = static_cast<long double>(frames)
                  * static_cast<long double>(t.num) * static_cast<long double>(f.den)
                  / (static_cast<long double>(t.den) * static_cast<long double>(f.num));
    constexpr long double limit = 9223372036854775807.0L;
    if(!std::isfinite(v) || std::fabs(v) >= limit) return false;
    out = static_cast<int64_t>(std::llround(v));
    return true;
}

int compare_frames(int64_t a_frames, const TimeRational& a_rate,
                   int64_t b_frames, const TimeRational& b_rate) noexcept {
    auto ra = normalize(a_rate);
    auto rb = normalize(b_rate);
    // a_frames / ra vs b_frames / rb  ->  a_frames * ra.den * rb.num vs b_frames * rb.den * ra.num
    int64_t sa = 0, sb = 0, lhs = 0, rhs = 0;
    if(a_frames >= 0 && b_frames >= 0 &&
       mul_non_negative(static_cast<int64_t>(ra.den), rb.num, sa) &&
       mul_non_negative(static_cast<int64_t>(rb.den), ra.num, sb)) {
        auto g = std::gcd(sa, sb);
        sa /= g;
        sb /= g;
        if(mul_non_negative(a_frames, sa, lhs) && mul_non_negative(b_frames, sb, rhs)) {
            return lhs < rhs ? -1 : (lhs > rhs ? 1 : 0);
        }
    }
    long double l = static_cast<long double>(a_frames) * ra.den * static_cast<long double>(rb.num);
    long double r = static_cast<long double>(b_frames) * rb.den * static_cast<long double>(ra.num);
    return l < r ? -1 : (l > r ? 1 : 0);
}

std::string rate_to_string(const TimeRational& rate) {
    auto n = normalize(rate);
    if(n.den == 1) return std::to_string(n.num);
    return std::to_string(n.num) + "/" + std::to_string(n.den);
}

} // namespace em
