#pragma once
#include <stdexcept>
#include <string>

namespace em::timecode {

/**
 * @brief Timecode failure kinds
 */
enum class TimecodeError {
    None,   ///< No error
    Parse,  ///< Text does not have the HH:MM:SS:FF shape
    Range   ///< A value is outside its valid range (component, frame count, rate, result)
};

const char* to_string(TimecodeError err) noexcept;

/**
 * @brief Thrown when timecode text is malformed
 */
class ParseError : public std::invalid_argument {
public:
    explicit ParseError(const std::string& what) : std::invalid_argument(what) {}
    TimecodeError code() const noexcept { return TimecodeError::Parse; }
};

/**
 * @brief Thrown when a component, frame count, frame rate or arithmetic result is out of range
 */
class RangeError : public std::out_of_range {
public:
    explicit RangeError(const std::string& what) : std::out_of_range(what) {}
    TimecodeError code() const noexcept { return TimecodeError::Range; }
};

} // namespace em::timecode
