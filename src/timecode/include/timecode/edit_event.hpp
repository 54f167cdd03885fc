#pragma once
#include "timecode/timecode.hpp"
#include <chrono>
#include <string>

namespace em::timecode {

/**
 * @brief One editorial event (an EDL line): where a source range lands on the record side
 */
struct EditEvent {
    std::string name;
    std::string tracks = "VA1A2";   ///< Track selection, video plus audio channels
    Timecode record_in;
    Timecode record_out;
    Timecode source_in;             ///< Mark in
    Timecode source_out;            ///< Mark out
    std::string tape;
    std::string scene;
    std::string dpx;                ///< Image sequence reference
    std::string comment;
    std::chrono::system_clock::time_point created = std::chrono::system_clock::now();

    /// record_out - record_in, at the record rate. @throws RangeError when out precedes in
    Timecode record_duration() const;
    /// source_out - source_in, at the source rate. @throws RangeError when out precedes in
    Timecode source_duration() const;

    bool is_valid() const noexcept;

    std::string describe() const;
};

} // namespace em::timecode
