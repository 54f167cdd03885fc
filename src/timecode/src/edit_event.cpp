#include "timecode/edit_event.hpp"
#include "core/log.hpp"

namespace em::timecode {

Timecode EditEvent::record_duration() const {
    return record_out - record_in;
}

Timecode EditEvent::source_duration() const {
    return source_out - source_in;
}

bool EditEvent::is_valid() const noexcept {
    return record_in <= record_out && source_in <= source_out;
}

std::string EditEvent::describe() const {
    std::string out = name.empty() ? std::string("<unnamed>") : name;
    out += " " + tracks;
    if(!tape.empty()) out += " tape=" + tape;
    if(!scene.empty()) out += " scene=" + scene;
    out += " src " + source_in.timecode() + "-" + source_out.timecode();
    out += " rec " + record_in.timecode() + "-" + record_out.timecode();
    if(!is_valid()) {
        em::log::warn("EditEvent '" + name + "' has an out point before its in point");
        out += " (invalid)";
    }
    return out;
}

} // namespace em::timecode
