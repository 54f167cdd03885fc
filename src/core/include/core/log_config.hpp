#pragma once
#include <string>

// Central logging configuration / helper macros.
// Define EM_TIMECODE_DEBUG (CMake option of the same name) to log rejected
// timecode input and arithmetic failures at debug level.

namespace em { namespace log { void debug(const std::string&) noexcept; } }

#if defined(EM_TIMECODE_DEBUG)
  #define EM_TC_DEBUG(msg) ::em::log::debug(msg)
#else
  #define EM_TC_DEBUG(msg) do {} while(0)
#endif
