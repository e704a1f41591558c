#pragma once
#include <string>

// Central logging configuration / helper macros.
// Define NLE_TIMELINE_DEBUG or NLE_AUDIO_DEBUG (CMake options of the same name) to enable verbose logs.

namespace nle { namespace log { void debug(const std::string&) noexcept; } }

#if defined(NLE_TIMELINE_DEBUG)
  #define NLE_TL_DEBUG(msg) ::nle::log::debug(msg)
#else
  #define NLE_TL_DEBUG(msg) do {} while(0)
#endif

#if defined(NLE_AUDIO_DEBUG)
  #define NLE_AUDIO_DEBUG_LOG(msg) ::nle::log::debug(msg)
#else
  #define NLE_AUDIO_DEBUG_LOG(msg) do {} while(0)
#endif
