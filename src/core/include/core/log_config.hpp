#pragma once
#include <string>

// Compile-time switches for chatty log categories.
// Define NLA_DECODE_DEBUG (e.g. via compiler flags) to trace every decode request and frame.
// Define NLA_RENDER_DEBUG to trace per-layer compositing decisions.

namespace nla { namespace log { void debug(const std::string&) noexcept; } }

#if defined(NLA_DECODE_DEBUG)
  #define NLA_DECODE_TRACE(msg) ::nla::log::debug(msg)
#else
  #define NLA_DECODE_TRACE(msg) do {} while(0)
#endif

#if defined(NLA_RENDER_DEBUG)
  #define NLA_RENDER_TRACE(msg) ::nla::log::debug(msg)
#else
  #define NLA_RENDER_TRACE(msg) do {} while(0)
#endif
