#pragma once
#include "core/log.hpp"

// Compile-time gated verbose logging.
// Define TLC_TIMELINE_DEBUG or TLC_GRAPH_VERBOSE (e.g. via compiler flags) to enable them.

#if defined(TLC_TIMELINE_DEBUG)
  #define TLC_TL_DEBUG(msg) ::tlc::log::debug(msg)
#else
  #define TLC_TL_DEBUG(msg) do {} while(0)
#endif

#if defined(TLC_GRAPH_VERBOSE)
  #define TLC_GRAPH_DEBUG(msg) ::tlc::log::debug(msg)
#else
  #define TLC_GRAPH_DEBUG(msg) do {} while(0)
#endif

// Silence an unused variable when the verbose macros compile out.
#define TLC_USE(var) do { (void)(var); } while(0)
