#pragma once

// Tracy profiler integration for xrayopt-core
//
//   - XRAYOPT_ZONE: mark the enclosing function
//   - XRAYOPT_ZONE_N(name): mark the enclosing function under a custom name
//   - XRAYOPT_FRAME_MARK: frame boundary, used by the benchmarks
//
// All macros expand to nothing unless TRACY_ENABLE is defined.

#ifdef TRACY_ENABLE

#  include <tracy/Tracy.hpp>

#  define XRAYOPT_ZONE ZoneScoped
#  define XRAYOPT_ZONE_N(name) ZoneScopedN(name)
#  define XRAYOPT_FRAME_MARK FrameMark

#else

#  define XRAYOPT_ZONE
#  define XRAYOPT_ZONE_N(name)
#  define XRAYOPT_FRAME_MARK

#endif
