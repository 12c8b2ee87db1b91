#pragma once

// Silent Vault profiler hooks.
// With VAULT_PROFILING_ENABLED these map to Tracy zones and frame marks;
// otherwise they compile to nothing.

#ifdef VAULT_PROFILING_ENABLED
#include <tracy/Tracy.hpp>

#define VAULT_ZONE_SCOPED ZoneScoped
#define VAULT_ZONE_SCOPED_N(name) ZoneScopedN(name)
#define VAULT_FRAME_MARK FrameMark
#define VAULT_PLOT(name, value) TracyPlot(name, value)

#else

#define VAULT_ZONE_SCOPED
#define VAULT_ZONE_SCOPED_N(name)
#define VAULT_FRAME_MARK
#define VAULT_PLOT(name, value)

#endif
