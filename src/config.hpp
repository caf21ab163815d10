#pragma once

/*here you can choose the layout limits and the resize clamp policy*/

#define SV_CLAMP_STRICT 1
#define SV_CLAMP_LEGACY 2

#ifndef SV_MAX_PANELS
#define SV_MAX_PANELS 4
#endif

#ifndef SV_MIN_PANEL_SIZE
#define SV_MIN_PANEL_SIZE 10.0
#endif

#ifndef SV_CLAMP_POLICY
#define SV_CLAMP_POLICY SV_CLAMP_STRICT
#endif

#if SV_CLAMP_POLICY == SV_CLAMP_STRICT
#define SV_CLAMP_POLICY_NAME "strict"
#elif SV_CLAMP_POLICY == SV_CLAMP_LEGACY
#define SV_CLAMP_POLICY_NAME "legacy"
#else
#define SV_CLAMP_POLICY_NAME "unknown"
#endif

#define SV_SIZE_EPSILON 1e-6

#include "types.hpp"

struct LayoutOptions {
  int max_panels = SV_MAX_PANELS;
  double min_size = SV_MIN_PANEL_SIZE;
#if SV_CLAMP_POLICY == SV_CLAMP_LEGACY
  ClampPolicy clamp = ClampPolicy::Legacy;
#else
  ClampPolicy clamp = ClampPolicy::Strict;
#endif
};
