#pragma once

// -----------------------------------------------------------------------------
// Telemetry level configuration
// -----------------------------------------------------------------------------

#if defined(TETHER_ENABLE_TELEMETRY_L1)
    #define TT_TL1(expr) expr
#else
    #define TT_TL1(expr) ((void)0)
#endif
