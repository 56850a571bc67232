#pragma once

#include <cstdint>
#include <string>

#include "timepuff/status.h"

namespace timepuff {
    struct CounterConfig {
        std::string statsFile;
        bool persist;
    };

    struct TelemetryConfig {
        bool enableTracing;
        std::uint32_t historySize;
    };

    struct ServiceConfig {
        CounterConfig counter;
        TelemetryConfig telemetry;
    };

    ServiceConfig MakeDefaultConfig();

    // Reads TIMEPUFF_STATS_FILE, TIMEPUFF_TELEMETRY_HISTORY and TIMEPUFF_TRACING.
    // Malformed values leave the existing field untouched and return InvalidArgument.
    StatusCode ApplyEnvironmentOverrides(ServiceConfig &config, std::string &outDiagnostics);
}
