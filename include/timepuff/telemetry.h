#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "timepuff/config.h"
#include "timepuff/status.h"

namespace timepuff::detail {
    struct TelemetrySample {
        std::string channel;
        StatusCode status;
        std::string detail;
        std::uint64_t sequence;
    };

    class TelemetryHub {
    public:
        virtual ~TelemetryHub() = default;
        virtual void PushSample(const TelemetrySample &sample) = 0;
        virtual std::vector<TelemetrySample> Drain() = 0;
        virtual bool TracingEnabled() const noexcept = 0;
    };

    // Keeps the most recent historySize samples; older ones are dropped.
    std::unique_ptr<TelemetryHub> CreateMemoryTelemetry(const TelemetryConfig &config);
}
