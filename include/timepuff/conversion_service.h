#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

#include "timepuff/config.h"
#include "timepuff/status.h"
#include "timepuff/telemetry.h"
#include "timepuff/engine/modules/alt_epoch_converter.h"

namespace timepuff::engine {
    class Environment;
}

namespace timepuff {
    // Receives one call per successful user-facing conversion.
    class ConversionSink {
    public:
        virtual ~ConversionSink() = default;
        virtual StatusCode OnConversion() = 0;
    };

    struct EpochConversion {
        StatusCode status;
        std::string input;
        std::int64_t epoch;
        std::string datetime;
        std::string diagnostics;
    };

    struct AltEpochConversion {
        StatusCode status;
        std::string input;
        std::int64_t swet;
        std::int64_t unixSeconds;
        std::string datetime;
        std::string diagnostics;
    };

    struct AltEpochSummary {
        StatusCode status;
        engine::AltEpochInfo info;
        std::string diagnostics;
    };

    class ConversionService {
    public:
        // Smallest and largest Unix seconds that render as years 1 through 9999.
        static constexpr std::int64_t kMinUnixSeconds = -62135596800;
        static constexpr std::int64_t kMaxUnixSeconds = 253402300799;

        static std::unique_ptr<ConversionService> Create(const ServiceConfig &config,
                                                         ConversionSink *sink = nullptr);

        ~ConversionService();

        // Accepts integer or decimal text; decimals truncate toward zero.
        EpochConversion EpochToHuman(std::string_view epochText, std::string_view zoneToken = {});

        EpochConversion EpochToHuman(std::int64_t epoch, std::string_view zoneToken = {});

        EpochConversion HumanToEpoch(std::string_view text, std::string_view zoneToken = {});

        AltEpochConversion AltEpochToHuman(std::string_view swetText, std::string_view zoneToken = {});

        AltEpochConversion HumanToAltEpoch(std::string_view text, std::string_view zoneToken = {});

        // Not a conversion: the sink is not notified.
        AltEpochSummary AltEpochInfo() const;

        AltEpochSummary AltEpochInfo(std::int64_t nowUnixSeconds) const;

        // Integer or decimal text to whole seconds. Rejects non-finite values
        // and magnitudes outside the 64-bit range.
        static StatusCode ParseSeconds(std::string_view text, std::int64_t &outSeconds) noexcept;

        StatusCode Reconfigure(const ServiceConfig &config);

        const ServiceConfig &Config() const;

        engine::Environment &Engine();

        const engine::Environment &Engine() const;

        detail::TelemetryHub &Telemetry();

    private:
        struct Impl;
        std::unique_ptr<Impl> m_Impl;

        explicit ConversionService(std::unique_ptr<Impl> impl);
    };
}
