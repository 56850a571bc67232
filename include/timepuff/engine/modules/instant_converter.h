#pragma once

#include <atomic>
#include <cstdint>
#include <string>
#include <string_view>

#include "absl/time/time.h"

#include "timepuff/config.h"
#include "timepuff/status.h"
#include "timepuff/engine/module.h"
#include "timepuff/engine/modules/datetime_format_parser.h"
#include "timepuff/engine/modules/timezone_resolver.h"

namespace timepuff::engine {
    class InstantConverter final : public Module {
    public:
        struct Metrics {
            std::atomic<std::uint64_t> instantConversions;
            std::atomic<std::uint64_t> formatConversions;
            std::atomic<std::uint64_t> utcFallbacks;
            std::atomic<std::uint64_t> formatFailures;
            std::atomic<std::uint64_t> rangeFallbacks;

            Metrics() noexcept;
        };

        InstantConverter();

        std::string_view Name() const noexcept override;
        std::string_view Summary() const noexcept override;

        void Initialize(const ModuleInitContext &context) override;

        // Wall-clock text in zoneToken (UTC when the token is empty or does not
        // resolve) to whole Unix seconds.
        StatusCode ToInstant(std::string_view text,
                             std::string_view zoneToken,
                             std::int64_t &outUnixSeconds,
                             std::string &outDiagnostics) const;

        // "<Dow> YYYY-MM-DD HH:MM:SS <abbr>" in zoneToken, or "... UTC" when the
        // token is empty or does not resolve. Never fails.
        std::string ToFormatted(std::int64_t unixSeconds, std::string_view zoneToken) const;

        // UTC rendering in the YYYY-MM-DD-HHMMSS input layout.
        std::string ToCanonicalText(std::int64_t unixSeconds) const;

        // Repeated and skipped wall-clock times use the offset in effect
        // before the transition.
        static std::int64_t Localize(const NaiveDateTime &dateTime, const absl::TimeZone &zone) noexcept;

        static std::string FormatUtc(std::int64_t unixSeconds);

        bool Ready() const noexcept;

        const Metrics &GetMetrics() const noexcept;

    private:
        const TimezoneResolver *m_Resolver;
        const DateTimeFormatParser *m_Parser;
        detail::TelemetryHub *m_Telemetry;
        mutable Metrics m_Metrics;

        void TraceFallback(std::string_view channel, std::string_view detail) const;
    };
}
