#include "timepuff/engine/modules/instant_converter.h"

#include "absl/time/civil_time.h"

#include "timepuff/telemetry.h"
#include "timepuff/engine/environment.h"

namespace timepuff::engine {
    namespace {
        constexpr std::string_view kName = "InstantConverter";
        constexpr std::string_view kSummary = "Zone-aware conversion between wall-clock text and Unix seconds.";
        constexpr const char *kZonedLayout = "%a %E4Y-%m-%d %H:%M:%S %Z";
        constexpr const char *kUtcLayout = "%a %E4Y-%m-%d %H:%M:%S UTC";
        constexpr absl::civil_year_t kMinRenderedYear = 1;
        constexpr absl::civil_year_t kMaxRenderedYear = 9999;

        absl::CivilSecond ToCivil(const NaiveDateTime &dateTime) noexcept {
            return absl::CivilSecond(dateTime.year, dateTime.month, dateTime.day,
                                     dateTime.hour, dateTime.minute, dateTime.second);
        }
    }

    InstantConverter::Metrics::Metrics() noexcept
        : instantConversions(0),
          formatConversions(0),
          utcFallbacks(0),
          formatFailures(0),
          rangeFallbacks(0) {
    }

    InstantConverter::InstantConverter()
        : m_Resolver(nullptr),
          m_Parser(nullptr),
          m_Telemetry(nullptr),
          m_Metrics() {
    }

    std::string_view InstantConverter::Name() const noexcept {
        return kName;
    }

    std::string_view InstantConverter::Summary() const noexcept {
        return kSummary;
    }

    void InstantConverter::Initialize(const ModuleInitContext &context) {
        m_Resolver = dynamic_cast<const TimezoneResolver *>(context.environment.FindModule("TimezoneResolver"));
        m_Parser = dynamic_cast<const DateTimeFormatParser *>(context.environment.FindModule("DateTimeFormatParser"));
        m_Telemetry = context.telemetry;
    }

    StatusCode InstantConverter::ToInstant(std::string_view text,
                                           std::string_view zoneToken,
                                           std::int64_t &outUnixSeconds,
                                           std::string &outDiagnostics) const {
        outDiagnostics.clear();
        if (!Ready()) {
            outDiagnostics = "Instant converter is not initialized";
            return StatusCode::InternalError;
        }

        NaiveDateTime fields{};
        auto status = m_Parser->Parse(text, fields);
        if (status != StatusCode::Ok) {
            outDiagnostics.assign(DateTimeFormatParser::SupportedFormatsMessage());
            return status;
        }

        auto resolution = m_Resolver->Resolve(zoneToken);
        switch (resolution.kind) {
            case ZoneResolution::Kind::Resolved:
                outUnixSeconds = Localize(fields, resolution.zone);
                break;
            case ZoneResolution::Kind::Unresolved:
                m_Metrics.utcFallbacks.fetch_add(1, std::memory_order_relaxed);
                TraceFallback("instant.zone_fallback", zoneToken);
                outUnixSeconds = Localize(fields, absl::UTCTimeZone());
                break;
            case ZoneResolution::Kind::NotRequested:
                outUnixSeconds = Localize(fields, absl::UTCTimeZone());
                break;
        }
        m_Metrics.instantConversions.fetch_add(1, std::memory_order_relaxed);
        return StatusCode::Ok;
    }

    std::string InstantConverter::ToFormatted(std::int64_t unixSeconds, std::string_view zoneToken) const {
        m_Metrics.formatConversions.fetch_add(1, std::memory_order_relaxed);
        if (m_Resolver == nullptr) {
            return FormatUtc(unixSeconds);
        }

        auto resolution = m_Resolver->Resolve(zoneToken);
        if (resolution.kind == ZoneResolution::Kind::Unresolved) {
            m_Metrics.utcFallbacks.fetch_add(1, std::memory_order_relaxed);
            TraceFallback("format.zone_fallback", zoneToken);
            return FormatUtc(unixSeconds);
        }
        if (resolution.kind == ZoneResolution::Kind::NotRequested) {
            return FormatUtc(unixSeconds);
        }

        const auto instant = absl::FromUnixSeconds(unixSeconds);
        // The zone offset can push the edges of the UTC range into year 0 or 10000.
        const auto localYear = absl::ToCivilSecond(instant, resolution.zone).year();
        if (localYear < kMinRenderedYear || localYear > kMaxRenderedYear) {
            m_Metrics.rangeFallbacks.fetch_add(1, std::memory_order_relaxed);
            TraceFallback("format.range_fallback", resolution.zoneId);
            return FormatUtc(unixSeconds);
        }

        auto rendered = absl::FormatTime(kZonedLayout, instant, resolution.zone);
        if (rendered.empty()) {
            m_Metrics.formatFailures.fetch_add(1, std::memory_order_relaxed);
            TraceFallback("format.render_fallback", resolution.zoneId);
            return FormatUtc(unixSeconds);
        }
        return rendered;
    }

    std::string InstantConverter::ToCanonicalText(std::int64_t unixSeconds) const {
        auto civil = absl::ToCivilSecond(absl::FromUnixSeconds(unixSeconds), absl::UTCTimeZone());
        NaiveDateTime fields{static_cast<int>(civil.year()), civil.month(), civil.day(),
                             civil.hour(), civil.minute(), civil.second()};
        return DateTimeFormatParser::FormatCanonical(fields);
    }

    std::int64_t InstantConverter::Localize(const NaiveDateTime &dateTime, const absl::TimeZone &zone) noexcept {
        const auto info = zone.At(ToCivil(dateTime));
        return absl::ToUnixSeconds(info.pre);
    }

    std::string InstantConverter::FormatUtc(std::int64_t unixSeconds) {
        return absl::FormatTime(kUtcLayout, absl::FromUnixSeconds(unixSeconds), absl::UTCTimeZone());
    }

    bool InstantConverter::Ready() const noexcept {
        return m_Resolver != nullptr && m_Parser != nullptr;
    }

    const InstantConverter::Metrics &InstantConverter::GetMetrics() const noexcept {
        return m_Metrics;
    }

    void InstantConverter::TraceFallback(std::string_view channel, std::string_view detail) const {
        if (m_Telemetry == nullptr || !m_Telemetry->TracingEnabled()) {
            return;
        }
        m_Telemetry->PushSample(detail::TelemetrySample{std::string(channel), StatusCode::Ok, std::string(detail), 0});
    }
}
