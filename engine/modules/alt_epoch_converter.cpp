#include "timepuff/engine/modules/alt_epoch_converter.h"

#include <cmath>

namespace timepuff::engine {
    namespace {
        constexpr std::string_view kName = "AltEpochConverter";
        constexpr std::string_view kSummary = "Linear transform between Unix seconds and Star Wars epoch seconds.";
        constexpr std::string_view kZeroPoint = "1977-05-26 00:00:00 UTC";
        constexpr std::string_view kDescription =
                "Star Wars Epoch Time: seconds elapsed since the theatrical release of Star Wars "
                "on May 26, 1977 (00:00:00 UTC).";

        constexpr double kSecondsPerYear = 365.25 * 86400.0;

        inline std::int64_t WrapSum(std::int64_t lhs, std::int64_t rhs) noexcept {
            return static_cast<std::int64_t>(static_cast<std::uint64_t>(lhs) + static_cast<std::uint64_t>(rhs));
        }

        inline std::int64_t WrapDifference(std::int64_t lhs, std::int64_t rhs) noexcept {
            return static_cast<std::int64_t>(static_cast<std::uint64_t>(lhs) - static_cast<std::uint64_t>(rhs));
        }
    }

    AltEpochConverter::Metrics::Metrics() noexcept : infoQueries(0) {
    }

    AltEpochConverter::AltEpochConverter() : m_Metrics() {
    }

    std::string_view AltEpochConverter::Name() const noexcept {
        return kName;
    }

    std::string_view AltEpochConverter::Summary() const noexcept {
        return kSummary;
    }

    std::int64_t AltEpochConverter::ToAltEpoch(std::int64_t unixSeconds) noexcept {
        return WrapDifference(unixSeconds, kOffset);
    }

    std::int64_t AltEpochConverter::ToUnix(std::int64_t altSeconds) noexcept {
        return WrapSum(altSeconds, kOffset);
    }

    AltEpochInfo AltEpochConverter::Info(std::int64_t nowUnixSeconds) const {
        m_Metrics.infoQueries.fetch_add(1, std::memory_order_relaxed);
        const auto current = ToAltEpoch(nowUnixSeconds);
        return AltEpochInfo{
            current,
            YearsSinceZero(current),
            std::string(kZeroPoint),
            std::string(kDescription)
        };
    }

    double AltEpochConverter::YearsSinceZero(std::int64_t altSeconds) noexcept {
        const double years = static_cast<double>(altSeconds) / kSecondsPerYear;
        return std::round(years * 10.0) / 10.0;
    }

    const AltEpochConverter::Metrics &AltEpochConverter::GetMetrics() const noexcept {
        return m_Metrics;
    }
}
