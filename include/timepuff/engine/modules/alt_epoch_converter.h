#pragma once

#include <atomic>
#include <cstdint>
#include <string>
#include <string_view>

#include "timepuff/engine/module.h"

namespace timepuff::engine {
    struct AltEpochInfo {
        std::int64_t currentAltEpoch;
        double yearsSinceZero;
        std::string zeroPoint;
        std::string description;
    };

    // SWET (Star Wars Epoch Time): seconds since 1977-05-26T00:00:00Z.
    class AltEpochConverter final : public Module {
    public:
        static constexpr std::int64_t kOffset = 233452800;

        struct Metrics {
            std::atomic<std::uint64_t> infoQueries;

            Metrics() noexcept;
        };

        AltEpochConverter();

        std::string_view Name() const noexcept override;
        std::string_view Summary() const noexcept override;

        // Both directions wrap modulo 2^64, so ToUnix(ToAltEpoch(x)) == x for
        // every x.
        static std::int64_t ToAltEpoch(std::int64_t unixSeconds) noexcept;
        static std::int64_t ToUnix(std::int64_t altSeconds) noexcept;

        AltEpochInfo Info(std::int64_t nowUnixSeconds) const;

        static double YearsSinceZero(std::int64_t altSeconds) noexcept;

        const Metrics &GetMetrics() const noexcept;

    private:
        mutable Metrics m_Metrics;
    };
}
