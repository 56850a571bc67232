#pragma once

#include <atomic>
#include <cstdint>
#include <string>
#include <string_view>

#include "absl/time/time.h"

#include "timepuff/config.h"
#include "timepuff/engine/module.h"

namespace timepuff::engine {
    struct ZoneResolution {
        enum class Kind : std::uint8_t {
            NotRequested,
            Resolved,
            Unresolved
        };

        Kind kind;
        std::string zoneId;
        absl::TimeZone zone;

        static ZoneResolution NotRequested();
        static ZoneResolution Unresolved();
        static ZoneResolution Resolved(std::string zoneId, absl::TimeZone zone);

        bool IsResolved() const noexcept {
            return kind == Kind::Resolved;
        }
    };

    // Maps abbreviations ("pst"), friendly names ("tokyo") and canonical
    // identifiers ("Europe/Paris") onto loaded zones. Resolution failure is a
    // value, never an error.
    class TimezoneResolver final : public Module {
    public:
        struct Metrics {
            std::atomic<std::uint64_t> lookups;
            std::atomic<std::uint64_t> aliasHits;
            std::atomic<std::uint64_t> databaseHits;
            std::atomic<std::uint64_t> unresolved;

            Metrics() noexcept;
        };

        TimezoneResolver();

        std::string_view Name() const noexcept override;
        std::string_view Summary() const noexcept override;

        ZoneResolution Resolve(std::string_view token) const;

        // Canonical identifier for a table alias, or empty if the key is unknown.
        static std::string_view LookupAlias(std::string_view loweredKey) noexcept;

        const Metrics &GetMetrics() const noexcept;

    private:
        mutable Metrics m_Metrics;

        static bool IsPlausibleZoneName(std::string_view name);
        static bool TryLoad(const std::string &name, absl::TimeZone &outZone);
    };
}
