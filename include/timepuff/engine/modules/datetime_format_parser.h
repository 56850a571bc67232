#pragma once

#include <atomic>
#include <cstdint>
#include <string>
#include <string_view>

#include "timepuff/config.h"
#include "timepuff/status.h"
#include "timepuff/engine/module.h"

namespace timepuff::engine {
    struct NaiveDateTime {
        int year;
        int month;
        int day;
        int hour;
        int minute;
        int second;
    };

    enum class DateTimeLayout : std::uint8_t {
        None,
        DashedSeconds,   // YYYY-MM-DD-HHMMSS
        CompactSeconds,  // YYYYMMDDHHMMSS
        CompactMinutes,  // YYYYMMDDHHMM
        SlashedMinutes   // MM/DD/YYYY HH:MM
    };

    class DateTimeFormatParser final : public Module {
    public:
        struct Metrics {
            std::atomic<std::uint64_t> parses;
            std::atomic<std::uint64_t> shapeMismatches;
            std::atomic<std::uint64_t> calendarRejections;

            Metrics() noexcept;
        };

        DateTimeFormatParser();

        std::string_view Name() const noexcept override;
        std::string_view Summary() const noexcept override;

        // Layouts are tried in declaration order of DateTimeLayout; the first
        // structural match decides, and a calendar-invalid match is not retried
        // against the remaining layouts.
        StatusCode Parse(std::string_view text,
                         NaiveDateTime &outDateTime,
                         DateTimeLayout *outLayout = nullptr) const;

        static std::string_view SupportedFormatsMessage() noexcept;

        static bool IsValid(const NaiveDateTime &dateTime) noexcept;

        // Renders in the YYYY-MM-DD-HHMMSS input layout.
        static std::string FormatCanonical(const NaiveDateTime &dateTime);

        const Metrics &GetMetrics() const noexcept;

    private:
        mutable Metrics m_Metrics;
    };
}
