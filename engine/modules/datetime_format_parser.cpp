#include "timepuff/engine/modules/datetime_format_parser.h"

#include <array>
#include <cstdio>
#include <regex>

namespace timepuff::engine {
    namespace {
        constexpr std::string_view kName = "DateTimeFormatParser";
        constexpr std::string_view kSummary = "Fixed-layout datetime text to naive calendar fields.";
        constexpr std::string_view kSupportedFormats =
                "Invalid datetime format. Supported formats: "
                "YYYY-MM-DD-HHMMSS, YYYYMMDDHHMMSS, YYYYMMDDHHMM, MM/DD/YYYY HH:MM";

        constexpr int kMinYear = 1;
        constexpr int kMaxYear = 9999;

        struct LayoutPattern {
            DateTimeLayout layout;
            const char *expression;
        };

        constexpr std::array<LayoutPattern, 4> kLayoutPatterns{ {
            {DateTimeLayout::DashedSeconds, R"((\d{4})-(\d{2})-(\d{2})-(\d{2})(\d{2})(\d{2}))"},
            {DateTimeLayout::CompactSeconds, R"((\d{4})(\d{2})(\d{2})(\d{2})(\d{2})(\d{2}))"},
            {DateTimeLayout::CompactMinutes, R"((\d{4})(\d{2})(\d{2})(\d{2})(\d{2}))"},
            {DateTimeLayout::SlashedMinutes, R"((\d{1,2})/(\d{1,2})/(\d{4}) (\d{1,2}):(\d{2}))"}
        } };

        struct CompiledLayout {
            DateTimeLayout layout;
            std::regex expression;
        };

        const std::array<CompiledLayout, 4> &CompiledLayouts() {
            static const std::array<CompiledLayout, 4> compiled{ {
                {kLayoutPatterns[0].layout, std::regex(kLayoutPatterns[0].expression)},
                {kLayoutPatterns[1].layout, std::regex(kLayoutPatterns[1].expression)},
                {kLayoutPatterns[2].layout, std::regex(kLayoutPatterns[2].expression)},
                {kLayoutPatterns[3].layout, std::regex(kLayoutPatterns[3].expression)}
            } };
            return compiled;
        }

        inline bool IsLeap(int year) noexcept {
            return (year % 4 == 0 && year % 100 != 0) || (year % 400 == 0);
        }

        inline int DaysInMonth(int year, int month) noexcept {
            static constexpr int kMonthDays[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
            if (month == 2 && IsLeap(year)) {
                return 29;
            }
            return kMonthDays[month - 1];
        }

        inline int ParseInt(const std::csub_match &match) noexcept {
            int value = 0;
            for (auto it = match.first; it != match.second; ++it) {
                value = value * 10 + (*it - '0');
            }
            return value;
        }

        NaiveDateTime FieldsFromMatch(DateTimeLayout layout, const std::cmatch &match) noexcept {
            NaiveDateTime fields{};
            switch (layout) {
                case DateTimeLayout::DashedSeconds:
                case DateTimeLayout::CompactSeconds:
                    fields = NaiveDateTime{ParseInt(match[1]), ParseInt(match[2]), ParseInt(match[3]),
                                           ParseInt(match[4]), ParseInt(match[5]), ParseInt(match[6])};
                    break;
                case DateTimeLayout::CompactMinutes:
                    fields = NaiveDateTime{ParseInt(match[1]), ParseInt(match[2]), ParseInt(match[3]),
                                           ParseInt(match[4]), ParseInt(match[5]), 0};
                    break;
                case DateTimeLayout::SlashedMinutes:
                    fields = NaiveDateTime{ParseInt(match[3]), ParseInt(match[1]), ParseInt(match[2]),
                                           ParseInt(match[4]), ParseInt(match[5]), 0};
                    break;
                case DateTimeLayout::None:
                    break;
            }
            return fields;
        }
    }

    DateTimeFormatParser::Metrics::Metrics() noexcept
        : parses(0),
          shapeMismatches(0),
          calendarRejections(0) {
    }

    DateTimeFormatParser::DateTimeFormatParser() : m_Metrics() {
    }

    std::string_view DateTimeFormatParser::Name() const noexcept {
        return kName;
    }

    std::string_view DateTimeFormatParser::Summary() const noexcept {
        return kSummary;
    }

    StatusCode DateTimeFormatParser::Parse(std::string_view text,
                                           NaiveDateTime &outDateTime,
                                           DateTimeLayout *outLayout) const {
        if (outLayout != nullptr) {
            *outLayout = DateTimeLayout::None;
        }
        const char *begin = text.data();
        const char *end = text.data() + text.size();
        for (const auto &candidate: CompiledLayouts()) {
            std::cmatch match;
            if (!std::regex_match(begin, end, match, candidate.expression)) {
                continue;
            }
            auto fields = FieldsFromMatch(candidate.layout, match);
            if (!IsValid(fields)) {
                m_Metrics.calendarRejections.fetch_add(1, std::memory_order_relaxed);
                return StatusCode::InvalidFormat;
            }
            outDateTime = fields;
            if (outLayout != nullptr) {
                *outLayout = candidate.layout;
            }
            m_Metrics.parses.fetch_add(1, std::memory_order_relaxed);
            return StatusCode::Ok;
        }
        m_Metrics.shapeMismatches.fetch_add(1, std::memory_order_relaxed);
        return StatusCode::InvalidFormat;
    }

    std::string_view DateTimeFormatParser::SupportedFormatsMessage() noexcept {
        return kSupportedFormats;
    }

    bool DateTimeFormatParser::IsValid(const NaiveDateTime &dateTime) noexcept {
        if (dateTime.year < kMinYear || dateTime.year > kMaxYear) {
            return false;
        }
        if (dateTime.month < 1 || dateTime.month > 12) {
            return false;
        }
        if (dateTime.hour < 0 || dateTime.hour >= 24 || dateTime.minute < 0 || dateTime.minute >= 60
            || dateTime.second < 0 || dateTime.second >= 60) {
            return false;
        }
        return dateTime.day >= 1 && dateTime.day <= DaysInMonth(dateTime.year, dateTime.month);
    }

    std::string DateTimeFormatParser::FormatCanonical(const NaiveDateTime &dateTime) {
        char buffer[32];
        const int written = std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02d-%02d%02d%02d",
                                          dateTime.year, dateTime.month, dateTime.day,
                                          dateTime.hour, dateTime.minute, dateTime.second);
        if (written <= 0) {
            return {};
        }
        return std::string(buffer, static_cast<std::size_t>(written));
    }

    const DateTimeFormatParser::Metrics &DateTimeFormatParser::GetMetrics() const noexcept {
        return m_Metrics;
    }
}
