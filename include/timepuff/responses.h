#pragma once

#include <cstdint>
#include <string>

#include "timepuff/conversion_service.h"

namespace timepuff {
    // Response bodies. Field order here is the order on the wire.

    struct EpochResponse {
        std::string input;
        std::int64_t epoch;
        std::string datetime;

        static EpochResponse From(const EpochConversion &conversion);

        std::string ToJson() const;
        std::string ToPlainText() const;
    };

    struct AltEpochResponse {
        std::string input;
        std::int64_t swet;
        std::int64_t unixSeconds;
        std::string datetime;

        static AltEpochResponse From(const AltEpochConversion &conversion);

        std::string ToJson() const;
        std::string ToPlainText() const;
    };

    struct AltEpochInfoResponse {
        std::int64_t currentSwet;
        double yearsSinceRelease;
        std::string swetEpochStart;
        std::string description;

        static AltEpochInfoResponse From(const engine::AltEpochInfo &info);

        std::string ToJson() const;
        std::string ToPlainText() const;
    };

    struct ErrorResponse {
        std::string message;

        std::string ToJson() const;
        std::string ToPlainText() const;
    };

    struct HealthResponse {
        std::string status;
        std::string timestamp;

        std::string ToJson() const;
    };

    struct StatsResponse {
        std::uint64_t conversions;

        std::string ToPlainText() const;
    };
}
