#include "timepuff/responses.h"

#include <cstdio>

#include "json_writer.h"

namespace timepuff {

namespace {
    // Label column is eleven characters wide; blocks end with a blank line.
    void AppendLine(std::string &out, std::string_view label, std::string_view value) {
        out += label;
        out.append(label.size() < 11 ? 11 - label.size() : 1, ' ');
        out += value;
        out.push_back('\n');
    }

    std::string FormatYears(double years) {
        char buffer[64];
        const int written = std::snprintf(buffer, sizeof(buffer), "%.1f", years);
        if (written <= 0 || static_cast<std::size_t>(written) >= sizeof(buffer)) {
            return "0.0";
        }
        return std::string(buffer, static_cast<std::size_t>(written));
    }
}

EpochResponse EpochResponse::From(const EpochConversion &conversion) {
    return EpochResponse{conversion.input, conversion.epoch, conversion.datetime};
}

std::string EpochResponse::ToJson() const {
    detail::JsonObjectWriter writer;
    writer.Field("input", input).Field("epoch", epoch).Field("datetime", datetime);
    return writer.Finish();
}

std::string EpochResponse::ToPlainText() const {
    std::string out;
    AppendLine(out, "Input:", input);
    AppendLine(out, "Epoch:", std::to_string(epoch));
    AppendLine(out, "Datetime:", datetime);
    out.push_back('\n');
    return out;
}

AltEpochResponse AltEpochResponse::From(const AltEpochConversion &conversion) {
    return AltEpochResponse{conversion.input, conversion.swet, conversion.unixSeconds, conversion.datetime};
}

std::string AltEpochResponse::ToJson() const {
    detail::JsonObjectWriter writer;
    writer.Field("input", input)
          .Field("swet", swet)
          .Field("unix", unixSeconds)
          .Field("datetime", datetime);
    return writer.Finish();
}

std::string AltEpochResponse::ToPlainText() const {
    std::string out;
    AppendLine(out, "Input:", input);
    AppendLine(out, "SWET:", std::to_string(swet));
    AppendLine(out, "Unix:", std::to_string(unixSeconds));
    AppendLine(out, "Datetime:", datetime);
    out.push_back('\n');
    return out;
}

AltEpochInfoResponse AltEpochInfoResponse::From(const engine::AltEpochInfo &info) {
    return AltEpochInfoResponse{info.currentAltEpoch, info.yearsSinceZero, info.zeroPoint, info.description};
}

std::string AltEpochInfoResponse::ToJson() const {
    detail::JsonObjectWriter writer;
    writer.Field("current_swet", currentSwet)
          .Field("years_since_release", yearsSinceRelease, 1)
          .Field("swet_epoch_start", swetEpochStart)
          .Field("description", description);
    return writer.Finish();
}

std::string AltEpochInfoResponse::ToPlainText() const {
    std::string out = "SWET (Star Wars Epoch Time) Information:\n";
    out += "Current SWET:        " + std::to_string(currentSwet) + "\n";
    out += "Years Since Release: " + FormatYears(yearsSinceRelease) + "\n";
    out += "SWET Epoch Start:    " + swetEpochStart + "\n";
    out += "Description:         " + description + "\n\n";
    return out;
}

std::string ErrorResponse::ToJson() const {
    detail::JsonObjectWriter writer;
    writer.Field("message", message);
    return writer.Finish();
}

std::string ErrorResponse::ToPlainText() const {
    return "Error: " + message + "\n\n";
}

std::string HealthResponse::ToJson() const {
    detail::JsonObjectWriter writer;
    writer.Field("status", status).Field("timestamp", timestamp);
    return writer.Finish();
}

std::string StatsResponse::ToPlainText() const {
    std::string out;
    AppendLine(out, "Conversions:", std::to_string(conversions));
    out.push_back('\n');
    return out;
}

}
