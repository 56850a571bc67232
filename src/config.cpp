#include "timepuff/config.h"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <string_view>

namespace timepuff {

namespace {
    constexpr std::string_view kStatsFileVariable = "TIMEPUFF_STATS_FILE";
    constexpr std::string_view kHistoryVariable = "TIMEPUFF_TELEMETRY_HISTORY";
    constexpr std::string_view kTracingVariable = "TIMEPUFF_TRACING";
    constexpr std::uint32_t kMaxHistory = 1u << 16;

    const char *ReadVariable(std::string_view name) {
        return std::getenv(std::string(name).c_str());
    }

    bool ParseSwitch(std::string_view text, bool &outValue) {
        std::string lowered(text);
        std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
            return static_cast<char>(std::tolower(c));
        });
        if (lowered == "1" || lowered == "true" || lowered == "on" || lowered == "yes") {
            outValue = true;
            return true;
        }
        if (lowered == "0" || lowered == "false" || lowered == "off" || lowered == "no") {
            outValue = false;
            return true;
        }
        return false;
    }

    void AppendDiagnostic(std::string &diagnostics, std::string_view message) {
        if (!diagnostics.empty()) {
            diagnostics += "; ";
        }
        diagnostics += message;
    }
}

ServiceConfig MakeDefaultConfig() {
    ServiceConfig config{};
    config.counter = CounterConfig{"conversion_stats.txt", true};
    config.telemetry = TelemetryConfig{false, 256};
    return config;
}

StatusCode ApplyEnvironmentOverrides(ServiceConfig &config, std::string &outDiagnostics) {
    outDiagnostics.clear();
    auto status = StatusCode::Ok;

    if (const char *statsFile = ReadVariable(kStatsFileVariable)) {
        std::string_view value(statsFile);
        if (value.empty()) {
            config.counter.persist = false;
        } else {
            config.counter.statsFile.assign(value);
            config.counter.persist = true;
        }
    }

    if (const char *history = ReadVariable(kHistoryVariable)) {
        std::string_view value(history);
        std::uint32_t parsed = 0;
        auto [end, error] = std::from_chars(value.data(), value.data() + value.size(), parsed);
        if (error != std::errc() || end != value.data() + value.size() || parsed == 0 || parsed > kMaxHistory) {
            AppendDiagnostic(outDiagnostics, "TIMEPUFF_TELEMETRY_HISTORY must be an integer in [1, 65536]");
            status = StatusCode::InvalidArgument;
        } else {
            config.telemetry.historySize = parsed;
        }
    }

    if (const char *tracing = ReadVariable(kTracingVariable)) {
        bool enabled = false;
        if (ParseSwitch(tracing, enabled)) {
            config.telemetry.enableTracing = enabled;
        } else {
            AppendDiagnostic(outDiagnostics, "TIMEPUFF_TRACING must be a boolean switch");
            status = StatusCode::InvalidArgument;
        }
    }

    return status;
}

}
