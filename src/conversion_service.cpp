#include "timepuff/conversion_service.h"

#include <charconv>
#include <cmath>
#include <system_error>
#include <utility>

#include "absl/time/clock.h"
#include "absl/time/time.h"

#include "timepuff/engine/environment.h"
#include "timepuff/engine/modules/all_modules.h"

namespace timepuff {

namespace {
    constexpr std::string_view kInvalidEpoch = "Invalid epoch time format";
    constexpr std::string_view kEngineUnavailable = "Conversion engine unavailable";
    constexpr std::string_view kCounterChannel = "counter.persist";

    // Just inside the int64 range so the cast after truncation is defined.
    constexpr double kMaxMagnitude = 9.2e18;

    std::string_view Trim(std::string_view text) noexcept {
        while (!text.empty() && (text.front() == ' ' || text.front() == '\t' || text.front() == '\n'
                                 || text.front() == '\r' || text.front() == '\f' || text.front() == '\v')) {
            text.remove_prefix(1);
        }
        while (!text.empty() && (text.back() == ' ' || text.back() == '\t' || text.back() == '\n'
                                 || text.back() == '\r' || text.back() == '\f' || text.back() == '\v')) {
            text.remove_suffix(1);
        }
        return text;
    }

    bool IsRenderable(std::int64_t unixSeconds) noexcept {
        return unixSeconds >= ConversionService::kMinUnixSeconds && unixSeconds <= ConversionService::kMaxUnixSeconds;
    }
}

struct ConversionService::Impl {
    ServiceConfig m_Config;
    std::unique_ptr<detail::TelemetryHub> m_Telemetry;
    engine::Environment m_Environment;
    ConversionSink *m_Sink = nullptr;
    const engine::InstantConverter *m_Instants = nullptr;
    const engine::AltEpochConverter *m_AltEpoch = nullptr;

    void Bind(const ServiceConfig &config) {
        m_Config = config;
        m_Telemetry = detail::CreateMemoryTelemetry(config.telemetry);
        m_Environment.Initialize(m_Config, m_Telemetry.get());
        m_Instants = dynamic_cast<const engine::InstantConverter *>(m_Environment.FindModule("InstantConverter"));
        m_AltEpoch = dynamic_cast<const engine::AltEpochConverter *>(m_Environment.FindModule("AltEpochConverter"));
    }

    bool Ready() const noexcept {
        return m_Instants != nullptr && m_Instants->Ready() && m_AltEpoch != nullptr;
    }

    void Push(std::string_view channel, StatusCode status, std::string detail) const {
        m_Telemetry->PushSample(detail::TelemetrySample{std::string(channel), status, std::move(detail), 0});
    }

    void Complete(std::string_view operation, StatusCode status, const std::string &input,
                  const std::string &diagnostics) const {
        if (status != StatusCode::Ok) {
            Push(operation, status, input + ": " + diagnostics);
            return;
        }
        if (m_Telemetry->TracingEnabled()) {
            Push(operation, status, input);
        }
        if (m_Sink == nullptr) {
            return;
        }
        auto sinkStatus = m_Sink->OnConversion();
        if (sinkStatus != StatusCode::Ok) {
            Push(kCounterChannel, sinkStatus, "Conversion count was not persisted");
        }
    }

    // Shared by both rendering directions; does not notify the sink.
    StatusCode Render(std::int64_t unixSeconds, std::string_view zoneToken, std::string &outText,
                      std::string &outDiagnostics) const {
        if (!IsRenderable(unixSeconds)) {
            outDiagnostics.assign(kInvalidEpoch);
            return StatusCode::InvalidNumber;
        }
        outText = m_Instants->ToFormatted(unixSeconds, zoneToken);
        return StatusCode::Ok;
    }
};

std::unique_ptr<ConversionService> ConversionService::Create(const ServiceConfig &config, ConversionSink *sink) {
    auto impl = std::make_unique<Impl>();
    impl->m_Sink = sink;
    impl->Bind(config);
    return std::unique_ptr<ConversionService>(new ConversionService(std::move(impl)));
}

ConversionService::ConversionService(std::unique_ptr<Impl> impl) : m_Impl(std::move(impl)) {}

ConversionService::~ConversionService() = default;

EpochConversion ConversionService::EpochToHuman(std::string_view epochText, std::string_view zoneToken) {
    EpochConversion result{StatusCode::Ok, std::string(epochText), 0, {}, {}};
    std::int64_t seconds = 0;
    result.status = ParseSeconds(epochText, seconds);
    if (result.status != StatusCode::Ok) {
        result.diagnostics.assign(kInvalidEpoch);
        m_Impl->Complete("epoch_to_human", result.status, result.input, result.diagnostics);
        return result;
    }
    auto converted = EpochToHuman(seconds, zoneToken);
    converted.input = std::move(result.input);
    return converted;
}

EpochConversion ConversionService::EpochToHuman(std::int64_t epoch, std::string_view zoneToken) {
    EpochConversion result{StatusCode::Ok, std::to_string(epoch), epoch, {}, {}};
    if (!m_Impl->Ready()) {
        result.status = StatusCode::InternalError;
        result.diagnostics.assign(kEngineUnavailable);
    } else {
        result.status = m_Impl->Render(epoch, zoneToken, result.datetime, result.diagnostics);
    }
    m_Impl->Complete("epoch_to_human", result.status, result.input, result.diagnostics);
    return result;
}

EpochConversion ConversionService::HumanToEpoch(std::string_view text, std::string_view zoneToken) {
    EpochConversion result{StatusCode::Ok, std::string(text), 0, std::string(text), {}};
    if (!m_Impl->Ready()) {
        result.status = StatusCode::InternalError;
        result.diagnostics.assign(kEngineUnavailable);
    } else {
        result.status = m_Impl->m_Instants->ToInstant(text, zoneToken, result.epoch, result.diagnostics);
    }
    m_Impl->Complete("human_to_epoch", result.status, result.input, result.diagnostics);
    return result;
}

AltEpochConversion ConversionService::AltEpochToHuman(std::string_view swetText, std::string_view zoneToken) {
    AltEpochConversion result{StatusCode::Ok, std::string(swetText), 0, 0, {}, {}};
    if (!m_Impl->Ready()) {
        result.status = StatusCode::InternalError;
        result.diagnostics.assign(kEngineUnavailable);
    } else {
        result.status = ParseSeconds(swetText, result.swet);
        if (result.status == StatusCode::Ok) {
            result.unixSeconds = engine::AltEpochConverter::ToUnix(result.swet);
            result.status = m_Impl->Render(result.unixSeconds, zoneToken, result.datetime, result.diagnostics);
        } else {
            result.diagnostics.assign(kInvalidEpoch);
        }
    }
    m_Impl->Complete("swet_to_human", result.status, result.input, result.diagnostics);
    return result;
}

AltEpochConversion ConversionService::HumanToAltEpoch(std::string_view text, std::string_view zoneToken) {
    AltEpochConversion result{StatusCode::Ok, std::string(text), 0, 0, std::string(text), {}};
    if (!m_Impl->Ready()) {
        result.status = StatusCode::InternalError;
        result.diagnostics.assign(kEngineUnavailable);
    } else {
        result.status = m_Impl->m_Instants->ToInstant(text, zoneToken, result.unixSeconds, result.diagnostics);
        if (result.status == StatusCode::Ok) {
            result.swet = engine::AltEpochConverter::ToAltEpoch(result.unixSeconds);
        }
    }
    m_Impl->Complete("human_to_swet", result.status, result.input, result.diagnostics);
    return result;
}

AltEpochSummary ConversionService::AltEpochInfo() const {
    return AltEpochInfo(absl::ToUnixSeconds(absl::Now()));
}

AltEpochSummary ConversionService::AltEpochInfo(std::int64_t nowUnixSeconds) const {
    AltEpochSummary summary{StatusCode::Ok, engine::AltEpochInfo{0, 0.0, {}, {}}, {}};
    if (m_Impl->m_AltEpoch == nullptr) {
        summary.status = StatusCode::InternalError;
        summary.diagnostics.assign(kEngineUnavailable);
        m_Impl->Push("swet_info", summary.status, summary.diagnostics);
        return summary;
    }
    summary.info = m_Impl->m_AltEpoch->Info(nowUnixSeconds);
    if (m_Impl->m_Telemetry->TracingEnabled()) {
        m_Impl->Push("swet_info", summary.status, std::to_string(summary.info.currentAltEpoch));
    }
    return summary;
}

StatusCode ConversionService::ParseSeconds(std::string_view text, std::int64_t &outSeconds) noexcept {
    auto trimmed = Trim(text);
    if (!trimmed.empty() && trimmed.front() == '+') {
        trimmed.remove_prefix(1);
        if (!trimmed.empty() && (trimmed.front() == '+' || trimmed.front() == '-')) {
            return StatusCode::InvalidNumber;
        }
    }
    if (trimmed.empty()) {
        return StatusCode::InvalidNumber;
    }

    const char *first = trimmed.data();
    const char *last = trimmed.data() + trimmed.size();

    std::int64_t integral = 0;
    auto [integralEnd, integralError] = std::from_chars(first, last, integral);
    if (integralError == std::errc() && integralEnd == last) {
        outSeconds = integral;
        return StatusCode::Ok;
    }

    double value = 0.0;
    auto [decimalEnd, decimalError] = std::from_chars(first, last, value);
    if (decimalError != std::errc() || decimalEnd != last || !std::isfinite(value)) {
        return StatusCode::InvalidNumber;
    }
    const double truncated = std::trunc(value);
    if (truncated < -kMaxMagnitude || truncated > kMaxMagnitude) {
        return StatusCode::InvalidNumber;
    }
    outSeconds = static_cast<std::int64_t>(truncated);
    return StatusCode::Ok;
}

StatusCode ConversionService::Reconfigure(const ServiceConfig &config) {
    m_Impl->Bind(config);
    return m_Impl->Ready() ? StatusCode::Ok : StatusCode::InternalError;
}

const ServiceConfig &ConversionService::Config() const {
    return m_Impl->m_Config;
}

engine::Environment &ConversionService::Engine() {
    return m_Impl->m_Environment;
}

const engine::Environment &ConversionService::Engine() const {
    return m_Impl->m_Environment;
}

detail::TelemetryHub &ConversionService::Telemetry() {
    return *m_Impl->m_Telemetry;
}

}
