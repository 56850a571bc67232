#include "timepuff/gateway.h"

#include <array>
#include <exception>
#include <utility>

#include "absl/time/clock.h"
#include "absl/time/time.h"

#include "timepuff/responses.h"
#include "timepuff/telemetry.h"

namespace timepuff {

namespace {
    enum class Encoding {
        Json,
        PlainText
    };

    enum class Operation {
        EpochToHuman,
        HumanToEpoch,
        AltEpochToHuman,
        HumanToAltEpoch,
        AltEpochInfo
    };

    struct RouteSpec {
        std::string_view segment;
        Operation operation;
        bool takesValue;
    };

    struct MatchedRoute {
        Encoding encoding;
        Operation operation;
        std::string_view rawValue;
    };

    constexpr std::string_view kJsonPrefix = "/api/v1/";
    constexpr std::string_view kTextPrefix = "/curl/v1/";
    constexpr std::string_view kCurlRoot = "/curl/";
    constexpr std::string_view kHealthPath = "/health";
    constexpr std::string_view kStatsPath = "/stats/";

    constexpr std::string_view kJsonType = "application/json";
    constexpr std::string_view kTextType = "text/plain; charset=utf-8";

    constexpr std::string_view kCurlNotFound = "Endpoint not found. Check your URL and try again.";
    constexpr std::string_view kJsonNotFound = "The requested URL was not found on the server.";
    constexpr std::string_view kMethodNotAllowed = "The method is not allowed for the requested URL.";
    constexpr std::string_view kMalformedTarget = "Malformed percent-encoding in request target";
    constexpr std::string_view kInternalError = "Internal server error";

    constexpr std::array<RouteSpec, 5> kRoutes{ {
        {"epoch/", Operation::EpochToHuman, true},
        {"datetime/", Operation::HumanToEpoch, true},
        {"swet/", Operation::AltEpochToHuman, true},
        {"datetime-to-swet/", Operation::HumanToAltEpoch, true},
        {"swet-info", Operation::AltEpochInfo, false}
    } };

    bool StartsWith(std::string_view text, std::string_view prefix) noexcept {
        return text.size() >= prefix.size() && text.compare(0, prefix.size(), prefix) == 0;
    }

    bool MatchRoute(std::string_view path, MatchedRoute &outRoute) noexcept {
        std::string_view rest;
        if (StartsWith(path, kJsonPrefix)) {
            outRoute.encoding = Encoding::Json;
            rest = path.substr(kJsonPrefix.size());
        } else if (StartsWith(path, kTextPrefix)) {
            outRoute.encoding = Encoding::PlainText;
            rest = path.substr(kTextPrefix.size());
        } else {
            return false;
        }
        for (const auto &route: kRoutes) {
            if (!route.takesValue) {
                if (rest == route.segment) {
                    outRoute.operation = route.operation;
                    outRoute.rawValue = {};
                    return true;
                }
                continue;
            }
            if (!StartsWith(rest, route.segment)) {
                continue;
            }
            auto value = rest.substr(route.segment.size());
            if (value.empty() || value.find('/') != std::string_view::npos) {
                return false;
            }
            outRoute.operation = route.operation;
            outRoute.rawValue = value;
            return true;
        }
        return false;
    }

    // First occurrence of key wins; absent keys yield an empty view.
    std::string_view RawQueryValue(std::string_view query, std::string_view key) noexcept {
        while (!query.empty()) {
            auto split = query.find('&');
            auto pair = query.substr(0, split);
            query = split == std::string_view::npos ? std::string_view{} : query.substr(split + 1);
            auto equals = pair.find('=');
            auto name = pair.substr(0, equals);
            if (name != key) {
                continue;
            }
            return equals == std::string_view::npos ? std::string_view{} : pair.substr(equals + 1);
        }
        return {};
    }

    int HexValue(char c) noexcept {
        if (c >= '0' && c <= '9') {
            return c - '0';
        }
        if (c >= 'a' && c <= 'f') {
            return c - 'a' + 10;
        }
        if (c >= 'A' && c <= 'F') {
            return c - 'A' + 10;
        }
        return -1;
    }

    HttpResponse MakeResponse(int status, Encoding encoding, std::string body) {
        return HttpResponse{status, std::string(encoding == Encoding::Json ? kJsonType : kTextType), std::move(body)};
    }

    HttpResponse MakeError(int status, Encoding encoding, std::string_view message) {
        ErrorResponse error{std::string(message)};
        return MakeResponse(status, encoding, encoding == Encoding::Json ? error.ToJson() : error.ToPlainText());
    }

    HttpResponse MakeFailure(StatusCode status, Encoding encoding, const std::string &diagnostics) {
        const int httpStatus = Gateway::HttpStatusFor(status);
        if (httpStatus >= 500) {
            return MakeError(httpStatus, encoding, kInternalError);
        }
        return MakeError(httpStatus, encoding, diagnostics);
    }

    template<typename Response, typename Conversion>
    HttpResponse Render(const Conversion &conversion, Encoding encoding) {
        if (conversion.status != StatusCode::Ok) {
            return MakeFailure(conversion.status, encoding, conversion.diagnostics);
        }
        auto response = Response::From(conversion);
        return MakeResponse(200, encoding, encoding == Encoding::Json ? response.ToJson() : response.ToPlainText());
    }

    std::string HealthTimestamp() {
        return absl::FormatTime("%Y-%m-%dT%H:%M:%E6S+00:00", absl::Now(), absl::UTCTimeZone());
    }
}

Gateway::Gateway(ConversionService &service, const ConversionCounter *counter)
    : m_Service(service),
      m_Counter(counter) {
}

HttpResponse Gateway::Handle(const HttpRequest &request) const {
    try {
        return Dispatch(request);
    } catch (const std::exception &error) {
        m_Service.Telemetry().PushSample(detail::TelemetrySample{"gateway", StatusCode::InternalError,
                                                                 request.target + ": " + error.what(), 0});
        const auto encoding = StartsWith(request.target, kCurlRoot) ? Encoding::PlainText : Encoding::Json;
        return MakeError(500, encoding, kInternalError);
    }
}

HttpResponse Gateway::Dispatch(const HttpRequest &request) const {
    std::string_view target(request.target);
    auto queryStart = target.find('?');
    auto path = target.substr(0, queryStart);
    auto query = queryStart == std::string_view::npos ? std::string_view{} : target.substr(queryStart + 1);
    const bool isGet = request.method == "GET";

    if (path == kHealthPath) {
        if (!isGet) {
            return MakeError(405, Encoding::Json, kMethodNotAllowed);
        }
        HealthResponse health{"healthy", HealthTimestamp()};
        return MakeResponse(200, Encoding::Json, health.ToJson());
    }
    if (path == kStatsPath) {
        if (!isGet) {
            return MakeError(405, Encoding::PlainText, kMethodNotAllowed);
        }
        StatsResponse stats{m_Counter != nullptr ? m_Counter->Value() : 0};
        return MakeResponse(200, Encoding::PlainText, stats.ToPlainText());
    }

    MatchedRoute route{Encoding::Json, Operation::EpochToHuman, {}};
    if (!MatchRoute(path, route)) {
        if (StartsWith(path, kCurlRoot)) {
            return MakeError(404, Encoding::PlainText, kCurlNotFound);
        }
        return MakeError(404, Encoding::Json, kJsonNotFound);
    }
    if (!isGet) {
        return MakeError(405, route.encoding, kMethodNotAllowed);
    }

    std::string value;
    std::string zone;
    if (PercentDecode(route.rawValue, false, value) != StatusCode::Ok
        || PercentDecode(RawQueryValue(query, "tz"), true, zone) != StatusCode::Ok) {
        return MakeError(400, route.encoding, kMalformedTarget);
    }

    switch (route.operation) {
        case Operation::EpochToHuman:
            return Render<EpochResponse>(m_Service.EpochToHuman(std::string_view(value), zone), route.encoding);
        case Operation::HumanToEpoch:
            return Render<EpochResponse>(m_Service.HumanToEpoch(value, zone), route.encoding);
        case Operation::AltEpochToHuman:
            return Render<AltEpochResponse>(m_Service.AltEpochToHuman(value, zone), route.encoding);
        case Operation::HumanToAltEpoch:
            return Render<AltEpochResponse>(m_Service.HumanToAltEpoch(value, zone), route.encoding);
        case Operation::AltEpochInfo: {
            auto summary = m_Service.AltEpochInfo();
            if (summary.status != StatusCode::Ok) {
                return MakeFailure(summary.status, route.encoding, summary.diagnostics);
            }
            auto response = AltEpochInfoResponse::From(summary.info);
            return MakeResponse(200, route.encoding,
                                route.encoding == Encoding::Json ? response.ToJson() : response.ToPlainText());
        }
    }
    return MakeError(500, route.encoding, kInternalError);
}

StatusCode Gateway::PercentDecode(std::string_view text, bool plusAsSpace, std::string &outDecoded) {
    outDecoded.clear();
    outDecoded.reserve(text.size());
    for (std::size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (c == '+' && plusAsSpace) {
            outDecoded.push_back(' ');
            continue;
        }
        if (c != '%') {
            outDecoded.push_back(c);
            continue;
        }
        if (i + 2 >= text.size()) {
            return StatusCode::InvalidArgument;
        }
        int high = HexValue(text[i + 1]);
        int low = HexValue(text[i + 2]);
        if (high < 0 || low < 0) {
            return StatusCode::InvalidArgument;
        }
        outDecoded.push_back(static_cast<char>((high << 4) | low));
        i += 2;
    }
    return StatusCode::Ok;
}

int Gateway::HttpStatusFor(StatusCode status) noexcept {
    switch (status) {
        case StatusCode::Ok:
            return 200;
        case StatusCode::InvalidArgument:
        case StatusCode::InvalidFormat:
        case StatusCode::InvalidNumber:
            return 400;
        case StatusCode::NotFound:
            return 404;
        case StatusCode::IoError:
        case StatusCode::InternalError:
            return 500;
    }
    return 500;
}

}
