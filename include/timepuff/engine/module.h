#pragma once

#include <string_view>

namespace timepuff {
    struct ServiceConfig;

    namespace detail {
        class TelemetryHub;
    }
}

namespace timepuff::engine {
    class Environment;

    struct ModuleInitContext {
        Environment &environment;
        const ServiceConfig &config;
        detail::TelemetryHub *telemetry;
    };

    class Module {
    public:
        virtual ~Module() = default;

        virtual std::string_view Name() const noexcept = 0;

        virtual std::string_view Summary() const noexcept {
            return {};
        }

        virtual void Initialize(const ModuleInitContext &context) {
            (void) context;
        }
    };
}
