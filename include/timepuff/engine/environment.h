#pragma once

#include <memory>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "timepuff/config.h"
#include "timepuff/engine/module.h"

namespace timepuff::engine {
    // Owns the conversion modules. Initialize runs (and may be repeated) before
    // the environment is shared between threads; lookups are read-only afterwards.
    class Environment {
    public:
        Environment();
        ~Environment();

        void Initialize(const ServiceConfig &config, detail::TelemetryHub *telemetry);

        Module *FindModule(std::string_view name) noexcept;

        const Module *FindModule(std::string_view name) const noexcept;

        const std::vector<std::unique_ptr<Module>> &Modules() const noexcept;

    private:
        std::vector<std::unique_ptr<Module>> m_Modules;
        std::unordered_map<std::string_view, Module *> m_Index;
        ServiceConfig m_Config;

        void Register(std::unique_ptr<Module> module);
    };
}
