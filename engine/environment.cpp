#include "timepuff/engine/environment.h"

#include "timepuff/engine/modules/all_modules.h"

namespace timepuff::engine {
    Environment::Environment() : m_Config{} {
        // Leaf modules first: InstantConverter looks the others up while initializing.
        Register(std::make_unique<TimezoneResolver>());
        Register(std::make_unique<DateTimeFormatParser>());
        Register(std::make_unique<AltEpochConverter>());
        Register(std::make_unique<InstantConverter>());
    }

    Environment::~Environment() = default;

    void Environment::Register(std::unique_ptr<Module> module) {
        if (!module) {
            return;
        }
        auto name = module->Name();
        if (name.empty() || m_Index.find(name) != m_Index.end()) {
            return;
        }
        m_Index.emplace(name, module.get());
        m_Modules.push_back(std::move(module));
    }

    void Environment::Initialize(const ServiceConfig &config, detail::TelemetryHub *telemetry) {
        m_Config = config;
        ModuleInitContext context{*this, m_Config, telemetry};
        for (auto &module: m_Modules) {
            module->Initialize(context);
        }
    }

    Module *Environment::FindModule(std::string_view name) noexcept {
        auto it = m_Index.find(name);
        return it == m_Index.end() ? nullptr : it->second;
    }

    const Module *Environment::FindModule(std::string_view name) const noexcept {
        auto it = m_Index.find(name);
        return it == m_Index.end() ? nullptr : it->second;
    }

    const std::vector<std::unique_ptr<Module> > &Environment::Modules() const noexcept {
        return m_Modules;
    }
}
