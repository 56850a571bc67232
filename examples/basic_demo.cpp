#include <iostream>

#include "timepuff/config.h"
#include "timepuff/conversion_service.h"
#include "timepuff/status.h"

int main() {
    auto config = timepuff::MakeDefaultConfig();
    config.counter.persist = false;
    std::string diagnostics;
    if (timepuff::ApplyEnvironmentOverrides(config, diagnostics) != timepuff::StatusCode::Ok) {
        std::cout << "Ignoring environment overrides: " << diagnostics << std::endl;
    }

    auto service = timepuff::ConversionService::Create(config);
    if (!service) {
        std::cout << "Failed to create conversion service" << std::endl;
        return 1;
    }

    auto human = service->EpochToHuman("1757509860", "pst");
    if (human.status != timepuff::StatusCode::Ok) {
        std::cout << "Epoch conversion failed: " << human.diagnostics << std::endl;
        return 1;
    }
    std::cout << human.input << " -> " << human.datetime << std::endl;

    auto epoch = service->HumanToEpoch("12/25/2023 16:10", "sydney");
    if (epoch.status != timepuff::StatusCode::Ok) {
        std::cout << "Datetime conversion failed: " << epoch.diagnostics << std::endl;
        return 1;
    }
    std::cout << epoch.input << " (sydney) -> " << epoch.epoch << std::endl;

    auto swet = service->HumanToAltEpoch("2025-09-10-131100");
    std::cout << swet.input << " -> SWET " << swet.swet << std::endl;

    auto info = service->AltEpochInfo();
    if (info.status == timepuff::StatusCode::Ok) {
        std::cout << "Current SWET: " << info.info.currentAltEpoch
                << " (" << info.info.yearsSinceZero << " years)" << std::endl;
    }

    auto rejected = service->HumanToEpoch("not-a-date-at-all");
    std::cout << "Rejected: " << timepuff::StatusName(rejected.status) << std::endl;

    for (const auto &sample: service->Telemetry().Drain()) {
        std::cout << "[" << sample.sequence << "] " << sample.channel << " "
                << timepuff::StatusName(sample.status) << " " << sample.detail << std::endl;
    }
    return 0;
}
