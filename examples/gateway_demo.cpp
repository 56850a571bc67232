#include <iostream>
#include <string>
#include <thread>
#include <vector>

#include "timepuff/config.h"
#include "timepuff/conversion_counter.h"
#include "timepuff/conversion_service.h"
#include "timepuff/gateway.h"
#include "timepuff/status.h"

// Replays request targets from argv (or a built-in set) through the gateway
// from several threads, then prints each response and the conversion count.
int main(int argc, char **argv) {
    auto config = timepuff::MakeDefaultConfig();
    std::string diagnostics;
    if (timepuff::ApplyEnvironmentOverrides(config, diagnostics) != timepuff::StatusCode::Ok) {
        std::cout << "Ignoring environment overrides: " << diagnostics << std::endl;
    }

    timepuff::ConversionCounter counter(config.counter);
    auto service = timepuff::ConversionService::Create(config, &counter);
    if (!service) {
        std::cout << "Failed to create conversion service" << std::endl;
        return 1;
    }
    timepuff::Gateway gateway(*service, &counter);

    std::vector<std::string> targets;
    for (int i = 1; i < argc; ++i) {
        targets.emplace_back(argv[i]);
    }
    if (targets.empty()) {
        targets = {
            "/api/v1/epoch/1757509860?tz=tokyo",
            "/api/v1/datetime/2025-09-10-131100?tz=America%2FLos_Angeles",
            "/api/v1/swet/1524057060",
            "/curl/v1/datetime-to-swet/202509101311",
            "/curl/v1/swet-info",
            "/curl/v1/epoch/not-a-number",
            "/health",
            "/stats/"
        };
    }

    std::vector<timepuff::HttpResponse> responses(targets.size());
    std::vector<std::thread> workers;
    workers.reserve(targets.size());
    for (std::size_t i = 0; i < targets.size(); ++i) {
        workers.emplace_back([&gateway, &targets, &responses, i]() {
            responses[i] = gateway.Handle(timepuff::HttpRequest{"GET", targets[i]});
        });
    }
    for (auto &worker: workers) {
        worker.join();
    }

    for (std::size_t i = 0; i < targets.size(); ++i) {
        std::cout << "GET " << targets[i] << " -> " << responses[i].status
                << " (" << responses[i].contentType << ")" << std::endl;
        std::cout << responses[i].body << std::endl;
    }
    std::cout << "Conversions recorded: " << counter.Value() << " (" << counter.Path() << ")" << std::endl;

    for (const auto &sample: service->Telemetry().Drain()) {
        std::cout << "[" << sample.sequence << "] " << sample.channel << " "
                << timepuff::StatusName(sample.status) << " " << sample.detail << std::endl;
    }
    return 0;
}
