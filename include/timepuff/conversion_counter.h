#pragma once

#include <atomic>
#include <cstdint>
#include <mutex>
#include <string>

#include "timepuff/config.h"
#include "timepuff/conversion_service.h"
#include "timepuff/status.h"

namespace timepuff {
    // Process-wide count of successful conversions, persisted as one decimal
    // integer. The file is rewritten in full on every increment.
    class ConversionCounter final : public ConversionSink {
    public:
        explicit ConversionCounter(const CounterConfig &config);

        // Increments in memory first; a failed write is reported but the
        // in-memory count is kept.
        StatusCode Increment();

        StatusCode OnConversion() override;

        std::uint64_t Value() const noexcept;

        // Re-reads the file, replacing the in-memory value. A missing or
        // unparsable file yields zero.
        StatusCode Reload();

        const std::string &Path() const noexcept;

    private:
        std::string m_Path;
        bool m_Persist;
        std::atomic<std::uint64_t> m_Value;
        std::mutex m_Mutex;

        StatusCode WriteLocked(std::uint64_t value) const;
    };
}
