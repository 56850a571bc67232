#include "timepuff/telemetry.h"

#include <deque>
#include <mutex>
#include <utility>

namespace timepuff::detail {
    namespace {
        class MemoryTelemetry final : public TelemetryHub {
        public:
            explicit MemoryTelemetry(const TelemetryConfig &config)
                : m_Capacity(config.historySize == 0 ? 1 : config.historySize),
                  m_Tracing(config.enableTracing),
                  m_Sequence(0) {
            }

            void PushSample(const TelemetrySample &sample) override {
                std::lock_guard<std::mutex> lock(m_Mutex);
                if (m_Buffer.size() == m_Capacity) {
                    m_Buffer.pop_front();
                }
                m_Buffer.push_back(sample);
                m_Buffer.back().sequence = ++m_Sequence;
            }

            std::vector<TelemetrySample> Drain() override {
                std::lock_guard<std::mutex> lock(m_Mutex);
                std::vector<TelemetrySample> data(std::make_move_iterator(m_Buffer.begin()),
                                                  std::make_move_iterator(m_Buffer.end()));
                m_Buffer.clear();
                return data;
            }

            bool TracingEnabled() const noexcept override {
                return m_Tracing;
            }

        private:
            std::size_t m_Capacity;
            bool m_Tracing;
            std::uint64_t m_Sequence;
            std::deque<TelemetrySample> m_Buffer;
            std::mutex m_Mutex;
        };
    }

    std::unique_ptr<TelemetryHub> CreateMemoryTelemetry(const TelemetryConfig &config) {
        return std::make_unique<MemoryTelemetry>(config);
    }
}
