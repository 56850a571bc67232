#include "timepuff/conversion_counter.h"

#include <charconv>
#include <fstream>
#include <iterator>
#include <string_view>
#include <system_error>

namespace timepuff {

namespace {
    std::uint64_t ReadStoredValue(const std::string &path) {
        std::ifstream input(path);
        if (!input) {
            return 0;
        }
        std::string contents((std::istreambuf_iterator<char>(input)), std::istreambuf_iterator<char>());
        std::string_view text(contents);
        while (!text.empty() && (text.back() == '\n' || text.back() == '\r' || text.back() == ' ')) {
            text.remove_suffix(1);
        }
        while (!text.empty() && text.front() == ' ') {
            text.remove_prefix(1);
        }
        std::uint64_t value = 0;
        auto [end, error] = std::from_chars(text.data(), text.data() + text.size(), value);
        if (text.empty() || error != std::errc() || end != text.data() + text.size()) {
            return 0;
        }
        return value;
    }
}

ConversionCounter::ConversionCounter(const CounterConfig &config)
    : m_Path(config.statsFile),
      m_Persist(config.persist && !config.statsFile.empty()),
      m_Value(0) {
    if (m_Persist) {
        m_Value.store(ReadStoredValue(m_Path), std::memory_order_release);
    }
}

StatusCode ConversionCounter::Increment() {
    std::lock_guard<std::mutex> lock(m_Mutex);
    const auto next = m_Value.load(std::memory_order_relaxed) + 1;
    m_Value.store(next, std::memory_order_release);
    if (!m_Persist) {
        return StatusCode::Ok;
    }
    return WriteLocked(next);
}

StatusCode ConversionCounter::OnConversion() {
    return Increment();
}

std::uint64_t ConversionCounter::Value() const noexcept {
    return m_Value.load(std::memory_order_acquire);
}

StatusCode ConversionCounter::Reload() {
    std::lock_guard<std::mutex> lock(m_Mutex);
    if (!m_Persist) {
        return StatusCode::Ok;
    }
    m_Value.store(ReadStoredValue(m_Path), std::memory_order_release);
    return StatusCode::Ok;
}

const std::string &ConversionCounter::Path() const noexcept {
    return m_Path;
}

StatusCode ConversionCounter::WriteLocked(std::uint64_t value) const {
    std::ofstream output(m_Path, std::ios::out | std::ios::trunc);
    if (!output) {
        return StatusCode::IoError;
    }
    output << value;
    output.flush();
    return output ? StatusCode::Ok : StatusCode::IoError;
}

}
