#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace timepuff::detail {
    // Flat JSON object with fields emitted in call order.
    class JsonObjectWriter {
    public:
        JsonObjectWriter();

        JsonObjectWriter &Field(std::string_view key, std::string_view value);
        JsonObjectWriter &Field(std::string_view key, std::int64_t value);
        JsonObjectWriter &Field(std::string_view key, std::uint64_t value);
        JsonObjectWriter &Field(std::string_view key, double value, int fractionDigits);

        std::string Finish();

    private:
        std::string m_Buffer;
        bool m_First;

        void AppendKey(std::string_view key);
    };

    void AppendEscapedString(std::string_view text, std::string &out);
}
