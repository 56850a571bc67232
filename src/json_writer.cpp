#include "json_writer.h"

#include <cmath>
#include <cstdio>

namespace timepuff::detail {
    namespace {
        void AppendControlEscape(unsigned char ch, std::string &out) {
            static const char kHex[] = "0123456789ABCDEF";
            char buffer[6] = {'\\', 'u', '0', '0', kHex[(ch >> 4) & 0x0F], kHex[ch & 0x0F]};
            out.append(buffer, buffer + 6);
        }
    }

    void AppendEscapedString(std::string_view text, std::string &out) {
        out.push_back('"');
        for (char c: text) {
            auto ch = static_cast<unsigned char>(c);
            switch (ch) {
                case '"':
                    out.append("\\\"");
                    continue;
                case '\\':
                    out.append("\\\\");
                    continue;
                case '\b':
                    out.append("\\b");
                    continue;
                case '\f':
                    out.append("\\f");
                    continue;
                case '\n':
                    out.append("\\n");
                    continue;
                case '\r':
                    out.append("\\r");
                    continue;
                case '\t':
                    out.append("\\t");
                    continue;
                default:
                    break;
            }
            if (ch <= 0x1F) {
                AppendControlEscape(ch, out);
                continue;
            }
            out.push_back(c);
        }
        out.push_back('"');
    }

    JsonObjectWriter::JsonObjectWriter() : m_Buffer("{"), m_First(true) {
    }

    JsonObjectWriter &JsonObjectWriter::Field(std::string_view key, std::string_view value) {
        AppendKey(key);
        AppendEscapedString(value, m_Buffer);
        return *this;
    }

    JsonObjectWriter &JsonObjectWriter::Field(std::string_view key, std::int64_t value) {
        AppendKey(key);
        m_Buffer += std::to_string(value);
        return *this;
    }

    JsonObjectWriter &JsonObjectWriter::Field(std::string_view key, std::uint64_t value) {
        AppendKey(key);
        m_Buffer += std::to_string(value);
        return *this;
    }

    JsonObjectWriter &JsonObjectWriter::Field(std::string_view key, double value, int fractionDigits) {
        AppendKey(key);
        if (!std::isfinite(value)) {
            m_Buffer += "null";
            return *this;
        }
        char buffer[64];
        const int written = std::snprintf(buffer, sizeof(buffer), "%.*f", fractionDigits, value);
        if (written <= 0 || static_cast<std::size_t>(written) >= sizeof(buffer)) {
            m_Buffer += "null";
            return *this;
        }
        m_Buffer.append(buffer, static_cast<std::size_t>(written));
        return *this;
    }

    std::string JsonObjectWriter::Finish() {
        m_Buffer.push_back('}');
        std::string out;
        out.swap(m_Buffer);
        m_Buffer = "{";
        m_First = true;
        return out;
    }

    void JsonObjectWriter::AppendKey(std::string_view key) {
        if (!m_First) {
            m_Buffer.push_back(',');
        }
        m_First = false;
        AppendEscapedString(key, m_Buffer);
        m_Buffer.push_back(':');
    }
}
