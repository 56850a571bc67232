#include "timepuff/engine/modules/timezone_resolver.h"

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <initializer_list>
#include <unordered_map>
#include <utility>
#include <vector>

namespace timepuff::engine {
    namespace {
        constexpr std::string_view kName = "TimezoneResolver";
        constexpr std::string_view kSummary =
                "Normalizes zone abbreviations and friendly names to canonical zone identifiers.";

        struct ZoneAlias {
            std::string_view key;
            std::string_view zoneId;
        };

        constexpr std::array<ZoneAlias, 38> kZoneAliases{ {
            {"pacific", "America/Los_Angeles"},
            {"pt", "America/Los_Angeles"},
            {"pst", "America/Los_Angeles"},
            {"pdt", "America/Los_Angeles"},
            {"eastern", "America/New_York"},
            {"et", "America/New_York"},
            {"est", "America/New_York"},
            {"edt", "America/New_York"},
            {"central", "America/Chicago"},
            {"ct", "America/Chicago"},
            {"cst", "America/Chicago"},
            {"cdt", "America/Chicago"},
            {"mountain", "America/Denver"},
            {"mt", "America/Denver"},
            {"mst", "America/Denver"},
            {"mdt", "America/Denver"},
            {"moscow", "Europe/Moscow"},
            {"msk", "Europe/Moscow"},
            {"london", "Europe/London"},
            {"gmt", "Europe/London"},
            {"paris", "Europe/Paris"},
            {"cet", "Europe/Paris"},
            {"berlin", "Europe/Berlin"},
            {"tokyo", "Asia/Tokyo"},
            {"jst", "Asia/Tokyo"},
            {"shanghai", "Asia/Shanghai"},
            {"dubai", "Asia/Dubai"},
            {"gst", "Asia/Dubai"},
            {"mumbai", "Asia/Kolkata"},
            {"ist", "Asia/Kolkata"},
            {"sydney", "Australia/Sydney"},
            {"aest", "Australia/Sydney"},
            {"auckland", "Pacific/Auckland"},
            {"nzst", "Pacific/Auckland"},
            {"utc", "UTC"},
            {"zulu", "UTC"},
            {"etc/utc", "Etc/UTC"},
            {"etc/gmt", "Etc/GMT"}
        } };

        std::string_view Trim(std::string_view text) noexcept {
            auto isSpace = [](char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; };
            while (!text.empty() && isSpace(text.front())) {
                text.remove_prefix(1);
            }
            while (!text.empty() && isSpace(text.back())) {
                text.remove_suffix(1);
            }
            return text;
        }

        std::string ToLower(std::string_view text) {
            std::string lowered(text);
            std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
                return static_cast<char>(std::tolower(c));
            });
            return lowered;
        }

        std::string ToUpper(std::string_view text) {
            std::string upper(text);
            std::transform(upper.begin(), upper.end(), upper.begin(), [](unsigned char c) {
                return static_cast<char>(std::toupper(c));
            });
            return upper;
        }

        // "america/los_angeles" -> "America/Los_Angeles"
        std::string ConventionalCase(std::string_view lowered) {
            std::string cased(lowered);
            bool wordStart = true;
            for (auto &c: cased) {
                if (c == '/' || c == '_' || c == '-') {
                    wordStart = true;
                    continue;
                }
                if (wordStart) {
                    c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
                }
                wordStart = false;
            }
            return cased;
        }

        using ZoneIndex = std::unordered_map<std::string, std::string>;

        bool HasZoneInfoMagic(const std::filesystem::path &path) {
            std::ifstream input(path, std::ios::binary);
            char magic[4] = {};
            return input.read(magic, sizeof(magic)) && std::string_view(magic, sizeof(magic)) == "TZif";
        }

        // Same root the abseil loader reads: TZDIR, else /usr/share/zoneinfo.
        std::filesystem::path ZoneInfoRoot() {
            const char *tzdir = std::getenv("TZDIR");
            return std::filesystem::path(tzdir != nullptr && *tzdir != '\0' ? tzdir : "/usr/share/zoneinfo");
        }

        // Lower-cased zone id -> id as spelled on disk. The posix/ and right/
        // mirrors repeat every zone and are skipped.
        ZoneIndex BuildZoneIndex() {
            namespace fs = std::filesystem;
            ZoneIndex index;
            const auto root = ZoneInfoRoot();
            std::error_code ec;
            fs::recursive_directory_iterator it(root, ec);
            const fs::recursive_directory_iterator end;
            while (!ec && it != end) {
                const auto relative = it->path().lexically_relative(root).generic_string();
                std::error_code entryError;
                if (it.depth() == 0 && it->is_directory(entryError) && (relative == "posix" || relative == "right")) {
                    it.disable_recursion_pending();
                } else if (it->is_regular_file(entryError) && HasZoneInfoMagic(it->path())) {
                    index.emplace(ToLower(relative), relative);
                }
                it.increment(ec);
            }
            return index;
        }

        const ZoneIndex &CaseFoldedZones() {
            static const ZoneIndex index = BuildZoneIndex();
            return index;
        }
    }

    ZoneResolution ZoneResolution::NotRequested() {
        return ZoneResolution{Kind::NotRequested, {}, absl::UTCTimeZone()};
    }

    ZoneResolution ZoneResolution::Unresolved() {
        return ZoneResolution{Kind::Unresolved, {}, absl::UTCTimeZone()};
    }

    ZoneResolution ZoneResolution::Resolved(std::string zoneId, absl::TimeZone zone) {
        return ZoneResolution{Kind::Resolved, std::move(zoneId), zone};
    }

    TimezoneResolver::Metrics::Metrics() noexcept
        : lookups(0),
          aliasHits(0),
          databaseHits(0),
          unresolved(0) {
    }

    TimezoneResolver::TimezoneResolver() : m_Metrics() {
    }

    std::string_view TimezoneResolver::Name() const noexcept {
        return kName;
    }

    std::string_view TimezoneResolver::Summary() const noexcept {
        return kSummary;
    }

    std::string_view TimezoneResolver::LookupAlias(std::string_view loweredKey) noexcept {
        for (const auto &alias: kZoneAliases) {
            if (alias.key == loweredKey) {
                return alias.zoneId;
            }
        }
        return {};
    }

    ZoneResolution TimezoneResolver::Resolve(std::string_view token) const {
        auto trimmed = Trim(token);
        if (trimmed.empty()) {
            return ZoneResolution::NotRequested();
        }
        m_Metrics.lookups.fetch_add(1, std::memory_order_relaxed);

        auto lowered = ToLower(trimmed);
        auto aliasTarget = LookupAlias(lowered);
        if (!aliasTarget.empty()) {
            absl::TimeZone zone;
            std::string zoneId(aliasTarget);
            if (TryLoad(zoneId, zone)) {
                m_Metrics.aliasHits.fetch_add(1, std::memory_order_relaxed);
                return ZoneResolution::Resolved(std::move(zoneId), zone);
            }
            m_Metrics.unresolved.fetch_add(1, std::memory_order_relaxed);
            return ZoneResolution::Unresolved();
        }

        if (!IsPlausibleZoneName(trimmed)) {
            m_Metrics.unresolved.fetch_add(1, std::memory_order_relaxed);
            return ZoneResolution::Unresolved();
        }

        // The name as supplied wins, then the on-disk spelling of the same id.
        std::vector<std::string> candidates;
        candidates.reserve(4);
        candidates.emplace_back(trimmed);
        const auto &folded = CaseFoldedZones();
        if (auto found = folded.find(lowered); found != folded.end()) {
            candidates.push_back(found->second);
        }
        // Without a readable zoneinfo tree only the common casings can be tried.
        for (auto variant: {ConventionalCase(lowered), ToUpper(lowered)}) {
            if (std::find(candidates.begin(), candidates.end(), variant) == candidates.end()) {
                candidates.push_back(std::move(variant));
            }
        }

        for (auto &candidate: candidates) {
            absl::TimeZone zone;
            if (TryLoad(candidate, zone)) {
                m_Metrics.databaseHits.fetch_add(1, std::memory_order_relaxed);
                return ZoneResolution::Resolved(std::move(candidate), zone);
            }
        }
        m_Metrics.unresolved.fetch_add(1, std::memory_order_relaxed);
        return ZoneResolution::Unresolved();
    }

    const TimezoneResolver::Metrics &TimezoneResolver::GetMetrics() const noexcept {
        return m_Metrics;
    }

    bool TimezoneResolver::IsPlausibleZoneName(std::string_view name) {
        if (name.empty() || name.front() == '/' || name.front() == '-' || name.size() > 64) {
            return false;
        }
        for (char c: name) {
            const bool allowed = std::isalnum(static_cast<unsigned char>(c)) != 0
                                 || c == '/' || c == '_' || c == '-' || c == '+';
            if (!allowed) {
                return false;
            }
        }
        // Loader pseudo-zones, not tzdata identifiers.
        auto lowered = ToLower(name);
        if (lowered == "localtime" || lowered.rfind("fixed/", 0) == 0) {
            return false;
        }
        return true;
    }

    bool TimezoneResolver::TryLoad(const std::string &name, absl::TimeZone &outZone) {
        return absl::LoadTimeZone(name, &outZone);
    }
}
