#include <mediasync/catalog/catalog.h>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <charconv>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <fstream>
#include <sstream>

namespace mediasync::catalog {

using json = nlohmann::json;

namespace {

// Largest epoch magnitude a TimePoint can hold without overflowing its duration
const std::int64_t kMaxEpochSeconds =
    std::chrono::duration_cast<std::chrono::seconds>(TimePoint::duration::max()).count();

std::optional<TimePoint> from_epoch(std::int64_t secs) {
    if (secs > kMaxEpochSeconds || secs < -kMaxEpochSeconds)
        return std::nullopt;
    return TimePoint{std::chrono::seconds(secs)};
}

std::optional<TimePoint> date_from_json(const json& j) {
    if (j.is_number_unsigned()) {
        auto secs = j.get<std::uint64_t>();
        if (secs > static_cast<std::uint64_t>(kMaxEpochSeconds))
            return std::nullopt;
        return from_epoch(static_cast<std::int64_t>(secs));
    }
    if (j.is_number_integer()) {
        return from_epoch(j.get<std::int64_t>());
    }
    if (j.is_number_float()) {
        auto secs = j.get<double>();
        if (!(secs <= static_cast<double>(kMaxEpochSeconds) &&
              secs >= -static_cast<double>(kMaxEpochSeconds)))
            return std::nullopt;
        return from_epoch(static_cast<std::int64_t>(secs));
    }
    if (j.is_string()) {
        return parseCatalogDate(j.get<std::string>());
    }
    return std::nullopt;
}

Result<sync::MediaDescriptor> media_from_json(const json& j, std::size_t index) {
    if (!j.is_object() || !j.contains("url") || !j["url"].is_string()) {
        return Error{ErrorCode::InvalidData,
                     "media[" + std::to_string(index) + "]: missing \"url\""};
    }

    sync::MediaDescriptor m;
    m.url = j["url"].get<std::string>();
    m.filename = j.value("filename", std::string{});
    if (m.filename.empty())
        m.filename = sync::urlBasename(m.url);
    if (m.filename.empty()) {
        return Error{ErrorCode::InvalidData,
                     "media[" + std::to_string(index) + "]: cannot derive a file name from " +
                         m.url};
    }
    // Names are joined onto the destination directory and must stay inside it
    if (m.filename == "." || m.filename == ".." ||
        m.filename.find('\0') != std::string::npos ||
        std::filesystem::path(m.filename).filename() != m.filename) {
        return Error{ErrorCode::InvalidData,
                     "media[" + std::to_string(index) + "]: unsafe file name " + m.filename};
    }
    m.displayName = j.value("name", std::string{});
    if (m.displayName.empty())
        m.displayName = m.filename;

    // A zero size or date means the catalog does not know it
    if (j.contains("size") && j["size"].is_number_unsigned()) {
        auto size = j["size"].get<std::uint64_t>();
        if (size > 0)
            m.expectedSizeBytes = size;
    }
    if (j.contains("md5") && j["md5"].is_string()) {
        auto md5 = j["md5"].get<std::string>();
        if (!md5.empty())
            m.expectedChecksum = std::move(md5);
    }
    if (j.contains("date")) {
        m.publishDate = date_from_json(j["date"]);
        if (m.publishDate && m.publishDate->time_since_epoch().count() == 0) {
            m.publishDate.reset();
        } else if (!m.publishDate) {
            spdlog::debug("unparseable date for {}: {}", m.filename, j["date"].dump());
        }
    }
    if (j.contains("subtitles") && j["subtitles"].is_object()) {
        for (const auto& [tag, url] : j["subtitles"].items()) {
            if (url.is_string())
                m.subtitleUrlsByLanguage[tag] = url.get<std::string>();
        }
    }
    return m;
}

} // namespace

sync::LanguageLookup Catalog::languageLookup() const {
    return [this](const std::string& tag) -> std::optional<std::string> {
        auto it = languages.find(tag);
        if (it == languages.end())
            return std::nullopt;
        return it->second;
    };
}

std::optional<TimePoint> parseCatalogDate(std::string_view text) {
    if (text.empty())
        return std::nullopt;

    std::int64_t epoch = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), epoch);
    if (ec == std::errc() && ptr == text.data() + text.size()) {
        return from_epoch(epoch);
    }
    if (ec == std::errc::result_out_of_range)
        return std::nullopt;

    std::tm tm{};
    std::istringstream in{std::string(text)};
    in >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (in.fail())
        return std::nullopt;
    char zone = 0;
    if (in >> zone && zone != 'Z')
        return std::nullopt;

    auto secs = ::timegm(&tm);
    if (secs == static_cast<time_t>(-1))
        return std::nullopt;
    return std::chrono::system_clock::from_time_t(secs);
}

Result<Catalog> parseCatalog(std::string_view text) {
    json j;
    try {
        j = json::parse(text);
    } catch (const json::parse_error& e) {
        return Error{ErrorCode::InvalidData, std::string("Catalog is not valid JSON: ") + e.what()};
    }
    if (!j.is_object()) {
        return Error{ErrorCode::InvalidData, "Catalog root must be an object"};
    }

    Catalog catalog;
    if (j.contains("languages") && j["languages"].is_object()) {
        for (const auto& [tag, iso] : j["languages"].items()) {
            if (iso.is_string())
                catalog.languages[tag] = iso.get<std::string>();
        }
    }

    if (j.contains("media")) {
        if (!j["media"].is_array()) {
            return Error{ErrorCode::InvalidData, "Catalog \"media\" must be an array"};
        }
        std::size_t index = 0;
        for (const auto& item : j["media"]) {
            auto m = media_from_json(item, index++);
            if (!m)
                return m.error();
            catalog.media.push_back(std::move(m).value());
        }
    }

    return catalog;
}

Result<Catalog> loadCatalog(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return Error{ErrorCode::FileNotFound, "Cannot open catalog: " + path.string()};
    }
    std::ostringstream buf;
    buf << in.rdbuf();
    auto parsed = parseCatalog(buf.str());
    if (parsed) {
        spdlog::debug("catalog {}: {} media item(s), {} language(s)", path.string(),
                      parsed.value().media.size(), parsed.value().languages.size());
    }
    return parsed;
}

} // namespace mediasync::catalog
