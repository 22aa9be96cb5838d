#include <mediasync/config/config_helpers.h>
#include <mediasync/config/settings_loader.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <system_error>

namespace mediasync::config {

namespace {

Error invalid(const std::string& key, const std::string& value) {
    return Error{ErrorCode::InvalidArgument,
                 "Invalid value for sync." + key + ": '" + value + "'"};
}

Result<double> parse_number(const std::string& key, const std::string& value) {
    try {
        std::size_t pos = 0;
        double v = std::stod(value, &pos);
        if (pos != value.size() || v < 0.0)
            return invalid(key, value);
        return v;
    } catch (const std::exception&) {
        return invalid(key, value);
    }
}

Result<int> parse_int(const std::string& key, const std::string& value) {
    int v = 0;
    auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), v);
    if (ec != std::errc() || ptr != value.data() + value.size() || v < 0)
        return invalid(key, value);
    return v;
}

std::string normalize_extension(std::string ext) {
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (!ext.empty() && ext.front() != '.')
        ext.insert(ext.begin(), '.');
    return ext;
}

} // namespace

Result<void> applySettings(const std::map<std::string, std::string>& values,
                           sync::Settings& settings) {
    for (const auto& [key, value] : values) {
        if (key == "media_dir") {
            settings.mediaDir = expand_tilde(value);
        } else if (key == "keep_free_mib") {
            auto v = parse_number(key, value);
            if (!v)
                return v.error();
            settings.keepFreeBytes = static_cast<std::uint64_t>(v.value() * MiB);
        } else if (key == "rate_limit_mbps") {
            auto v = parse_number(key, value);
            if (!v)
                return v.error();
            settings.rateLimitMBps = v.value();
        } else if (key == "checksums" || key == "fix_broken" || key == "warning") {
            bool b = false;
            if (!parse_bool(value, b))
                return invalid(key, value);
            if (key == "checksums")
                settings.verifyChecksums = b;
            else if (key == "fix_broken")
                settings.fixBroken = b;
            else
                settings.diskWarning = b;
        } else if (key == "quiet") {
            auto v = parse_int(key, value);
            if (!v)
                return v.error();
            settings.quiet = v.value();
        } else if (key == "subtitles") {
            bool b = false;
            if (parse_bool(value, b)) {
                settings.subtitlesForPrimaryLanguage = b;
            } else {
                for (auto& lang : parse_list(value))
                    settings.subtitleLanguages.insert(lang);
            }
        } else if (key == "language") {
            if (value.empty())
                return invalid(key, value);
            settings.primaryLanguage = value;
        } else if (key == "import_dir") {
            if (!value.empty())
                settings.importDir = expand_tilde(value);
        } else if (key == "extensions") {
            std::set<std::string> exts;
            for (auto& e : parse_list(value))
                exts.insert(normalize_extension(e));
            if (exts.empty())
                return invalid(key, value);
            settings.mediaExtensions = std::move(exts);
        } else {
            spdlog::debug("ignoring unknown config key sync.{}", key);
        }
    }
    return Result<void>{};
}

Result<sync::Settings> loadSettings(const std::filesystem::path& configPath) {
    sync::Settings settings;

    std::error_code ec;
    if (!std::filesystem::exists(configPath, ec)) {
        spdlog::debug("no config file at {}", configPath.string());
        return settings;
    }

    auto r = applySettings(parse_config_section(configPath, "sync"), settings);
    if (!r)
        return r.error();
    return settings;
}

} // namespace mediasync::config
