#pragma once

#include <mediasync/core/types.h>
#include <mediasync/sync/sync.hpp>

#include <filesystem>
#include <map>
#include <string>

namespace mediasync::config {

/**
 * Read the [sync] section of a config.toml into Settings.
 *
 * A missing file yields default Settings. Keys that are present but cannot be parsed
 * (non-numeric sizes, unknown booleans) yield InvalidArgument naming the key.
 */
Result<sync::Settings> loadSettings(const std::filesystem::path& configPath);

/**
 * Apply [sync] keys on top of an existing Settings value.
 */
Result<void> applySettings(const std::map<std::string, std::string>& values,
                           sync::Settings& settings);

} // namespace mediasync::config
