#pragma once

#include <mediasync/core/types.h>
#include <mediasync/sync/sync.hpp>

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mediasync::catalog {

/**
 * Media catalog: the list of items to mirror plus the language tag table
 * used to name subtitle files.
 */
struct Catalog {
    std::vector<sync::MediaDescriptor> media;
    std::map<std::string, std::string> languages; // tag -> iso639[_suffix]

    // Lookup over `languages`; the returned callable references this catalog
    [[nodiscard]] sync::LanguageLookup languageLookup() const;
};

// Parse "1700000000" or "2023-11-14T22:13:20Z" into a UTC time point
std::optional<TimePoint> parseCatalogDate(std::string_view text);

Result<Catalog> parseCatalog(std::string_view json);
Result<Catalog> loadCatalog(const std::filesystem::path& path);

} // namespace mediasync::catalog
