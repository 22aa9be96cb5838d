#include <mediasync/sync/subtitle_sync.h>

#include <spdlog/spdlog.h>

namespace mediasync::sync {

namespace fs = std::filesystem;

SubtitleSync::SubtitleSync(IFileSystem& fs, ITransferEngine& transfer, LanguageLookup languages)
    : fs_(fs), transfer_(transfer), languages_(std::move(languages)) {}

std::vector<SubtitleSync::Job> SubtitleSync::plan(const Settings& settings,
                                                  const std::vector<MediaDescriptor>& mediaList) const {
    std::vector<Job> queue;
    for (const auto& media : mediaList) {
        const auto mediaFile = finalPathFor(settings, media);
        for (const auto& [lang, url] : media.subtitleUrlsByLanguage) {
            const bool selected =
                settings.subtitleLanguages.count(lang) > 0 ||
                (settings.subtitlesForPrimaryLanguage && lang == settings.primaryLanguage);
            if (!selected)
                continue;

            auto iso = languages_ ? languages_(lang) : std::nullopt;
            if (!iso || iso->empty()) {
                spdlog::warn("unknown subtitle language '{}' for {}", lang, media.displayName);
                continue;
            }
            // Some codes carry a regional suffix ("pt_BR"); only the ISO 639 part is used
            const auto isoLang = iso->substr(0, iso->find('_'));

            std::string name = mediaFile.stem().string();
            name += ".";
            name += isoLang;
            name += fs::path(urlBasename(url)).extension().string();
            auto subFile = mediaFile.parent_path() / name;

            if (settings.fixBroken || !fs_.exists(subFile)) {
                queue.push_back(Job{url, std::move(subFile), media.displayName});
            }
        }
    }
    return queue;
}

Result<SubtitleSummary> SubtitleSync::syncAll(const Settings& settings,
                                              const std::vector<MediaDescriptor>& mediaList) {
    SubtitleSummary summary;
    const auto queue = plan(settings, mediaList);
    summary.queued = queue.size();

    for (std::size_t i = 0; i < queue.size(); ++i) {
        const auto& job = queue[i];
        if (settings.normal()) {
            spdlog::info("[{}/{}] downloading: {} ({})", i + 1, queue.size(), urlBasename(job.url),
                         job.mediaName);
        }
        auto r = transfer_.transfer(job.url, job.destination, TransferOptions{});
        if (!r)
            return r.error();
        ++summary.downloaded;
    }
    return summary;
}

} // namespace mediasync::sync
