/**
 * @file FormatSelector.h
 * @brief Quality/format presets and their yt-dlp translation
 *
 * @copyright Copyright (c) 2024 Baresha Project
 * @license GPL-3.0-or-later
 */

#pragma once

#include "baresha/core/Types.h"

#include <optional>

#include <QString>
#include <QStringList>

namespace Baresha {

/**
 * @brief One parsed line of yt-dlp's machine-readable progress output
 */
struct YtDlpProgress {
    ByteCount downloadedBytes = 0;
    std::optional<ByteCount> totalBytes;
    SpeedBps speed = 0.0;
};

/**
 * @class FormatSelector
 * @brief Maps user-facing quality/format choices to engine arguments
 *
 * Quality presets: 2160p, 1440p, 1080p, 720p, 480p, 360p, best.
 * Format presets: mp4, webm (video), mp3, m4a, aac (audio), best.
 * Both accept their long display labels ("1080p Full HD", "MP3 Audio"...).
 */
class FormatSelector {
public:
    static constexpr const char* DEFAULT_QUALITY = "best";
    static constexpr const char* DEFAULT_FORMAT = "mp4";
    static constexpr int AUDIO_BITRATE_KBPS = 192;

    /// Marker prefixed to every progress line requested with --progress-template
    static constexpr const char* PROGRESS_MARKER = "BARESHA";

    static QStringList qualityPresets();
    static QStringList formatPresets();

    /// @return Canonical preset name, or nullopt for unknown input
    static std::optional<QString> normalizeQuality(const QString& quality);
    static std::optional<QString> normalizeFormat(const QString& format);

    static bool isAudioFormat(const QString& format);

    /// @return Height cap for a quality preset, nullopt for "best"/unknown
    static std::optional<int> maxHeight(const QString& quality);

    /**
     * @brief yt-dlp -f selector for a quality/format pair
     *
     * Unknown quality falls back to best.
     */
    static QString formatSelector(const QString& quality, const QString& format);

    /**
     * @brief Format-related yt-dlp arguments (-f, audio extraction, merge container)
     */
    static QStringList ytDlpArguments(const QString& quality, const QString& format);

    /// Value for --progress-template
    static QString progressTemplate();

    /// Parse one stdout line produced by progressTemplate()
    static std::optional<YtDlpProgress> parseProgressLine(const QString& line);

    /**
     * @brief Extract the output file from "[download] Destination: ...",
     *        "[Merger] Merging formats into ..." or "[ExtractAudio] Destination: ..." lines
     */
    static std::optional<QString> parseDestinationLine(const QString& line);
};

} // namespace Baresha
