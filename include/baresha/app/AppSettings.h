/**
 * @file AppSettings.h
 * @brief User configuration and its storage in the settings table
 *
 * @copyright Copyright (c) 2024 Baresha Project
 * @license GPL-3.0-or-later
 */

#pragma once

#include "baresha/core/Types.h"

#include <QString>

namespace Baresha {

class PersistenceManager;

struct AppSettings {
    QString downloadPath;
    QString defaultQuality;
    QString defaultFormat;
    ByteCount speedLimit = 0;           ///< bytes/s, 0 = unlimited
    Duration resolveTimeout = Constants::DEFAULT_RESOLVE_TIMEOUT;
    QString ytDlpPath;                  ///< Empty = auto-detect
    QString ffmpegPath;                 ///< Empty = auto-detect

    static AppSettings defaults();

    /// Stored values over defaults; unparsable entries keep the default
    static AppSettings load(PersistenceManager& persistence);
    void save(PersistenceManager& persistence) const;

    /**
     * @brief Parse "500K", "2M", "1.5G" or plain bytes/s (binary units)
     * @throws RateLimitConfigError for negative or malformed input
     */
    static ByteCount parseRate(const QString& text);
};

namespace SettingsKeys {
    constexpr const char* DOWNLOAD_PATH = "download_path";
    constexpr const char* DEFAULT_QUALITY = "default_quality";
    constexpr const char* DEFAULT_FORMAT = "default_format";
    constexpr const char* SPEED_LIMIT = "speed_limit";
    constexpr const char* RESOLVE_TIMEOUT = "resolve_timeout_ms";
    constexpr const char* YTDLP_PATH = "ytdlp_path";
    constexpr const char* FFMPEG_PATH = "ffmpeg_path";
}

} // namespace Baresha
