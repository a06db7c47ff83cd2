/**
 * @file AppSettings.cpp
 *
 * @copyright Copyright (c) 2024 Baresha Project
 * @license GPL-3.0-or-later
 */

#include "baresha/app/AppSettings.h"
#include "baresha/core/Errors.h"
#include "baresha/engine/FormatSelector.h"
#include "baresha/persistence/PersistenceManager.h"

#include <cmath>
#include <limits>

#include <QDebug>
#include <QDir>
#include <QStandardPaths>

namespace Baresha {

AppSettings AppSettings::defaults() {
    AppSettings settings;
    settings.downloadPath = QStandardPaths::writableLocation(QStandardPaths::DownloadLocation);
    if (settings.downloadPath.isEmpty()) {
        settings.downloadPath = QDir::homePath() + QStringLiteral("/Downloads");
    }
    settings.defaultQuality = QString::fromLatin1(FormatSelector::DEFAULT_QUALITY);
    settings.defaultFormat = QString::fromLatin1(FormatSelector::DEFAULT_FORMAT);
    return settings;
}

AppSettings AppSettings::load(PersistenceManager& persistence) {
    AppSettings settings = defaults();

    auto value = [&persistence](const char* key) {
        return persistence.loadSetting(QString::fromLatin1(key));
    };

    if (const QString path = value(SettingsKeys::DOWNLOAD_PATH); !path.isEmpty()) {
        settings.downloadPath = path;
    }
    if (const auto quality = FormatSelector::normalizeQuality(value(SettingsKeys::DEFAULT_QUALITY))) {
        settings.defaultQuality = *quality;
    }
    if (const auto format = FormatSelector::normalizeFormat(value(SettingsKeys::DEFAULT_FORMAT))) {
        settings.defaultFormat = *format;
    }

    if (const QString limit = value(SettingsKeys::SPEED_LIMIT); !limit.isEmpty()) {
        try {
            settings.speedLimit = parseRate(limit);
        } catch (const RateLimitConfigError& e) {
            qWarning() << "AppSettings: Ignoring stored speed limit:" << e.message();
        }
    }

    bool ok = false;
    const qint64 timeoutMs = value(SettingsKeys::RESOLVE_TIMEOUT).toLongLong(&ok);
    if (ok && timeoutMs > 0) {
        settings.resolveTimeout = Duration(timeoutMs);
    }

    settings.ytDlpPath = value(SettingsKeys::YTDLP_PATH);
    settings.ffmpegPath = value(SettingsKeys::FFMPEG_PATH);
    return settings;
}

void AppSettings::save(PersistenceManager& persistence) const {
    persistence.saveSetting(QString::fromLatin1(SettingsKeys::DOWNLOAD_PATH), downloadPath);
    persistence.saveSetting(QString::fromLatin1(SettingsKeys::DEFAULT_QUALITY), defaultQuality);
    persistence.saveSetting(QString::fromLatin1(SettingsKeys::DEFAULT_FORMAT), defaultFormat);
    persistence.saveSetting(QString::fromLatin1(SettingsKeys::SPEED_LIMIT), QString::number(speedLimit));
    persistence.saveSetting(QString::fromLatin1(SettingsKeys::RESOLVE_TIMEOUT),
                            QString::number(resolveTimeout.count()));
    persistence.saveSetting(QString::fromLatin1(SettingsKeys::YTDLP_PATH), ytDlpPath);
    persistence.saveSetting(QString::fromLatin1(SettingsKeys::FFMPEG_PATH), ffmpegPath);
    qDebug() << "AppSettings: Saved";
}

ByteCount AppSettings::parseRate(const QString& text) {
    QString value = text.trimmed().toUpper();
    if (value.endsWith(QLatin1String("/S"))) {
        value.chop(2);
    }
    if (value.endsWith(QLatin1Char('B'))) {
        value.chop(1);
    }

    double multiplier = 1.0;
    if (!value.isEmpty()) {
        switch (value.back().toLatin1()) {
            case 'K': multiplier = 1024.0; break;
            case 'M': multiplier = 1024.0 * 1024.0; break;
            case 'G': multiplier = 1024.0 * 1024.0 * 1024.0; break;
            default: break;
        }
        if (multiplier > 1.0) {
            value.chop(1);
        }
    }

    bool ok = false;
    const double number = value.trimmed().toDouble(&ok);
    if (!ok || !std::isfinite(number)) {
        throw RateLimitConfigError(QStringLiteral("Invalid rate \"%1\"").arg(text));
    }
    if (number < 0) {
        throw RateLimitConfigError(QStringLiteral("Rate must not be negative: %1").arg(text));
    }
    const double bytes = number * multiplier;
    // 2^63 as a double; anything at or above it does not fit a ByteCount
    if (bytes >= static_cast<double>(std::numeric_limits<ByteCount>::max())) {
        throw RateLimitConfigError(QStringLiteral("Rate is out of range: %1").arg(text));
    }
    return static_cast<ByteCount>(std::llround(bytes));
}

} // namespace Baresha
