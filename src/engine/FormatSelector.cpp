/**
 * @file FormatSelector.cpp
 * @brief Preset tables and yt-dlp argument construction
 *
 * @copyright Copyright (c) 2024 Baresha Project
 * @license GPL-3.0-or-later
 */

#include "baresha/engine/FormatSelector.h"

#include <QRegularExpression>

namespace Baresha {

namespace {

struct Preset {
    const char* name;
    const char* label;
    int height;     // 0 = no cap
};

constexpr Preset QUALITY_PRESETS[] = {
    {"2160p", "4K Ultra HD", 2160},
    {"1440p", "2K QHD", 1440},
    {"1080p", "1080p Full HD", 1080},
    {"720p", "720p HD", 720},
    {"480p", "480p SD", 480},
    {"360p", "360p", 360},
    {"best", "Best Quality", 0},
};

struct FormatPreset {
    const char* name;
    const char* label;
    bool audio;
};

constexpr FormatPreset FORMAT_PRESETS[] = {
    {"mp4", "MP4 Video", false},
    {"webm", "WebM Video", false},
    {"mp3", "MP3 Audio", true},
    {"m4a", "M4A Audio", true},
    {"aac", "AAC Audio", true},
    {"best", "Best Format", false},
};

} // namespace

QStringList FormatSelector::qualityPresets() {
    QStringList names;
    for (const auto& preset : QUALITY_PRESETS) {
        names << QString::fromLatin1(preset.name);
    }
    return names;
}

QStringList FormatSelector::formatPresets() {
    QStringList names;
    for (const auto& preset : FORMAT_PRESETS) {
        names << QString::fromLatin1(preset.name);
    }
    return names;
}

std::optional<QString> FormatSelector::normalizeQuality(const QString& quality) {
    const QString key = quality.trimmed();
    if (key.isEmpty()) {
        return QString::fromLatin1(DEFAULT_QUALITY);
    }

    for (const auto& preset : QUALITY_PRESETS) {
        if (key.compare(QLatin1String(preset.name), Qt::CaseInsensitive) == 0 ||
            key.compare(QLatin1String(preset.label), Qt::CaseInsensitive) == 0) {
            return QString::fromLatin1(preset.name);
        }
    }

    // Shorthands: "4k", "2k", "1080"
    if (key.compare(QLatin1String("4k"), Qt::CaseInsensitive) == 0) return QStringLiteral("2160p");
    if (key.compare(QLatin1String("2k"), Qt::CaseInsensitive) == 0) return QStringLiteral("1440p");
    bool ok = false;
    const int height = key.toInt(&ok);
    if (ok) {
        for (const auto& preset : QUALITY_PRESETS) {
            if (preset.height == height) {
                return QString::fromLatin1(preset.name);
            }
        }
    }
    return std::nullopt;
}

std::optional<QString> FormatSelector::normalizeFormat(const QString& format) {
    const QString key = format.trimmed();
    if (key.isEmpty()) {
        return QString::fromLatin1(DEFAULT_FORMAT);
    }

    for (const auto& preset : FORMAT_PRESETS) {
        if (key.compare(QLatin1String(preset.name), Qt::CaseInsensitive) == 0 ||
            key.compare(QLatin1String(preset.label), Qt::CaseInsensitive) == 0) {
            return QString::fromLatin1(preset.name);
        }
    }
    return std::nullopt;
}

bool FormatSelector::isAudioFormat(const QString& format) {
    const auto normalized = normalizeFormat(format);
    if (!normalized) {
        return false;
    }
    for (const auto& preset : FORMAT_PRESETS) {
        if (*normalized == QLatin1String(preset.name)) {
            return preset.audio;
        }
    }
    return false;
}

std::optional<int> FormatSelector::maxHeight(const QString& quality) {
    const auto normalized = normalizeQuality(quality);
    if (!normalized) {
        return std::nullopt;
    }
    for (const auto& preset : QUALITY_PRESETS) {
        if (*normalized == QLatin1String(preset.name) && preset.height > 0) {
            return preset.height;
        }
    }
    return std::nullopt;
}

QString FormatSelector::formatSelector(const QString& quality, const QString& format) {
    if (isAudioFormat(format)) {
        return QStringLiteral("bestaudio/best");
    }

    const auto height = maxHeight(quality);
    if (!height) {
        return QStringLiteral("best");
    }

    const QString cap = QStringLiteral("[height<=%1]").arg(*height);
    const QString container = normalizeFormat(format).value_or(QString::fromLatin1(DEFAULT_FORMAT));

    if (container == QLatin1String("webm")) {
        return QStringLiteral("bestvideo%1[ext=webm]+bestaudio[ext=webm]/best%1/best").arg(cap);
    }
    if (container == QLatin1String("best")) {
        return QStringLiteral("bestvideo%1+bestaudio/best%1/best").arg(cap);
    }
    return QStringLiteral("bestvideo%1[ext=mp4]+bestaudio[ext=m4a]/best%1/best").arg(cap);
}

QStringList FormatSelector::ytDlpArguments(const QString& quality, const QString& format) {
    QStringList args = {QStringLiteral("-f"), formatSelector(quality, format)};

    const QString container = normalizeFormat(format).value_or(QString::fromLatin1(DEFAULT_FORMAT));
    if (isAudioFormat(container)) {
        args << QStringLiteral("--extract-audio")
             << QStringLiteral("--audio-format") << container
             << QStringLiteral("--audio-quality") << QStringLiteral("%1K").arg(AUDIO_BITRATE_KBPS);
    } else if (container != QLatin1String("best")) {
        args << QStringLiteral("--merge-output-format") << container;
    }
    return args;
}

// ═══════════════════════════════════════════════════════════════════════════════
// Output Parsing
// ═══════════════════════════════════════════════════════════════════════════════

QString FormatSelector::progressTemplate() {
    return QStringLiteral("download:%1 %(progress.downloaded_bytes)s %(progress.total_bytes)s "
                          "%(progress.total_bytes_estimate)s %(progress.speed)s")
        .arg(QLatin1String(PROGRESS_MARKER));
}

std::optional<YtDlpProgress> FormatSelector::parseProgressLine(const QString& line) {
    const QStringList parts = line.trimmed().split(QLatin1Char(' '), Qt::SkipEmptyParts);
    if (parts.size() < 5 || parts.at(0) != QLatin1String(PROGRESS_MARKER)) {
        return std::nullopt;
    }

    // Missing fields are printed as "NA"
    auto number = [](const QString& text) -> std::optional<double> {
        bool ok = false;
        const double value = text.toDouble(&ok);
        if (!ok || value < 0) return std::nullopt;
        return value;
    };

    const auto downloaded = number(parts.at(1));
    if (!downloaded) {
        return std::nullopt;
    }

    YtDlpProgress progress;
    progress.downloadedBytes = static_cast<ByteCount>(*downloaded);
    if (const auto total = number(parts.at(2)); total && *total > 0) {
        progress.totalBytes = static_cast<ByteCount>(*total);
    } else if (const auto estimate = number(parts.at(3)); estimate && *estimate > 0) {
        progress.totalBytes = static_cast<ByteCount>(*estimate);
    }
    progress.speed = number(parts.at(4)).value_or(0.0);
    return progress;
}

std::optional<QString> FormatSelector::parseDestinationLine(const QString& line) {
    static const QRegularExpression destinationRegex(
        QStringLiteral("^\\[(?:download|ExtractAudio)\\]\\s+Destination:\\s+(.+)$"));
    static const QRegularExpression mergerRegex(
        QStringLiteral("^\\[Merger\\]\\s+Merging formats into \"(.+)\"$"));
    static const QRegularExpression alreadyRegex(
        QStringLiteral("^\\[download\\]\\s+(.+) has already been downloaded"));

    const QString trimmed = line.trimmed();
    for (const auto* regex : {&mergerRegex, &destinationRegex, &alreadyRegex}) {
        auto match = regex->match(trimmed);
        if (match.hasMatch()) {
            return match.captured(1).trimmed();
        }
    }
    return std::nullopt;
}

} // namespace Baresha
