/**
 * @file YtDlpFetchEngine.cpp
 * @brief yt-dlp process driver
 *
 * @copyright Copyright (c) 2024 Baresha Project
 * @license GPL-3.0-or-later
 */

#include "baresha/engine/YtDlpFetchEngine.h"
#include "baresha/core/Errors.h"
#include "baresha/core/RateLimiter.h"
#include "baresha/engine/FormatSelector.h"

#include <algorithm>
#include <cmath>

#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QProcess>
#include <QStandardPaths>

namespace Baresha {

namespace {

constexpr int START_TIMEOUT_MS = 5000;
constexpr int STOP_TIMEOUT_MS = 3000;

QString findExecutable(const QString& name) {
    QString found = QStandardPaths::findExecutable(name);
    if (!found.isEmpty()) {
        return found;
    }

#ifdef Q_OS_WIN
    const QStringList candidates = {name + QStringLiteral(".exe")};
    const QStringList paths = {
        QDir::homePath() + QStringLiteral("/AppData/Local/Programs/") + name,
        QStringLiteral("C:/Program Files/") + name,
        QStringLiteral("C:/") + name,
    };
#else
    const QStringList candidates = {name};
    const QStringList paths = {
        QStringLiteral("/usr/local/bin"),
        QStringLiteral("/usr/bin"),
        QDir::homePath() + QStringLiteral("/.local/bin"),
    };
#endif

    for (const QString& path : paths) {
        for (const QString& candidate : candidates) {
            const QString fullPath = path + QDir::separator() + candidate;
            if (QFile::exists(fullPath)) {
                return fullPath;
            }
        }
    }
    return QString();
}

/// Splits complete lines off the front of @p buffer
QStringList takeLines(QByteArray& buffer) {
    QStringList lines;
    qsizetype newline = buffer.indexOf('\n');
    while (newline >= 0) {
        const QString line = QString::fromUtf8(buffer.left(newline)).trimmed();
        if (!line.isEmpty()) {
            lines << line;
        }
        buffer.remove(0, newline + 1);
        newline = buffer.indexOf('\n');
    }
    return lines;
}

} // namespace

// ═══════════════════════════════════════════════════════════════════════════════
// Construction
// ═══════════════════════════════════════════════════════════════════════════════

YtDlpFetchEngine::YtDlpFetchEngine()
    : YtDlpFetchEngine(Options{})
{
}

YtDlpFetchEngine::YtDlpFetchEngine(Options options)
    : m_ytDlpPath(options.ytDlpPath.isEmpty() ? findYtDlp() : options.ytDlpPath)
    , m_ffmpegPath(options.ffmpegPath.isEmpty() ? findFfmpeg() : options.ffmpegPath)
{
    if (m_ytDlpPath.isEmpty()) {
        qWarning() << "YtDlpFetchEngine: yt-dlp not found, streaming sites unavailable";
    } else {
        qDebug() << "YtDlpFetchEngine: Using" << m_ytDlpPath;
    }
}

bool YtDlpFetchEngine::isAvailable() const {
    return !m_ytDlpPath.isEmpty() && QFile::exists(m_ytDlpPath);
}

QString YtDlpFetchEngine::version() const {
    if (!isAvailable()) {
        return QString();
    }

    QProcess process;
    process.start(m_ytDlpPath, {QStringLiteral("--version")});
    if (!process.waitForFinished(START_TIMEOUT_MS)) {
        stopProcess(process);
        return QString();
    }
    return QString::fromUtf8(process.readAllStandardOutput()).trimmed();
}

// ═══════════════════════════════════════════════════════════════════════════════
// Resolve
// ═══════════════════════════════════════════════════════════════════════════════

StreamInfo YtDlpFetchEngine::resolve(const QUrl& url, const std::function<bool()>& shouldAbort) {
    if (!isAvailable()) {
        throw ResolveError(ErrorCause::Unknown, QStringLiteral("yt-dlp is not installed or not found in PATH"));
    }

    const QStringList args = {
        QStringLiteral("--dump-json"),
        QStringLiteral("--no-playlist"),
        QStringLiteral("--no-download"),
        url.toString()
    };

    qDebug() << "YtDlpFetchEngine: Extracting info for" << url.toString();

    QProcess process;
    process.start(m_ytDlpPath, args);
    if (!process.waitForStarted(START_TIMEOUT_MS)) {
        throw ResolveError(ErrorCause::Unknown,
                           QStringLiteral("Failed to start yt-dlp: %1").arg(process.errorString()));
    }

    while (process.state() != QProcess::NotRunning) {
        if (shouldAbort && shouldAbort()) {
            stopProcess(process);
            throw ResolveError(ErrorCause::Timeout,
                               QStringLiteral("Extraction of %1 aborted").arg(url.toString()));
        }
        process.waitForFinished(static_cast<int>(Constants::CONTROL_POLL_INTERVAL.count()));
    }

    const QByteArray output = process.readAllStandardOutput();
    const QString errors = QString::fromUtf8(process.readAllStandardError());

    if (process.exitStatus() == QProcess::CrashExit) {
        throw ResolveError(ErrorCause::Unknown, QStringLiteral("yt-dlp process crashed"));
    }
    if (process.exitCode() != 0) {
        const QString message = lastErrorLine(errors);
        throw ResolveError(classifyError(errors),
                           message.isEmpty()
                               ? QStringLiteral("yt-dlp exited with code %1").arg(process.exitCode())
                               : message);
    }

    StreamInfo info = parseInfoJson(output);
    qDebug() << "YtDlpFetchEngine: Resolved" << info.title << "formats:" << info.availableFormats;
    return info;
}

// ═══════════════════════════════════════════════════════════════════════════════
// Transfer
// ═══════════════════════════════════════════════════════════════════════════════

TransferOutcome YtDlpFetchEngine::transfer(const TransferRequest& request,
                                           const TransferControl& control) {
    if (!isAvailable()) {
        throw TransferError(ErrorCause::Unknown, QStringLiteral("yt-dlp is not installed or not found in PATH"));
    }

    QString directory = request.outputDirectory.isEmpty() ? QDir::currentPath() : request.outputDirectory;
    if (request.resumeToken && !request.resumeToken->partialPath.isEmpty()) {
        directory = QFileInfo(request.resumeToken->partialPath).absolutePath();
    }
    if (!QDir().mkpath(directory)) {
        throw TransferError(ErrorCause::DiskWrite,
                            QStringLiteral("Cannot create output directory %1").arg(directory));
    }

    QStringList args = {
        QStringLiteral("--newline"),
        QStringLiteral("--continue"),
        QStringLiteral("--no-playlist"),
        QStringLiteral("--progress-template"), FormatSelector::progressTemplate(),
        QStringLiteral("-o"), QDir(directory).filePath(QStringLiteral("%(title)s.%(ext)s")),
    };
    args << FormatSelector::ytDlpArguments(request.quality, request.format);

    // yt-dlp enforces the cap itself; the shared bucket is charged afterwards
    if (control.rateLimiter && !control.rateLimiter->isUnlimited()) {
        args << QStringLiteral("--limit-rate")
             << QString::number(static_cast<qint64>(control.rateLimiter->maxBytesPerSecond()));
    }
    if (!m_ffmpegPath.isEmpty()) {
        args << QStringLiteral("--ffmpeg-location") << m_ffmpegPath;
    }
    args << request.url.toString();

    ResumeToken token;
    token.sourceUrl = request.sourceUrl.isEmpty() ? request.url.toString() : request.sourceUrl;
    token.format = request.format;
    if (request.resumeToken) {
        token.offset = request.resumeToken->offset;
        token.partialPath = request.resumeToken->partialPath;
        token.engineState = request.resumeToken->engineState;
    }

    qDebug() << "YtDlpFetchEngine: Starting download" << request.url.toString() << "into" << directory;

    QProcess process;
    process.start(m_ytDlpPath, args);
    if (!process.waitForStarted(START_TIMEOUT_MS)) {
        throw TransferError(ErrorCause::Unknown,
                            QStringLiteral("Failed to start yt-dlp: %1").arg(process.errorString()));
    }

    QByteArray stdoutBuffer;
    QByteArray stderrBuffer;
    QString destination = QString::fromUtf8(token.engineState);

    ByteCount partialBytes = 0;
    if (token.offset > 0 && !token.partialPath.isEmpty()) {
        const QFileInfo partial(token.partialPath);
        partialBytes = partial.exists() ? partial.size() : 0;
    }
    StreamProgress streams(token.offset, partialBytes);
    ByteCount reported = token.offset;
    bool stopped = false;

    auto handleLine = [&](const QString& line) {
        if (const auto progress = FormatSelector::parseProgressLine(line)) {
            const ByteCount absolute = streams.update(progress->downloadedBytes);
            if (absolute > reported) {
                if (control.rateLimiter) {
                    control.rateLimiter->account(absolute - reported);
                }
                reported = absolute;
            }

            std::optional<ByteCount> total;
            if (progress->totalBytes) {
                total = streams.totalFor(*progress->totalBytes);
            }

            token.offset = reported;
            if (control.onProgress) {
                control.onProgress(reported, total);
            }
            if (control.onCheckpoint && !token.partialPath.isEmpty()) {
                control.onCheckpoint(token);
            }
            return;
        }

        if (const auto path = FormatSelector::parseDestinationLine(line)) {
            destination = *path;
            token.engineState = destination.toUtf8();
            token.partialPath = destination + QStringLiteral(".part");
            qDebug() << "YtDlpFetchEngine: Destination" << destination;
        }
    };

    while (true) {
        if (control.stopRequested()) {
            stopProcess(process);
            stopped = true;
        }

        const bool running = process.state() != QProcess::NotRunning;
        if (running && !stopped) {
            process.waitForReadyRead(static_cast<int>(Constants::CONTROL_POLL_INTERVAL.count()));
        }

        stdoutBuffer += process.readAllStandardOutput();
        stderrBuffer += process.readAllStandardError();
        for (const QString& line : takeLines(stdoutBuffer)) {
            handleLine(line);
        }

        if (!running || stopped) {
            break;
        }
    }
    if (!stdoutBuffer.trimmed().isEmpty()) {
        handleLine(QString::fromUtf8(stdoutBuffer).trimmed());
    }

    token.offset = reported;

    if (stopped) {
        TransferOutcome outcome;
        outcome.bytesReceived = reported;
        if (control.shouldCancel && control.shouldCancel()) {
            discardPartial(token);
            outcome.status = TransferStatus::Cancelled;
            return outcome;
        }
        qDebug() << "YtDlpFetchEngine: Paused at" << formatByteSize(reported);
        outcome.status = TransferStatus::Paused;
        outcome.resumeToken = token;
        return outcome;
    }

    const QString errors = QString::fromUtf8(stderrBuffer);
    if (process.exitStatus() == QProcess::CrashExit || process.exitCode() != 0) {
        QString message = lastErrorLine(errors);
        if (message.isEmpty()) {
            message = process.exitStatus() == QProcess::CrashExit
                          ? QStringLiteral("yt-dlp process crashed")
                          : QStringLiteral("yt-dlp exited with code %1").arg(process.exitCode());
        }
        qWarning() << "YtDlpFetchEngine: Download failed:" << message;
        throw TransferError(classifyError(errors), message,
                            (reported > 0 && !token.partialPath.isEmpty())
                                ? std::optional<ResumeToken>(token)
                                : std::nullopt);
    }

    qDebug() << "YtDlpFetchEngine: Finished" << destination << formatByteSize(reported);

    TransferOutcome outcome;
    outcome.status = TransferStatus::Completed;
    outcome.bytesReceived = reported;
    outcome.outputPath = destination;
    return outcome;
}

void YtDlpFetchEngine::discardPartial(const ResumeToken& token) {
    if (token.partialPath.isEmpty()) {
        return;
    }

    // Merged downloads leave one .part per stream beside the destination
    const QFileInfo partial(token.partialPath);
    const QString stem = QFileInfo(QString::fromUtf8(token.engineState)).completeBaseName();
    QDir dir = partial.absoluteDir();

    QStringList victims = {partial.fileName()};
    if (!stem.isEmpty()) {
        victims << dir.entryList({stem + QStringLiteral("*.part"), stem + QStringLiteral("*.ytdl")},
                                 QDir::Files);
    }
    victims.removeDuplicates();

    for (const QString& name : victims) {
        if (dir.exists(name)) {
            if (dir.remove(name)) {
                qDebug() << "YtDlpFetchEngine: Discarded" << dir.filePath(name);
            } else {
                qWarning() << "YtDlpFetchEngine: Failed to remove" << dir.filePath(name);
            }
        }
    }
}

// ═══════════════════════════════════════════════════════════════════════════════
// Helpers
// ═══════════════════════════════════════════════════════════════════════════════

bool YtDlpFetchEngine::isSupportedUrl(const QUrl& url) {
    const QString host = url.host().toLower();

    // Common supported sites (not exhaustive)
    static const QStringList supportedHosts = {
        QStringLiteral("youtube.com"),
        QStringLiteral("youtu.be"),
        QStringLiteral("vimeo.com"),
        QStringLiteral("dailymotion.com"),
        QStringLiteral("twitch.tv"),
        QStringLiteral("twitter.com"),
        QStringLiteral("x.com"),
        QStringLiteral("instagram.com"),
        QStringLiteral("facebook.com"),
        QStringLiteral("tiktok.com"),
        QStringLiteral("reddit.com"),
        QStringLiteral("soundcloud.com"),
        QStringLiteral("bandcamp.com"),
        QStringLiteral("bilibili.com"),
        QStringLiteral("nicovideo.jp"),
    };

    for (const QString& supported : supportedHosts) {
        if (host == supported || host.endsWith(QLatin1Char('.') + supported)) {
            return true;
        }
    }

    const QString path = url.path().toLower();
    return path.endsWith(QLatin1String(".m3u8")) || path.endsWith(QLatin1String(".mpd"));
}

ErrorCause YtDlpFetchEngine::classifyError(const QString& stderrText) {
    auto has = [&stderrText](const char* needle) {
        return stderrText.contains(QLatin1String(needle), Qt::CaseInsensitive);
    };

    if (has("No space left")) {
        return ErrorCause::StorageExhausted;
    }
    if (has("Private video") || has("Sign in") || has("members-only") ||
        has("not available in your country") || has("HTTP Error 403") || has("age-restricted")) {
        return ErrorCause::Restricted;
    }
    if (has("HTTP Error 404") || has("does not exist") || has("Unsupported URL") ||
        has("Video unavailable") || has("has been removed")) {
        return ErrorCause::NotFound;
    }
    if (has("timed out")) {
        return ErrorCause::Timeout;
    }
    if (has("getaddrinfo") || has("Name or service not known") || has("Failed to resolve") ||
        has("Unable to download webpage") || has("Connection refused")) {
        return ErrorCause::Unreachable;
    }
    if (has("Connection reset") || has("IncompleteRead") || has("HTTP Error 5")) {
        return ErrorCause::Network;
    }
    if (has("Permission denied") || has("unable to open for writing")) {
        return ErrorCause::DiskWrite;
    }
    return ErrorCause::Unknown;
}

StreamInfo YtDlpFetchEngine::parseInfoJson(const QByteArray& json) {
    // One JSON document per line; with --no-playlist there is exactly one
    QByteArray document = json.trimmed();
    const qsizetype lastLine = document.lastIndexOf('\n');
    if (lastLine >= 0) {
        document = document.mid(lastLine + 1);
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(document, &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        throw ResolveError(ErrorCause::Unknown, QStringLiteral("Invalid JSON response from yt-dlp"));
    }

    const QJsonObject obj = doc.object();

    StreamInfo info;
    info.title = obj.value(QStringLiteral("title")).toString();

    const qint64 size = obj.value(QStringLiteral("filesize")).toVariant().toLongLong();
    const qint64 approx = obj.value(QStringLiteral("filesize_approx")).toVariant().toLongLong();
    if (size > 0) {
        info.bytesTotal = size;
    } else if (approx > 0) {
        info.bytesTotal = approx;
    }

    QString fileName = obj.value(QStringLiteral("_filename")).toString();
    if (fileName.isEmpty()) {
        fileName = obj.value(QStringLiteral("filename")).toString();
    }
    info.suggestedFileName = QFileInfo(fileName).fileName();

    QList<int> heights;
    const QJsonArray formats = obj.value(QStringLiteral("formats")).toArray();
    for (const QJsonValue& value : formats) {
        const int height = value.toObject().value(QStringLiteral("height")).toInt();
        if (height > 0 && !heights.contains(height)) {
            heights << height;
        }
    }
    std::sort(heights.begin(), heights.end(), std::greater<int>());
    for (int height : heights) {
        info.availableFormats << QStringLiteral("%1p").arg(height);
    }

    return info;
}

QString YtDlpFetchEngine::findYtDlp() {
    return findExecutable(QStringLiteral("yt-dlp"));
}

QString YtDlpFetchEngine::findFfmpeg() {
    return findExecutable(QStringLiteral("ffmpeg"));
}

void YtDlpFetchEngine::stopProcess(QProcess& process) {
    if (process.state() != QProcess::NotRunning) {
        process.terminate();
        if (!process.waitForFinished(STOP_TIMEOUT_MS)) {
            process.kill();
            process.waitForFinished(STOP_TIMEOUT_MS);
        }
    }
}

QString YtDlpFetchEngine::lastErrorLine(const QString& stderrText) {
    const QStringList lines = stderrText.split(QLatin1Char('\n'), Qt::SkipEmptyParts);
    for (auto it = lines.crbegin(); it != lines.crend(); ++it) {
        const QString line = it->trimmed();
        if (line.startsWith(QLatin1String("ERROR:"))) {
            return line.mid(6).trimmed();
        }
    }
    return lines.isEmpty() ? QString() : lines.last().trimmed();
}

// ═══════════════════════════════════════════════════════════════════════════════
// Stream Progress
// ═══════════════════════════════════════════════════════════════════════════════

YtDlpFetchEngine::StreamProgress::StreamProgress(ByteCount resumedOffset, ByteCount partialBytes)
    : m_completedStreams(std::max<ByteCount>(0, resumedOffset - partialBytes))
{
}

ByteCount YtDlpFetchEngine::StreamProgress::update(ByteCount streamDownloaded) {
    // A counter that goes backwards belongs to the next stream
    if (streamDownloaded < m_streamBytes) {
        m_completedStreams += m_streamBytes;
    }
    m_streamBytes = streamDownloaded;
    return m_completedStreams + m_streamBytes;
}

} // namespace Baresha
