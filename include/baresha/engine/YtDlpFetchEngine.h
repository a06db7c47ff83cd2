/**
 * @file YtDlpFetchEngine.h
 * @brief FetchEngine driving an external yt-dlp process
 *
 * yt-dlp covers YouTube, Vimeo and the other streaming sites. It runs as a
 * separate process (it is GPL licensed) and is driven synchronously from the
 * worker thread:
 * - resolve(): `--dump-json --no-playlist --no-download`
 * - transfer(): `--newline --continue --progress-template ...`, stdout parsed
 *   line by line, process terminated on pause/cancel
 *
 * @copyright Copyright (c) 2024 Baresha Project
 * @license GPL-3.0-or-later
 */

#pragma once

#include "baresha/core/FetchEngine.h"

#include <QByteArray>
#include <QString>

class QProcess;

namespace Baresha {

class YtDlpFetchEngine : public FetchEngine {
public:
    struct Options {
        QString ytDlpPath;    ///< Empty: search PATH and the usual install dirs
        QString ffmpegPath;   ///< Empty: search PATH; passed as --ffmpeg-location
    };

    YtDlpFetchEngine();
    explicit YtDlpFetchEngine(Options options);
    ~YtDlpFetchEngine() override = default;

    StreamInfo resolve(const QUrl& url, const std::function<bool()>& shouldAbort) override;
    TransferOutcome transfer(const TransferRequest& request, const TransferControl& control) override;
    void discardPartial(const ResumeToken& token) override;
    QString name() const override { return QStringLiteral("yt-dlp"); }

    [[nodiscard]] bool isAvailable() const;
    [[nodiscard]] QString executablePath() const { return m_ytDlpPath; }

    /// `yt-dlp --version`, empty when unavailable
    QString version() const;

    // ───────────────────────────────────────────────────────────────────────
    // Helpers (exposed for testing)
    // ───────────────────────────────────────────────────────────────────────

    /// Streaming sites and manifest URLs that need yt-dlp
    static bool isSupportedUrl(const QUrl& url);

    /// Map yt-dlp's stderr to an error cause
    static ErrorCause classifyError(const QString& stderrText);

    /// Parse `--dump-json` output
    /// @throws ResolveError on malformed output
    static StreamInfo parseInfoJson(const QByteArray& json);

    static QString findYtDlp();
    static QString findFfmpeg();

    /**
     * @brief Folds per-stream progress lines into one byte count for the job
     *
     * yt-dlp restarts its counters for every stream (video, then audio). When
     * a transfer continues from a token, the bytes of streams finished before
     * the pause are the token offset minus what the .part file being
     * continued already holds.
     */
    class StreamProgress {
    public:
        explicit StreamProgress(ByteCount resumedOffset = 0, ByteCount partialBytes = 0);

        /// @return Bytes received for the whole job
        ByteCount update(ByteCount streamDownloaded);
        [[nodiscard]] ByteCount totalFor(ByteCount streamTotal) const { return m_completedStreams + streamTotal; }
        [[nodiscard]] ByteCount completedStreams() const { return m_completedStreams; }

    private:
        ByteCount m_completedStreams;
        ByteCount m_streamBytes = 0;
    };

private:
    static void stopProcess(QProcess& process);
    static QString lastErrorLine(const QString& stderrText);

    QString m_ytDlpPath;
    QString m_ffmpegPath;
};

} // namespace Baresha
