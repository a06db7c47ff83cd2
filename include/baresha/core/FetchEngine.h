/**
 * @file FetchEngine.h
 * @brief Abstract capability that resolves URLs and transfers media bytes
 *
 * @copyright Copyright (c) 2024 Baresha Project
 * @license GPL-3.0-or-later
 */

#pragma once

#include "baresha/core/Types.h"

#include <functional>
#include <optional>

#include <QtGlobal>
#include <QString>
#include <QStringList>
#include <QUrl>

namespace Baresha {

class RateLimiter;

/**
 * @brief Metadata returned by FetchEngine::resolve()
 */
struct StreamInfo {
    std::optional<ByteCount> bytesTotal;  ///< Size, if the source reports one
    QStringList availableFormats;         ///< Engine-specific format labels
    QString title;                        ///< Human-readable media title
    QString suggestedFileName;            ///< Output name, if known up front
};

/**
 * @brief What to transfer
 */
struct TransferRequest {
    QUrl url;
    QString sourceUrl;                       ///< Job URL as entered; resume tokens must carry it
    QString quality;
    QString format;
    QString outputDirectory;
    std::optional<ResumeToken> resumeToken;  ///< Continue from this checkpoint
    std::optional<StreamInfo> streamInfo;    ///< Result of the preceding resolve
};

/**
 * @brief Signals and callbacks the engine must honor during transfer()
 *
 * shouldPause/shouldCancel are polled at every chunk boundary. onProgress
 * receives the absolute number of bytes on disk for this job.
 */
struct TransferControl {
    std::function<void(ByteCount received, std::optional<ByteCount> total)> onProgress;
    std::function<void(const ResumeToken&)> onCheckpoint;
    std::function<bool()> shouldPause;
    std::function<bool()> shouldCancel;
    RateLimiter* rateLimiter = nullptr;

    bool stopRequested() const {
        return (shouldPause && shouldPause()) || (shouldCancel && shouldCancel());
    }
};

enum class TransferStatus : uint8_t {
    Completed,   ///< All bytes written, output finalized
    Paused,      ///< Stopped on shouldPause, resumeToken set
    Cancelled    ///< Stopped on shouldCancel, partial output removed
};

struct TransferOutcome {
    TransferStatus status = TransferStatus::Completed;
    ByteCount bytesReceived = 0;
    std::optional<ResumeToken> resumeToken;
    QString outputPath;
};

/**
 * @class FetchEngine
 * @brief External collaborator performing the actual protocol work
 *
 * Both operations block the calling thread. Failures are reported by
 * throwing ResolveError / TransferError; the caller never sees
 * engine-specific exceptions.
 */
class FetchEngine {
public:
    virtual ~FetchEngine() = default;

    /**
     * @brief Retrieve stream metadata
     * @param shouldAbort Polled while waiting; engine gives up when it returns true
     * @throws ResolveError
     */
    virtual StreamInfo resolve(const QUrl& url, const std::function<bool()>& shouldAbort) = 0;

    /**
     * @brief Perform (or continue) the byte transfer
     * @throws TransferError
     */
    virtual TransferOutcome transfer(const TransferRequest& request,
                                     const TransferControl& control) = 0;

    /**
     * @brief Delete whatever partial output @p token refers to
     *
     * Called for jobs cancelled while holding a checkpoint. May run on any thread.
     */
    virtual void discardPartial(const ResumeToken& token) { Q_UNUSED(token) }

    virtual QString name() const = 0;
};

} // namespace Baresha
