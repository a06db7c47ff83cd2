/**
 * @file CurlFetchEngine.cpp
 * @brief libcurl-backed FetchEngine for direct media URLs
 *
 * @copyright Copyright (c) 2024 Baresha Project
 * @license GPL-3.0-or-later
 */

#include "baresha/engine/CurlFetchEngine.h"
#include "baresha/core/Errors.h"
#include "baresha/core/RateLimiter.h"

#include <curl/curl.h>

#include <algorithm>
#include <memory>

#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QRegularExpression>

namespace Baresha {

namespace {

// ═══════════════════════════════════════════════════════════════════════════════
// Global init / handle lifetime
// ═══════════════════════════════════════════════════════════════════════════════

class CurlGlobalInit {
public:
    static CurlGlobalInit& instance() {
        static CurlGlobalInit instance;
        return instance;
    }

    ~CurlGlobalInit() {
        if (m_valid) {
            curl_global_cleanup();
        }
    }

    CurlGlobalInit(const CurlGlobalInit&) = delete;
    CurlGlobalInit& operator=(const CurlGlobalInit&) = delete;

    bool isValid() const noexcept { return m_valid; }

private:
    CurlGlobalInit() {
        const CURLcode result = curl_global_init(CURL_GLOBAL_ALL);
        m_valid = (result == CURLE_OK);
        if (!m_valid) {
            qCritical() << "CurlFetchEngine: Failed to initialize libcurl:" << curl_easy_strerror(result);
        } else {
            qDebug() << "CurlFetchEngine: libcurl initialized:" << curl_version();
        }
    }

    bool m_valid = false;
};

using CurlHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;

CurlHandle makeHandle() {
    CurlGlobalInit::instance();
    return CurlHandle(curl_easy_init(), &curl_easy_cleanup);
}

void applyCommonOptions(CURL* curl, const QByteArray& url, const QByteArray& userAgent,
                        const CurlFetchEngine::Options& options, char* errorBuffer) {
    curl_easy_setopt(curl, CURLOPT_URL, url.constData());
    curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, errorBuffer);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 10L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS,
                     static_cast<long>(options.connectTimeout.count()));
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, options.verifySsl ? 1L : 0L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, options.verifySsl ? 2L : 0L);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, userAgent.constData());
#ifdef Q_OS_WIN
    curl_easy_setopt(curl, CURLOPT_SSL_OPTIONS, CURLSSLOPT_NATIVE_CA);
#endif
}

QString curlMessage(CURLcode code, const char* errorBuffer) {
    if (errorBuffer && errorBuffer[0] != '\0') {
        return QString::fromUtf8(errorBuffer).trimmed();
    }
    return QString::fromUtf8(curl_easy_strerror(code));
}

// ═══════════════════════════════════════════════════════════════════════════════
// Probe (HEAD)
// ═══════════════════════════════════════════════════════════════════════════════

struct ProbeSession {
    QString rawHeaders;
    const std::function<bool()>* shouldAbort = nullptr;
};

size_t probeHeaderCallback(char* buffer, size_t size, size_t nitems, void* userdata) {
    auto* session = static_cast<ProbeSession*>(userdata);
    const size_t totalSize = size * nitems;
    session->rawHeaders += QString::fromUtf8(buffer, static_cast<qsizetype>(totalSize));
    return totalSize;
}

int probeProgressCallback(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* session = static_cast<ProbeSession*>(clientp);
    return (session->shouldAbort && *session->shouldAbort && (*session->shouldAbort)()) ? 1 : 0;
}

// ═══════════════════════════════════════════════════════════════════════════════
// Transfer (GET)
// ═══════════════════════════════════════════════════════════════════════════════

struct TransferSession {
    CURL* curl = nullptr;
    QFile* file = nullptr;
    const TransferControl* control = nullptr;

    ByteOffset startOffset = 0;
    ByteCount written = 0;
    std::optional<ByteCount> total;
    ResumeToken token;

    bool responseChecked = false;
    bool stopped = false;
    bool writeFailed = false;
    QFileDevice::FileError fileError = QFileDevice::NoError;
    QString fileErrorString;

    ByteOffset offset() const { return startOffset + written; }
};

size_t transferWriteCallback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* session = static_cast<TransferSession*>(userdata);
    const size_t totalSize = size * nmemb;

    if (!session->responseChecked) {
        session->responseChecked = true;

        long status = 0;
        curl_easy_getinfo(session->curl, CURLINFO_RESPONSE_CODE, &status);
        if (session->startOffset > 0 && status == 200) {
            // Range ignored: the body starts at byte 0
            qWarning() << "CurlFetchEngine: Server ignored range request, restarting"
                       << session->token.sourceUrl;
            session->file->resize(0);
            session->file->seek(0);
            session->startOffset = 0;
        }

        curl_off_t remaining = -1;
        curl_easy_getinfo(session->curl, CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &remaining);
        if (remaining > 0) {
            session->total = session->startOffset + static_cast<ByteCount>(remaining);
        }
    }

    const TransferControl& control = *session->control;
    if (control.rateLimiter) {
        control.rateLimiter->throttle(static_cast<ByteCount>(totalSize),
                                      [&control] { return control.stopRequested(); });
    }

    const qint64 written = session->file->write(ptr, static_cast<qint64>(totalSize));
    if (written != static_cast<qint64>(totalSize)) {
        session->writeFailed = true;
        session->fileError = session->file->error();
        session->fileErrorString = session->file->errorString();
        qWarning() << "CurlFetchEngine: Write failed, expected:" << totalSize
                   << "written:" << written << session->fileErrorString;
        return 0;  // Abort transfer
    }

    session->written += static_cast<ByteCount>(totalSize);
    session->token.offset = session->offset();

    if (control.onProgress) {
        control.onProgress(session->offset(), session->total);
    }
    if (control.onCheckpoint) {
        control.onCheckpoint(session->token);
    }

    if (control.stopRequested()) {
        session->stopped = true;
        return 0;
    }
    return totalSize;
}

int transferProgressCallback(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* session = static_cast<TransferSession*>(clientp);
    if (session->control->stopRequested()) {
        session->stopped = true;
        return 1;  // Non-zero aborts transfer
    }
    return 0;
}

} // namespace

// ═══════════════════════════════════════════════════════════════════════════════
// Construction
// ═══════════════════════════════════════════════════════════════════════════════

CurlFetchEngine::CurlFetchEngine()
    : CurlFetchEngine(Options{})
{
}

CurlFetchEngine::CurlFetchEngine(Options options)
    : m_options(std::move(options))
{
    CurlGlobalInit::instance();
}

// ═══════════════════════════════════════════════════════════════════════════════
// Resolve
// ═══════════════════════════════════════════════════════════════════════════════

StreamInfo CurlFetchEngine::resolve(const QUrl& url, const std::function<bool()>& shouldAbort) {
    qDebug() << "CurlFetchEngine: Probing" << url.toString();

    CurlHandle handle = makeHandle();
    if (!handle) {
        throw ResolveError(ErrorCause::Unknown, QStringLiteral("Failed to initialize curl"));
    }

    char errorBuffer[CURL_ERROR_SIZE] = {0};
    const QByteArray urlBytes = url.toString(QUrl::FullyEncoded).toUtf8();
    const QByteArray userAgent = m_options.userAgent.toUtf8();
    applyCommonOptions(handle.get(), urlBytes, userAgent, m_options, errorBuffer);

    ProbeSession session;
    session.shouldAbort = &shouldAbort;

    curl_easy_setopt(handle.get(), CURLOPT_NOBODY, 1L);  // HEAD request
    curl_easy_setopt(handle.get(), CURLOPT_HEADERFUNCTION, probeHeaderCallback);
    curl_easy_setopt(handle.get(), CURLOPT_HEADERDATA, &session);
    curl_easy_setopt(handle.get(), CURLOPT_XFERINFOFUNCTION, probeProgressCallback);
    curl_easy_setopt(handle.get(), CURLOPT_XFERINFODATA, &session);
    curl_easy_setopt(handle.get(), CURLOPT_NOPROGRESS, 0L);

    const CURLcode result = curl_easy_perform(handle.get());

    if (result == CURLE_ABORTED_BY_CALLBACK) {
        throw ResolveError(ErrorCause::Timeout, QStringLiteral("Probe of %1 aborted").arg(url.toString()));
    }
    if (result != CURLE_OK) {
        throw ResolveError(classifyCurlCode(result), curlMessage(result, errorBuffer));
    }

    long httpCode = 0;
    curl_easy_getinfo(handle.get(), CURLINFO_RESPONSE_CODE, &httpCode);

    HttpProbeInfo probe = parseHeaders(session.rawHeaders);
    probe.httpStatus = httpCode;

    curl_off_t contentLength = -1;
    curl_easy_getinfo(handle.get(), CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &contentLength);
    if (contentLength > 0) {
        probe.contentLength = static_cast<ByteCount>(contentLength);
    }

    char* effective = nullptr;
    curl_easy_getinfo(handle.get(), CURLINFO_EFFECTIVE_URL, &effective);
    const QUrl effectiveUrl = effective ? QUrl(QString::fromUtf8(effective)) : url;

    if (httpCode == 405 || httpCode == 501) {
        // HEAD not supported; size stays unknown until the GET
        qDebug() << "CurlFetchEngine: HEAD rejected with" << httpCode << "for" << url.toString();
        probe.contentLength.reset();
    } else if (httpCode >= 400) {
        throw ResolveError(classifyHttpStatus(httpCode), QStringLiteral("HTTP error %1").arg(httpCode));
    }

    StreamInfo info;
    info.bytesTotal = probe.contentLength;
    info.suggestedFileName = probe.fileName.isEmpty() ? fileNameFromUrl(effectiveUrl) : probe.fileName;
    info.title = QFileInfo(info.suggestedFileName).completeBaseName();

    const QString suffix = QFileInfo(info.suggestedFileName).suffix().toLower();
    if (!suffix.isEmpty()) {
        info.availableFormats << suffix;
    } else if (!probe.contentType.isEmpty()) {
        info.availableFormats << probe.contentType;
    }

    qDebug() << "CurlFetchEngine: Probe complete. Size:"
             << (info.bytesTotal ? formatByteSize(*info.bytesTotal) : QStringLiteral("unknown"))
             << "Ranges:" << probe.supportsRanges << "File:" << info.suggestedFileName;
    return info;
}

// ═══════════════════════════════════════════════════════════════════════════════
// Transfer
// ═══════════════════════════════════════════════════════════════════════════════

TransferOutcome CurlFetchEngine::transfer(const TransferRequest& request,
                                          const TransferControl& control) {
    QString directory;
    QString fileName;
    QString partialPath;
    ByteOffset offset = 0;

    const auto& resume = request.resumeToken;
    if (resume && !resume->partialPath.isEmpty() && QFile::exists(resume->partialPath)) {
        partialPath = resume->partialPath;
        directory = QFileInfo(partialPath).absolutePath();
        fileName = QString::fromUtf8(resume->engineState);
        if (fileName.isEmpty()) {
            fileName = QFileInfo(partialPath).completeBaseName();
        }
        // Never trust the token past what actually reached the disk
        offset = std::min(resume->offset, QFileInfo(partialPath).size());
    } else {
        directory = request.outputDirectory.isEmpty() ? QDir::currentPath() : request.outputDirectory;
        if (!QDir().mkpath(directory)) {
            throw TransferError(ErrorCause::DiskWrite,
                                QStringLiteral("Cannot create output directory %1").arg(directory));
        }
        fileName = (request.streamInfo && !request.streamInfo->suggestedFileName.isEmpty())
                       ? request.streamInfo->suggestedFileName
                       : fileNameFromUrl(request.url);
        partialPath = uniqueFilePath(directory, fileName) + QStringLiteral(".part");
    }

    QFile file(partialPath);
    const bool opened = offset > 0 ? file.open(QIODevice::ReadWrite)
                                   : file.open(QIODevice::WriteOnly | QIODevice::Truncate);
    if (!opened) {
        throw TransferError(ErrorCause::DiskWrite,
                            QStringLiteral("Cannot open %1: %2").arg(partialPath, file.errorString()));
    }
    if (offset > 0) {
        file.resize(offset);
        file.seek(offset);
    }

    CurlHandle handle = makeHandle();
    if (!handle) {
        throw TransferError(ErrorCause::Unknown, QStringLiteral("Failed to initialize curl"));
    }

    TransferSession session;
    session.curl = handle.get();
    session.file = &file;
    session.control = &control;
    session.startOffset = offset;
    session.token.sourceUrl = request.sourceUrl.isEmpty() ? request.url.toString() : request.sourceUrl;
    session.token.format = request.format;
    session.token.offset = offset;
    session.token.partialPath = partialPath;
    session.token.engineState = fileName.toUtf8();
    if (request.streamInfo && request.streamInfo->bytesTotal) {
        session.total = request.streamInfo->bytesTotal;
    }

    char errorBuffer[CURL_ERROR_SIZE] = {0};
    const QByteArray urlBytes = request.url.toString(QUrl::FullyEncoded).toUtf8();
    const QByteArray userAgent = m_options.userAgent.toUtf8();
    applyCommonOptions(handle.get(), urlBytes, userAgent, m_options, errorBuffer);

    curl_easy_setopt(handle.get(), CURLOPT_FAILONERROR, 1L);
    curl_easy_setopt(handle.get(), CURLOPT_LOW_SPEED_LIMIT, 1L);  // 1 byte/sec
    curl_easy_setopt(handle.get(), CURLOPT_LOW_SPEED_TIME, static_cast<long>(m_options.lowSpeedTimeSeconds));
    curl_easy_setopt(handle.get(), CURLOPT_WRITEFUNCTION, transferWriteCallback);
    curl_easy_setopt(handle.get(), CURLOPT_WRITEDATA, &session);
    curl_easy_setopt(handle.get(), CURLOPT_XFERINFOFUNCTION, transferProgressCallback);
    curl_easy_setopt(handle.get(), CURLOPT_XFERINFODATA, &session);
    curl_easy_setopt(handle.get(), CURLOPT_NOPROGRESS, 0L);
    if (offset > 0) {
        curl_easy_setopt(handle.get(), CURLOPT_RESUME_FROM_LARGE, static_cast<curl_off_t>(offset));
    }

    qDebug() << "CurlFetchEngine: Downloading" << request.url.toString()
             << "to" << partialPath << "from offset" << offset;

    const CURLcode result = curl_easy_perform(handle.get());

    file.flush();
    file.close();

    ResumeToken token = session.token;
    token.offset = session.offset();
    const bool hasProgress = token.offset > 0;

    if (session.writeFailed) {
        const ErrorCause cause = session.fileError == QFileDevice::ResourceError
                                     ? ErrorCause::StorageExhausted
                                     : ErrorCause::DiskWrite;
        throw TransferError(cause, QStringLiteral("Cannot write %1: %2").arg(partialPath, session.fileErrorString),
                            token);
    }

    if (session.stopped &&
        (result == CURLE_ABORTED_BY_CALLBACK || result == CURLE_WRITE_ERROR || result == CURLE_OK)) {
        TransferOutcome outcome;
        outcome.bytesReceived = token.offset;
        if (control.shouldCancel && control.shouldCancel()) {
            QFile::remove(partialPath);
            qDebug() << "CurlFetchEngine: Cancelled, removed" << partialPath;
            outcome.status = TransferStatus::Cancelled;
            return outcome;
        }
        qDebug() << "CurlFetchEngine: Paused at" << token.offset << "bytes";
        outcome.status = TransferStatus::Paused;
        outcome.resumeToken = token;
        return outcome;
    }

    if (result == CURLE_HTTP_RETURNED_ERROR) {
        long httpCode = 0;
        curl_easy_getinfo(handle.get(), CURLINFO_RESPONSE_CODE, &httpCode);

        const bool alreadyComplete = httpCode == 416 && offset > 0 && session.total &&
                                     offset >= *session.total;
        if (!alreadyComplete) {
            if (httpCode == 416) {
                // Stale partial file; the next attempt starts over
                QFile::remove(partialPath);
                throw TransferError(ErrorCause::Network,
                                    QStringLiteral("Server rejected resume range at %1").arg(offset));
            }
            throw TransferError(classifyHttpStatus(httpCode), QStringLiteral("HTTP error %1").arg(httpCode),
                                hasProgress ? std::optional<ResumeToken>(token) : std::nullopt);
        }
    } else if (result != CURLE_OK) {
        throw TransferError(classifyCurlCode(result), curlMessage(result, errorBuffer),
                            hasProgress ? std::optional<ResumeToken>(token) : std::nullopt);
    } else if (session.total && token.offset < *session.total) {
        throw TransferError(ErrorCause::Network,
                            QStringLiteral("Connection closed after %1 of %2")
                                .arg(formatByteSize(token.offset), formatByteSize(*session.total)),
                            token);
    }

    QString finalPath = QDir(directory).filePath(fileName);
    if (QFile::exists(finalPath)) {
        finalPath = uniqueFilePath(directory, fileName);
    }
    if (!QFile::rename(partialPath, finalPath)) {
        throw TransferError(ErrorCause::DiskWrite,
                            QStringLiteral("Cannot rename %1 to %2").arg(partialPath, finalPath), token);
    }

    qDebug() << "CurlFetchEngine: Finished" << finalPath << formatByteSize(token.offset);

    TransferOutcome outcome;
    outcome.status = TransferStatus::Completed;
    outcome.bytesReceived = token.offset;
    outcome.outputPath = finalPath;
    return outcome;
}

void CurlFetchEngine::discardPartial(const ResumeToken& token) {
    if (!token.partialPath.isEmpty() && QFile::exists(token.partialPath)) {
        if (QFile::remove(token.partialPath)) {
            qDebug() << "CurlFetchEngine: Discarded" << token.partialPath;
        } else {
            qWarning() << "CurlFetchEngine: Failed to remove" << token.partialPath;
        }
    }
}

// ═══════════════════════════════════════════════════════════════════════════════
// Helpers
// ═══════════════════════════════════════════════════════════════════════════════

ErrorCause CurlFetchEngine::classifyHttpStatus(long status) {
    switch (status) {
        case 401:
        case 403:
        case 451:
            return ErrorCause::Restricted;
        case 404:
        case 410:
            return ErrorCause::NotFound;
        case 408:
        case 504:
            return ErrorCause::Timeout;
        default:
            break;
    }
    if (status >= 500) {
        return ErrorCause::Unreachable;
    }
    return ErrorCause::Unknown;
}

ErrorCause CurlFetchEngine::classifyCurlCode(int code) {
    switch (static_cast<CURLcode>(code)) {
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY:
        case CURLE_COULDNT_CONNECT:
        case CURLE_SSL_CONNECT_ERROR:
        case CURLE_PEER_FAILED_VERIFICATION:
            return ErrorCause::Unreachable;

        case CURLE_OPERATION_TIMEDOUT:
            return ErrorCause::Timeout;

        case CURLE_RECV_ERROR:
        case CURLE_SEND_ERROR:
        case CURLE_PARTIAL_FILE:
        case CURLE_GOT_NOTHING:
        case CURLE_HTTP2:
        case CURLE_HTTP2_STREAM:
            return ErrorCause::Network;

        case CURLE_REMOTE_ACCESS_DENIED:
        case CURLE_LOGIN_DENIED:
            return ErrorCause::Restricted;

        case CURLE_REMOTE_FILE_NOT_FOUND:
            return ErrorCause::NotFound;

        case CURLE_WRITE_ERROR:
            return ErrorCause::DiskWrite;

        default:
            return ErrorCause::Unknown;
    }
}

HttpProbeInfo CurlFetchEngine::parseHeaders(const QString& rawHeaders) {
    HttpProbeInfo info;

    // With redirects the buffer holds several responses; only the last one counts
    const QStringList lines = rawHeaders.split(QRegularExpression(QStringLiteral("\r?\n")));
    qsizetype start = 0;
    for (qsizetype i = 0; i < lines.size(); ++i) {
        if (lines.at(i).startsWith(QLatin1String("HTTP/"), Qt::CaseInsensitive)) {
            start = i;
        }
    }

    static const QRegularExpression encodedNameRegex(
        QStringLiteral("filename\\*\\s*=\\s*[\\w-]+'[^']*'([^;\\r\\n]+)"),
        QRegularExpression::CaseInsensitiveOption);
    static const QRegularExpression plainNameRegex(
        QStringLiteral("filename\\s*=\\s*\"?([^\";\\r\\n]+)\"?"),
        QRegularExpression::CaseInsensitiveOption);

    for (qsizetype i = start; i < lines.size(); ++i) {
        const QString& line = lines.at(i);
        if (i == start && line.startsWith(QLatin1String("HTTP/"), Qt::CaseInsensitive)) {
            const QStringList parts = line.split(QLatin1Char(' '), Qt::SkipEmptyParts);
            if (parts.size() >= 2) {
                info.httpStatus = parts.at(1).toLong();
            }
            continue;
        }

        const qsizetype colon = line.indexOf(QLatin1Char(':'));
        if (colon <= 0) {
            continue;
        }
        const QString name = line.left(colon).trimmed().toLower();
        const QString value = line.mid(colon + 1).trimmed();

        if (name == QLatin1String("content-length")) {
            bool ok = false;
            const ByteCount length = value.toLongLong(&ok);
            if (ok && length > 0) {
                info.contentLength = length;
            }
        } else if (name == QLatin1String("content-type")) {
            info.contentType = value.section(QLatin1Char(';'), 0, 0).trimmed();
        } else if (name == QLatin1String("accept-ranges")) {
            info.supportsRanges = value.compare(QLatin1String("bytes"), Qt::CaseInsensitive) == 0;
        } else if (name == QLatin1String("content-disposition")) {
            auto match = encodedNameRegex.match(value);
            if (!match.hasMatch()) {
                match = plainNameRegex.match(value);
            }
            if (match.hasMatch()) {
                info.fileName = QFileInfo(QUrl::fromPercentEncoding(match.captured(1).trimmed().toUtf8()))
                                    .fileName();
            }
        }
    }
    return info;
}

QString CurlFetchEngine::fileNameFromUrl(const QUrl& url) {
    QString name = QFileInfo(url.path()).fileName();

    static const QRegularExpression unsafeChars(QStringLiteral("[\\\\/:*?\"<>|]"));
    name.replace(unsafeChars, QStringLiteral("_"));
    name = name.trimmed();

    if (name.isEmpty() || name == QLatin1String(".") || name == QLatin1String("..")) {
        return QStringLiteral("download");
    }
    return name;
}

QString CurlFetchEngine::uniqueFilePath(const QString& directory, const QString& fileName) {
    const QDir dir(directory);
    QString candidate = dir.filePath(fileName);
    if (!QFile::exists(candidate) && !QFile::exists(candidate + QStringLiteral(".part"))) {
        return candidate;
    }

    const QFileInfo info(fileName);
    const QString base = info.completeBaseName();
    const QString suffix = info.suffix().isEmpty() ? QString() : QStringLiteral(".") + info.suffix();
    for (int n = 1;; ++n) {
        candidate = dir.filePath(QStringLiteral("%1 (%2)%3").arg(base).arg(n).arg(suffix));
        if (!QFile::exists(candidate) && !QFile::exists(candidate + QStringLiteral(".part"))) {
            return candidate;
        }
    }
}

} // namespace Baresha
