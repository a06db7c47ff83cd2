/**
 * @file FetchEngineRouter.cpp
 *
 * @copyright Copyright (c) 2024 Baresha Project
 * @license GPL-3.0-or-later
 */

#include "baresha/engine/FetchEngineRouter.h"
#include "baresha/engine/YtDlpFetchEngine.h"

#include <QDebug>

namespace Baresha {

FetchEngineRouter::FetchEngineRouter(FetchEngine& directEngine, FetchEngine& streamingEngine)
    : m_direct(directEngine)
    , m_streaming(streamingEngine)
{
}

FetchEngine& FetchEngineRouter::engineFor(const QUrl& url) const {
    return YtDlpFetchEngine::isSupportedUrl(url) ? m_streaming : m_direct;
}

StreamInfo FetchEngineRouter::resolve(const QUrl& url, const std::function<bool()>& shouldAbort) {
    FetchEngine& engine = engineFor(url);
    qDebug() << "FetchEngineRouter:" << url.host() << "->" << engine.name();
    return engine.resolve(url, shouldAbort);
}

TransferOutcome FetchEngineRouter::transfer(const TransferRequest& request,
                                            const TransferControl& control) {
    return engineFor(request.url).transfer(request, control);
}

void FetchEngineRouter::discardPartial(const ResumeToken& token) {
    engineFor(QUrl(token.sourceUrl)).discardPartial(token);
}

} // namespace Baresha
