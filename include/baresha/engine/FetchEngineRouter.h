/**
 * @file FetchEngineRouter.h
 * @brief Picks the engine for a URL: yt-dlp for streaming sites, libcurl otherwise
 *
 * @copyright Copyright (c) 2024 Baresha Project
 * @license GPL-3.0-or-later
 */

#pragma once

#include "baresha/core/FetchEngine.h"

namespace Baresha {

class FetchEngineRouter : public FetchEngine {
public:
    /// Neither engine is owned
    FetchEngineRouter(FetchEngine& directEngine, FetchEngine& streamingEngine);

    StreamInfo resolve(const QUrl& url, const std::function<bool()>& shouldAbort) override;
    TransferOutcome transfer(const TransferRequest& request, const TransferControl& control) override;
    void discardPartial(const ResumeToken& token) override;
    QString name() const override { return QStringLiteral("router"); }

    [[nodiscard]] FetchEngine& engineFor(const QUrl& url) const;

private:
    FetchEngine& m_direct;
    FetchEngine& m_streaming;
};

} // namespace Baresha
