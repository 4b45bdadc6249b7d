#include "query_service.h"
#include "core/shared/logging.h"

#include <algorithm>

namespace rc {

QueryService::QueryService(std::unique_ptr<SearchService> search,
                           int queryThreads, int queueLimit, QObject* parent)
    : ServiceBase(QStringLiteral("query"), parent)
    , m_search(std::move(search))
    , m_queryPool(QStringLiteral("query"), queryThreads, queueLimit)
{
    LOG_INFO(rcCore, "QueryService initialized (default corpus '%s')",
             qUtf8Printable(m_search->defaultCorpus()));
}

QueryService::~QueryService()
{
    {
        std::lock_guard<std::mutex> lock(m_tokensMutex);
        for (const auto& tokens : m_inFlight) {
            for (const CancelToken& token : tokens) {
                token->store(true);
            }
        }
    }
    // Queries reference m_search; drain them before it goes away.
    m_queryPool.shutdown();
    m_search.reset();
}

QJsonObject QueryService::handleRequest(const IpcRequest& request,
                                        const SocketServer::RequestContext& context)
{
    const uint64_t id = request.id;
    const QString& method = request.method;
    const QJsonObject& params = request.params;

    if (method == QLatin1String(ipc_method::kSearch)) {
        return dispatch(id, method, context,
                        [this, params](const CancelToken& cancel, ServiceError* error) {
                            return m_search->search(params, cancel, error);
                        });
    }
    if (method == QLatin1String(ipc_method::kReindex)) {
        return dispatch(id, method, context,
                        [this, params](const CancelToken&, ServiceError* error) {
                            return m_search->reindex(params, error);
                        });
    }
    if (method == QLatin1String(ipc_method::kListProfiles)) {
        return IpcMessage::makeResponse(id, m_search->listProfiles());
    }
    if (method == QLatin1String(ipc_method::kListCorpora)) {
        return IpcMessage::makeResponse(id, m_search->listCorpora());
    }
    if (method == QLatin1String(ipc_method::kCacheStats)) {
        QJsonObject stats = m_search->cacheStats();
        QJsonObject pool;
        pool[QStringLiteral("threads")] = m_queryPool.threadCount();
        pool[QStringLiteral("pending")] = m_queryPool.pendingCount();
        pool[QStringLiteral("submitted")] = static_cast<qint64>(m_queryPool.submittedCount());
        pool[QStringLiteral("rejected")] = static_cast<qint64>(m_queryPool.rejectedCount());
        stats[QStringLiteral("queryPool")] = pool;
        return IpcMessage::makeResponse(id, stats);
    }

    return ServiceBase::handleRequest(request, context);
}

QJsonObject QueryService::dispatch(uint64_t id, const QString& method,
                                   const SocketServer::RequestContext& context, Job job)
{
    const CancelToken token = makeCancelToken();
    const quint64 clientId = context.clientId;
    const SocketServer::Responder respond = context.respond;
    trackToken(clientId, token);

    auto submitted = m_queryPool.submit([this, id, method, clientId, token, respond,
                                         job = std::move(job)]() {
        ServiceError error;
        std::optional<QJsonObject> result;
        if (isCancelled(token)) {
            error.code = IpcErrorCode::Cancelled;
            error.message = QStringLiteral("Request cancelled");
        } else {
            result = job(token, &error);
        }
        untrackToken(clientId, token);

        if (isCancelled(token)) {
            LOG_DEBUG(rcIpc, "Dropping %s response for cancelled request %llu",
                      qUtf8Printable(method), static_cast<unsigned long long>(id));
            return;
        }
        if (result) {
            respond(IpcMessage::makeResponse(id, *result));
        } else {
            respond(IpcMessage::makeError(id, error));
        }
    });

    if (!submitted) {
        untrackToken(clientId, token);
        return IpcMessage::makeError(id, IpcErrorCode::ServiceUnavailable,
                                     QStringLiteral("Query queue is full"));
    }
    return {};
}

void QueryService::onClientGone(quint64 clientId)
{
    std::vector<CancelToken> tokens;
    {
        std::lock_guard<std::mutex> lock(m_tokensMutex);
        tokens = m_inFlight.take(clientId);
    }
    for (const CancelToken& token : tokens) {
        token->store(true);
    }
    if (!tokens.empty()) {
        LOG_INFO(rcIpc, "Cancelled %d in-flight request(s) of client %llu",
                 static_cast<int>(tokens.size()), static_cast<unsigned long long>(clientId));
    }
}

void QueryService::trackToken(quint64 clientId, const CancelToken& token)
{
    std::lock_guard<std::mutex> lock(m_tokensMutex);
    m_inFlight[clientId].push_back(token);
}

void QueryService::untrackToken(quint64 clientId, const CancelToken& token)
{
    std::lock_guard<std::mutex> lock(m_tokensMutex);
    auto it = m_inFlight.find(clientId);
    if (it == m_inFlight.end()) {
        return;
    }
    auto& tokens = it.value();
    tokens.erase(std::remove(tokens.begin(), tokens.end(), token), tokens.end());
    if (tokens.empty()) {
        m_inFlight.erase(it);
    }
}

} // namespace rc
