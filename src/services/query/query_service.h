#pragma once

#include "core/concurrency/worker_pool.h"
#include "core/ipc/service_base.h"
#include "core/search/search_service.h"

#include <QHash>
#include <memory>
#include <mutex>

namespace rc {

// QueryService: IPC front of SearchService. Searches and re-index runs are
// answered asynchronously from the query pool; everything else inline.
class QueryService : public ServiceBase {
    Q_OBJECT
public:
    explicit QueryService(std::unique_ptr<SearchService> search,
                          int queryThreads, int queueLimit,
                          QObject* parent = nullptr);
    ~QueryService() override;

protected:
    QJsonObject handleRequest(const IpcRequest& request,
                              const SocketServer::RequestContext& context) override;
    void onClientGone(quint64 clientId) override;

private:
    using Job = std::function<std::optional<QJsonObject>(const CancelToken&, ServiceError*)>;

    // Runs job on the query pool and answers through context.respond.
    QJsonObject dispatch(uint64_t id, const QString& method,
                         const SocketServer::RequestContext& context, Job job);

    void trackToken(quint64 clientId, const CancelToken& token);
    void untrackToken(quint64 clientId, const CancelToken& token);

    std::unique_ptr<SearchService> m_search;
    WorkerPool m_queryPool;

    std::mutex m_tokensMutex;
    QHash<quint64, std::vector<CancelToken>> m_inFlight;
};

} // namespace rc
