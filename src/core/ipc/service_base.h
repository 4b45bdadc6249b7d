#pragma once

#include "core/ipc/socket_server.h"
#include <QString>
#include <memory>

namespace rc {

// ServiceBase: socket-facing skeleton of a recollect service. Answers ping
// and shutdown itself; subclasses take every other method.
class ServiceBase : public QObject {
    Q_OBJECT
public:
    explicit ServiceBase(const QString& serviceName, QObject* parent = nullptr);
    ~ServiceBase() override;

    // Listens, prints the readiness line and enters the event loop.
    int run();

    // <socket dir>/<serviceName>.sock. The directory is RECOLLECT_SOCKET_DIR,
    // else RECOLLECT_RUNTIME_DIR, else /tmp/recollect-<uid>.
    static QString socketPath(const QString& serviceName);

protected:
    // Return an empty object to answer later through context.respond.
    virtual QJsonObject handleRequest(const IpcRequest& request,
                                      const SocketServer::RequestContext& context);

    // Called on the server thread after a client goes away.
    virtual void onClientGone(quint64 clientId);

    QString m_serviceName;
    std::unique_ptr<SocketServer> m_server;
};

} // namespace rc
