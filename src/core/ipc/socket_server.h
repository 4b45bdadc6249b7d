#pragma once

#include "core/ipc/message.h"
#include <QHash>
#include <QObject>
#include <QLocalServer>
#include <QLocalSocket>
#include <functional>
#include <memory>

namespace rc {

// SocketServer: QLocalServer front of a recollect service. Decodes frames,
// turns well-formed request envelopes into IpcRequest and hands them to the
// request handler; malformed envelopes are answered with INVALID_PARAMS.
class SocketServer : public QObject {
    Q_OBJECT
public:
    explicit SocketServer(QObject* parent = nullptr);
    ~SocketServer() override;

    // Thread-safe: may be called from any thread, at most once per request.
    // Dropped silently when the client has gone away.
    using Responder = std::function<void(const QJsonObject& response)>;

    struct RequestContext {
        quint64 clientId = 0;
        Responder respond;
    };

    // Returns the response, or an empty object when the handler kept
    // context.respond to answer later.
    using RequestHandler =
        std::function<QJsonObject(const IpcRequest& request, const RequestContext& context)>;

    // Replaces a stale socket file; fails if another service answers on it.
    bool listen(const QString& socketPath);
    void close();

    void setRequestHandler(RequestHandler handler);

    static constexpr int kMaxReadBufferSize = IpcMessage::kMaxMessageSize + 4;

signals:
    void clientDisconnected(quint64 clientId);

private slots:
    void onNewConnection();
    void onClientReadyRead();
    void onClientDisconnected();

private:
    struct ClientState {
        quint64 id = 0;
        QByteArray readBuffer;
    };

    void processBuffer(QLocalSocket* client);
    QJsonObject handleFrame(const QJsonObject& frame, const RequestContext& context);
    bool detachClient(QLocalSocket* client, quint64* clientId = nullptr);
    void deliver(quint64 clientId, const QJsonObject& response);

    std::unique_ptr<QLocalServer> m_server;
    QHash<QLocalSocket*, ClientState> m_clients;
    QHash<quint64, QLocalSocket*> m_clientsById;
    RequestHandler m_handler;
    quint64 m_nextClientId = 1;
    bool m_closing = false;
};

} // namespace rc
