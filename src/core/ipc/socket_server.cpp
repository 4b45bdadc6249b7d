#include "core/ipc/socket_server.h"
#include "core/shared/logging.h"
#include <QJsonObject>
#include <QMetaObject>

namespace rc {

namespace {

bool socketHasActivePeer(const QString& socketPath)
{
    QLocalSocket peer;
    peer.connectToServer(socketPath);
    const bool connected = peer.waitForConnected(150);
    if (connected) {
        peer.disconnectFromServer();
        peer.waitForDisconnected(50);
    }
    return connected;
}

} // namespace

SocketServer::SocketServer(QObject* parent)
    : QObject(parent)
    , m_server(std::make_unique<QLocalServer>(this))
{
    connect(m_server.get(), &QLocalServer::newConnection,
            this, &SocketServer::onNewConnection);
}

SocketServer::~SocketServer()
{
    close();
}

bool SocketServer::listen(const QString& socketPath)
{
    m_server->setSocketOptions(QLocalServer::UserAccessOption);
    if (m_server->listen(socketPath)) {
        LOG_INFO(rcIpc, "Listening on %s", qUtf8Printable(socketPath));
        return true;
    }

    if (m_server->serverError() != QAbstractSocket::AddressInUseError) {
        LOG_ERROR(rcIpc, "Failed to listen on %s: %s",
                  qUtf8Printable(socketPath), qUtf8Printable(m_server->errorString()));
        return false;
    }
    if (socketHasActivePeer(socketPath)) {
        LOG_ERROR(rcIpc, "Socket already in use by an active service: %s",
                  qUtf8Printable(socketPath));
        return false;
    }

    LOG_WARN(rcIpc, "Removing stale socket: %s", qUtf8Printable(socketPath));
    QLocalServer::removeServer(socketPath);
    if (!m_server->listen(socketPath)) {
        LOG_ERROR(rcIpc, "Failed to listen on %s after stale cleanup: %s",
                  qUtf8Printable(socketPath), qUtf8Printable(m_server->errorString()));
        return false;
    }
    LOG_INFO(rcIpc, "Listening on %s", qUtf8Printable(socketPath));
    return true;
}

void SocketServer::close()
{
    if (m_closing) {
        return;
    }
    m_closing = true;

    // Detach bookkeeping first so disconnect callbacks find nothing to do.
    const QList<QLocalSocket*> clients = m_clients.keys();
    m_clients.clear();
    m_clientsById.clear();

    for (QLocalSocket* client : clients) {
        client->disconnect(this);
        if (client->state() != QLocalSocket::UnconnectedState) {
            client->disconnectFromServer();
        }
        client->deleteLater();
    }

    if (m_server->isListening()) {
        const QString path = m_server->fullServerName();
        m_server->close();
        LOG_INFO(rcIpc, "Server closed: %s", qUtf8Printable(path));
    }

    m_closing = false;
}

void SocketServer::setRequestHandler(RequestHandler handler)
{
    m_handler = std::move(handler);
}

void SocketServer::onNewConnection()
{
    while (QLocalSocket* client = m_server->nextPendingConnection()) {
        const quint64 id = m_nextClientId++;
        m_clients.insert(client, ClientState{id, {}});
        m_clientsById.insert(id, client);
        LOG_INFO(rcIpc, "Client %llu connected", static_cast<unsigned long long>(id));

        connect(client, &QLocalSocket::readyRead,
                this, &SocketServer::onClientReadyRead);
        connect(client, &QLocalSocket::disconnected,
                this, &SocketServer::onClientDisconnected);
    }
}

void SocketServer::onClientReadyRead()
{
    auto* client = qobject_cast<QLocalSocket*>(sender());
    if (!client || !m_clients.contains(client)) return;

    QByteArray& buffer = m_clients[client].readBuffer;
    buffer.append(client->readAll());

    if (buffer.size() > kMaxReadBufferSize) {
        LOG_ERROR(rcIpc, "Client read buffer exceeded %d bytes, disconnecting client",
                  kMaxReadBufferSize);
        quint64 id = 0;
        const bool wasTracked = detachClient(client, &id);
        client->disconnectFromServer();
        if (wasTracked) {
            client->deleteLater();
            emit clientDisconnected(id);
        }
        return;
    }

    processBuffer(client);
}

void SocketServer::onClientDisconnected()
{
    auto* client = qobject_cast<QLocalSocket*>(sender());
    if (!client) return;

    quint64 id = 0;
    if (detachClient(client, &id)) {
        LOG_INFO(rcIpc, "Client %llu disconnected", static_cast<unsigned long long>(id));
        client->deleteLater();
        emit clientDisconnected(id);
    }
}

bool SocketServer::detachClient(QLocalSocket* client, quint64* clientId)
{
    auto it = m_clients.find(client);
    if (it == m_clients.end()) {
        return false;
    }
    if (clientId) {
        *clientId = it->id;
    }
    m_clientsById.remove(it->id);
    m_clients.erase(it);
    return true;
}

void SocketServer::deliver(quint64 clientId, const QJsonObject& response)
{
    QLocalSocket* client = m_clientsById.value(clientId, nullptr);
    if (!client) {
        LOG_DEBUG(rcIpc, "Dropping response for departed client %llu",
                  static_cast<unsigned long long>(clientId));
        return;
    }
    const QByteArray encoded = IpcMessage::encode(response);
    if (!encoded.isEmpty()) {
        client->write(encoded);
        client->flush();
    }
}

void SocketServer::processBuffer(QLocalSocket* client)
{
    while (m_clients.contains(client)) {
        ClientState& state = m_clients[client];
        auto result = IpcMessage::decode(state.readBuffer);
        if (!result) break;

        state.readBuffer.remove(0, result->bytesConsumed);
        if (result->json.isEmpty()) {
            continue;   // dropped malformed frame
        }

        const quint64 clientId = state.id;
        RequestContext context;
        context.clientId = clientId;
        context.respond = [this, clientId](const QJsonObject& response) {
            QMetaObject::invokeMethod(this, [this, clientId, response]() {
                deliver(clientId, response);
            }, Qt::QueuedConnection);
        };

        const QJsonObject response = handleFrame(result->json, context);
        if (!response.isEmpty()) {
            deliver(clientId, response);
        }
    }
}

QJsonObject SocketServer::handleFrame(const QJsonObject& frame, const RequestContext& context)
{
    const QString type = frame.value(QStringLiteral("type")).toString();
    if (type != QLatin1String("request")) {
        LOG_WARN(rcIpc, "Ignoring message of type '%s' from client %llu",
                 qUtf8Printable(type), static_cast<unsigned long long>(context.clientId));
        return {};
    }

    QString error;
    auto request = IpcMessage::parseRequest(frame, &error);
    if (!request) {
        return IpcMessage::makeError(IpcMessage::requestId(frame),
                                     IpcErrorCode::InvalidParams, error);
    }
    LOG_DEBUG(rcIpc, "Request %llu: %s from client %llu",
              static_cast<unsigned long long>(request->id), qUtf8Printable(request->method),
              static_cast<unsigned long long>(context.clientId));

    if (!m_handler) {
        return IpcMessage::makeError(request->id, IpcErrorCode::InternalError,
                                     QStringLiteral("No request handler registered"));
    }
    return m_handler(*request, context);
}

} // namespace rc
