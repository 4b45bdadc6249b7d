#include "core/ipc/service_base.h"
#include "core/shared/logging.h"
#include <QCoreApplication>
#include <QDateTime>
#include <QDir>
#include <QFileInfo>
#include <QJsonObject>

#include <sys/types.h>
#include <unistd.h>

#include <cstdio>

namespace rc {

namespace {

QString envDirectory(const char* envName)
{
    const QString value = qEnvironmentVariable(envName).trimmed();
    return value.isEmpty() ? QString() : QDir::cleanPath(value);
}

QString socketDirectory()
{
    QString dir = envDirectory("RECOLLECT_SOCKET_DIR");
    if (dir.isEmpty()) {
        dir = envDirectory("RECOLLECT_RUNTIME_DIR");
    }
    if (dir.isEmpty()) {
        dir = QStringLiteral("/tmp/recollect-%1").arg(getuid());
    }
    return dir;
}

} // namespace

ServiceBase::ServiceBase(const QString& serviceName, QObject* parent)
    : QObject(parent)
    , m_serviceName(serviceName)
    , m_server(std::make_unique<SocketServer>(this))
{
    m_server->setRequestHandler(
        [this](const IpcRequest& request, const SocketServer::RequestContext& context) {
            return handleRequest(request, context);
        });
    connect(m_server.get(), &SocketServer::clientDisconnected,
            this, [this](quint64 clientId) { onClientGone(clientId); });
}

ServiceBase::~ServiceBase() = default;

int ServiceBase::run()
{
    const QString path = socketPath(m_serviceName);
    const QDir dir = QFileInfo(path).dir();
    if (!dir.exists() && !dir.mkpath(QStringLiteral("."))) {
        LOG_ERROR(rcIpc, "Failed to create socket directory: %s", qUtf8Printable(dir.path()));
        return 1;
    }

    if (!m_server->listen(path)) {
        LOG_ERROR(rcIpc, "Service '%s' failed to start", qUtf8Printable(m_serviceName));
        return 1;
    }
    LOG_INFO(rcIpc, "Service '%s' started on %s",
             qUtf8Printable(m_serviceName), qUtf8Printable(path));

    // Readiness line for whoever launched us
    fprintf(stdout, "ready\n");
    fflush(stdout);

    return QCoreApplication::exec();
}

QString ServiceBase::socketPath(const QString& serviceName)
{
    return QDir::cleanPath(socketDirectory() + QLatin1Char('/')
                           + serviceName + QStringLiteral(".sock"));
}

QJsonObject ServiceBase::handleRequest(const IpcRequest& request,
                                       const SocketServer::RequestContext& context)
{
    Q_UNUSED(context);

    if (request.method == QLatin1String(ipc_method::kPing)) {
        QJsonObject result;
        result[QStringLiteral("pong")] = true;
        result[QStringLiteral("timestamp")] = QDateTime::currentMSecsSinceEpoch();
        result[QStringLiteral("service")] = m_serviceName;
        return IpcMessage::makeResponse(request.id, result);
    }

    if (request.method == QLatin1String(ipc_method::kShutdown)) {
        LOG_INFO(rcIpc, "Shutdown requested for service '%s'", qUtf8Printable(m_serviceName));
        // Quit after the response has been written
        QMetaObject::invokeMethod(QCoreApplication::instance(), &QCoreApplication::quit,
                                  Qt::QueuedConnection);
        QJsonObject result;
        result[QStringLiteral("shutting_down")] = true;
        return IpcMessage::makeResponse(request.id, result);
    }

    LOG_WARN(rcIpc, "Unknown method '%s' in service '%s'",
             qUtf8Printable(request.method), qUtf8Printable(m_serviceName));
    return IpcMessage::makeError(request.id, IpcErrorCode::NotFound,
                                 QStringLiteral("Unknown method: %1").arg(request.method));
}

void ServiceBase::onClientGone(quint64 clientId)
{
    Q_UNUSED(clientId);
}

} // namespace rc
