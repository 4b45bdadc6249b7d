#include "core/ipc/message.h"
#include "core/shared/logging.h"
#include <QJsonDocument>
#include <QtEndian>

#include <cstring>

namespace rc {

QByteArray IpcMessage::encode(const QJsonObject& json)
{
    const QByteArray payload = QJsonDocument(json).toJson(QJsonDocument::Compact);
    if (payload.size() > kMaxMessageSize) {
        LOG_WARN(rcIpc, "Message exceeds max size: %d > %d",
                 static_cast<int>(payload.size()), kMaxMessageSize);
        return {};
    }

    QByteArray msg;
    msg.reserve(4 + payload.size());
    const quint32 len = qToBigEndian(static_cast<quint32>(payload.size()));
    msg.append(reinterpret_cast<const char*>(&len), 4);
    msg.append(payload);
    return msg;
}

std::optional<IpcMessage::DecodeResult> IpcMessage::decode(const QByteArray& buffer)
{
    if (buffer.size() < 4) {
        return std::nullopt;
    }

    quint32 rawLen = 0;
    std::memcpy(&rawLen, buffer.constData(), 4);
    const quint32 payloadLen = qFromBigEndian(rawLen);
    if (payloadLen > static_cast<quint32>(kMaxMessageSize)) {
        LOG_WARN(rcIpc, "Received message length exceeds max: %u > %d",
                 payloadLen, kMaxMessageSize);
        return std::nullopt;
    }

    const int totalLen = 4 + static_cast<int>(payloadLen);
    if (buffer.size() < totalLen) {
        return std::nullopt;
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(
        buffer.mid(4, static_cast<int>(payloadLen)), &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        // Drop the frame so one bad message does not stall the stream.
        LOG_WARN(rcIpc, "Dropping malformed frame: %s",
                 qUtf8Printable(parseError.error != QJsonParseError::NoError
                                    ? parseError.errorString()
                                    : QStringLiteral("not a JSON object")));
        DecodeResult dropped;
        dropped.bytesConsumed = totalLen;
        return dropped;
    }

    DecodeResult result;
    result.json = doc.object();
    result.bytesConsumed = totalLen;
    return result;
}

std::optional<IpcRequest> IpcMessage::parseRequest(const QJsonObject& json, QString* error)
{
    IpcRequest request;
    request.id = requestId(json);
    request.method = json.value(QStringLiteral("method")).toString().trimmed();
    if (request.method.isEmpty()) {
        if (error) {
            *error = QStringLiteral("Request has no method");
        }
        return std::nullopt;
    }
    const QJsonValue params = json.value(QStringLiteral("params"));
    if (!params.isUndefined() && !params.isNull() && !params.isObject()) {
        if (error) {
            *error = QStringLiteral("Request params must be an object");
        }
        return std::nullopt;
    }
    request.params = params.toObject();
    return request;
}

uint64_t IpcMessage::requestId(const QJsonObject& json)
{
    return static_cast<uint64_t>(json.value(QStringLiteral("id")).toInteger());
}

QJsonObject IpcMessage::makeResponse(uint64_t id, const QJsonObject& result)
{
    QJsonObject json;
    json[QStringLiteral("type")] = QStringLiteral("response");
    json[QStringLiteral("id")] = static_cast<qint64>(id);
    json[QStringLiteral("result")] = result;
    return json;
}

QJsonObject IpcMessage::makeError(uint64_t id, IpcErrorCode code, const QString& message)
{
    QJsonObject errorObj;
    errorObj[QStringLiteral("code")] = static_cast<int>(code);
    errorObj[QStringLiteral("codeString")] = ipcErrorCodeToString(code);
    errorObj[QStringLiteral("message")] = message;

    QJsonObject json;
    json[QStringLiteral("type")] = QStringLiteral("error");
    json[QStringLiteral("id")] = static_cast<qint64>(id);
    json[QStringLiteral("error")] = errorObj;
    return json;
}

QJsonObject IpcMessage::makeError(uint64_t id, const ServiceError& error)
{
    return makeError(id, error.code, error.message);
}

} // namespace rc
