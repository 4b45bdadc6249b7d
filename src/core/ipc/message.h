#pragma once

#include "core/shared/ipc_messages.h"
#include <QByteArray>
#include <QJsonObject>
#include <optional>

namespace rc {

// Framing and envelopes of the recollect-query socket protocol. A frame is a
// 4-byte big-endian payload length followed by one compact JSON object.
class IpcMessage {
public:
    static constexpr int kMaxMessageSize = 16 * 1024 * 1024;

    // Empty when the payload exceeds kMaxMessageSize.
    static QByteArray encode(const QJsonObject& json);

    struct DecodeResult {
        QJsonObject json;           // empty for a dropped malformed frame
        int bytesConsumed = 0;
    };
    // nullopt until the buffer holds a whole frame, or when the declared
    // length is over the limit.
    static std::optional<DecodeResult> decode(const QByteArray& buffer);

    // Fails on a missing method or non-object params.
    static std::optional<IpcRequest> parseRequest(const QJsonObject& json, QString* error = nullptr);
    static uint64_t requestId(const QJsonObject& json);

    static QJsonObject makeResponse(uint64_t id, const QJsonObject& result);
    static QJsonObject makeError(uint64_t id, IpcErrorCode code, const QString& message);
    static QJsonObject makeError(uint64_t id, const ServiceError& error);
};

} // namespace rc
