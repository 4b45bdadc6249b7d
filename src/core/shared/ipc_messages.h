#pragma once

#include <QJsonObject>
#include <QString>
#include <cstdint>

namespace rc {

// Error codes of recollect-query error responses.
enum class IpcErrorCode : int {
    InvalidParams      = 1,     // malformed envelope or search/reindex parameters
    NotFound           = 2,     // unknown method, corpus or profile
    AlreadyRunning     = 3,     // corpus is being re-indexed
    InternalError      = 4,
    ServiceUnavailable = 5,     // query queue full or corpus cannot be opened
    StorageMismatch    = 6,     // storage bound to another corpus root
    Cancelled          = 7,
};

inline QString ipcErrorCodeToString(IpcErrorCode code)
{
    switch (code) {
    case IpcErrorCode::InvalidParams:      return QStringLiteral("INVALID_PARAMS");
    case IpcErrorCode::NotFound:           return QStringLiteral("NOT_FOUND");
    case IpcErrorCode::AlreadyRunning:     return QStringLiteral("ALREADY_RUNNING");
    case IpcErrorCode::InternalError:      return QStringLiteral("INTERNAL_ERROR");
    case IpcErrorCode::ServiceUnavailable: return QStringLiteral("SERVICE_UNAVAILABLE");
    case IpcErrorCode::StorageMismatch:    return QStringLiteral("STORAGE_MISMATCH");
    case IpcErrorCode::Cancelled:          return QStringLiteral("CANCELLED");
    }
    return QStringLiteral("UNKNOWN");
}

// Failure of a search or reindex call, sent back as an error response.
struct ServiceError {
    IpcErrorCode code = IpcErrorCode::InternalError;
    QString message;
};

// Methods answered by recollect-query.
namespace ipc_method {
inline constexpr char kPing[] = "ping";
inline constexpr char kShutdown[] = "shutdown";
inline constexpr char kSearch[] = "search";
inline constexpr char kReindex[] = "reindex";
inline constexpr char kListProfiles[] = "list_profiles";
inline constexpr char kListCorpora[] = "list_corpora";
inline constexpr char kCacheStats[] = "get_cache_stats";
} // namespace ipc_method

// Decoded request envelope.
struct IpcRequest {
    uint64_t id = 0;
    QString method;
    QJsonObject params;
};

} // namespace rc
