#include <QtTest/QtTest>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QtEndian>
#include "core/ipc/message.h"
#include "core/shared/ipc_messages.h"

#include <cstring>

class TestIpcMessages : public QObject {
    Q_OBJECT

private slots:
    // ── Framing ──────────────────────────────────────────────────
    void testSearchRequestRoundtrip();
    void testErrorRoundtrip();
    void testLengthPrefixIsBigEndian();
    void testDecodeIncompleteBuffer();
    void testDecodeConsecutiveFrames();
    void testDecodeRejectsOversizedLength();
    void testMalformedFrameDropped();
    void testNonObjectFrameDropped();
    void testUnicodeContentSurvivesRoundtrip();

    // ── Envelopes ────────────────────────────────────────────────
    void testErrorFromServiceError();
    void testErrorCodeStrings();
    void testMethodNames();

    // ── parseRequest ─────────────────────────────────────────────
    void testParseRequest();
    void testParseRequestWithoutParams();
    void testParseRequestRejectsMissingMethod();
    void testParseRequestRejectsNonObjectParams();
};

namespace {

QByteArray frame(const QByteArray& payload)
{
    QByteArray buf(4, '\0');
    const quint32 len = qToBigEndian(static_cast<quint32>(payload.size()));
    std::memcpy(buf.data(), &len, 4);
    buf.append(payload);
    return buf;
}

QJsonObject requestEnvelope(uint64_t id, const QString& method, const QJsonObject& params = {})
{
    QJsonObject json{
        {QStringLiteral("type"), QStringLiteral("request")},
        {QStringLiteral("id"), static_cast<qint64>(id)},
        {QStringLiteral("method"), method},
    };
    if (!params.isEmpty()) {
        json[QStringLiteral("params")] = params;
    }
    return json;
}

} // namespace

// ── Framing ──────────────────────────────────────────────────────

void TestIpcMessages::testSearchRequestRoundtrip()
{
    const QJsonObject params{
        {QStringLiteral("query"), QStringLiteral("AI")},
        {QStringLiteral("profile"), QStringLiteral("recent")},
        {QStringLiteral("includeTypes"), QJsonArray{QStringLiteral("note")}},
    };
    const QByteArray encoded = rc::IpcMessage::encode(
        requestEnvelope(42, QStringLiteral("search"), params));
    QVERIFY(!encoded.isEmpty());

    const auto decoded = rc::IpcMessage::decode(encoded);
    QVERIFY(decoded.has_value());
    QCOMPARE(decoded->bytesConsumed, static_cast<int>(encoded.size()));
    QCOMPARE(decoded->json[QStringLiteral("type")].toString(), QStringLiteral("request"));
    QCOMPARE(rc::IpcMessage::requestId(decoded->json), uint64_t(42));
    QCOMPARE(decoded->json[QStringLiteral("method")].toString(), QStringLiteral("search"));
    QCOMPARE(decoded->json[QStringLiteral("params")].toObject(), params);
}

void TestIpcMessages::testErrorRoundtrip()
{
    const QByteArray encoded = rc::IpcMessage::encode(rc::IpcMessage::makeError(
        7, rc::IpcErrorCode::StorageMismatch, QStringLiteral("Storage directory mismatch detected.")));
    const auto decoded = rc::IpcMessage::decode(encoded);
    QVERIFY(decoded.has_value());
    QCOMPARE(decoded->json[QStringLiteral("type")].toString(), QStringLiteral("error"));
    QCOMPARE(decoded->json[QStringLiteral("id")].toInteger(), 7);

    const QJsonObject errObj = decoded->json[QStringLiteral("error")].toObject();
    QCOMPARE(errObj[QStringLiteral("code")].toInt(),
             static_cast<int>(rc::IpcErrorCode::StorageMismatch));
    QCOMPARE(errObj[QStringLiteral("codeString")].toString(), QStringLiteral("STORAGE_MISMATCH"));
    QCOMPARE(errObj[QStringLiteral("message")].toString(),
             QStringLiteral("Storage directory mismatch detected."));
}

void TestIpcMessages::testLengthPrefixIsBigEndian()
{
    const QByteArray encoded = rc::IpcMessage::encode(QJsonObject{});
    QCOMPARE(encoded.size(), 4 + 2);
    QCOMPARE(encoded.left(4), QByteArray("\x00\x00\x00\x02", 4));
    QCOMPARE(encoded.mid(4), QByteArray("{}"));
}

void TestIpcMessages::testDecodeIncompleteBuffer()
{
    QVERIFY(!rc::IpcMessage::decode(QByteArray()).has_value());
    QVERIFY(!rc::IpcMessage::decode(QByteArray("\x00\x00", 2)).has_value());

    const QByteArray encoded = rc::IpcMessage::encode(
        requestEnvelope(1, QStringLiteral("list_profiles")));
    QVERIFY(!rc::IpcMessage::decode(encoded.left(encoded.size() - 1)).has_value());
}

void TestIpcMessages::testDecodeConsecutiveFrames()
{
    QByteArray combined = rc::IpcMessage::encode(
        requestEnvelope(1, QStringLiteral("ping")));
    combined.append(rc::IpcMessage::encode(
        requestEnvelope(2, QStringLiteral("list_corpora"))));

    const auto first = rc::IpcMessage::decode(combined);
    QVERIFY(first.has_value());
    QCOMPARE(first->json[QStringLiteral("method")].toString(), QStringLiteral("ping"));
    QVERIFY(first->bytesConsumed < combined.size());

    const auto second = rc::IpcMessage::decode(combined.mid(first->bytesConsumed));
    QVERIFY(second.has_value());
    QCOMPARE(second->json[QStringLiteral("method")].toString(), QStringLiteral("list_corpora"));
}

void TestIpcMessages::testDecodeRejectsOversizedLength()
{
    QByteArray buf(4, '\0');
    const quint32 hugeLen = qToBigEndian(static_cast<quint32>(20 * 1024 * 1024));
    std::memcpy(buf.data(), &hugeLen, 4);
    buf.append(QByteArray(100, 'x'));
    QVERIFY(!rc::IpcMessage::decode(buf).has_value());
    QCOMPARE(rc::IpcMessage::kMaxMessageSize, 16 * 1024 * 1024);
}

void TestIpcMessages::testMalformedFrameDropped()
{
    QByteArray buf = frame("{ not json");
    const int badSize = static_cast<int>(buf.size());
    buf.append(rc::IpcMessage::encode(requestEnvelope(3, QStringLiteral("ping"))));

    const auto dropped = rc::IpcMessage::decode(buf);
    QVERIFY(dropped.has_value());
    QVERIFY(dropped->json.isEmpty());
    QCOMPARE(dropped->bytesConsumed, badSize);

    const auto next = rc::IpcMessage::decode(buf.mid(dropped->bytesConsumed));
    QVERIFY(next.has_value());
    QCOMPARE(next->json[QStringLiteral("method")].toString(), QStringLiteral("ping"));
}

void TestIpcMessages::testNonObjectFrameDropped()
{
    const QByteArray buf = frame("[1, 2, 3]");
    const auto dropped = rc::IpcMessage::decode(buf);
    QVERIFY(dropped.has_value());
    QVERIFY(dropped->json.isEmpty());
    QCOMPARE(dropped->bytesConsumed, static_cast<int>(buf.size()));
}

void TestIpcMessages::testUnicodeContentSurvivesRoundtrip()
{
    const QString query = QString::fromUtf8("\xC3\xA9\xC3\xA0\xC3\xBC \xe6\x97\xa5\xe6\x9c\xac\xe8\xaa\x9e");
    const auto decoded = rc::IpcMessage::decode(rc::IpcMessage::encode(
        requestEnvelope(1, QStringLiteral("search"),
                                    QJsonObject{{QStringLiteral("query"), query}})));
    QVERIFY(decoded.has_value());
    QCOMPARE(decoded->json[QStringLiteral("params")].toObject()[QStringLiteral("query")].toString(),
             query);
}

// ── Envelopes ────────────────────────────────────────────────────

void TestIpcMessages::testErrorFromServiceError()
{
    rc::ServiceError error;
    error.code = rc::IpcErrorCode::AlreadyRunning;
    error.message = QStringLiteral("Corpus 'notes' is already being re-indexed");

    const QJsonObject json = rc::IpcMessage::makeError(12, error);
    QCOMPARE(json[QStringLiteral("type")].toString(), QStringLiteral("error"));
    QCOMPARE(rc::IpcMessage::requestId(json), uint64_t(12));
    const QJsonObject errObj = json[QStringLiteral("error")].toObject();
    QCOMPARE(errObj[QStringLiteral("codeString")].toString(), QStringLiteral("ALREADY_RUNNING"));
    QCOMPARE(errObj[QStringLiteral("message")].toString(), error.message);

    // Defaults to an internal error.
    const QJsonObject fallback = rc::IpcMessage::makeError(13, rc::ServiceError{});
    QCOMPARE(fallback[QStringLiteral("error")].toObject()[QStringLiteral("codeString")].toString(),
             QStringLiteral("INTERNAL_ERROR"));
}

void TestIpcMessages::testErrorCodeStrings()
{
    QCOMPARE(rc::ipcErrorCodeToString(rc::IpcErrorCode::InvalidParams), QStringLiteral("INVALID_PARAMS"));
    QCOMPARE(rc::ipcErrorCodeToString(rc::IpcErrorCode::NotFound), QStringLiteral("NOT_FOUND"));
    QCOMPARE(rc::ipcErrorCodeToString(rc::IpcErrorCode::AlreadyRunning), QStringLiteral("ALREADY_RUNNING"));
    QCOMPARE(rc::ipcErrorCodeToString(rc::IpcErrorCode::ServiceUnavailable),
             QStringLiteral("SERVICE_UNAVAILABLE"));
    QCOMPARE(rc::ipcErrorCodeToString(rc::IpcErrorCode::Cancelled), QStringLiteral("CANCELLED"));
    QCOMPARE(rc::ipcErrorCodeToString(rc::IpcErrorCode::StorageMismatch),
             QStringLiteral("STORAGE_MISMATCH"));
    QCOMPARE(rc::ipcErrorCodeToString(rc::IpcErrorCode::InternalError),
             QStringLiteral("INTERNAL_ERROR"));
}

void TestIpcMessages::testMethodNames()
{
    QCOMPARE(QString::fromLatin1(rc::ipc_method::kSearch), QStringLiteral("search"));
    QCOMPARE(QString::fromLatin1(rc::ipc_method::kReindex), QStringLiteral("reindex"));
    QCOMPARE(QString::fromLatin1(rc::ipc_method::kCacheStats), QStringLiteral("get_cache_stats"));

    const auto parsed = rc::IpcMessage::parseRequest(
        requestEnvelope(1, QString::fromLatin1(rc::ipc_method::kListCorpora)));
    QVERIFY(parsed.has_value());
    QCOMPARE(parsed->method, QStringLiteral("list_corpora"));
}

// ── parseRequest ─────────────────────────────────────────────────

void TestIpcMessages::testParseRequest()
{
    QString error;
    const auto request = rc::IpcMessage::parseRequest(
        requestEnvelope(9, QStringLiteral(" reindex "),
                                    QJsonObject{{QStringLiteral("force"), true}}),
        &error);
    QVERIFY2(request.has_value(), qPrintable(error));
    QCOMPARE(request->id, uint64_t(9));
    QCOMPARE(request->method, QStringLiteral("reindex"));
    QCOMPARE(request->params.value(QStringLiteral("force")).toBool(), true);
}

void TestIpcMessages::testParseRequestWithoutParams()
{
    const auto request = rc::IpcMessage::parseRequest(
        requestEnvelope(2, QStringLiteral("list_profiles")));
    QVERIFY(request.has_value());
    QVERIFY(request->params.isEmpty());

    QJsonObject withNull = requestEnvelope(3, QStringLiteral("ping"));
    withNull[QStringLiteral("params")] = QJsonValue::Null;
    QVERIFY(rc::IpcMessage::parseRequest(withNull).has_value());
}

void TestIpcMessages::testParseRequestRejectsMissingMethod()
{
    QString error;
    QVERIFY(!rc::IpcMessage::parseRequest(QJsonObject{{QStringLiteral("id"), 1}}, &error));
    QCOMPARE(error, QStringLiteral("Request has no method"));
}

void TestIpcMessages::testParseRequestRejectsNonObjectParams()
{
    QJsonObject req = requestEnvelope(4, QStringLiteral("search"));
    req[QStringLiteral("params")] = QJsonArray{QStringLiteral("AI")};

    QString error;
    QVERIFY(!rc::IpcMessage::parseRequest(req, &error));
    QCOMPARE(error, QStringLiteral("Request params must be an object"));
}

QTEST_MAIN(TestIpcMessages)
#include "test_ipc_messages.moc"
