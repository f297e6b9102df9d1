#include "FakeS3Server.hpp"
#include <QtCore/QMutexLocker>
#include <QtCore/QUrl>
#include <QtCore/QUrlQuery>
#include <QtNetwork/QHostAddress>
#include <QtNetwork/QTcpServer>
#include <QtNetwork/QTcpSocket>

namespace Scribe {
namespace Test {

namespace {

QByteArray xmlEscape(const QString& text) {
    return text.toHtmlEscaped().toUtf8();
}

QByteArray reasonPhrase(int status) {
    switch (status) {
        case 200: return "OK";
        case 403: return "Forbidden";
        case 404: return "Not Found";
        default: return "Error";
    }
}

} // namespace

FakeS3Server::FakeS3Server(const QString& bucket, const QString& accessKey)
    : bucket_(bucket)
    , accessKey_(accessKey) {
}

FakeS3Server::~FakeS3Server() {
    stopServing();
}

bool FakeS3Server::startServing() {
    start();
    if (!ready_.tryAcquire(1, 5000)) {
        return false;
    }
    return port_.load() != 0;
}

void FakeS3Server::stopServing() {
    stop_ = true;
    wait();
}

QString FakeS3Server::endpoint() const {
    return QStringLiteral("http://127.0.0.1:%1").arg(port_.load());
}

void FakeS3Server::putObject(const QString& key, const QByteArray& data) {
    QMutexLocker locker(&mutex_);
    objects_.insert(key, data);
}

void FakeS3Server::setPageSize(int pageSize) {
    QMutexLocker locker(&mutex_);
    pageSize_ = qMax(1, pageSize);
}

QStringList FakeS3Server::requests() const {
    QMutexLocker locker(&mutex_);
    return requests_;
}

int FakeS3Server::listRequestCount() const {
    QMutexLocker locker(&mutex_);
    int count = 0;
    for (const QString& request : requests_) {
        if (request.contains("list-type=2")) {
            ++count;
        }
    }
    return count;
}

void FakeS3Server::run() {
    QTcpServer server;
    if (server.listen(QHostAddress::LocalHost, 0)) {
        port_ = server.serverPort();
    }
    ready_.release();
    if (port_.load() == 0) {
        return;
    }

    while (!stop_) {
        if (!server.waitForNewConnection(100)) {
            continue;
        }
        while (QTcpSocket* socket = server.nextPendingConnection()) {
            handle(*socket);
            delete socket;
        }
    }
}

void FakeS3Server::handle(QTcpSocket& socket) {
    QByteArray head;
    while (!head.contains("\r\n\r\n")) {
        if (!socket.waitForReadyRead(2000)) {
            return;
        }
        head += socket.readAll();
    }

    const QList<QByteArray> lines = head.left(head.indexOf("\r\n\r\n")).split('\n');
    const QList<QByteArray> requestLine = lines.value(0).trimmed().split(' ');
    const QString method = QString::fromLatin1(requestLine.value(0));
    const QString target = QString::fromLatin1(requestLine.value(1));

    QByteArray authorization;
    for (const QByteArray& line : lines) {
        if (line.toLower().startsWith("authorization:")) {
            authorization = line.mid(line.indexOf(':') + 1).trimmed();
        }
    }

    {
        QMutexLocker locker(&mutex_);
        requests_ << method + " " + target;
    }

    const int queryStart = target.indexOf('?');
    const QString path = QUrl::fromPercentEncoding(target.left(queryStart).toUtf8());
    const QString query = queryStart < 0 ? QString() : target.mid(queryStart + 1);

    int status = 200;
    QByteArray body;
    const QString bucketPath = "/" + bucket_;

    if (!authorization.contains("Credential=" + accessKey_.toUtf8() + "/")) {
        status = 403;
        body = errorBody("InvalidAccessKeyId", "The access key ID you provided does not exist in our records.");
    } else if (method != "GET") {
        status = 405;
        body = errorBody("MethodNotAllowed", "Only GET is supported.");
    } else if (path == bucketPath || path == bucketPath + "/") {
        body = listResponse(query, status);
    } else if (path.startsWith(bucketPath + "/")) {
        body = objectResponse(path.mid(bucketPath.size() + 1), status);
    } else {
        status = 404;
        body = errorBody("NoSuchBucket", "The specified bucket does not exist");
    }

    const bool isXml = status != 200 || !path.startsWith(bucketPath + "/");
    QByteArray response = "HTTP/1.1 " + QByteArray::number(status) + " " + reasonPhrase(status) + "\r\n";
    response += "Content-Type: " + QByteArray(isXml ? "application/xml" : "application/octet-stream") + "\r\n";
    response += "Content-Length: " + QByteArray::number(body.size()) + "\r\n";
    response += "x-amz-request-id: scribe-test\r\n";
    response += "Connection: close\r\n\r\n";
    response += body;

    socket.write(response);
    while (socket.bytesToWrite() > 0 && socket.waitForBytesWritten(2000)) {
    }
    socket.disconnectFromHost();
    if (socket.state() != QAbstractSocket::UnconnectedState) {
        socket.waitForDisconnected(1000);
    }
}

QByteArray FakeS3Server::listResponse(const QString& query, int& status) {
    const QUrlQuery params(query);
    const QString prefix = params.queryItemValue("prefix", QUrl::FullyDecoded);
    const QString delimiter = params.queryItemValue("delimiter", QUrl::FullyDecoded);
    const int start = params.queryItemValue("continuation-token", QUrl::FullyDecoded).toInt();

    QMutexLocker locker(&mutex_);
    int limit = pageSize_;
    const int maxKeys = params.queryItemValue("max-keys").toInt();
    if (maxKeys > 0) {
        limit = qMin(limit, maxKeys);
    }

    // Keys and rolled-up prefixes in lexical order, as S3 returns them
    QStringList entries;
    for (auto it = objects_.constBegin(); it != objects_.constEnd(); ++it) {
        const QString& key = it.key();
        if (!key.startsWith(prefix)) {
            continue;
        }
        if (!delimiter.isEmpty()) {
            const int cut = key.indexOf(delimiter, prefix.size());
            if (cut >= 0) {
                const QString common = key.left(cut + delimiter.size());
                if (!entries.contains("P" + common)) {
                    entries << "P" + common;
                }
                continue;
            }
        }
        entries << "K" + key;
    }

    const int end = qMin<int>(entries.size(), start + limit);
    const bool truncated = end < entries.size();

    status = 200;
    QByteArray xml = "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
                     "<ListBucketResult xmlns=\"http://s3.amazonaws.com/doc/2006-03-01/\">";
    xml += "<Name>" + xmlEscape(bucket_) + "</Name>";
    xml += "<Prefix>" + xmlEscape(prefix) + "</Prefix>";
    xml += "<KeyCount>" + QByteArray::number(end - start) + "</KeyCount>";
    xml += "<MaxKeys>" + QByteArray::number(limit) + "</MaxKeys>";
    if (!delimiter.isEmpty()) {
        xml += "<Delimiter>" + xmlEscape(delimiter) + "</Delimiter>";
    }
    xml += QByteArray("<IsTruncated>") + (truncated ? "true" : "false") + "</IsTruncated>";
    if (truncated) {
        xml += "<NextContinuationToken>" + QByteArray::number(end) + "</NextContinuationToken>";
    }
    for (int i = start; i < end; ++i) {
        const QString entry = entries.at(i);
        if (entry.startsWith('K')) {
            const QString key = entry.mid(1);
            xml += "<Contents><Key>" + xmlEscape(key) + "</Key>"
                   "<LastModified>2024-05-01T09:00:00.000Z</LastModified>"
                   "<Size>" + QByteArray::number(objects_.value(key).size()) + "</Size>"
                   "<StorageClass>STANDARD</StorageClass></Contents>";
        } else {
            xml += "<CommonPrefixes><Prefix>" + xmlEscape(entry.mid(1)) + "</Prefix></CommonPrefixes>";
        }
    }
    xml += "</ListBucketResult>";
    return xml;
}

QByteArray FakeS3Server::objectResponse(const QString& key, int& status) {
    QMutexLocker locker(&mutex_);
    if (!objects_.contains(key)) {
        status = 404;
        return errorBody("NoSuchKey", "The specified key does not exist.");
    }
    status = 200;
    return objects_.value(key);
}

QByteArray FakeS3Server::errorBody(const QString& code, const QString& message) {
    return "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n<Error><Code>" + xmlEscape(code) +
           "</Code><Message>" + xmlEscape(message) + "</Message><RequestId>scribe-test</RequestId></Error>";
}

} // namespace Test
} // namespace Scribe
