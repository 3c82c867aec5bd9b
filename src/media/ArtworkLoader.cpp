#include "ArtworkLoader.hpp"
#include <QEventLoop>
#include <QFile>
#include <QFileInfo>
#include <QNetworkReply>
#include <QTimer>
#include <QUrl>
#include "core/Logger.hpp"

namespace nd {

namespace {

Bytes toBytes(const QByteArray& data) {
    return Bytes(data.begin(), data.end());
}

} // namespace

ArtworkLoader::ArtworkLoader(u32 maxBytes, u32 timeoutMs)
    : maxBytes_(maxBytes), timeoutMs_(timeoutMs) {
}

ArtworkLoader::~ArtworkLoader() = default;

QString ArtworkLoader::cacheKey(const QString& url) {
    QUrl parsed(url);
    if (!parsed.isLocalFile())
        return url;
    QFileInfo info(parsed.toLocalFile());
    return url + QString("@%1:%2")
                         .arg(info.lastModified().toMSecsSinceEpoch())
                         .arg(info.size());
}

Result<Bytes> ArtworkLoader::load(const QString& url) {
    if (url.isEmpty())
        return Result<Bytes>::err("Empty artwork URL");

    QUrl parsed(url);
    QString key = cacheKey(url);

    if (cached_ && key == cachedKey_)
        return *cached_;

    Result<Bytes> result = Result<Bytes>::err("Unsupported artwork URL scheme: " +
                                              parsed.scheme().toStdString());
    if (parsed.isLocalFile()) {
        result = loadFile(parsed.toLocalFile());
    } else if (parsed.scheme() == "http" || parsed.scheme() == "https") {
        result = loadRemote(url);
    } else if (parsed.scheme() == "data") {
        result = loadDataUri(url);
    }

    if (!result)
        LOG_DEBUG("ArtworkLoader: {} ({})", result.error().message,
                  url.left(120).toStdString());

    cachedKey_ = key;
    cached_ = result;
    return result;
}

Result<Bytes> ArtworkLoader::loadFile(const QString& localPath) {
    QFile file(localPath);
    if (!file.open(QIODevice::ReadOnly))
        return Result<Bytes>::err("Cannot open artwork file: " +
                                  file.errorString().toStdString());
    if (file.size() > static_cast<qint64>(maxBytes_))
        return Result<Bytes>::err("Artwork file exceeds size limit");
    return Result<Bytes>::ok(toBytes(file.readAll()));
}

Result<Bytes> ArtworkLoader::loadRemote(const QString& url) {
    if (!network_)
        network_ = std::make_unique<QNetworkAccessManager>();

    QNetworkRequest request((QUrl(url)));
    request.setTransferTimeout(static_cast<int>(timeoutMs_));
    std::unique_ptr<QNetworkReply> reply(network_->get(request));

    // Bounded synchronous wait, the poll loop is single threaded
    QEventLoop loop;
    QTimer timer;
    timer.setSingleShot(true);
    QObject::connect(&timer, &QTimer::timeout, &loop, &QEventLoop::quit);
    QObject::connect(reply.get(), &QNetworkReply::finished, &loop,
                     &QEventLoop::quit);
    timer.start(static_cast<int>(timeoutMs_));
    loop.exec();

    if (!reply->isFinished()) {
        reply->abort();
        return Result<Bytes>::err("Artwork download timed out");
    }
    if (reply->error() != QNetworkReply::NoError)
        return Result<Bytes>::err("Artwork download failed: " +
                                  reply->errorString().toStdString());

    QByteArray data = reply->readAll();
    if (data.size() > static_cast<qsizetype>(maxBytes_))
        return Result<Bytes>::err("Artwork download exceeds size limit");
    return Result<Bytes>::ok(toBytes(data));
}

Result<Bytes> ArtworkLoader::loadDataUri(const QString& url) {
    // data:[<mediatype>][;base64],<data>
    int comma = url.indexOf(',');
    if (comma < 0)
        return Result<Bytes>::err("Malformed data URI");

    QString header = url.mid(5, comma - 5);
    QByteArray payload = url.mid(comma + 1).toLatin1();
    QByteArray data;
    if (header.endsWith(";base64")) {
        auto decoded = QByteArray::fromBase64Encoding(payload);
        if (!decoded)
            return Result<Bytes>::err("Malformed base64 in data URI");
        data = *decoded;
    } else {
        data = QByteArray::fromPercentEncoding(payload);
    }

    if (data.size() > static_cast<qsizetype>(maxBytes_))
        return Result<Bytes>::err("Artwork data exceeds size limit");
    return Result<Bytes>::ok(toBytes(data));
}

} // namespace nd
