#pragma once
// ArtworkLoader.hpp - Turns an mpris:artUrl into encoded image bytes
// file://, http(s):// and data: URLs; everything else is an error

#include <QNetworkAccessManager>
#include <QString>
#include <memory>
#include <optional>
#include "util/Result.hpp"
#include "util/Types.hpp"

namespace nd {

class ArtworkLoader {
public:
    ArtworkLoader(u32 maxBytes, u32 timeoutMs);
    ~ArtworkLoader();

    Result<Bytes> load(const QString& url);

    // Identity of what load(url) returns: the URL, plus modification time
    // and size for local files since players rewrite those in place
    static QString cacheKey(const QString& url);

private:
    Result<Bytes> loadFile(const QString& localPath);
    Result<Bytes> loadRemote(const QString& url);
    Result<Bytes> loadDataUri(const QString& url);

    u32 maxBytes_;
    u32 timeoutMs_;
    std::unique_ptr<QNetworkAccessManager> network_;

    // Last resolved URL, including failures, so a poll loop never refetches
    QString cachedKey_;
    std::optional<Result<Bytes>> cached_;
};

} // namespace nd
