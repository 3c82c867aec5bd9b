#include "MprisProvider.hpp"
#include <QDBusArgument>
#include <QDBusConnection>
#include <QDBusConnectionInterface>
#include <QDBusError>
#include <QDBusMessage>
#include <QDBusReply>
#include <QDBusVariant>
#include <vector>
#include "core/Logger.hpp"

namespace nd {

namespace {

const QString kMprisPrefix = QStringLiteral("org.mpris.MediaPlayer2.");
const QString kMprisPath = QStringLiteral("/org/mpris/MediaPlayer2");
const QString kPlayerInterface =
        QStringLiteral("org.mpris.MediaPlayer2.Player");
const QString kPropertiesInterface =
        QStringLiteral("org.freedesktop.DBus.Properties");

Result<std::string> stringField(const QVariantMap& metadata,
                                const QString& key) {
    auto it = metadata.find(key);
    if (it == metadata.end())
        return Result<std::string>::ok({});
    if (it->typeId() != QMetaType::QString)
        return Result<std::string>::err("MPRIS field " + key.toStdString() +
                                        " is not a string");
    return Result<std::string>::ok(it->toString().trimmed().toStdString());
}

// xesam:artist is specified as a string list but some players send a string
Result<std::string> artistField(const QVariantMap& metadata) {
    auto it = metadata.find(QStringLiteral("xesam:artist"));
    if (it == metadata.end())
        return Result<std::string>::ok({});
    if (it->typeId() == QMetaType::QString)
        return Result<std::string>::ok(it->toString().trimmed().toStdString());
    if (it->typeId() == QMetaType::QStringList) {
        QStringList artists;
        for (const auto& a : it->toStringList()) {
            if (!a.trimmed().isEmpty())
                artists << a.trimmed();
        }
        return Result<std::string>::ok(artists.join(", ").toStdString());
    }
    return Result<std::string>::err("MPRIS field xesam:artist is not a string list");
}

PlaybackStatus parseStatus(const QString& status) {
    if (status == QLatin1String("Playing"))
        return PlaybackStatus::Playing;
    if (status == QLatin1String("Paused"))
        return PlaybackStatus::Paused;
    return PlaybackStatus::Stopped;
}

} // namespace

std::unique_ptr<MediaProvider> createMediaProvider(const MediaConfig& config) {
    return std::make_unique<MprisProvider>(config);
}

MprisProvider::MprisProvider(const MediaConfig& config)
    : config_(config),
      artwork_(config.artworkMaxBytes, config.artworkTimeoutMs) {
}

MprisProvider::~MprisProvider() = default;

QStringList MprisProvider::filterPlayers(const QStringList& busNames,
                                         const QString& filter) {
    const auto wanted = filter.toStdString();
    QStringList players;
    for (const auto& name : busNames) {
        if (!name.startsWith(kMprisPrefix))
            continue;
        if (!matchesPlayerFilter(name.toStdString(), wanted))
            continue;
        players << name;
    }
    players.sort();
    return players;
}

Result<TrackInfo> MprisProvider::trackFromMetadata(const QVariantMap& metadata) {
    TrackInfo track;

    auto title = stringField(metadata, QStringLiteral("xesam:title"));
    if (!title)
        return Result<TrackInfo>::err(title.error().message);
    auto album = stringField(metadata, QStringLiteral("xesam:album"));
    if (!album)
        return Result<TrackInfo>::err(album.error().message);
    auto artist = artistField(metadata);
    if (!artist)
        return Result<TrackInfo>::err(artist.error().message);

    track.title = std::move(title).value();
    track.album = std::move(album).value();
    track.artist = std::move(artist).value();
    return Result<TrackInfo>::ok(std::move(track));
}

Result<QVariant> MprisProvider::playerProperty(const QString& busName,
                                               const QString& property) {
    auto msg = QDBusMessage::createMethodCall(
            busName, kMprisPath, kPropertiesInterface, QStringLiteral("Get"));
    msg << kPlayerInterface << property;

    QDBusMessage reply = QDBusConnection::sessionBus().call(
            msg, QDBus::Block, static_cast<int>(config_.dbusTimeoutMs));
    if (reply.type() == QDBusMessage::ErrorMessage)
        return Result<QVariant>::err(reply.errorName().toStdString() + ": " +
                                     reply.errorMessage().toStdString());
    if (reply.arguments().isEmpty())
        return Result<QVariant>::err("Empty reply for " + property.toStdString());

    QVariant value = reply.arguments().first();
    if (value.canConvert<QDBusVariant>())
        value = value.value<QDBusVariant>().variant();
    return Result<QVariant>::ok(value);
}

Result<QString> MprisProvider::selectPlayer() {
    auto bus = QDBusConnection::sessionBus();
    if (!bus.isConnected())
        return Result<QString>::err("D-Bus session bus unavailable: " +
                                    bus.lastError().message().toStdString());

    QDBusReply<QStringList> names = bus.interface()->registeredServiceNames();
    if (!names.isValid())
        return Result<QString>::err("ListNames failed: " +
                                    names.error().message().toStdString());

    auto players = filterPlayers(names.value(),
                                 QString::fromStdString(config_.player));

    std::vector<PlaybackStatus> statuses;
    for (const auto& player : players) {
        auto status = playerProperty(player, QStringLiteral("PlaybackStatus"));
        if (!status) {
            LOG_DEBUG("MprisProvider: {} did not answer: {}",
                      player.toStdString(), status.error().message);
            statuses.push_back(PlaybackStatus::Stopped);
            continue;
        }
        statuses.push_back(parseStatus(status.value().toString()));
    }

    auto index = selectSession(statuses);
    if (!index)
        return Result<QString>::ok(QString());
    return Result<QString>::ok(players.at(static_cast<qsizetype>(*index)));
}

Result<std::optional<TrackInfo>> MprisProvider::currentMedia() {
    using R = Result<std::optional<TrackInfo>>;

    auto player = selectPlayer();
    if (!player)
        return R::err(player.error().message);
    if (player.value().isEmpty())
        return R::ok(std::nullopt);

    auto metaValue = playerProperty(player.value(), QStringLiteral("Metadata"));
    if (!metaValue)
        return R::err(metaValue.error().message);

    QVariantMap metadata;
    if (metaValue.value().canConvert<QDBusArgument>()) {
        const auto arg = metaValue.value().value<QDBusArgument>();
        if (arg.currentType() != QDBusArgument::MapType)
            return R::err("MPRIS Metadata is not a dictionary");
        arg >> metadata;
    } else if (metaValue.value().typeId() == QMetaType::QVariantMap) {
        metadata = metaValue.value().toMap();
    } else {
        return R::err("MPRIS Metadata has unexpected type");
    }

    auto track = trackFromMetadata(metadata);
    if (!track)
        return R::err(track.error().message);

    track.value().player = player.value().mid(kMprisPrefix.size()).toStdString();

    auto artUrl = metadata.value(QStringLiteral("mpris:artUrl")).toString();
    if (!artUrl.isEmpty()) {
        auto art = artwork_.load(artUrl);
        if (art) {
            track.value().artwork = std::move(art).value();
            // data: URIs carry the image itself, the bytes are the identity
            if (!artUrl.startsWith(QLatin1String("data:")))
                track.value().artworkKey =
                        ArtworkLoader::cacheKey(artUrl).toStdString();
        }
    }

    return R::ok(std::move(track).value());
}

} // namespace nd
