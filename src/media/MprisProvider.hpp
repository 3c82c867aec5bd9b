/**
 * @file MprisProvider.hpp
 * @brief MediaProvider backed by MPRIS players on the D-Bus session bus.
 *
 * Players register as org.mpris.MediaPlayer2.<name>. The provider prefers
 * a Playing player, then a Paused one, and reads xesam metadata plus the
 * artwork behind mpris:artUrl.
 *
 * @section Dependencies
 * - QtDBus
 * - ArtworkLoader
 */

#pragma once
#include <QString>
#include <QVariantMap>
#include "ArtworkLoader.hpp"
#include "MediaProvider.hpp"
#include "core/ConfigData.hpp"

namespace nd {

class MprisProvider : public MediaProvider {
public:
    explicit MprisProvider(const MediaConfig& config);
    ~MprisProvider() override;

    Result<std::optional<TrackInfo>> currentMedia() override;

    // Maps an MPRIS Metadata dictionary, artwork excluded. Wrongly typed
    // xesam fields are an error rather than silently empty.
    static Result<TrackInfo> trackFromMetadata(const QVariantMap& metadata);

    // Bus names that look like MPRIS players and pass the player filter
    static QStringList filterPlayers(const QStringList& busNames,
                                     const QString& filter);

private:
    Result<QString> selectPlayer();
    Result<QVariant> playerProperty(const QString& busName,
                                    const QString& property);

    MediaConfig config_;
    ArtworkLoader artwork_;
};

} // namespace nd
