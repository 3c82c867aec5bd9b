/**
 * @file MediaDisplayLoop.hpp
 * @brief The poll/compare/render cycle that mirrors desktop media on a deck.
 *
 * One tick() is one iteration: (re)connect the device if needed, poll the
 * media provider, repaint whatever changed since the last successful
 * render, then act on key presses (favorite, refresh). The loop owns the
 * only mutable state, LastRenderedState, and never blocks beyond the
 * bounded provider/device calls.
 *
 * @section Dependencies
 * - MediaProvider
 * - DeckDevice
 * - DeckRenderer
 * - FavoritesLog
 */

#pragma once
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include "core/ConfigData.hpp"
#include "core/FavoritesLog.hpp"
#include "device/DeckDevice.hpp"
#include "media/MediaProvider.hpp"
#include "render/DeckRenderer.hpp"
#include "util/Signal.hpp"

namespace nd {

// What the device currently shows, as far as the loop knows
struct LastRenderedState {
    std::optional<TrackInfo> track;            // text on the touch strip
    std::optional<std::string> artworkId;      // art key, "" = blank key

    void invalidate() {
        track.reset();
        artworkId.reset();
    }
};

using DeviceConnector = std::function<Result<std::unique_ptr<DeckDevice>>()>;

struct LoopSettings {
    KeysConfig keys;
    Duration reconnectInterval{1000};
};

class MediaDisplayLoop {
public:
    MediaDisplayLoop(MediaProvider& provider,
                     DeckRenderer& renderer,
                     FavoritesLog& favorites,
                     DeviceConnector connector,
                     LoopSettings settings);
    ~MediaDisplayLoop();

    // Hands over a device opened elsewhere, e.g. during startup. Refuses
    // (and logs) a device whose keys or touch strip can't hold the layout.
    bool attach(std::unique_ptr<DeckDevice> device);

    void tick();

    bool connected() const {
        return device_ != nullptr;
    }
    const LastRenderedState& state() const {
        return state_;
    }

    Signal<const TrackInfo&> trackRendered;
    Signal<const TrackInfo&> favoriteSaved;
    Signal<bool> connectionChanged;

private:
    bool fitsLayout(const DeckDevice& device) const;
    bool ensureDevice();
    TrackInfo pollMedia();
    void render(const TrackInfo& current);
    void renderText(const TrackInfo& current);
    void renderArtwork(const TrackInfo& current);
    void handleKeys(const TrackInfo& current);
    void saveFavorite();
    void dropDevice(const std::string& reason);

    MediaProvider& provider_;
    DeckRenderer& renderer_;
    FavoritesLog& favorites_;
    DeviceConnector connector_;
    LoopSettings settings_;

    std::unique_ptr<DeckDevice> device_;
    LastRenderedState state_;

    std::optional<TimePoint> lastConnectAttempt_;
    std::string lastConnectError_;
    std::string lastProviderError_;
};

} // namespace nd
