#pragma once
// TrackInfo.hpp - Snapshot of what the desktop says is playing

#include <optional>
#include <string>
#include "util/Types.hpp"

namespace nd {

struct TrackInfo {
    std::string title;
    std::string artist;
    std::string album;
    std::string player;                 // bus name / source app, informational
    std::optional<Bytes> artwork;       // encoded image as delivered
    std::string artworkKey;             // cheap identity of the artwork source, may be empty

    bool isIdle() const {
        return title.empty() && artist.empty();
    }

    // Title/artist/album, which is everything the touch strip shows
    bool sameText(const TrackInfo& other) const {
        return title == other.title && artist == other.artist &&
               album == other.album;
    }

    // artworkKey when the provider set one, else a hash of the bytes
    std::string artworkIdentity() const;

    static TrackInfo idle() {
        return {};
    }
};

// Stable 64-bit FNV-1a over the artwork bytes
u64 hashBytes(ByteView data);

} // namespace nd
