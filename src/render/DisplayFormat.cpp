#include "DisplayFormat.hpp"
#include <QString>

namespace nd::display {

std::string stripNonAscii(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        if (static_cast<unsigned char>(c) < 128)
            out.push_back(c);
    }
    return out;
}

std::vector<std::string> wrapTitle(const std::string& title, u32 column) {
    // Columns are UTF-16 code units; a surrogate pair is never split
    QString t = QString::fromStdString(title);
    const auto col = static_cast<qsizetype>(column);
    if (t.size() <= col)
        return {title};

    qsizetype split = t.lastIndexOf(QLatin1Char(' '), col);
    QString first;
    QString rest;
    if (split > 0) {
        first = t.left(split).trimmed();
        rest = t.mid(split + 1).trimmed();
    } else {
        qsizetype cut = col;
        if (cut > 0 && t.at(cut - 1).isHighSurrogate())
            cut = cut > 1 ? cut - 1 : cut + 1;
        first = t.left(cut);
        rest = t.mid(cut).trimmed();
    }

    if (rest.isEmpty())
        return {first.toStdString()};
    return {first.toStdString(), rest.toStdString()};
}

std::vector<std::string> formatLines(const TrackInfo& track,
                                     const TouchStripConfig& cfg) {
    if (track.isIdle())
        return {cfg.idleText};

    auto clean = [&cfg](const std::string& s) {
        auto text = cfg.asciiOnly ? stripNonAscii(s) : s;
        return QString::fromStdString(text).simplified().toStdString();
    };

    std::vector<std::string> lines;
    auto title = clean(track.title);
    if (!title.empty()) {
        for (auto& line : wrapTitle(title, cfg.wrapColumn))
            lines.push_back(std::move(line));
    }

    auto artist = clean(track.artist);
    if (!artist.empty())
        lines.push_back(std::move(artist));

    if (cfg.showAlbum) {
        auto album = clean(track.album);
        if (!album.empty())
            lines.push_back(std::move(album));
    }

    if (lines.empty())
        lines.push_back(cfg.idleText);
    return lines;
}

std::string formatText(const TrackInfo& track, const TouchStripConfig& cfg) {
    std::string text;
    for (const auto& line : formatLines(track, cfg)) {
        if (!text.empty())
            text += '\n';
        text += line;
    }
    return text;
}

} // namespace nd::display
