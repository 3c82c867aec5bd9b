#pragma once
// FakeDeck.hpp - DeckDevice that counts writes and serves scripted presses

#include <deque>
#include <memory>
#include "device/DeckDevice.hpp"

namespace nd::test {

struct DeckLog {
    struct KeyWrite {
        u32 key;
        Bytes image;
    };
    struct StripWrite {
        Bytes image;
        u32 x, y, width, height;
    };

    std::vector<KeyWrite> keyWrites;
    std::vector<StripWrite> stripWrites;
    std::deque<std::set<u32>> presses;
    bool failWrites{false};
    bool failPolls{false};
    u32 keys{8};
    PixelSize keySize{120, 120};
    PixelSize screen{800, 100};

    usize writeCount() const {
        return keyWrites.size() + stripWrites.size();
    }
};

class FakeDeck : public DeckDevice {
public:
    explicit FakeDeck(std::shared_ptr<DeckLog> log) : log_(std::move(log)) {
    }

    std::string deckType() const override {
        return "Fake Deck";
    }
    u32 keyCount() const override {
        return log_->keys;
    }
    PixelSize keyImageSize() const override {
        return log_->keySize;
    }
    PixelSize touchscreenSize() const override {
        return log_->screen;
    }

    Result<void> reset() override {
        return Result<void>::ok();
    }
    Result<void> setBrightness(u32) override {
        return Result<void>::ok();
    }

    Result<void> setKeyImage(u32 key, ByteView image) override {
        if (log_->failWrites)
            return Result<void>::err("device unplugged");
        log_->keyWrites.push_back({key, Bytes(image.begin(), image.end())});
        return Result<void>::ok();
    }

    Result<void> setTouchscreenImage(ByteView image,
                                     u32 x,
                                     u32 y,
                                     u32 width,
                                     u32 height) override {
        if (log_->failWrites)
            return Result<void>::err("device unplugged");
        log_->stripWrites.push_back(
                {Bytes(image.begin(), image.end()), x, y, width, height});
        return Result<void>::ok();
    }

    Result<std::set<u32>> pollButtonEvents() override {
        if (log_->failPolls)
            return Result<std::set<u32>>::err("device unplugged");
        if (log_->presses.empty())
            return Result<std::set<u32>>::ok({});
        auto next = log_->presses.front();
        log_->presses.pop_front();
        return Result<std::set<u32>>::ok(std::move(next));
    }

    Result<std::string> serialNumber() override {
        return Result<std::string>::ok("FAKE0001");
    }
    Result<std::string> firmwareVersion() override {
        return Result<std::string>::ok("1.00.000");
    }

private:
    std::shared_ptr<DeckLog> log_;
};

} // namespace nd::test
