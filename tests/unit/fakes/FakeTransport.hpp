#pragma once
// FakeTransport.hpp - Records HID traffic, replays queued input reports

#include <deque>
#include <map>
#include <memory>
#include "device/Transport.hpp"

namespace nd::test {

struct TransportLog {
    std::vector<Bytes> writes;
    std::vector<Bytes> features;
    std::deque<Bytes> inputs;
    std::map<u8, Bytes> featureReplies;
    bool failWrites{false};
    bool failReads{false};
};

class FakeTransport : public Transport {
public:
    explicit FakeTransport(std::shared_ptr<TransportLog> log)
        : log_(std::move(log)) {
    }

    Result<void> write(ByteView report) override {
        if (log_->failWrites)
            return Result<void>::err("write failed");
        log_->writes.emplace_back(report.begin(), report.end());
        return Result<void>::ok();
    }

    Result<std::optional<Bytes>> read(usize maxLength, i32) override {
        if (log_->failReads)
            return Result<std::optional<Bytes>>::err("read failed");
        if (log_->inputs.empty())
            return Result<std::optional<Bytes>>::ok(std::nullopt);
        Bytes next = std::move(log_->inputs.front());
        log_->inputs.pop_front();
        if (next.size() > maxLength)
            next.resize(maxLength);
        return Result<std::optional<Bytes>>::ok(std::move(next));
    }

    Result<void> sendFeature(ByteView report) override {
        log_->features.emplace_back(report.begin(), report.end());
        return Result<void>::ok();
    }

    Result<Bytes> getFeature(u8 reportId, usize length) override {
        auto it = log_->featureReplies.find(reportId);
        if (it == log_->featureReplies.end())
            return Result<Bytes>::err("no such feature report");
        Bytes reply = it->second;
        reply.resize(length, 0);
        return Result<Bytes>::ok(std::move(reply));
    }

    std::string path() const override {
        return "fake";
    }

private:
    std::shared_ptr<TransportLog> log_;
};

} // namespace nd::test
