#pragma once
#include "shockmcp/client/downstream.hpp"

#include <mutex>
#include <string>
#include <vector>

namespace shockmcp::testing
{

/// Records every batch and answers with a canned result.
class FakeDownstream : public client::DownstreamClient
{
  public:
    struct Call
    {
        std::vector<DownstreamCommand> commands;
        std::string label;
    };

    explicit FakeDownstream(client::DownstreamResult reply = client::DownstreamOk{
                                Json{{"message", "Successfully sent control messages"}}})
        : reply_(std::move(reply))
    {
    }

    client::DownstreamResult send(const std::vector<DownstreamCommand>& commands,
                                  const std::string& label) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        calls_.push_back({commands, label});
        return reply_;
    }

    std::vector<Call> calls() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_;
    }

    void set_reply(client::DownstreamResult reply)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        reply_ = std::move(reply);
    }

  private:
    mutable std::mutex mutex_;
    client::DownstreamResult reply_;
    std::vector<Call> calls_;
};

} // namespace shockmcp::testing
