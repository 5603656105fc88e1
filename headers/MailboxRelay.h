#pragma once
#include "BotErrors.h"
#include "BotState.h"
#include "ConcurrentQueue.h"
#include "LineStream.h"
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

// one outbound message together with the state it was sent with
struct RelayRequest
{
    BotState state;
    BotMessage message;
};

// the blocking side of a relay: turns one request into exactly one list of responses
class RelayEndpoint
{
public:
    virtual ~RelayEndpoint() = default;

    // a returned error ends the relay thread
    virtual std::optional<ProcessError> exchange(const RelayRequest &request, std::vector<BotResponse> &responses) = 0;
};

// exchanges requests with an external program over a line writer/reader pair
class StreamEndpoint : public RelayEndpoint
{
public:
    StreamEndpoint(std::unique_ptr<LineWriter> writer, std::unique_ptr<LineReader> reader);

    std::optional<ProcessError> exchange(const RelayRequest &request, std::vector<BotResponse> &responses) override;

private:
    std::unique_ptr<LineWriter> writer_;
    std::unique_ptr<LineReader> reader_;
};

/**
 * asynchronous mailbox in front of a blocking endpoint
 * send() and tryReceive() never block: a single background thread pops requests from the outbound queue,
 * runs them through the endpoint one at a time and pushes each reply list onto the inbound queue.
 * the thread is detached and ends when its endpoint fails or the relay is destroyed while idle
 */
class MailboxRelay
{
public:
    explicit MailboxRelay(std::unique_ptr<RelayEndpoint> endpoint);
    ~MailboxRelay();

    MailboxRelay(MailboxRelay &&) noexcept = default;
    // assigning over a live relay would orphan its thread
    MailboxRelay &operator=(MailboxRelay &&) = delete;
    MailboxRelay(const MailboxRelay &) = delete;
    MailboxRelay &operator=(const MailboxRelay &) = delete;

    void send(const BotState &state, const BotMessage &message);
    std::optional<std::vector<BotResponse>> tryReceive();

    // set once the relay thread has given up
    std::optional<ProcessError> getFailure() const;

    size_t getPendingResponseCount() const;

private:
    struct Shared
    {
        ConcurrentQueue<RelayRequest> requests;
        ConcurrentQueue<std::vector<BotResponse>> responses;

        mutable std::mutex failureMutex;
        std::optional<ProcessError> failure;
    };

    static void relayLoop(std::shared_ptr<Shared> shared, std::unique_ptr<RelayEndpoint> endpoint);

    std::shared_ptr<Shared> shared_;
};
