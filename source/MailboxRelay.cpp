#include "MailboxRelay.h"
#include "WireFormat.h"
#include <exception>
#include <thread>
#include <utility>

StreamEndpoint::StreamEndpoint(std::unique_ptr<LineWriter> writer, std::unique_ptr<LineReader> reader)
    : writer_(std::move(writer)), reader_(std::move(reader))
{
}

std::optional<ProcessError> StreamEndpoint::exchange(const RelayRequest &request, std::vector<BotResponse> &responses)
{
    std::string line;
    try
    {
        line = encodeRequest(request.state, request.message);
    }
    catch (const WireFormatError &e)
    {
        return ProcessError{ProcessError::Kind::Serialization, e.what()};
    }

    switch (writer_->writeLine(line))
    {
    case StreamStatus::Ok:
        break;
    case StreamStatus::Closed:
        return ProcessError{ProcessError::Kind::Closed, "bot stopped reading"};
    case StreamStatus::Failed:
        return ProcessError{ProcessError::Kind::Writing, BotMessage::kindName(request.message.kind)};
    }

    std::string reply;
    switch (reader_->readLine(reply))
    {
    case StreamStatus::Ok:
        break;
    case StreamStatus::Closed:
        return ProcessError{ProcessError::Kind::Closed, "end of stream"};
    case StreamStatus::Failed:
        return ProcessError{ProcessError::Kind::Reading, BotMessage::kindName(request.message.kind)};
    }

    try
    {
        responses = decodeResponses(reply);
    }
    catch (const WireFormatError &e)
    {
        return ProcessError{ProcessError::Kind::Deserialization, e.what()};
    }

    return std::nullopt;
}

MailboxRelay::MailboxRelay(std::unique_ptr<RelayEndpoint> endpoint)
    : shared_(std::make_shared<Shared>())
{
    std::thread(relayLoop, shared_, std::move(endpoint)).detach();
}

MailboxRelay::~MailboxRelay()
{
    // lets an idle relay thread run off the end, a busy one finishes its exchange first
    if (shared_)
        shared_->requests.close();
}

void MailboxRelay::send(const BotState &state, const BotMessage &message)
{
    shared_->requests.push(RelayRequest{state, message});
}

std::optional<std::vector<BotResponse>> MailboxRelay::tryReceive()
{
    return shared_->responses.tryPop();
}

std::optional<ProcessError> MailboxRelay::getFailure() const
{
    std::lock_guard<std::mutex> lock(shared_->failureMutex);
    return shared_->failure;
}

size_t MailboxRelay::getPendingResponseCount() const
{
    return shared_->responses.size();
}

void MailboxRelay::relayLoop(std::shared_ptr<Shared> shared, std::unique_ptr<RelayEndpoint> endpoint)
{
    while (auto request = shared->requests.pop())
    {
        std::vector<BotResponse> responses;
        std::optional<ProcessError> error;
        try
        {
            error = endpoint->exchange(*request, responses);
        }
        catch (const std::exception &e)
        {
            error = ProcessError{ProcessError::Kind::Fault, e.what()};
        }
        catch (...)
        {
            error = ProcessError{ProcessError::Kind::Fault, "unknown fault"};
        }

        if (error)
        {
            std::lock_guard<std::mutex> lock(shared->failureMutex);
            shared->failure = std::move(error);
            shared->requests.close();
            return;
        }

        shared->responses.push(std::move(responses));
    }
}
