#pragma once

#include "amount.hpp"
#include "clock.hpp"
#include "event_log.hpp"
#include "reentrancy_guard.hpp"

#include <cstddef>
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <optional>
#include <vector>

namespace lf {

using RequestId = std::uint64_t;
using RoundId = std::uint64_t;

enum class RequestStatus { Outstanding, Fulfilled };

struct RandomnessRequest {
    RequestId id = 0;
    RoundId roundId = 0;
    std::size_t numValues = 0;
    RequestStatus status = RequestStatus::Outstanding;
    Timestamp requestedAt = 0;
    Timestamp fulfilledAt = 0;
};

// The oracle side of the boundary. submit() is fire and forget; the values
// come back later through RandomnessGateway::deliver, or never.
class RandomnessBackend {
public:
    virtual ~RandomnessBackend() = default;
    virtual void submit(RequestId id, std::size_t numValues) = 0;
};

class RandomnessConsumer {
public:
    virtual ~RandomnessConsumer() = default;
    virtual void onRandomness(RequestId id, RoundId roundId, const std::vector<RandomWord>& values) = 0;
};

// Queues submitted requests for a driver (tests, console) to answer.
class ManualRandomnessBackend : public RandomnessBackend {
public:
    struct Pending {
        RequestId id;
        std::size_t numValues;
    };

    void submit(RequestId id, std::size_t numValues) override;

    const std::deque<Pending>& pending() const { return pending_; }
    std::optional<Pending> next();

private:
    std::deque<Pending> pending_;
};

// Request/deliver state machine. A request is consumed exactly once: the
// outstanding flag is cleared before the consumer runs, so a replayed or
// concurrent delivery for the same id is rejected.
class RandomnessGateway {
public:
    RandomnessGateway(std::shared_ptr<RandomnessBackend> backend, const Clock& clock, EventLog& log);

    void setConsumer(RandomnessConsumer* consumer) { consumer_ = consumer; }

    RequestId request(RoundId roundId, std::size_t numValues);
    void deliver(RequestId id, const std::vector<RandomWord>& values);

    bool isOutstanding(RequestId id) const;
    const RandomnessRequest* find(RequestId id) const;
    std::size_t outstandingCount() const;
    RequestId lastRequestId() const { return nextId_ - 1; }

    RandomnessBackend& backend() { return *backend_; }

private:
    std::shared_ptr<RandomnessBackend> backend_;
    const Clock& clock_;
    EventLog& log_;
    RandomnessConsumer* consumer_ = nullptr;
    ReentrancyGuard guard_;

    std::map<RequestId, RandomnessRequest> requests_;
    RequestId nextId_ = 1;
};

} // namespace lf
