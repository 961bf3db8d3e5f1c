#include "randomness_gateway.hpp"

#include "errors.hpp"

#include <stdexcept>
#include <string>
#include <utility>

namespace lf {

void ManualRandomnessBackend::submit(RequestId id, std::size_t numValues) {
    pending_.push_back(Pending{ id, numValues });
}

std::optional<ManualRandomnessBackend::Pending> ManualRandomnessBackend::next() {
    if (pending_.empty()) {
        return std::nullopt;
    }
    Pending front = pending_.front();
    pending_.pop_front();
    return front;
}

RandomnessGateway::RandomnessGateway(std::shared_ptr<RandomnessBackend> backend, const Clock& clock, EventLog& log)
    : backend_(std::move(backend))
    , clock_(clock)
    , log_(log) {
    if (!backend_) {
        throw std::invalid_argument("RandomnessGateway requires a backend");
    }
}

RequestId RandomnessGateway::request(RoundId roundId, std::size_t numValues) {
    ReentrancyGuard::Scope scope(guard_, "randomness request");
    if (numValues == 0) {
        throw LottoError(ErrorCode::InvalidRequest, "at least one random value must be requested");
    }
    RequestId id = nextId_;
    backend_->submit(id, numValues);

    RandomnessRequest req;
    req.id = id;
    req.roundId = roundId;
    req.numValues = numValues;
    req.requestedAt = clock_.now();
    requests_.emplace(id, req);
    ++nextId_;
    log_.append(req.requestedAt, "randomness-requested",
                EventFields().add("request", id).add("round", roundId).add("values", numValues));
    return id;
}

void RandomnessGateway::deliver(RequestId id, const std::vector<RandomWord>& values) {
    ReentrancyGuard::Scope scope(guard_, "randomness delivery");
    auto it = requests_.find(id);
    if (it == requests_.end() || it->second.status != RequestStatus::Outstanding) {
        throw LottoError(ErrorCode::InvalidRequest, "request " + std::to_string(id) + " is not outstanding");
    }
    RandomnessRequest& req = it->second;
    if (values.size() != req.numValues) {
        throw LottoError(ErrorCode::InvalidRandomness, "request " + std::to_string(id) + " expects " +
                                                           std::to_string(req.numValues) + " values, got " +
                                                           std::to_string(values.size()));
    }
    if (consumer_ == nullptr) {
        throw std::logic_error("RandomnessGateway has no consumer");
    }

    req.status = RequestStatus::Fulfilled;
    req.fulfilledAt = clock_.now();
    try {
        consumer_->onRandomness(id, req.roundId, values);
    } catch (...) {
        req.status = RequestStatus::Outstanding;
        req.fulfilledAt = 0;
        throw;
    }
    log_.append(req.fulfilledAt, "randomness-fulfilled",
                EventFields().add("request", id).add("round", req.roundId));
}

bool RandomnessGateway::isOutstanding(RequestId id) const {
    auto it = requests_.find(id);
    return it != requests_.end() && it->second.status == RequestStatus::Outstanding;
}

const RandomnessRequest* RandomnessGateway::find(RequestId id) const {
    auto it = requests_.find(id);
    return it == requests_.end() ? nullptr : &it->second;
}

std::size_t RandomnessGateway::outstandingCount() const {
    std::size_t count = 0;
    for (const auto& entry : requests_) {
        if (entry.second.status == RequestStatus::Outstanding) {
            ++count;
        }
    }
    return count;
}

} // namespace lf
