#include "gift_distributor.hpp"

#include "errors.hpp"

#include <stdexcept>
#include <string>
#include <utility>

namespace lf {

namespace {

void requireGiftAmounts(std::uint32_t recipients, const Amount& creatorAmount, const Amount& userAmount) {
    if (recipients == 0) {
        throw std::invalid_argument("at least one gift recipient per round is required");
    }
    if (creatorAmount == 0 || userAmount == 0) {
        throw std::invalid_argument("gift amounts must be positive");
    }
}

} // namespace

GiftDistributor::GiftDistributor(GiftConfig cfg,
                                 Address giftAccount,
                                 Address creator,
                                 const Clock& clock,
                                 const AccessControl& access,
                                 TokenLedger& ledger,
                                 RoundEngine& engine,
                                 EventLog& log)
    : cfg_(std::move(cfg))
    , giftAccount_(std::move(giftAccount))
    , creator_(std::move(creator))
    , clock_(clock)
    , access_(access)
    , ledger_(ledger)
    , engine_(engine)
    , log_(log) {
    if (giftAccount_.empty() || creator_.empty()) {
        throw std::invalid_argument("GiftDistributor requires a gift account and a creator");
    }
    requireGiftAmounts(cfg_.recipientsPerRound, cfg_.creatorAmount, cfg_.userAmount);
}

void GiftDistributor::fundReserve(const Address& funder, const Amount& amount) {
    ReentrancyGuard::Scope scope(guard_, "fundReserve");
    if (amount == 0) {
        throw LottoError(ErrorCode::ZeroAmount, "reserve funding must be positive");
    }
    if (funder == giftAccount_) {
        throw LottoError(ErrorCode::InvalidAddress, "the gift account cannot fund its own reserve");
    }
    ledger_.transferFrom(giftAccount_, funder, giftAccount_, amount);
    reserve_ += amount;
    log_.append(clock_.now(), "reserve-funded",
                EventFields().add("funder", funder).add("amount", amount).add("reserve", reserve_));
}

Amount GiftDistributor::costPerRound() const {
    return cfg_.creatorAmount + cfg_.userAmount * cfg_.recipientsPerRound;
}

RoundId GiftDistributor::cooldownRounds() const {
    return cfg_.giftCooldown / engine_.config().roundDuration;
}

std::vector<Address> GiftDistributor::eligibleRecipients(RoundId roundId) const {
    std::vector<Address> out;
    if (!engine_.hasRound(roundId)) {
        return out;
    }
    RoundId cooldown = cooldownRounds();
    for (const auto& participant : engine_.round(roundId).participants) {
        if (participant == creator_) {
            continue;
        }
        PlayerStats stats = engine_.playerStats(participant);
        if (!stats.eligibleForGift) {
            continue;
        }
        if (stats.lastGiftRound != 0 && roundId < stats.lastGiftRound + cooldown) {
            continue;
        }
        out.push_back(participant);
    }
    return out;
}

std::vector<Address> GiftDistributor::selectRecipients(const Round& round, std::vector<Address> eligible) const {
    std::size_t wanted = cfg_.recipientsPerRound;
    if (eligible.size() <= wanted) {
        return eligible;
    }
    std::string seed = EventLog::hash("gift-selection|" + std::to_string(round.id) + "|" +
                                      formatNumbers(round.winningNumbers) + "|" +
                                      std::to_string(clock_.now()));
    // Partial Fisher-Yates: position i takes a pick from the unchosen tail.
    for (std::size_t i = 0; i < wanted; ++i) {
        std::string digest = EventLog::hash(seed + ":" + std::to_string(i));
        std::uint64_t draw = std::stoull(digest.substr(0, 16), nullptr, 16);
        std::size_t j = i + static_cast<std::size_t>(draw % (eligible.size() - i));
        std::swap(eligible[i], eligible[j]);
    }
    eligible.resize(wanted);
    return eligible;
}

std::vector<Address> GiftDistributor::distributeGifts(const Address& caller, RoundId roundId) {
    ReentrancyGuard::Scope scope(guard_, "distributeGifts");
    access_.requireRole(caller, Role::Distributor);
    const Round& r = engine_.round(roundId);
    if (!r.drawn) {
        throw LottoError(ErrorCode::NumbersNotDrawn, "round " + std::to_string(roundId) + " is not drawn yet");
    }
    if (r.giftsDistributed) {
        throw LottoError(ErrorCode::GiftsAlreadyDistributed, "gifts for round " + std::to_string(roundId) +
                                                                 " were already distributed");
    }
    Amount cost = costPerRound();
    if (reserve_ < cost || ledger_.availableBalance(giftAccount_) < cost) {
        throw LottoError(ErrorCode::InsufficientReserve, "reserve " + formatTokens(reserve_) +
                                                             " does not cover " + formatTokens(cost));
    }

    std::vector<Address> recipients = selectRecipients(r, eligibleRecipients(roundId));
    engine_.markGiftsDistributed(roundId);

    Amount paid = cfg_.creatorAmount;
    ledger_.transfer(giftAccount_, creator_, cfg_.creatorAmount);
    for (const auto& recipient : recipients) {
        ledger_.transfer(giftAccount_, recipient, cfg_.userAmount);
        engine_.recordGift(recipient, roundId);
        paid += cfg_.userAmount;
    }
    reserve_ -= paid;
    totalDistributed_ += paid;

    log_.append(clock_.now(), "gifts-distributed",
                EventFields()
                    .add("round", roundId)
                    .add("creator", creator_)
                    .add("recipients", recipients.size())
                    .add("paid", paid)
                    .add("reserve", reserve_));
    return recipients;
}

void GiftDistributor::setGiftConfig(const Address& caller,
                                    std::uint32_t recipientsPerRound,
                                    const Amount& creatorAmount,
                                    const Amount& userAmount) {
    access_.requireRole(caller, Role::Admin);
    requireGiftAmounts(recipientsPerRound, creatorAmount, userAmount);
    cfg_.recipientsPerRound = recipientsPerRound;
    cfg_.creatorAmount = creatorAmount;
    cfg_.userAmount = userAmount;
    log_.append(clock_.now(), "gift-config-updated",
                EventFields()
                    .add("recipients", recipientsPerRound)
                    .add("creatorAmount", creatorAmount)
                    .add("userAmount", userAmount));
}

void GiftDistributor::withdrawReserve(const Address& to, const Amount& amount) {
    ReentrancyGuard::Scope scope(guard_, "withdrawReserve");
    if (amount == 0) {
        throw LottoError(ErrorCode::ZeroAmount, "withdrawal must be positive");
    }
    if (amount > reserve_) {
        throw LottoError(ErrorCode::InsufficientReserve, "reserve holds only " + formatTokens(reserve_));
    }
    ledger_.transfer(giftAccount_, to, amount);
    reserve_ -= amount;
    log_.append(clock_.now(), "reserve-withdrawn",
                EventFields().add("to", to).add("amount", amount).add("reserve", reserve_));
}

} // namespace lf
