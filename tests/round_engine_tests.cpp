#include "errors.hpp"
#include "lotto_platform.hpp"

#include "test_support.hpp"

#include <iostream>
#include <memory>
#include <string>
#include <vector>

using namespace lf;
using namespace lf::test;

namespace {

const Numbers kJackpot = { 1, 5, 15, 25, 35 };
const Numbers kThreeHits = { 1, 5, 15, 40, 41 };
const Numbers kMiss = { 2, 3, 4, 6, 7 };

void testBetValidation() {
    Harness h = makeHarness();
    readyPlayer(h, "alice");
    h.lotto().approve("dave", h.cfg().engineAccount, tokens(1'000));
    h.lotto().stake("erin", tokens(100));

    Amount before = h.lotto().accountSnapshot("alice").balance;
    expectError(ErrorCode::InvalidNumbers, [&] { h.lotto().placeBet("alice", { 5, 1, 15, 25, 35 }, tokens(10)); },
                "unsorted ticket");
    expectError(ErrorCode::InvalidNumbers, [&] { h.lotto().placeBet("alice", { 1, 5, 15, 25 }, tokens(10)); },
                "short ticket");
    expectAmount(h.lotto().accountSnapshot("alice").balance, before, "rejected tickets cost nothing");

    expectError(ErrorCode::BetTooSmall, [&] { h.lotto().placeBet("alice", kJackpot, tokenUnit() / 2); },
                "bet below minimum");
    expectError(ErrorCode::NotEligible, [&] { h.lotto().placeBet("dave", kJackpot, tokens(10)); },
                "bettor without stake");
    expectError(ErrorCode::InsufficientAllowance, [&] { h.lotto().placeBet("erin", kJackpot, tokens(10)); },
                "bettor without approval");
    expect(h.lotto().roundSnapshot(1).betCount == 0, "failed bets are not recorded");

    h.lotto().placeBet("alice", kJackpot, tokens(600));
    expectError(ErrorCode::ExceedsMaxBet, [&] { h.lotto().placeBet("alice", kMiss, tokens(500)); },
                "per-round bet cap");
    h.lotto().placeBet("alice", kMiss, tokens(400));
    expectAmount(h.lotto().engine().userRoundTotal(1, "alice"), tokens(1'000), "cap reached exactly");

    advanceTo(h, h.lotto().roundSnapshot(1).endTime);
    expect(h.lotto().roundPhase(1) == RoundPhase::Closed, "round closes at its end time");
    expectError(ErrorCode::RoundNotOpen, [&] { h.lotto().placeBet("alice", kJackpot, tokens(1)); },
                "bet after the end time");
}

void testBetBookkeeping() {
    Harness h = makeHarness();
    readyPlayer(h, "alice");
    readyPlayer(h, "bob");

    std::uint64_t first = h.lotto().placeBet("alice", kJackpot, tokens(10));
    std::uint64_t second = h.lotto().placeBet("bob", kThreeHits, tokens(10));
    std::uint64_t third = h.lotto().placeBet("alice", kMiss, tokens(10));
    expect(first == 0 && second == 1 && third == 2, "bet indices are sequential per round");

    Round r = h.lotto().roundSnapshot(1);
    expectAmount(r.totalBetAmount, tokens(30), "round volume");
    expectAmount(r.totalPrizePool, tokens(30) - applyBasisPoints(tokens(30), 500), "prize pool net of house edge");
    expect(r.participants == std::vector<Address>({ "alice", "bob" }), "participants in first-bet order");
    expectAmount(h.lotto().accountSnapshot(h.cfg().engineAccount).balance, tokens(1'000'030),
                 "stakes moved to the engine");
    expectAmount(h.lotto().accountSnapshot("alice").balance, tokens(9'980), "alice paid for two tickets");

    Bet b = h.lotto().betSnapshot(1, 1);
    expect(b.bettor == "bob" && b.numbers == kThreeHits && !b.claimed, "bet snapshot");
    expect(h.lotto().betsOf(1, "alice").size() == 2, "alice has two bets");
    expect(h.lotto().accountSnapshot("alice").stats.totalBets == 2, "player stats count bets");
}

void testEndRoundAndDraw() {
    Harness h = makeHarness();
    readyPlayer(h, "alice");
    readyPlayer(h, "bob");
    readyPlayer(h, "carol");
    h.lotto().placeBet("alice", kJackpot, tokens(10));
    h.lotto().placeBet("bob", kThreeHits, tokens(10));
    h.lotto().placeBet("carol", kMiss, tokens(10));

    expectError(ErrorCode::RoundNotEnded, [&] { h.lotto().endRound("keeper"); }, "end before the deadline");
    Timestamp end = h.lotto().roundSnapshot(1).endTime;
    advanceTo(h, end);
    RequestId request = h.lotto().endRound("keeper");
    expect(h.lotto().roundPhase(1) == RoundPhase::AwaitingDraw, "round awaits randomness");
    expect(h.lotto().roundSnapshot(1).pendingRequestId == request, "request id stored on the round");
    expectError(ErrorCode::DrawAlreadyRequested, [&] { h.lotto().endRound("keeper"); }, "second end call");
    expectError(ErrorCode::NumbersNotDrawn, [&] { h.lotto().claimWinnings("alice", 1, { 0 }); },
                "claim before the draw");
    expectError(ErrorCode::Unauthorized,
                [&] { h.lotto().deliverRandomness("alice", request, wordsFor(kJackpot)); },
                "randomness from a stranger");

    h.clock->advance(600);
    h.lotto().deliverRandomness(h.cfg().randomnessCoordinator, request, wordsFor(kJackpot));
    Round drawn = h.lotto().roundSnapshot(1);
    expect(drawn.drawn && drawn.winningNumbers == kJackpot, "round drawn with the oracle numbers");
    expect(h.lotto().betSnapshot(1, 0).matchCount == 5, "jackpot ticket");
    expect(h.lotto().betSnapshot(1, 1).matchCount == 3, "three-hit ticket");
    expect(h.lotto().betSnapshot(1, 2).matchCount == 0, "losing ticket");

    expect(h.lotto().currentRoundId() == 2, "next round opened");
    Round next = h.lotto().roundSnapshot(2);
    expect(next.startTime == end + 600, "next round starts at draw time");
    expect(next.endTime == next.startTime + h.cfg().round.roundDuration, "next round has the full duration");

    expectError(ErrorCode::InvalidRequest,
                [&] { h.lotto().deliverRandomness(h.cfg().randomnessCoordinator, request, wordsFor(kMiss)); },
                "replayed randomness");
    expect(h.lotto().roundSnapshot(1).winningNumbers == kJackpot, "replay did not redraw");
    expectError(ErrorCode::RoundNotEnded, [&] { h.lotto().endRound("keeper"); }, "new round is still open");
}

void testClaims() {
    Harness h = makeHarness();
    readyPlayer(h, "alice");
    readyPlayer(h, "bob");
    readyPlayer(h, "carol");
    h.lotto().placeBet("alice", kJackpot, tokens(10));
    h.lotto().placeBet("bob", kThreeHits, tokens(10));
    h.lotto().placeBet("carol", kMiss, tokens(10));
    h.lotto().placeBet("bob", kThreeHits, tokens(20));
    RoundId id = finishRound(h, kJackpot);

    expectAmount(h.lotto().claimableWinnings(id, "alice"), tokens(7'600), "alice claimable");
    expectAmount(h.lotto().claimableWinnings(id, "bob"), tokens(76) + tokens(152), "bob claimable");
    expectAmount(h.lotto().claimableWinnings(id, "carol"), Amount(0), "carol claimable");

    expectError(ErrorCode::NoWinnings, [&] { h.lotto().claimWinnings("carol", id, { 2 }); }, "losing ticket");
    expectError(ErrorCode::NoWinnings, [&] { h.lotto().claimWinnings("carol", id, { 0, 1, 99 }); },
                "other players' and missing tickets are skipped");
    expectError(ErrorCode::RoundNotFound, [&] { h.lotto().claimWinnings("alice", 42, { 0 }); }, "unknown round");

    Amount before = h.lotto().accountSnapshot("alice").balance;
    Amount paid = h.lotto().claimWinnings("alice", id, { 0 });
    expectAmount(paid, tokens(7'600), "jackpot paid");
    expectAmount(h.lotto().accountSnapshot("alice").balance, before + tokens(7'600), "alice credited");
    expectAmount(h.lotto().claimableWinnings(id, "alice"), Amount(0), "nothing left to claim");
    expectError(ErrorCode::AlreadyClaimed, [&] { h.lotto().claimWinnings("alice", id, { 0 }); }, "double claim");

    expectError(ErrorCode::AlreadyClaimed, [&] { h.lotto().claimWinnings("bob", id, { 1, 1 }); },
                "duplicate index in one call");
    expect(!h.lotto().betSnapshot(id, 1).claimed, "rejected claim left the bet unclaimed");
    expectAmount(h.lotto().claimWinnings("bob", id, { 0, 1, 3 }), tokens(228), "bob claims both tickets");

    Round r = h.lotto().roundSnapshot(id);
    expectAmount(r.totalPaidOut, tokens(7'828), "round paid out total");
    expectAmount(h.lotto().accountSnapshot("bob").stats.totalWinnings, tokens(228), "bob winnings recorded");
}

void testRepeatedLosingTicketIsSkipped() {
    Harness h = makeHarness();
    readyPlayer(h, "alice");
    readyPlayer(h, "carol");
    h.lotto().placeBet("alice", kMiss, tokens(10));
    h.lotto().placeBet("alice", kThreeHits, tokens(10));
    h.lotto().placeBet("carol", kMiss, tokens(10));
    RoundId id = finishRound(h, kJackpot);

    expectError(ErrorCode::NoWinnings, [&] { h.lotto().claimWinnings("carol", id, { 2, 2 }); },
                "repeated losing ticket alone");
    Amount paid = h.lotto().claimWinnings("alice", id, { 0, 0, 1 });
    expectAmount(paid, tokens(76), "winning ticket paid despite the repeated loser");
    expect(h.lotto().betSnapshot(id, 1).claimed, "winning ticket marked claimed");
    expect(!h.lotto().betSnapshot(id, 0).claimed, "losing ticket never marked claimed");

    expectError(ErrorCode::BetNotFound, [&] { h.lotto().betSnapshot(id, 9); }, "missing bet lookup");
    expectError(ErrorCode::BetNotFound, [&] { h.lotto().betSnapshot(42, 0); }, "bet in unknown round");
}

void testPayoutCap() {
    PlatformConfig cfg = testConfig();
    cfg.round.maxPayoutPerRound = tokens(100);
    Harness h = makeHarness(cfg);
    readyPlayer(h, "alice");
    readyPlayer(h, "bob");
    h.lotto().placeBet("alice", kThreeHits, tokens(10));
    h.lotto().placeBet("bob", kThreeHits, tokens(10));
    RoundId id = finishRound(h, kJackpot);

    expectAmount(h.lotto().claimWinnings("alice", id, { 0 }), tokens(76), "first claimant fits under the cap");
    Amount bobBefore = h.lotto().accountSnapshot("bob").balance;
    expectError(ErrorCode::PayoutExceedsMaximum, [&] { h.lotto().claimWinnings("bob", id, { 1 }); },
                "second claimant breaks the cap");
    expectAmount(h.lotto().accountSnapshot("bob").balance, bobBefore, "failed claim paid nothing");
    expect(!h.lotto().betSnapshot(id, 1).claimed, "failed claim left the bet open");
}

void testEmergencyDraw() {
    Harness h = makeHarness();
    readyPlayer(h, "alice");
    h.lotto().placeBet("alice", kJackpot, tokens(10));
    Timestamp end = h.lotto().roundSnapshot(1).endTime;
    advanceTo(h, end);
    RequestId request = h.lotto().endRound("keeper");

    expectError(ErrorCode::Unauthorized, [&] { h.lotto().emergencyDraw("alice", 1, kJackpot); },
                "emergency draw by a player");
    advanceTo(h, end + h.cfg().round.drawTimeout);
    expectError(ErrorCode::DrawNotTimedOut, [&] { h.lotto().emergencyDraw(h.cfg().owner, 1, kJackpot); },
                "emergency draw inside the grace period");
    advanceTo(h, end + h.cfg().round.drawTimeout + 1);
    expectError(ErrorCode::InvalidNumbers, [&] { h.lotto().emergencyDraw(h.cfg().owner, 1, { 9, 8, 7, 6, 5 }); },
                "emergency numbers follow ticket rules");
    expectError(ErrorCode::RoundNotFound, [&] { h.lotto().emergencyDraw(h.cfg().owner, 9, kJackpot); },
                "emergency draw of an unknown round");

    h.lotto().grantRole(h.cfg().owner, "ops", Role::Operator);
    h.lotto().emergencyDraw("ops", 1, kMiss);
    Round r = h.lotto().roundSnapshot(1);
    expect(r.drawn && r.emergencyDrawn && r.winningNumbers == kMiss, "emergency draw settled the round");
    expect(h.lotto().currentRoundId() == 2, "emergency draw opened the next round");
    expectError(ErrorCode::RoundAlreadyDrawn, [&] { h.lotto().emergencyDraw("ops", 1, kJackpot); },
                "second emergency draw");

    h.lotto().deliverRandomness(h.cfg().randomnessCoordinator, request, wordsFor(kJackpot));
    expect(h.lotto().roundSnapshot(1).winningNumbers == kMiss, "late oracle answer is discarded");
    expect(h.lotto().outstandingRandomnessRequests() == 0, "late answer consumed the request");
    expect(!h.lotto().eventLog().entriesOfKind("randomness-discarded").empty(), "discard is logged");
}

void testEmergencyDrawWithoutRequest() {
    Harness h = makeHarness();
    advanceTo(h, h.lotto().roundSnapshot(1).endTime + h.cfg().round.drawTimeout + 1);
    h.lotto().emergencyDraw(h.cfg().owner, 1, kJackpot);
    expect(h.lotto().roundPhase(1) == RoundPhase::Drawn, "oracle never asked, round still drawable");
    expectError(ErrorCode::NoWinnings, [&] { h.lotto().claimWinnings("alice", 1, {}); }, "empty claim");
}

void testConsecutiveRounds() {
    Harness h = makeHarness();
    readyPlayer(h, "alice");
    for (int i = 0; i < 3; ++i) {
        h.lotto().placeBet("alice", kMiss, tokens(1));
        h.lotto().placeBet("alice", kMiss, tokens(1));
        finishRound(h, kJackpot);
    }
    PlayerStats stats = h.lotto().accountSnapshot("alice").stats;
    expect(stats.consecutiveRounds == 3, "three rounds in a row");
    expect(stats.eligibleForGift, "streak makes alice gift eligible");
    expect(stats.lastParticipatedRound == 3, "last participated round");

    finishRound(h, kJackpot);
    h.lotto().placeBet("alice", kMiss, tokens(1));
    stats = h.lotto().accountSnapshot("alice").stats;
    expect(stats.consecutiveRounds == 1, "gap resets the streak");
    expect(!stats.eligibleForGift, "reset streak loses gift eligibility");
}

// Answers submit() by calling back into the platform on the same thread.
class ReenteringBackend : public RandomnessBackend {
public:
    void submit(RequestId id, std::size_t numValues) override {
        attempt([&] { platform->endRound("attacker"); });
        attempt([&] { platform->placeBet("alice", kJackpot, tokens(1)); });
        attempt([&] {
            platform->deliverRandomness(platform->config().randomnessCoordinator, id,
                                        std::vector<RandomWord>(numValues));
        });
    }

    template <typename Fn>
    void attempt(Fn&& fn) {
        try {
            fn();
            ++accepted;
        } catch (const LottoError& ex) {
            rejections.push_back(ex.code());
        }
    }

    LottoPlatform* platform = nullptr;
    std::vector<ErrorCode> rejections;
    int accepted = 0;
};

void testReentrancyIsRejected() {
    auto clock = std::make_shared<ManualClock>(kGenesisTime);
    auto backend = std::make_shared<ReenteringBackend>();
    LottoPlatform platform(testConfig(), clock, backend);
    backend->platform = &platform;

    platform.stake("alice", tokens(100));
    platform.approve("alice", platform.config().engineAccount, tokens(1'000));
    platform.placeBet("alice", kJackpot, tokens(10));
    clock->set(platform.roundSnapshot(1).endTime);

    RequestId id = platform.endRound("keeper");
    expect(backend->accepted == 0 && backend->rejections.size() == 3, "every nested call was rejected");
    for (auto code : backend->rejections) {
        expect(code == ErrorCode::Reentrancy, std::string("nested call must fail with Reentrancy, got ") + toString(code));
    }
    expect(platform.outstandingRandomnessRequests() == 1, "exactly one randomness request recorded");
    expect(platform.roundSnapshot(1).betCount == 1, "nested bet was not recorded");
    expect(platform.roundSnapshot(1).pendingRequestId == id, "round tied to the outer request");
    expect(!platform.roundSnapshot(1).drawn, "nested delivery did not draw the round");
}

} // namespace

int main() {
    suiteName() = "round_engine_tests";
    testBetValidation();
    testBetBookkeeping();
    testEndRoundAndDraw();
    testClaims();
    testRepeatedLosingTicketIsSkipped();
    testPayoutCap();
    testEmergencyDraw();
    testEmergencyDrawWithoutRequest();
    testConsecutiveRounds();
    testReentrancyIsRejected();
    std::cout << "Round engine checks passed.\n";
    return 0;
}
