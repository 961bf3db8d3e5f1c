#include "errors.hpp"
#include "lotto_platform.hpp"

#include "test_support.hpp"

#include <iostream>
#include <vector>

using namespace lf;
using namespace lf::test;

namespace {

const Numbers kPicked = { 1, 5, 15, 25, 35 };

void jackpotThroughEmergencyDraw() {
    Harness h = makeHarness();
    h.lotto().stake("alice", tokens(100));
    h.lotto().approve("alice", h.cfg().engineAccount, tokens(10));
    h.clock->advance(kDay + 1);
    expect(h.lotto().accountSnapshot("alice").eligibleForBenefits, "alice eligible after a day");

    h.lotto().placeBet("alice", kPicked, tokens(10));
    Timestamp end = h.lotto().roundSnapshot(1).endTime;
    advanceTo(h, end);
    h.lotto().endRound("keeper");
    advanceTo(h, end + h.cfg().round.drawTimeout + 1);
    h.lotto().emergencyDraw(h.cfg().owner, 1, kPicked);

    expect(h.lotto().betSnapshot(1, 0).matchCount == 5, "all five numbers matched");
    expectAmount(h.lotto().claimableWinnings(1, "alice"), tokens(7'600), "10 x 800 x 0.95");
    Amount before = h.lotto().accountSnapshot("alice").balance;
    h.lotto().claimWinnings("alice", 1, { 0 });
    expectAmount(h.lotto().accountSnapshot("alice").balance, before + tokens(7'600), "jackpot credited");
}

void onlyWinnersHaveClaims() {
    Harness h = makeHarness();
    readyPlayer(h, "alice");
    readyPlayer(h, "bob");
    h.lotto().placeBet("alice", { 1, 5, 15, 40, 41 }, tokens(10));
    h.lotto().placeBet("bob", { 2, 3, 4, 6, 7 }, tokens(10));
    RoundId id = finishRound(h, kPicked);

    expect(h.lotto().claimableWinnings(id, "alice") > 0, "three matches pay");
    expectAmount(h.lotto().claimableWinnings(id, "bob"), Amount(0), "no matches pay nothing");
}

void giftReserveMustCoverExactCost() {
    Harness h = makeHarness();
    RoundId id = finishRound(h, kPicked);
    Amount cost = h.lotto().giftCostPerRound();
    h.lotto().approve(h.cfg().owner, h.cfg().giftAccount, cost);
    h.lotto().fundGiftReserve(h.cfg().owner, cost - 1);
    expectError(ErrorCode::InsufficientReserve, [&] { h.lotto().distributeGifts(h.cfg().owner, id); },
                "one unit short of the cost");
    h.lotto().fundGiftReserve(h.cfg().owner, Amount(1));
    h.lotto().distributeGifts(h.cfg().owner, id);
}

void streakAcrossRounds() {
    Harness h = makeHarness();
    readyPlayer(h, "alice");
    for (int i = 0; i < 3; ++i) {
        h.lotto().placeBet("alice", kPicked, tokens(1));
        finishRound(h, { 2, 3, 4, 6, 7 });
    }
    AccountSnapshot snap = h.lotto().accountSnapshot("alice");
    expect(snap.stats.consecutiveRounds == 3 && snap.stats.eligibleForGift, "three in a row is gift eligible");

    finishRound(h, { 2, 3, 4, 6, 7 });
    h.lotto().placeBet("alice", kPicked, tokens(1));
    expect(h.lotto().accountSnapshot("alice").stats.consecutiveRounds == 1, "skipping a round resets the streak");
}

void unstakeNeedsDurationUnlessEmergency() {
    Harness h = makeHarness();
    h.lotto().stake("alice", tokens(100));
    expectError(ErrorCode::DurationNotMet, [&] { h.lotto().unstake("alice", tokens(100)); }, "immediate unstake");
    h.lotto().setEmergencyMode(h.cfg().owner, true);
    h.lotto().unstake("alice", tokens(100));
    expectAmount(h.lotto().accountSnapshot("alice").staked, Amount(0), "emergency unstake went through");
}

void supplyIsConservedAcrossPlay() {
    Harness h = makeHarness();
    const std::vector<Address> players = { "alice", "bob", "carol" };
    for (const auto& player : players) {
        readyPlayer(h, player);
    }
    Amount supply = h.lotto().ledger().totalSupply();

    h.lotto().placeBet("alice", kPicked, tokens(10));
    h.lotto().placeBet("bob", { 1, 5, 15, 40, 41 }, tokens(20));
    h.lotto().placeBet("carol", { 1, 5, 30, 40, 41 }, tokens(30));
    RoundId id = finishRound(h, kPicked);

    Amount expected;
    for (const auto& player : players) {
        expected += h.lotto().claimableWinnings(id, player);
    }
    Amount paid;
    for (std::uint64_t i = 0; i < 3; ++i) {
        paid += h.lotto().claimWinnings(players[i], id, { i });
    }
    expectAmount(paid, expected, "total paid equals the sum of individual payouts");
    expectAmount(paid, tokens(7'600) + tokens(152) + tokens(57), "payout table");
    expectAmount(h.lotto().ledger().totalSupply(), supply, "betting and claiming never mint");

    Amount held;
    for (const auto& account : { std::string("alice"), std::string("bob"), std::string("carol"), std::string("dave"),
                                 std::string("erin"), h.cfg().owner, h.cfg().engineAccount }) {
        held += h.lotto().accountSnapshot(account).balance;
    }
    expectAmount(held, supply, "every token is accounted for");
    expect(!h.lotto().eventLogRoot().empty(), "history committed to the event log");
}

} // namespace

int main() {
    suiteName() = "scenario_tests";
    jackpotThroughEmergencyDraw();
    onlyWinnersHaveClaims();
    giftReserveMustCoverExactCost();
    streakAcrossRounds();
    unstakeNeedsDurationUnlessEmergency();
    supplyIsConservedAcrossPlay();
    std::cout << "Scenario checks passed.\n";
    return 0;
}
