#include "amount.hpp"
#include "lottery_numbers.hpp"
#include "round_engine.hpp"

#include <cstdint>
#include <iomanip>
#include <iostream>

namespace {

double choose(std::uint32_t n, std::uint32_t k) {
    if (k > n) {
        return 0.0;
    }
    double out = 1.0;
    for (std::uint32_t i = 1; i <= k; ++i) {
        out = out * static_cast<double>(n - k + i) / static_cast<double>(i);
    }
    return out;
}

// Chance that a ticket shares exactly k numbers with the draw.
double matchProbability(std::uint32_t k) {
    const std::uint32_t pick = static_cast<std::uint32_t>(lf::kNumbersPerTicket);
    const std::uint32_t pool = lf::kMaxNumber;
    return choose(pick, k) * choose(pool - pick, pick - k) / choose(pool, pick);
}

} // namespace

int main() {
    lf::RoundConfig cfg;
    const double edge = static_cast<double>(cfg.houseEdgeBps) / lf::kBasisPoints;

    std::cout << "=== PAYOUT ANALYSIS (5 of " << lf::kMaxNumber << ") ===\n";
    std::cout << "Configured house edge: " << (edge * 100.0) << "%\n\n";

    double expectedReturn = 0.0;
    std::cout << "Matches  Probability        Multiplier  Payout per 100 tokens\n";
    for (std::uint32_t k = 0; k <= lf::kNumbersPerTicket; ++k) {
        double p = matchProbability(k);
        std::uint32_t multiplier = lf::payoutMultiplier(k);
        lf::Amount payout = lf::calculatePayout(lf::tokens(100), k, cfg.houseEdgeBps);
        expectedReturn += p * multiplier * (1.0 - edge);
        std::cout << "  " << k << "      " << std::setw(16) << std::scientific << std::setprecision(6) << p
                  << "   " << std::setw(8) << multiplier << "x    " << lf::formatTokens(payout) << '\n';
    }

    std::cout << std::fixed << std::setprecision(4);
    std::cout << "\n=== EXPECTED VALUE ===\n";
    std::cout << "Return per token wagered: " << expectedReturn << '\n';
    std::cout << "Player edge: " << ((expectedReturn - 1.0) * 100.0) << "%\n";

    std::cout << "\n=== RISK METRICS ===\n";
    std::cout << "Jackpot payout at the per-user cap (" << lf::formatTokens(cfg.maxBetPerUserPerRound)
              << " tokens): " << lf::formatTokens(lf::calculatePayout(cfg.maxBetPerUserPerRound, 5, cfg.houseEdgeBps))
              << '\n';
    std::cout << "Round payout cap: " << lf::formatTokens(cfg.maxPayoutPerRound) << '\n';
    return 0;
}
