#pragma once

#include "amount.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace lf {

using Numbers = std::vector<std::uint32_t>;

constexpr std::size_t kNumbersPerTicket = 5;
constexpr std::uint32_t kMinNumber = 1;
constexpr std::uint32_t kMaxNumber = 49;

// Canonical ticket: exactly five values in [1,49], strictly ascending.
// Unsorted or duplicated input is rejected, never normalized.
void validateNumbers(const Numbers& numbers);
bool isValidNumbers(const Numbers& numbers);

std::uint32_t countMatches(const Numbers& ticket, const Numbers& winning);

// Reduces each word to value % 49 + 1; on a collision the word is replaced
// by SHA-256 of its 32-byte big-endian encoding until a fresh value comes
// out. The result is sorted ascending.
Numbers deriveWinningNumbers(const std::vector<RandomWord>& words);

// 5 -> 800, 4 -> 80, 3 -> 8, 2 -> 2, otherwise 0.
std::uint32_t payoutMultiplier(std::uint32_t matches);
Amount calculatePayout(const Amount& betAmount, std::uint32_t matches, std::uint32_t houseEdgeBps);

std::string formatNumbers(const Numbers& numbers);
// Accepts "1,5,15,25,35" or whitespace separated values; validates.
Numbers parseNumbers(const std::string& text);

} // namespace lf
