#include "lottery_numbers.hpp"

#include "errors.hpp"

#include "picosha2.h"

#include <algorithm>
#include <array>
#include <iterator>
#include <set>
#include <sstream>
#include <stdexcept>

namespace lf {

namespace {

constexpr std::size_t kWordBytes = 32;

RandomWord rehash(const RandomWord& word) {
    std::array<unsigned char, kWordBytes> bytes{};
    std::vector<unsigned char> raw;
    boost::multiprecision::export_bits(word, std::back_inserter(raw), 8);
    // export_bits drops leading zero bytes; right-align into the fixed buffer.
    std::copy(raw.begin(), raw.end(), bytes.begin() + (kWordBytes - raw.size()));

    std::array<unsigned char, kWordBytes> digest{};
    picosha2::hash256(bytes.begin(), bytes.end(), digest.begin(), digest.end());

    RandomWord out;
    boost::multiprecision::import_bits(out, digest.begin(), digest.end(), 8);
    return out;
}

std::uint32_t reduce(const RandomWord& word) {
    RandomWord remainder = word % kMaxNumber;
    return remainder.convert_to<std::uint32_t>() + kMinNumber;
}

} // namespace

void validateNumbers(const Numbers& numbers) {
    if (numbers.size() != kNumbersPerTicket) {
        throw LottoError(ErrorCode::InvalidNumbers, "exactly 5 numbers are required, got " +
                                                        std::to_string(numbers.size()));
    }
    for (std::size_t i = 0; i < numbers.size(); ++i) {
        if (numbers[i] < kMinNumber || numbers[i] > kMaxNumber) {
            throw LottoError(ErrorCode::InvalidNumbers,
                             "number " + std::to_string(numbers[i]) + " is outside 1-49");
        }
        if (i > 0 && numbers[i] <= numbers[i - 1]) {
            throw LottoError(ErrorCode::InvalidNumbers,
                             "numbers must be distinct and strictly ascending: " + formatNumbers(numbers));
        }
    }
}

bool isValidNumbers(const Numbers& numbers) {
    try {
        validateNumbers(numbers);
        return true;
    } catch (const LottoError&) {
        return false;
    }
}

std::uint32_t countMatches(const Numbers& ticket, const Numbers& winning) {
    std::uint32_t matches = 0;
    for (auto n : ticket) {
        if (std::find(winning.begin(), winning.end(), n) != winning.end()) {
            ++matches;
        }
    }
    return matches;
}

Numbers deriveWinningNumbers(const std::vector<RandomWord>& words) {
    if (words.size() != kNumbersPerTicket) {
        throw LottoError(ErrorCode::InvalidRandomness, "a draw needs exactly 5 random words, got " +
                                                           std::to_string(words.size()));
    }
    std::set<std::uint32_t> seen;
    Numbers out;
    out.reserve(kNumbersPerTicket);
    for (const auto& word : words) {
        RandomWord current = word;
        std::uint32_t value = reduce(current);
        while (seen.count(value) != 0) {
            current = rehash(current);
            value = reduce(current);
        }
        seen.insert(value);
        out.push_back(value);
    }
    std::sort(out.begin(), out.end());
    return out;
}

std::uint32_t payoutMultiplier(std::uint32_t matches) {
    switch (matches) {
    case 5: return 800;
    case 4: return 80;
    case 3: return 8;
    case 2: return 2;
    default: return 0;
    }
}

Amount calculatePayout(const Amount& betAmount, std::uint32_t matches, std::uint32_t houseEdgeBps) {
    if (houseEdgeBps >= kBasisPoints) {
        throw std::invalid_argument("house edge must be below 10000 basis points");
    }
    std::uint32_t multiplier = payoutMultiplier(matches);
    if (multiplier == 0) {
        return Amount(0);
    }
    return applyBasisPoints(betAmount * multiplier, kBasisPoints - houseEdgeBps);
}

std::string formatNumbers(const Numbers& numbers) {
    std::ostringstream oss;
    for (std::size_t i = 0; i < numbers.size(); ++i) {
        if (i > 0) {
            oss << ',';
        }
        oss << numbers[i];
    }
    return oss.str();
}

Numbers parseNumbers(const std::string& text) {
    std::string normalized = text;
    std::replace(normalized.begin(), normalized.end(), ',', ' ');
    std::istringstream iss(normalized);
    Numbers out;
    std::string token;
    while (iss >> token) {
        if (token.find_first_not_of("0123456789") != std::string::npos || token.size() > 2) {
            throw LottoError(ErrorCode::InvalidNumbers, "not a lottery number: " + token);
        }
        out.push_back(static_cast<std::uint32_t>(std::stoul(token)));
    }
    validateNumbers(out);
    return out;
}

} // namespace lf
