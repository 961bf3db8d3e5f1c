#pragma once

#include <cstdint>
#include <string>

#include <boost/multiprecision/cpp_int.hpp>

namespace lf {

// Token amounts in base units, 1 token = 10^18 units. The checked backend
// throws on overflow and on negative results instead of wrapping.
using Amount = boost::multiprecision::checked_uint256_t;

// Raw 256-bit words as delivered by the randomness oracle.
using RandomWord = boost::multiprecision::uint256_t;

constexpr unsigned kTokenDecimals = 18;
constexpr std::uint32_t kBasisPoints = 10'000;

const Amount& tokenUnit();
Amount tokens(std::uint64_t whole);

// value * bps / 10000, rounded down.
Amount applyBasisPoints(const Amount& value, std::uint32_t bps);

// "7600", "0.5", "12.000001" (trailing zeros of the fraction trimmed).
std::string formatTokens(const Amount& value);
Amount parseTokens(const std::string& text);

} // namespace lf
