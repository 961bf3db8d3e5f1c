#include "amount.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace lf {

namespace {

std::string trim(const std::string& value) {
    const auto start = value.find_first_not_of(" \t\n\r\f\v");
    if (start == std::string::npos) {
        return "";
    }
    const auto end = value.find_last_not_of(" \t\n\r\f\v");
    return value.substr(start, end - start + 1);
}

bool allDigits(const std::string& value) {
    return std::all_of(value.begin(), value.end(), [](unsigned char ch) {
        return std::isdigit(ch) != 0;
    });
}

// Leading zeros are stripped so the digits are never read as octal.
Amount fromDigits(const std::string& digits) {
    auto first = digits.find_first_not_of('0');
    if (first == std::string::npos) {
        return Amount(0);
    }
    return Amount(digits.substr(first).c_str());
}

Amount pow10(unsigned exponent) {
    Amount out = 1;
    for (unsigned i = 0; i < exponent; ++i) {
        out *= 10;
    }
    return out;
}

} // namespace

const Amount& tokenUnit() {
    static const Amount unit = pow10(kTokenDecimals);
    return unit;
}

Amount tokens(std::uint64_t whole) {
    return Amount(whole) * tokenUnit();
}

Amount applyBasisPoints(const Amount& value, std::uint32_t bps) {
    return value * bps / kBasisPoints;
}

std::string formatTokens(const Amount& value) {
    Amount whole = value / tokenUnit();
    Amount fraction = value % tokenUnit();
    if (fraction == 0) {
        return whole.str();
    }
    std::string digits = fraction.str();
    digits.insert(digits.begin(), kTokenDecimals - digits.size(), '0');
    while (!digits.empty() && digits.back() == '0') {
        digits.pop_back();
    }
    return whole.str() + "." + digits;
}

Amount parseTokens(const std::string& text) {
    std::string value = trim(text);
    if (value.empty()) {
        throw std::invalid_argument("token amount must not be empty");
    }

    std::string wholePart = value;
    std::string fractionPart;
    auto dot = value.find('.');
    if (dot != std::string::npos) {
        wholePart = value.substr(0, dot);
        fractionPart = value.substr(dot + 1);
    }
    if (wholePart.empty() && fractionPart.empty()) {
        throw std::invalid_argument("token amount has no digits: " + text);
    }
    if (!allDigits(wholePart) || !allDigits(fractionPart)) {
        throw std::invalid_argument("token amount must be a non-negative decimal: " + text);
    }
    if (fractionPart.size() > kTokenDecimals) {
        throw std::invalid_argument("token amount has more than 18 decimals: " + text);
    }

    Amount out = fromDigits(wholePart) * tokenUnit();
    if (!fractionPart.empty()) {
        out += fromDigits(fractionPart) * pow10(kTokenDecimals - static_cast<unsigned>(fractionPart.size()));
    }
    return out;
}

} // namespace lf
