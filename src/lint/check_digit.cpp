#include "gs1/lint/check_digit.hpp"

#include "gs1/core/common.hpp"

namespace gs1::lint {

std::optional<char> compute_check_digit(std::string_view payload) noexcept {
    if (payload.empty() || !core::all_digits(payload)) {
        return std::nullopt;
    }

    unsigned int sum = 0;
    unsigned int weight = 3;
    for (auto it = payload.rbegin(); it != payload.rend(); ++it) {
        sum += weight * static_cast<unsigned int>(*it - '0');
        weight = 4 - weight;
    }
    return static_cast<char>('0' + (10 - sum % 10) % 10);
}

bool verify_check_digit(std::string_view value) noexcept {
    if (value.size() < 2 || !core::is_digit(value.back())) {
        return false;
    }
    const auto expected = compute_check_digit(value.substr(0, value.size() - 1));
    return expected.has_value() && *expected == value.back();
}

std::optional<std::string> expand_zero_suppressed_gtin(std::string_view value) {
    if (!core::all_digits(value)) {
        return std::nullopt;
    }
    switch (value.size()) {
    case 8:
    case 12:
    case 13:
    case 14:
        break;
    default:
        return std::nullopt;
    }
    std::string out(14 - value.size(), '0');
    out.append(value);
    return out;
}

}  // namespace gs1::lint
