#include "NaturalOrderComparator.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <string>

namespace {

// Past this many significant digits the value may not fit in 64 bits.
constexpr std::size_t kMaxNumericDigits = 20;

bool is_digit(char ch)
{
    return ch >= '0' && ch <= '9';
}

int sign_of(int value)
{
    return (value > 0) - (value < 0);
}

std::string_view next_run(std::string_view text, std::size_t& pos, bool& numeric)
{
    const std::size_t start = pos;
    numeric = is_digit(text[pos++]);
    while (pos < text.size() && is_digit(text[pos]) == numeric) {
        ++pos;
    }
    return text.substr(start, pos - start);
}

std::string_view strip_leading_zeros(std::string_view run)
{
    const auto first = run.find_first_not_of('0');
    return first == std::string_view::npos ? std::string_view() : run.substr(first);
}

std::uint64_t to_number(std::string_view digits)
{
    std::uint64_t value = 0;
    for (char ch : digits) {
        value = value * 10 + static_cast<std::uint64_t>(ch - '0');
    }
    return value;
}

int compare_numeric_runs(std::string_view lhs, std::string_view rhs)
{
    lhs = strip_leading_zeros(lhs);
    rhs = strip_leading_zeros(rhs);
    if (lhs.size() != rhs.size()) {
        return lhs.size() < rhs.size() ? -1 : 1;
    }
    if (lhs.size() >= kMaxNumericDigits) {
        return sign_of(lhs.compare(rhs));
    }
    const std::uint64_t left = to_number(lhs);
    const std::uint64_t right = to_number(rhs);
    if (left == right) {
        return 0;
    }
    return left < right ? -1 : 1;
}

int compare_text_runs(std::string_view lhs, std::string_view rhs)
{
    const std::size_t common = std::min(lhs.size(), rhs.size());
    for (std::size_t i = 0; i < common; ++i) {
        const int left = std::tolower(static_cast<unsigned char>(lhs[i]));
        const int right = std::tolower(static_cast<unsigned char>(rhs[i]));
        if (left != right) {
            return left < right ? -1 : 1;
        }
    }
    if (lhs.size() != rhs.size()) {
        return lhs.size() < rhs.size() ? -1 : 1;
    }
    return sign_of(lhs.compare(rhs));
}

}

int NaturalOrderComparator::compare(std::string_view lhs, std::string_view rhs)
{
    if (lhs.empty() || rhs.empty()) {
        if (lhs.empty() && rhs.empty()) {
            return 0;
        }
        return lhs.empty() ? -1 : 1;
    }

    std::size_t lhs_pos = 0;
    std::size_t rhs_pos = 0;
    do {
        bool lhs_numeric = false;
        bool rhs_numeric = false;
        const std::string_view lhs_run = next_run(lhs, lhs_pos, lhs_numeric);
        const std::string_view rhs_run = next_run(rhs, rhs_pos, rhs_numeric);

        const int result = (lhs_numeric && rhs_numeric)
            ? compare_numeric_runs(lhs_run, rhs_run)
            : compare_text_runs(lhs_run, rhs_run);
        if (result != 0) {
            return result;
        }
    } while (lhs_pos < lhs.size() && rhs_pos < rhs.size());

    // The input with runs left over sorts last.
    const bool lhs_left = lhs_pos < lhs.size();
    const bool rhs_left = rhs_pos < rhs.size();
    if (lhs_left != rhs_left) {
        return lhs_left ? 1 : -1;
    }
    // Same runs, different spelling ("a1" vs "a01"): shorter first, then bytes.
    if (lhs.size() != rhs.size()) {
        return lhs.size() < rhs.size() ? -1 : 1;
    }
    return sign_of(lhs.compare(rhs));
}
