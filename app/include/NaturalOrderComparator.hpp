#ifndef NATURAL_ORDER_COMPARATOR_HPP
#define NATURAL_ORDER_COMPARATOR_HPP

#include <string_view>

/**
 * @brief Compares strings so that embedded digit runs compare by value.
 *
 * "Episode 2" sorts before "Episode 10", "720p" before "1080p". Text runs
 * compare case-insensitively first and fall back to byte order, so the
 * ordering stays total and deterministic.
 */
class NaturalOrderComparator {
public:
    /**
     * @brief Three-way comparison.
     * @return -1 when @p lhs sorts first, 1 when @p rhs sorts first, 0 when equal.
     */
    static int compare(std::string_view lhs, std::string_view rhs);

    bool operator()(std::string_view lhs, std::string_view rhs) const {
        return compare(lhs, rhs) < 0;
    }
};

#endif
