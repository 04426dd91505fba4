#include "VersionOrdering.hpp"
#include "NaturalOrderComparator.hpp"

#include <algorithm>

std::vector<std::size_t> VersionOrdering::order(const std::vector<Candidate>& candidates,
                                                const std::regex& resolution_regex)
{
    std::vector<std::size_t> marked;
    std::vector<std::size_t> unmarked;
    for (std::size_t i = 0; i < candidates.size(); ++i) {
        if (std::regex_search(candidates[i].bucket_label, resolution_regex)) {
            marked.push_back(i);
        } else {
            unmarked.push_back(i);
        }
    }

    std::vector<std::string> markers(candidates.size());
    for (std::size_t index : marked) {
        markers[index] = resolution_marker(candidates[index].base_name, resolution_regex);
    }

    std::stable_sort(marked.begin(), marked.end(),
        [&candidates, &markers](std::size_t lhs, std::size_t rhs) {
            const int by_resolution = NaturalOrderComparator::compare(markers[lhs], markers[rhs]);
            if (by_resolution != 0) {
                return by_resolution > 0;
            }
            return NaturalOrderComparator::compare(candidates[lhs].base_name,
                                                   candidates[rhs].base_name) < 0;
        });

    std::stable_sort(unmarked.begin(), unmarked.end(),
        [&candidates](std::size_t lhs, std::size_t rhs) {
            return NaturalOrderComparator::compare(candidates[lhs].base_name,
                                                   candidates[rhs].base_name) < 0;
        });

    std::vector<std::size_t> ordered;
    ordered.reserve(candidates.size());
    ordered.insert(ordered.end(), marked.begin(), marked.end());
    ordered.insert(ordered.end(), unmarked.begin(), unmarked.end());
    return ordered;
}


std::string VersionOrdering::resolution_marker(const std::string& text,
                                               const std::regex& resolution_regex)
{
    std::smatch match;
    if (std::regex_search(text, match, resolution_regex)) {
        return match.str(0);
    }
    return std::string();
}
