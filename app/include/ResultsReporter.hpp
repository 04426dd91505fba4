#ifndef RESULTS_REPORTER_HPP
#define RESULTS_REPORTER_HPP

#include "Types.hpp"

#include <string>
#include <vector>

namespace Json { class Value; }

class ResultsReporter {
public:
    // JSON array with one object per logical entry.
    static Json::Value to_json(const std::vector<LogicalEntry>& entries);
    static std::string to_json_string(const std::vector<LogicalEntry>& entries, bool pretty = true);

private:
    static Json::Value file_to_json(const FileRecord& file);
};

#endif
