// options.cpp - DiffOptions validation and comparator dispatch

#include <tree_diff/errors.h>
#include <tree_diff/options.h>

#include <cmath>

namespace tree_diff {

void DiffOptions::validate() const
{
    if (!(similarity > 0.0 && similarity <= 1.0)) {
        detail::log_access_error("DiffOptions::validate", "similarity must be in (0, 1]");
        throw invalid_options_error("similarity must be in (0, 1], got " + std::to_string(similarity));
    }
    if (std::isnan(numeric_tolerance) || numeric_tolerance < 0.0) {
        detail::log_access_error("DiffOptions::validate", "numeric_tolerance must be >= 0");
        throw invalid_options_error("numeric_tolerance must be >= 0, got " + std::to_string(numeric_tolerance));
    }
    if (max_depth == 0) {
        detail::log_access_error("DiffOptions::validate", "max_depth must be positive");
        throw invalid_options_error("max_depth must be positive");
    }
}

DiffOptions DiffOptions::with_similarity(double value) const
{
    DiffOptions copy = *this;
    copy.similarity = value;
    return copy;
}

Verdict consult_comparator(const DiffPath& path, const Value& lhs, const Value& rhs,
                           const DiffOptions& options)
{
    if (!options.comparator) {
        return Verdict::defer();
    }
    return options.comparator(path, lhs, rhs);
}

} // namespace tree_diff
