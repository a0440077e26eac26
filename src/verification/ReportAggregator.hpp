#pragma once

#include "VerificationTypes.hpp"

#include <vector>

namespace verification
{

/// Folds per-field outcomes into report statistics. One-sided and empty fields
/// contribute 0 to the average and count toward none of the category totals.
[[nodiscard]] VerificationReport aggregateReport(std::vector<VerificationOutcome> outcomes);

} // namespace verification
