#pragma once

#include "b2error.h"
#include "b2types.h"

namespace b2client
{
// ConfigError unless kMinPartSize <= part_size <= kMaxPartSize
B2Outcome<tOffset> ValidatePartSize(tOffset part_size);

// part_count is ceil(total_size / part_size), and 1 for an empty file.
// No side effect: the same arguments always give the same plan.
B2Outcome<PartPlan> PlanParts(tOffset total_size, tOffset part_size);

// Same as PlanParts, the size being read from the local file
B2Outcome<PartPlan> PlanPartsForFile(const Aws::String& path, tOffset part_size);

B2Outcome<tOffset> GetLocalFileSize(const Aws::String& path);
} // namespace b2client
