#include "partplanner.h"

#include "spdlog/spdlog.h"

#include <aws/core/utils/memory/stl/AWSStreamFwd.h>
#include <aws/core/utils/memory/stl/AWSStringStream.h>

#include <fstream>

namespace b2client
{
B2Outcome<tOffset> ValidatePartSize(tOffset part_size)
{
	if (part_size < kMinPartSize || part_size > kMaxPartSize)
	{
		Aws::OStringStream os;
		os << "Part size " << part_size << " is out of bounds [" << kMinPartSize << ", " << kMaxPartSize << ']';
		return MakeConfigError(os.str());
	}
	return part_size;
}

B2Outcome<PartPlan> PlanParts(tOffset total_size, tOffset part_size)
{
	const auto size_outcome = ValidatePartSize(part_size);
	B2C_PASS_OUTCOME_ON_ERROR(size_outcome);

	if (total_size < 0)
	{
		return MakeConfigError("Invalid negative upload size " + std::to_string(total_size));
	}

	PartPlan plan;
	plan.total_size_ = total_size;
	plan.part_size_ = part_size;
	plan.part_count_ = (0 == total_size) ? 1 : total_size / part_size + (total_size % part_size ? 1 : 0);

	spdlog::debug("Plan for {} bytes: {} part(s) of {} bytes", total_size, plan.part_count_, part_size);

	return plan;
}

B2Outcome<tOffset> GetLocalFileSize(const Aws::String& path)
{
	Aws::IFStream file(path.c_str(), std::ios::binary | std::ios::ate);
	if (!file.is_open())
	{
		return MakeConfigError("Cannot open local file " + path);
	}
	const auto size = static_cast<tOffset>(file.tellg());
	if (size < 0)
	{
		return MakeConfigError("Cannot get the size of local file " + path);
	}
	return size;
}

B2Outcome<PartPlan> PlanPartsForFile(const Aws::String& path, tOffset part_size)
{
	const auto size_outcome = GetLocalFileSize(path);
	B2C_PASS_OUTCOME_ON_ERROR(size_outcome);
	return PlanParts(size_outcome.GetResult(), part_size);
}
} // namespace b2client
