#include "uploaddispatcher.h"
#include "largefileupload.h"
#include "partplanner.h"
#include "singlefileupload.h"

#include "spdlog/spdlog.h"

namespace b2client
{
Aws::String GetBaseName(const Aws::String& path)
{
	const size_t pos = path.find_last_of("/\\");
	return pos == Aws::String::npos ? path : path.substr(pos + 1);
}

UploadDispatcher::UploadDispatcher(UploadSession& session) : session_{session} {}

B2Outcome<UploadProducerPtr> UploadDispatcher::UploadPath(const Aws::String& path, UploadTarget target) const
{
	auto target_outcome = ResolveTarget(std::move(target), path);
	B2C_PASS_OUTCOME_ON_ERROR(target_outcome);

	const auto size_outcome = GetLocalFileSize(path);
	B2C_PASS_OUTCOME_ON_ERROR(size_outcome);

	return Dispatch(target_outcome.GetResultWithOwnership(), UploadSource::FromPath(path), size_outcome.GetResult());
}

B2Outcome<UploadProducerPtr> UploadDispatcher::UploadStream(Aws::IStream& stream, tOffset size,
							     UploadTarget target) const
{
	if (size < 0)
	{
		return MakeConfigError("The size of a stream upload must be given");
	}

	auto target_outcome = ResolveTarget(std::move(target), "");
	B2C_PASS_OUTCOME_ON_ERROR(target_outcome);

	return Dispatch(target_outcome.GetResultWithOwnership(), UploadSource::FromStream(stream), size);
}

B2Outcome<UploadTarget> UploadDispatcher::ResolveTarget(UploadTarget target, const Aws::String& local_path) const
{
	if (!session_.IsAuthenticated())
	{
		return MakeConfigError("Not authenticated");
	}
	if (!session_.HasCapabilities({KeyCapability::WRITE_FILES}))
	{
		return MakeConfigError("Application key is not allowed to write files");
	}

	if (target.file_name_.empty() || target.file_name_.back() == '/')
	{
		if (local_path.empty())
		{
			return MakeConfigError("No destination file name");
		}
		target.file_name_ += GetBaseName(local_path);
	}
	target.file_name_ = session_.PrefixFileName(target.file_name_);

	if (target.bucket_id_.empty())
	{
		target.bucket_id_ = session_.GetBucketId();
	}
	if (target.bucket_id_.empty())
	{
		return MakeConfigError("No bucket selected");
	}
	return target;
}

B2Outcome<UploadProducerPtr> UploadDispatcher::Dispatch(UploadTarget target, UploadSource source, tOffset size) const
{
	const auto plan_outcome = PlanParts(size, session_.GetPartSize());
	B2C_PASS_OUTCOME_ON_ERROR(plan_outcome);

	const PartPlan& plan = plan_outcome.GetResult();
	spdlog::debug("Upload of {} bytes to {}: {} part(s)", size, target.file_name_, plan.part_count_);

	if (plan.part_count_ <= 1)
	{
		return MakeSingleFileUpload(session_.GetGateway(), std::move(target), std::move(source), size);
	}
	return MakeLargeFileUpload(session_.GetGateway(), std::move(target), std::move(source), size,
				   plan.part_size_);
}
} // namespace b2client
