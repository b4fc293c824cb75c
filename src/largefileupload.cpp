#include "largefileupload.h"
#include "partplanner.h"

#include "spdlog/spdlog.h"

namespace b2client
{
LargeFileUpload::LargeFileUpload(B2Gateway& gateway, UploadTarget target, UploadSource source, PartPlan plan)
    : gateway_{gateway}, target_{std::move(target)}, source_{std::move(source)}, plan_{plan}
{
}

LargeFileUpload::~LargeFileUpload()
{
	if (state_ == UploadState::UPLOADING)
	{
		spdlog::debug("Large file {} abandoned after {} part(s)", session_.file_id_, session_.parts_completed_.size());
		Fail(MakeProtocolError("Upload abandoned before completion"));
	}
}

bool LargeFileUpload::HasNext() const
{
	return state_ == UploadState::IDLE || state_ == UploadState::UPLOADING;
}

B2Outcome<UploadProgressEvent> LargeFileUpload::Next()
{
	switch (state_)
	{
	case UploadState::IDLE:
	{
		const auto start_outcome = Start();
		B2C_PASS_OUTCOME_ON_ERROR(start_outcome);
		return UploadNextPart();
	}
	case UploadState::UPLOADING:
		if (next_part_ <= plan_.part_count_)
		{
			return UploadNextPart();
		}
		return Finish();
	default:
		break;
	}

	UploadProgressEvent end;
	end.type_ = UploadEventType::END_OF_UPLOAD;
	end.total_parts_ = GetTotalParts();
	return end;
}

B2Outcome<bool> LargeFileUpload::Start()
{
	const auto open_outcome = source_.Open();
	B2C_IF_ERROR(open_outcome)
	{
		return Fail(open_outcome.GetError());
	}

	spdlog::debug("Starting large file {} in bucket {}, {} parts", target_.file_name_, target_.bucket_id_,
		      plan_.part_count_);

	const auto start_outcome =
	    gateway_.StartLargeFile(target_.bucket_id_, target_.file_name_, target_.content_type_, target_.file_info_);
	B2C_IF_ERROR(start_outcome)
	{
		return Fail(start_outcome.GetError());
	}

	const FileInfo& started = start_outcome.GetResult();
	if (started.file_id_.empty())
	{
		return Fail(MakeProtocolError("Large file started without a file id"));
	}

	session_.file_id_ = started.file_id_;
	session_.bucket_id_ = target_.bucket_id_;
	session_.file_name_ = started.file_name_.empty() ? target_.file_name_ : started.file_name_;
	session_.parts_completed_.reserve(static_cast<size_t>(plan_.part_count_));
	session_.part_sha1s_.reserve(static_cast<size_t>(plan_.part_count_));
	state_ = UploadState::UPLOADING;

	spdlog::debug("Large file id {}", session_.file_id_);
	return true;
}

B2Outcome<UploadProgressEvent> LargeFileUpload::UploadNextPart()
{
	const int part_number = next_part_;
	const tOffset length = plan_.PartLength(part_number);

	const auto url_outcome = gateway_.GetUploadPartUrl(session_.file_id_);
	B2C_IF_ERROR(url_outcome)
	{
		return Fail(url_outcome.GetError());
	}

	auto read_outcome = source_.Read(length);
	B2C_IF_ERROR(read_outcome)
	{
		return Fail(read_outcome.GetError());
	}
	const PartBuffer buffer = read_outcome.GetResultWithOwnership();
	const Aws::String sha1 = Sha1Hex(buffer);

	spdlog::debug("Uploading part {}/{} of {}, {} bytes", part_number, plan_.part_count_, session_.file_id_,
		      length);

	const auto part_outcome = gateway_.UploadPart(buffer, url_outcome.GetResult(), part_number, sha1);
	B2C_IF_ERROR(part_outcome)
	{
		return Fail(part_outcome.GetError());
	}

	PartResult part = part_outcome.GetResult();
	if (part.part_number_ != 0 && part.part_number_ != part_number)
	{
		return Fail(MakeProtocolError("Service acknowledged part " + std::to_string(part.part_number_) +
					      " instead of part " + std::to_string(part_number)));
	}
	part.part_number_ = part_number;
	if (part.file_id_.empty())
	{
		part.file_id_ = session_.file_id_;
	}
	if (part.content_sha1_.empty())
	{
		part.content_sha1_ = sha1;
	}
	if (part.content_length_ == 0)
	{
		part.content_length_ = length;
	}

	session_.parts_completed_.push_back(part);
	session_.part_sha1s_.push_back(sha1);
	next_part_++;

	if (next_part_ > plan_.part_count_)
	{
		// every byte has been read
		source_.Close();
	}

	UploadProgressEvent event;
	event.type_ = UploadEventType::PART_UPLOADED;
	event.part_number_ = part_number;
	event.total_parts_ = GetTotalParts();
	event.part_ = std::move(part);
	return event;
}

B2Outcome<UploadProgressEvent> LargeFileUpload::Finish()
{
	spdlog::debug("Finishing large file {} with {} parts", session_.file_id_, session_.part_sha1s_.size());

	const auto finish_outcome = gateway_.FinishLargeFile(session_.file_id_, session_.part_sha1s_);
	B2C_IF_ERROR(finish_outcome)
	{
		return Fail(finish_outcome.GetError());
	}

	source_.Close();
	state_ = UploadState::COMPLETED;

	UploadProgressEvent event;
	event.type_ = UploadEventType::COMPLETED;
	event.part_number_ = 0;
	event.total_parts_ = GetTotalParts();
	event.file_ = finish_outcome.GetResult();
	if (event.file_.file_id_.empty())
	{
		event.file_.file_id_ = session_.file_id_;
	}
	return event;
}

B2Error LargeFileUpload::Fail(B2Error error)
{
	if (state_ == UploadState::UPLOADING && !cancel_attempted_)
	{
		cancel_attempted_ = true;
		state_ = UploadState::CANCELLING;
		spdlog::debug("Cancelling large file {}: {}", session_.file_id_, error.GetMessage());

		const auto cancel_outcome = gateway_.CancelLargeFile(session_.file_id_);
		B2C_IF_ERROR(cancel_outcome)
		{
			LogBadOutcome(cancel_outcome, "Cancel of large file " + session_.file_id_ + " failed");
			error.AttachContext("cancel of large file " + session_.file_id_ +
					    " failed: " + cancel_outcome.GetError().GetMessage());
		}
	}

	source_.Close();
	state_ = UploadState::FAILED;
	return error;
}

B2Outcome<UploadProducerPtr> MakeLargeFileUpload(B2Gateway& gateway, UploadTarget target, UploadSource source,
						 tOffset total_size, tOffset part_size)
{
	if (target.bucket_id_.empty() || target.file_name_.empty())
	{
		return MakeConfigError("Large file upload needs a bucket id and a file name");
	}

	const auto plan_outcome = PlanParts(total_size, part_size);
	B2C_PASS_OUTCOME_ON_ERROR(plan_outcome);

	const PartPlan& plan = plan_outcome.GetResult();
	if (plan.part_count_ < 2)
	{
		return MakeConfigError("A large file needs at least 2 parts, " + std::to_string(total_size) +
				       " bytes fit in one");
	}
	if (plan.part_count_ > kMaxPartCount)
	{
		return MakeConfigError(std::to_string(plan.part_count_) + " parts exceed the limit of " +
				       std::to_string(kMaxPartCount) + ", use a larger part size");
	}

	UploadProducerPtr producer =
	    Aws::MakeUnique<LargeFileUpload>(kAllocationTag, gateway, std::move(target), std::move(source), plan);
	return B2Outcome<UploadProducerPtr>(std::move(producer));
}
} // namespace b2client
