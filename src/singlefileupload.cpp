#include "singlefileupload.h"

#include "spdlog/spdlog.h"

namespace b2client
{
SingleFileUpload::SingleFileUpload(B2Gateway& gateway, UploadTarget target, UploadSource source, tOffset size)
    : gateway_{gateway}, target_{std::move(target)}, source_{std::move(source)}, size_{size}
{
}

B2Outcome<UploadProgressEvent> SingleFileUpload::Next()
{
	UploadProgressEvent event;
	event.total_parts_ = 1;
	if (done_)
	{
		event.type_ = UploadEventType::END_OF_UPLOAD;
		return event;
	}

	done_ = true;
	auto outcome = Upload();
	source_.Close();
	B2C_PASS_OUTCOME_ON_ERROR(outcome);

	event.type_ = UploadEventType::COMPLETED;
	event.part_number_ = 0;
	event.file_ = outcome.GetResultWithOwnership();
	return event;
}

B2Outcome<FileInfo> SingleFileUpload::Upload()
{
	const auto open_outcome = source_.Open();
	B2C_PASS_OUTCOME_ON_ERROR(open_outcome);

	const auto url_outcome = gateway_.GetUploadUrl(target_.bucket_id_);
	B2C_PASS_OUTCOME_ON_ERROR(url_outcome);

	auto read_outcome = source_.Read(size_);
	B2C_PASS_OUTCOME_ON_ERROR(read_outcome);
	const PartBuffer buffer = read_outcome.GetResultWithOwnership();
	const Aws::String sha1 = Sha1Hex(buffer);

	spdlog::debug("Uploading {} in one request, {} bytes", target_.file_name_, size_);

	return gateway_.UploadFile(buffer, url_outcome.GetResult(), target_, sha1);
}

B2Outcome<UploadProducerPtr> MakeSingleFileUpload(B2Gateway& gateway, UploadTarget target, UploadSource source,
						  tOffset size)
{
	if (target.bucket_id_.empty() || target.file_name_.empty())
	{
		return MakeConfigError("File upload needs a bucket id and a file name");
	}
	if (size < 0)
	{
		return MakeConfigError("Invalid negative upload size " + std::to_string(size));
	}
	if (size > kMaxPartSize)
	{
		return MakeConfigError("File of " + std::to_string(size) + " bytes is too large for one request");
	}

	UploadProducerPtr producer =
	    Aws::MakeUnique<SingleFileUpload>(kAllocationTag, gateway, std::move(target), std::move(source), size);
	return B2Outcome<UploadProducerPtr>(std::move(producer));
}
} // namespace b2client
