#pragma once

#include "b2gateway.h"
#include "uploadproducer.h"
#include "uploadsource.h"

namespace b2client
{
enum class UploadState
{
	IDLE,
	UPLOADING,
	// while the large file is being cancelled after a failure
	CANCELLING,
	COMPLETED,
	FAILED
};

// Multipart upload of one file, one part per Next, then finish. The first Next
// also opens the source and starts the large file before its part, so it makes
// three calls: start, part URL and part upload. Later parts take two calls,
// the part URL and the upload, and the last Next makes the finish call.
// Any failure once the large file is started cancels it on the service before
// the error is returned. The producer is not restartable.
class LargeFileUpload : public UploadProducer
{
public:
	LargeFileUpload(B2Gateway& gateway, UploadTarget target, UploadSource source, PartPlan plan);

	// cancels the large file if the upload was left in progress
	~LargeFileUpload() override;

	LargeFileUpload(const LargeFileUpload&) = delete;
	LargeFileUpload& operator=(const LargeFileUpload&) = delete;

	B2Outcome<UploadProgressEvent> Next() override;

	bool HasNext() const override;

	int GetTotalParts() const override
	{
		return static_cast<int>(plan_.part_count_);
	}

	UploadState GetState() const
	{
		return state_;
	}

	const LargeFileSession& GetSession() const
	{
		return session_;
	}

	const PartPlan& GetPlan() const
	{
		return plan_;
	}

	bool IsSourceOpen() const
	{
		return source_.IsOpen();
	}

private:
	B2Outcome<bool> Start();
	B2Outcome<UploadProgressEvent> UploadNextPart();
	B2Outcome<UploadProgressEvent> Finish();

	// Leaves the upload FAILED, the returned error is the one given
	B2Error Fail(B2Error error);

	B2Gateway& gateway_;
	const UploadTarget target_;
	UploadSource source_;
	const PartPlan plan_;
	UploadState state_{UploadState::IDLE};
	LargeFileSession session_;
	int next_part_{1};
	bool cancel_attempted_{false};
};

// Plans eagerly: a bad part size, less than two parts or more than
// kMaxPartCount parts are ConfigError and nothing is sent.
B2Outcome<UploadProducerPtr> MakeLargeFileUpload(B2Gateway& gateway, UploadTarget target, UploadSource source,
						 tOffset total_size, tOffset part_size);
} // namespace b2client
