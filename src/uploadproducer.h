#pragma once

#include "b2error.h"
#include "b2types.h"

#include <aws/core/utils/memory/AWSMemory.h>

#include <functional>

namespace b2client
{
enum class UploadEventType
{
	PART_UPLOADED,
	COMPLETED,
	// returned by Next once the upload has ended
	END_OF_UPLOAD
};

struct UploadProgressEvent
{
	UploadEventType type_{UploadEventType::END_OF_UPLOAD};
	// 1-based, 0 for COMPLETED
	int part_number_{0};
	int total_parts_{0};
	PartResult part_;
	FileInfo file_;

	bool IsFinal() const
	{
		return type_ != UploadEventType::PART_UPLOADED;
	}
};

// Pull-based upload: each Next performs one network step and reports it.
// An error is final, the producer then only returns END_OF_UPLOAD.
class UploadProducer
{
public:
	virtual ~UploadProducer() = default;

	virtual B2Outcome<UploadProgressEvent> Next() = 0;

	virtual bool HasNext() const = 0;

	virtual int GetTotalParts() const = 0;
};

using UploadProducerPtr = Aws::UniquePtr<UploadProducer>;

using ProgressCallback = std::function<void(const UploadProgressEvent&)>;

// Drains the producer, the callback sees every event but END_OF_UPLOAD
B2Outcome<FileInfo> RunToCompletion(UploadProducer& producer, const ProgressCallback& callback);
} // namespace b2client
