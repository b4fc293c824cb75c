#include "uploadproducer.h"

namespace b2client
{
B2Outcome<FileInfo> RunToCompletion(UploadProducer& producer, const ProgressCallback& callback)
{
	while (producer.HasNext())
	{
		auto outcome = producer.Next();
		B2C_PASS_OUTCOME_ON_ERROR(outcome);

		const UploadProgressEvent& event = outcome.GetResult();
		if (event.type_ == UploadEventType::END_OF_UPLOAD)
		{
			break;
		}
		if (callback)
		{
			callback(event);
		}
		if (event.type_ == UploadEventType::COMPLETED)
		{
			return event.file_;
		}
	}
	return MakeProtocolError("Upload ended without completion");
}
} // namespace b2client
