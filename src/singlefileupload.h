#pragma once

#include "b2gateway.h"
#include "uploadproducer.h"
#include "uploadsource.h"

namespace b2client
{
// Upload in one request, for content that fits in one part. The only event
// is COMPLETED with part number 0.
class SingleFileUpload : public UploadProducer
{
public:
	SingleFileUpload(B2Gateway& gateway, UploadTarget target, UploadSource source, tOffset size);

	B2Outcome<UploadProgressEvent> Next() override;

	bool HasNext() const override
	{
		return !done_;
	}

	int GetTotalParts() const override
	{
		return 1;
	}

	bool IsSourceOpen() const
	{
		return source_.IsOpen();
	}

private:
	B2Outcome<FileInfo> Upload();

	B2Gateway& gateway_;
	const UploadTarget target_;
	UploadSource source_;
	const tOffset size_;
	bool done_{false};
};

B2Outcome<UploadProducerPtr> MakeSingleFileUpload(B2Gateway& gateway, UploadTarget target, UploadSource source,
						  tOffset size);
} // namespace b2client
