#pragma once

#include "uploadproducer.h"
#include "uploadsession.h"
#include "uploadsource.h"

namespace b2client
{
// Entry point of uploads: content that fits in one part goes in one request,
// anything larger through a multipart LargeFileUpload. Both come back as the
// same UploadProducer.
class UploadDispatcher
{
public:
	explicit UploadDispatcher(UploadSession& session);

	// An empty file name, or one ending with '/', takes the base name of path
	B2Outcome<UploadProducerPtr> UploadPath(const Aws::String& path, UploadTarget target) const;

	// The size of a stream is never guessed, kUnknownSize is a ConfigError
	B2Outcome<UploadProducerPtr> UploadStream(Aws::IStream& stream, tOffset size, UploadTarget target) const;

private:
	B2Outcome<UploadTarget> ResolveTarget(UploadTarget target, const Aws::String& local_path) const;

	B2Outcome<UploadProducerPtr> Dispatch(UploadTarget target, UploadSource source, tOffset size) const;

	UploadSession& session_;
};

Aws::String GetBaseName(const Aws::String& path);
} // namespace b2client
