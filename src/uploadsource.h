#pragma once

#include "b2error.h"
#include "b2types.h"

#include <aws/core/utils/memory/AWSMemory.h>
#include <aws/core/utils/memory/stl/AWSStreamFwd.h>

#include <fstream>

namespace b2client
{
// Content of one upload. A path source owns the file it opens, a stream source
// borrows the caller's stream and rewinds it to its start when opened.
class UploadSource
{
public:
	static UploadSource FromPath(Aws::String path);
	static UploadSource FromStream(Aws::IStream& stream);

	UploadSource(UploadSource&&) = default;
	UploadSource& operator=(UploadSource&&) = default;
	UploadSource(const UploadSource&) = delete;
	UploadSource& operator=(const UploadSource&) = delete;

	~UploadSource();

	B2Outcome<bool> Open();

	// Exactly length bytes, a shorter read is a protocol error
	B2Outcome<PartBuffer> Read(tOffset length);

	// Releases the file of a path source, safe to call more than once
	void Close();

	bool IsOpen() const;

	bool IsPath() const
	{
		return !path_.empty();
	}

	const Aws::String& GetPath() const
	{
		return path_;
	}

	tOffset GetBytesRead() const
	{
		return bytes_read_;
	}

private:
	UploadSource() = default;

	Aws::String path_;
	Aws::UniquePtr<Aws::IFStream> file_;
	Aws::IStream* stream_{nullptr};
	bool borrowed_open_{false};
	tOffset bytes_read_{0};
};

// Lowercase hex SHA-1 of a buffer
Aws::String Sha1Hex(const PartBuffer& data);
} // namespace b2client
