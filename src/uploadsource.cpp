#include "uploadsource.h"

#include "spdlog/spdlog.h"

#include <aws/core/utils/HashingUtils.h>
#include <aws/core/utils/stream/PreallocatedStreamBuf.h>

#include <fstream>

namespace b2client
{
UploadSource UploadSource::FromPath(Aws::String path)
{
	UploadSource source;
	source.path_ = std::move(path);
	return source;
}

UploadSource UploadSource::FromStream(Aws::IStream& stream)
{
	UploadSource source;
	source.stream_ = &stream;
	return source;
}

UploadSource::~UploadSource()
{
	Close();
}

B2Outcome<bool> UploadSource::Open()
{
	if (IsOpen())
	{
		return MakeProtocolError("Upload source is already open");
	}

	bytes_read_ = 0;
	if (!IsPath())
	{
		if (!stream_ || stream_->bad())
		{
			return MakeConfigError("Upload stream is not readable");
		}
		// the upload always covers the stream from its first byte
		stream_->clear();
		stream_->seekg(0, std::ios::beg);
		if (stream_->fail())
		{
			return MakeConfigError("Upload stream cannot be rewound");
		}
		borrowed_open_ = true;
		return true;
	}

	file_ = Aws::MakeUnique<Aws::IFStream>(kAllocationTag, path_.c_str(), std::ios::binary);
	if (!file_->is_open())
	{
		file_.reset();
		return MakeConfigError("Cannot open local file " + path_);
	}
	spdlog::debug("Opened {}", path_);
	return true;
}

B2Outcome<PartBuffer> UploadSource::Read(tOffset length)
{
	if (!IsOpen())
	{
		return MakeProtocolError("Read on a closed upload source");
	}
	if (length < 0)
	{
		return MakeProtocolError("Negative read length");
	}

	Aws::IStream& in = file_ ? static_cast<Aws::IStream&>(*file_) : *stream_;

	PartBuffer buffer(static_cast<size_t>(length));
	if (length > 0)
	{
		in.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(length));
	}
	const tOffset got = length > 0 ? static_cast<tOffset>(in.gcount()) : 0;
	bytes_read_ += got;

	if (got != length)
	{
		return MakeProtocolError("Upload source ended early: expected " + std::to_string(length) +
					 " bytes, got " + std::to_string(got) + " after " +
					 std::to_string(bytes_read_ - got) + " bytes");
	}
	return buffer;
}

void UploadSource::Close()
{
	if (file_)
	{
		file_->close();
		file_.reset();
		spdlog::debug("Closed {}", path_);
	}
	borrowed_open_ = false;
}

bool UploadSource::IsOpen() const
{
	return file_ != nullptr || borrowed_open_;
}

Aws::String Sha1Hex(const PartBuffer& data)
{
	Aws::Utils::Stream::PreallocatedStreamBuf pre_buf(const_cast<unsigned char*>(data.data()), data.size());
	Aws::IOStream stream(&pre_buf);
	return Aws::Utils::HashingUtils::HexEncode(Aws::Utils::HashingUtils::CalculateSHA1(stream));
}
} // namespace b2client
