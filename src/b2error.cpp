#include "b2error.h"

#include "spdlog/spdlog.h"

#include <aws/core/utils/memory/stl/AWSStringStream.h>

namespace b2client
{
const char* GetErrorTypeName(B2Errors type)
{
	switch (type)
	{
	case B2Errors::CONFIG:
		return "config";
	case B2Errors::TRANSPORT:
		return "transport";
	case B2Errors::REMOTE:
		return "remote";
	case B2Errors::PROTOCOL:
		return "protocol";
	}
	return "unknown";
}

Aws::String B2Error::GetMessage() const
{
	Aws::OStringStream os;
	os << '[' << GetErrorTypeName(type_);
	if (status_ != 0)
	{
		os << ' ' << status_;
	}
	if (!code_.empty())
	{
		os << ' ' << code_;
	}
	os << "] " << err_msg_;
	if (!context_.empty())
	{
		os << " (" << context_ << ')';
	}
	return os.str();
}

void B2Error::AttachContext(const Aws::String& context)
{
	if (!context_.empty())
	{
		context_ += "; ";
	}
	context_ += context;
}

B2Error MakeConfigError(Aws::String err_msg)
{
	return {B2Errors::CONFIG, 0, "", std::move(err_msg), ""};
}

B2Error MakeTransportError(Aws::String err_msg)
{
	return {B2Errors::TRANSPORT, 0, "", std::move(err_msg), ""};
}

B2Error MakeRemoteError(int status, Aws::String code, Aws::String err_msg)
{
	return {B2Errors::REMOTE, status, std::move(code), std::move(err_msg), ""};
}

B2Error MakeProtocolError(Aws::String err_msg)
{
	return {B2Errors::PROTOCOL, 0, "", std::move(err_msg), ""};
}

void LogError(const Aws::String& msg)
{
	spdlog::error(msg);
}
} // namespace b2client
