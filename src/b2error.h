#pragma once

#include <aws/core/utils/Outcome.h>
#include <aws/core/utils/memory/stl/AWSString.h>

namespace b2client
{
enum class B2Errors
{
	CONFIG,    // caller mistake, detected before any network call
	TRANSPORT, // no response: connectivity, DNS, socket
	REMOTE,    // the service answered with an error
	PROTOCOL   // a local invariant was broken
};

const char* GetErrorTypeName(B2Errors type);

struct B2Error
{
	B2Errors type_{B2Errors::PROTOCOL};
	int status_{0};
	Aws::String code_;
	Aws::String err_msg_;
	// secondary failures that happened while handling this error
	Aws::String context_;

	B2Errors GetErrorType() const
	{
		return type_;
	}

	int GetStatus() const
	{
		return status_;
	}

	const Aws::String& GetCode() const
	{
		return code_;
	}

	const Aws::String& GetContext() const
	{
		return context_;
	}

	Aws::String GetMessage() const;

	void AttachContext(const Aws::String& context);
};

template <typename R> using B2Outcome = Aws::Utils::Outcome<R, B2Error>;

B2Error MakeConfigError(Aws::String err_msg);
B2Error MakeTransportError(Aws::String err_msg);
B2Error MakeRemoteError(int status, Aws::String code, Aws::String err_msg);
B2Error MakeProtocolError(Aws::String err_msg);

void LogError(const Aws::String& msg);

template <typename R> void LogBadOutcome(const B2Outcome<R>& outcome, const Aws::String& msg)
{
	LogError(msg + ": " + outcome.GetError().GetMessage());
}
} // namespace b2client

#define B2C_IF_ERROR(outcome) if (!(outcome).IsSuccess())

#define B2C_PASS_OUTCOME_ON_ERROR(outcome)                                                                             \
	B2C_IF_ERROR((outcome))                                                                                        \
	{                                                                                                              \
		return (outcome).GetError();                                                                           \
	}
