#pragma once

#include "b2error.h"

#include <aws/core/utils/memory/stl/AWSSet.h>
#include <aws/core/utils/memory/stl/AWSString.h>
#include <aws/core/utils/memory/stl/AWSVector.h>

namespace b2client
{
enum class KeyCapability
{
	DELETE_BUCKETS,
	DELETE_FILES,
	DELETE_KEYS,
	LIST_BUCKETS,
	LIST_FILES,
	LIST_KEYS,
	READ_BUCKETS,
	READ_FILES,
	SHARE_FILES,
	WRITE_BUCKETS,
	WRITE_FILES,
	WRITE_KEYS
};

using KeyCapabilities = Aws::Set<KeyCapability>;

// Name used by the service, e.g. "writeFiles"
const char* GetKeyCapabilityName(KeyCapability capability);

B2Outcome<KeyCapability> ParseKeyCapability(const Aws::String& name);

// Names not known to this library are skipped
KeyCapabilities ParseKeyCapabilities(const Aws::Vector<Aws::String>& names);

Aws::Vector<Aws::String> GetKeyCapabilityNames(const KeyCapabilities& capabilities);

// true if every element of required is in granted
bool IncludesAll(const KeyCapabilities& granted, const KeyCapabilities& required);

// Groupings of related permissions
namespace capability_groups
{
const KeyCapabilities& Keys();
const KeyCapabilities& Buckets();
const KeyCapabilities& Files();
const KeyCapabilities& Read();
const KeyCapabilities& Write();
const KeyCapabilities& Delete();
} // namespace capability_groups
} // namespace b2client
