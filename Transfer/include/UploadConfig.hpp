#pragma once

#include <chrono>
#include <cstddef>
#include <cstdio>
#include <string>

struct UploadConfig {
	static constexpr std::chrono::milliseconds kDefaultFinalizeTimeout{10000};
	static constexpr std::size_t kDefaultChunkSize = 64 * BUFSIZ;

	// Destination bucket and object name prefix. Used by callers that derive
	// object descriptors from their sources; the task itself ignores them.
	std::string bucket;
	std::string prefix;

	// Report SKIPPED instead of FAILED_TO_FINISH when the backend rejects
	// the write because of a precondition.
	bool skip_if_exists = false;

	// Bound on the wait for the backend to confirm the finalized object.
	std::chrono::milliseconds finalize_timeout = kDefaultFinalizeTimeout;

	std::size_t chunk_size = kDefaultChunkSize;
};
