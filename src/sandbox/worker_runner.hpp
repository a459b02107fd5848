#pragma once

#include "sandbox/worker_protocol.hpp"

namespace mathguard::sandbox {

// Runs one request in the calling process: builds a fresh namespace from the
// catalog, executes the submission, calls the entry point and encodes the
// result. Every failure becomes a response, library exceptions included;
// nothing escapes except std::bad_alloc, which the worker maps to MemoryError
// itself.
WorkerResponse RunRequest(const WorkerRequest& request);

}  // namespace mathguard::sandbox
