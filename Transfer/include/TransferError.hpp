#pragma once

#include <exception>
#include <string>

enum class ErrorKind {
	InvalidArgument,
	PreconditionFailed,
	Backend,
	Io,
	Timeout,
	Cancelled,
	Internal
};

// Diagnostic attached to every outcome that is not a success. `code` is the
// raw code of whoever reported the error (a gRPC status code, an errno, ...).
struct TransferError {
	ErrorKind kind = ErrorKind::Internal;
	int code = 0;
	std::string message;

	bool IsPreconditionFailure() const noexcept;
	std::string ToString() const;

	static TransferError InvalidArgument(std::string message);
	static TransferError PreconditionFailed(int code, std::string message);
	static TransferError Backend(int code, std::string message);
	static TransferError Io(int code, std::string message);
	static TransferError Timeout(std::string message);
	static TransferError Cancelled(std::string message);
	static TransferError Internal(std::string message);

	// Maps an exception caught at the task boundary onto an error kind.
	static TransferError FromException(const std::exception& e, const char* context);
};

const char* ErrorKindToString(ErrorKind kind) noexcept;
