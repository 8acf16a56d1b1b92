#include "TransferError.hpp"

#include <filesystem>
#include <future>
#include <ios>
#include <stdexcept>
#include <system_error>

#include <fmt/core.h>

bool TransferError::IsPreconditionFailure() const noexcept
{
	return kind == ErrorKind::PreconditionFailed;
}

std::string TransferError::ToString() const
{
	return fmt::format("{} (code={}): {}", ErrorKindToString(kind), code, message);
}

TransferError TransferError::InvalidArgument(std::string message)
{
	return TransferError{ ErrorKind::InvalidArgument, 0, std::move(message) };
}

TransferError TransferError::PreconditionFailed(int code, std::string message)
{
	return TransferError{ ErrorKind::PreconditionFailed, code, std::move(message) };
}

TransferError TransferError::Backend(int code, std::string message)
{
	return TransferError{ ErrorKind::Backend, code, std::move(message) };
}

TransferError TransferError::Io(int code, std::string message)
{
	return TransferError{ ErrorKind::Io, code, std::move(message) };
}

TransferError TransferError::Timeout(std::string message)
{
	return TransferError{ ErrorKind::Timeout, 0, std::move(message) };
}

TransferError TransferError::Cancelled(std::string message)
{
	return TransferError{ ErrorKind::Cancelled, 0, std::move(message) };
}

TransferError TransferError::Internal(std::string message)
{
	return TransferError{ ErrorKind::Internal, 0, std::move(message) };
}

TransferError TransferError::FromException(const std::exception& e, const char* context)
{
	std::string message = fmt::format("{}: {}", context, e.what());

	if (dynamic_cast<const std::invalid_argument*>(&e))
		return InvalidArgument(std::move(message));

	if (const auto* fe = dynamic_cast<const std::filesystem::filesystem_error*>(&e))
		return Io(fe->code().value(), std::move(message));

	if (const auto* ie = dynamic_cast<const std::ios_base::failure*>(&e))
		return Io(ie->code().value(), std::move(message));

	if (const auto* fe = dynamic_cast<const std::future_error*>(&e))
		return Internal(fmt::format("{} (future_errc={})", message, fe->code().value()));

	return Internal(std::move(message));
}

const char* ErrorKindToString(ErrorKind kind) noexcept
{
	switch (kind) {
	case ErrorKind::InvalidArgument:    return "invalid-argument";
	case ErrorKind::PreconditionFailed: return "precondition-failed";
	case ErrorKind::Backend:            return "backend";
	case ErrorKind::Io:                 return "io";
	case ErrorKind::Timeout:            return "timeout";
	case ErrorKind::Cancelled:          return "cancelled";
	case ErrorKind::Internal:           return "internal";
	}

	return "unknown";
}
