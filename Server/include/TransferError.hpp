#pragma once

#include <string>

#include <grpcpp/support/status.h>

struct TransferError {
	enum class Kind {
		None = 0,
		ProtocolViolation,
		StreamTerminatedEarly,
		StorageUnavailable,
		StorageWriteError,
		FileBusy,
		Internal
	};

	Kind kind = Kind::None;
	std::string message;
};

const char* TransferErrorKindName(TransferError::Kind kind) noexcept;

// Status used when the error has to surface at the transport level.
// Protocol violations and early stream termination never do; they are
// reported inside a TransferResponse instead.
grpc::Status ToStatus(const TransferError& error);
