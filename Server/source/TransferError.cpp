#include "TransferError.hpp"

const char* TransferErrorKindName(TransferError::Kind kind) noexcept
{
    switch (kind) {
    case TransferError::Kind::None:                  return "None";
    case TransferError::Kind::ProtocolViolation:     return "ProtocolViolation";
    case TransferError::Kind::StreamTerminatedEarly: return "StreamTerminatedEarly";
    case TransferError::Kind::StorageUnavailable:    return "StorageUnavailable";
    case TransferError::Kind::StorageWriteError:     return "StorageWriteError";
    case TransferError::Kind::FileBusy:              return "FileBusy";
    case TransferError::Kind::Internal:              return "Internal";
    }

    return "Unknown";
}

grpc::Status ToStatus(const TransferError& error)
{
    switch (error.kind) {
    case TransferError::Kind::None:
        return grpc::Status::OK;
    case TransferError::Kind::ProtocolViolation:
    case TransferError::Kind::StreamTerminatedEarly:
        return grpc::Status(grpc::StatusCode::FAILED_PRECONDITION, error.message);
    case TransferError::Kind::StorageUnavailable:
        return grpc::Status(grpc::StatusCode::UNAVAILABLE, error.message);
    case TransferError::Kind::FileBusy:
        return grpc::Status(grpc::StatusCode::ABORTED, error.message);
    case TransferError::Kind::StorageWriteError:
    case TransferError::Kind::Internal:
        break;
    }

    return grpc::Status(grpc::StatusCode::INTERNAL, error.message);
}
