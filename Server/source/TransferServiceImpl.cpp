#include "TransferServiceImpl.hpp"

#include <optional>
#include <string>

#include <spdlog/spdlog.h>

#include "ChunkValidator.hpp"
#include "IdleWatchdog.hpp"

namespace {
	constexpr int64_t kProgressInterval = 100;
	constexpr double kMiB = 1024.0 * 1024.0;

	// Drops the stream's session from the registry on every exit path.
	class SessionLease
	{
	public:
		SessionLease(TransferSessionRegistry& registry, TransferSessionRegistry::StreamId id)
			: registry_(registry), id_(id) { }

		~SessionLease()
		{
			registry_.Remove(id_);
		}

		SessionLease(const SessionLease&) = delete;
		SessionLease& operator=(const SessionLease&) = delete;

	private:
		TransferSessionRegistry& registry_;
		const TransferSessionRegistry::StreamId id_;
	};

	TransferError Violation(const filetransfer::FileChunk& chunk, const Rejection& rejection)
	{
		return TransferError{ TransferError::Kind::ProtocolViolation,
			fmt::format("chunk {} rejected ({}): {}",
				    chunk.chunk_number(), ChunkRejectionName(rejection.reason), rejection.message) };
	}

	filetransfer::TransferResponse Failure(std::string message, int64_t bytes_received)
	{
		filetransfer::TransferResponse response;

		response.set_success(false);
		response.set_message(std::move(message));
		response.set_bytes_received(bytes_received);

		return response;
	}

	void LogCompletion(TransferSessionRegistry::StreamId id, const TransferSession& session)
	{
		const double seconds = std::chrono::duration<double>(session.GetElapsed()).count();
		const double mib = static_cast<double>(session.GetBytesReceived()) / kMiB;

		spdlog::info("stream {}: '{}' received: {} bytes in {:.2f} s ({:.2f} MiB/s), sha256 {}",
			     id, session.GetFilename(), session.GetBytesReceived(), seconds,
			     seconds > 0 ? mib / seconds : 0.0, session.GetChecksum());
	}
}

TransferServiceImpl::TransferServiceImpl(TransferSessionRegistry& registry,
                                         const FileInfoResolver& resolver,
                                         std::chrono::milliseconds idle_timeout)
    : registry_(registry)
    , resolver_(resolver)
    , idle_timeout_(idle_timeout)
{
}

grpc::Status TransferServiceImpl::ReceiveTransfer(ChunkReader* reader,
                                                  filetransfer::TransferResponse* response,
                                                  const std::function<void()>& cancel)
{
    const auto id = registry_.NextStreamId();
    SessionLease lease(registry_, id);
    IdleWatchdog watchdog(idle_timeout_, cancel);
    watchdog.Suspend();

    StreamState state = StreamState::AwaitingFirstChunk;
    TransferSession* session = nullptr;
    std::optional<TransferError> failure;
    bool last_chunk_seen = false;

    filetransfer::FileChunk chunk;

    // the idle deadline only runs while blocked on the client
    while (state != StreamState::Finalizing) {
        watchdog.Resume();
        const bool read = reader->Read(&chunk);
        watchdog.Suspend();

        if (!read) {
            if (watchdog.Expired())
                spdlog::warn("stream {}: no chunk within {} ms, closing", id, idle_timeout_.count());
            else
                spdlog::warn("stream {}: stream ended prematurely", id);

            state = StreamState::Finalizing;
            break;
        }

        const SessionState expected = session ? session->GetState() : SessionState::ForFirstChunk(chunk);
        if (auto rejection = ValidateChunk(expected, chunk)) {
            failure = Violation(chunk, *rejection);
            spdlog::warn("stream {}: {}", id, failure->message);
            state = StreamState::Finalizing;
            break;
        }

        if (state == StreamState::AwaitingFirstChunk) {
            auto [ok, created, err] = registry_.GetOrCreate(id, chunk);
            if (!ok) {
                spdlog::error("stream {}: cannot start transfer of '{}' [{}]: {}",
                              id, chunk.filename(), TransferErrorKindName(err.kind), err.message);
                return ToStatus(err);
            }

            session = created;
            spdlog::info("stream {}: receiving '{}' in {} chunk(s)", id, session->GetFilename(), session->GetDeclaredTotalChunks());
            state = StreamState::Receiving;
        }

        if (auto err = session->Apply(chunk)) {
            if (err->kind == TransferError::Kind::Internal)
                return ToStatus(*err);

            spdlog::error("stream {}: {}", id, err->message);
            failure = std::move(*err);
            state = StreamState::Finalizing;
            break;
        }

        if (session->GetChunksApplied() % kProgressInterval == 0)
            spdlog::info("stream {}: {} chunks, {:.2f} MiB received",
                         id, session->GetChunksApplied(), static_cast<double>(session->GetBytesReceived()) / kMiB);

        if (chunk.is_last_chunk()) {
            last_chunk_seen = true;
            state = StreamState::Finalizing;
        }
    }

    if (!session) {
        // nothing was opened; answer straight from the recorded failure
        *response = Failure(failure ? failure->message : "stream ended before the first chunk", 0);
        return grpc::Status::OK;
    }

    auto [ok, result, err] = failure ? session->Abort(*failure) : session->Finalize(last_chunk_seen);
    if (!ok) {
        spdlog::critical("stream {}: {}", id, err.message);
        return ToStatus(err);
    }

    if (result.success())
        LogCompletion(id, *session);
    else
        spdlog::warn("stream {}: transfer of '{}' failed: {}", id, session->GetFilename(), result.message());

    *response = std::move(result);

    return grpc::Status::OK;
}

grpc::Status TransferServiceImpl::TransferFile(grpc::ServerContext* context,
                                               grpc::ServerReader<filetransfer::FileChunk>* reader,
                                               filetransfer::TransferResponse* response)
{
    grpc::Status status = ReceiveTransfer(reader, response, [context] { context->TryCancel(); });

    if (context->IsCancelled())
        spdlog::warn("TransferFile from {} was cancelled; response not delivered", context->peer());

    return status;
}

grpc::Status TransferServiceImpl::GetFileInfo(grpc::ServerContext* context,
                                              const filetransfer::FileInfoRequest* request,
                                              filetransfer::FileInfoResponse* response)
{
    auto [ok, info, err] = resolver_.Resolve(request->filename());
    if (!ok) {
        spdlog::error("GetFileInfo('{}') from {} failed [{}]: {}",
                      request->filename(), context->peer(), TransferErrorKindName(err.kind), err.message);
        return ToStatus(err);
    }

    spdlog::debug("GetFileInfo('{}'): exists={} size={}", request->filename(), info.exists(), info.file_size());
    *response = std::move(info);

    return grpc::Status::OK;
}
