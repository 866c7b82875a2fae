#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <string>

#include <grpcpp/support/server_interceptor.h>
#include <grpcpp/support/interceptor.h>
#include <grpcpp/grpcpp.h>

#include <spdlog/spdlog.h>

// Logs one line per finished call.
class ServerInterceptor final : public grpc::experimental::Interceptor {
public:
	explicit ServerInterceptor(grpc::experimental::ServerRpcInfo *info,
				   std::shared_ptr<spdlog::logger> logger)
		: info_(info)
		, logger_(std::move(logger))
		, start_(std::chrono::steady_clock::now()) { }

public:
	void Intercept(grpc::experimental::InterceptorBatchMethods *methods) override {
		using grpc::experimental::InterceptionHookPoints;

		if (methods->QueryInterceptionHookPoint(InterceptionHookPoints::POST_RECV_INITIAL_METADATA)) {
			method_ = info_ ? info_->method() : "";
			if (info_ && info_->server_context())
				peer_ = info_->server_context()->peer();
		}

		if (methods->QueryInterceptionHookPoint(InterceptionHookPoints::POST_RECV_MESSAGE))
			recv_messages_.fetch_add(1, std::memory_order_relaxed);

		if (methods->QueryInterceptionHookPoint(InterceptionHookPoints::PRE_SEND_STATUS))
			Report(methods->GetSendStatus());

		methods->Proceed();
	}

private:
	void Report(const grpc::Status& status) {
		if (!logger_)
			return;

		const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
			std::chrono::steady_clock::now() - start_).count();
		const bool cancelled = info_ && info_->server_context() && info_->server_context()->IsCancelled();

		logger_->log(status.ok() ? spdlog::level::info : spdlog::level::warn,
			     "[grpc] method={} type={} peer={} code={} cancelled={} recv_msgs={} latency_ms={}{}{}",
			     method_, TypeName(), peer_, static_cast<int>(status.error_code()), cancelled,
			     recv_messages_.load(std::memory_order_relaxed), ms,
			     status.ok() ? "" : " error=", status.error_message());
	}

	const char* TypeName() const {
		if (!info_)
			return "unknown";

		switch (info_->type()) {
		case grpc::experimental::ServerRpcInfo::Type::UNARY:         return "unary";
		case grpc::experimental::ServerRpcInfo::Type::CLIENT_STREAMING: return "client-streaming";
		case grpc::experimental::ServerRpcInfo::Type::SERVER_STREAMING: return "server-streaming";
		case grpc::experimental::ServerRpcInfo::Type::BIDI_STREAMING:   return "bidi-streaming";
		}

		return "unknown";
	}

private:
	grpc::experimental::ServerRpcInfo *info_;
	std::shared_ptr<spdlog::logger> logger_;

	std::chrono::steady_clock::time_point start_;
	std::string method_;
	std::string peer_;
	std::atomic<int64_t> recv_messages_{0};
};

class ServerInterceptorFactory final
	: public grpc::experimental::ServerInterceptorFactoryInterface {
public:
	explicit ServerInterceptorFactory(std::shared_ptr<spdlog::logger> logger)
		: logger_(std::move(logger)) { }

	grpc::experimental::Interceptor* CreateServerInterceptor(
		grpc::experimental::ServerRpcInfo *info
	) override
	{
		return new ServerInterceptor(info, logger_);
	}

private:
	std::shared_ptr<spdlog::logger> logger_;
};
