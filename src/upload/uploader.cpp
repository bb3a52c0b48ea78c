#include "cloudup/upload/uploader.hpp"

#include <spdlog/spdlog.h>

#include <sstream>
#include <utility>

namespace cloudup::upload {

UploadHandle::UploadHandle(std::shared_ptr<UploadSession> session)
    : session_(std::move(session)) {
    std::promise<UploadOutcome> promise;
    outcome_ = promise.get_future().share();
    worker_ = std::thread([session = session_, promise = std::move(promise)]() mutable {
        try {
            promise.set_value(session->run());
        } catch (const std::exception& e) {
            spdlog::error("Upload {} terminated by exception: {}", session->id(), e.what());
            promise.set_value(UploadOutcome::failed(
                Error::protocol(std::string("Upload terminated by exception: ") + e.what())));
        }
    });
}

UploadHandle::~UploadHandle() {
    if (worker_.joinable()) {
        worker_.join();
    }
}

void UploadHandle::cancel() {
    session_->cancel();
}

UploadOutcome UploadHandle::await_outcome() {
    return outcome_.get();
}

std::optional<UploadOutcome> UploadHandle::await_outcome_for(std::chrono::milliseconds timeout) {
    if (outcome_.wait_for(timeout) != std::future_status::ready) {
        return std::nullopt;
    }
    return outcome_.get();
}

Uploader::Uploader(SessionOptions options, events::EventBus* bus)
    : options_(options), bus_(bus) {}

std::string Uploader::next_session_id() {
    std::ostringstream oss;
    oss << "upload-" << ++session_counter_;
    return oss.str();
}

Result<std::shared_ptr<UploadHandle>> Uploader::start_upload(UploadTarget target,
                                                            std::shared_ptr<io::ByteSource> source,
                                                            std::shared_ptr<backend::Backend> backend) {
    using Handle = std::shared_ptr<UploadHandle>;

    if (target.total_length == 0) {
        return Err<Handle>(Error::validation("Upload target has zero length"));
    }
    if (target.remote_path.empty()) {
        return Err<Handle>(Error::validation("Upload target has no remote path"));
    }
    if (!source) {
        return Err<Handle>(Error::validation("Upload needs a byte source"));
    }
    if (!backend) {
        return Err<Handle>(Error::validation("Upload needs a backend"));
    }
    if (source->size() < target.total_length) {
        return Err<Handle>(Error::validation("Byte source holds " + std::to_string(source->size()) +
                                             " bytes but the target declares " +
                                             std::to_string(target.total_length)));
    }

    auto session = std::make_shared<UploadSession>(next_session_id(), std::move(target), std::move(source),
                                                   std::move(backend), options_, bus_);
    return Ok(std::make_shared<UploadHandle>(std::move(session)));
}

} // namespace cloudup::upload
