// Usage: upload_example <config.json> <local-file> <remote-path>
//
// Uploads one file to the backend named in the configuration. Ctrl+C
// cancels the upload and removes whatever was already sent.

#include "cloudup/auth/token_refresher.hpp"
#include "cloudup/backend/backend_factory.hpp"
#include "cloudup/config/config.hpp"
#include "cloudup/core/format.hpp"
#include "cloudup/core/logging.hpp"
#include "cloudup/events/components.hpp"
#include "cloudup/events/event_bus.hpp"
#include "cloudup/io/byte_source.hpp"
#include "cloudup/network/asio_http_transport.hpp"
#include "cloudup/upload/uploader.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <optional>

using namespace cloudup;

namespace {

volatile std::sig_atomic_t g_interrupted = 0;

void signal_handler(int signal) {
    if (signal == SIGINT) {
        g_interrupted = 1;
    }
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc != 4) {
        std::cerr << "Usage: " << argv[0] << " <config.json> <local-file> <remote-path>\n";
        return 2;
    }

    auto settings = config::load_file(argv[1]);
    if (settings.is_error()) {
        std::cerr << "Configuration error: " << settings.error().describe() << "\n";
        return 2;
    }
    logging::initialize(settings.value().logging);

    auto source = io::FileByteSource::open(argv[2]);
    if (source.is_error()) {
        spdlog::error("Cannot read {}: {}", argv[2], source.error().describe());
        return 1;
    }

    auto transport = std::make_shared<network::AsioHttpTransport>();
    auto remote = backend::make_backend(settings.value().backend, transport);
    if (remote.is_error()) {
        spdlog::error("Cannot set up backend: {}", remote.error().describe());
        return 1;
    }

    // Keeps long uploads from running into token expiry between chunks
    std::unique_ptr<auth::TokenRefresher> refresher;
    if (auto tokens = remote.value()->token_manager()) {
        refresher = std::make_unique<auth::TokenRefresher>(tokens);
    }

    events::EventBus bus;
    events::LoggerComponent logger(bus);
    events::MetricsComponent metrics(bus);

    upload::Uploader uploader(settings.value().session_options(), &bus);

    upload::UploadTarget target;
    target.remote_path = argv[3];
    target.total_length = source.value()->size();

    auto handle = uploader.start_upload(target, source.value(), remote.value());
    if (handle.is_error()) {
        spdlog::error("Upload rejected: {}", handle.error().describe());
        return 1;
    }

    std::signal(SIGINT, signal_handler);

    std::optional<upload::UploadOutcome> outcome;
    bool cancel_sent = false;
    while (!outcome) {
        outcome = handle.value()->await_outcome_for(std::chrono::milliseconds(200));
        if (!outcome && g_interrupted && !cancel_sent) {
            spdlog::info("Interrupted, cancelling upload {}", handle.value()->id());
            handle.value()->cancel();
            cancel_sent = true;
        }
    }

    metrics.print_stats();

    int exit_code = 0;
    switch (outcome->status) {
        case upload::UploadOutcome::Status::Completed:
            std::cout << "Uploaded " << format_size(target.total_length) << " to " << target.remote_path
                      << " (id " << outcome->resource_id << ")\n";
            break;
        case upload::UploadOutcome::Status::Cancelled:
            std::cout << "Upload cancelled\n";
            exit_code = 130;
            break;
        case upload::UploadOutcome::Status::Failed:
            std::cout << "Upload failed: " << outcome->error->describe() << "\n";
            exit_code = 1;
            break;
    }

    handle.value().reset();
    if (refresher) {
        refresher->stop();
    }
    logging::shutdown();
    return exit_code;
}
