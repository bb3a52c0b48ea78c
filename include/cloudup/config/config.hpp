#pragma once

#include "cloudup/backend/onedrive_backend.hpp"
#include "cloudup/core/logging.hpp"
#include "cloudup/core/result.hpp"
#include "cloudup/upload/retry_policy.hpp"
#include "cloudup/upload/upload_session.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>

namespace cloudup::config {

enum class BackendType { OneDrive, WebDav, Local };

const char* to_string(BackendType type) noexcept;

struct HttpConfig {
    std::chrono::milliseconds request_timeout{std::chrono::seconds(60)};
    std::chrono::milliseconds abort_timeout{std::chrono::seconds(10)};
};

struct OneDriveConfig {
    backend::OneDriveApi api = backend::OneDriveApi::Common;
    std::string client_id;
    std::string client_secret;
    std::string refresh_token;
    std::string root_folder = "/";
    std::uint64_t chunk_size = backend::OneDriveBackend::kDefaultChunkSize;
};

struct WebDavConfig {
    std::string url;
    std::string username;
    std::string password;
    std::string root;
    bool replace_existing = true;
    bool create_collections = true;
};

struct LocalConfig {
    std::string folder;
    std::uint64_t chunk_size = 4 * 1024 * 1024;
};

/**
 * @brief Which backend to build and its settings
 *
 * Only the section matching `type` is meaningful.
 */
struct BackendConfig {
    BackendType type = BackendType::Local;
    OneDriveConfig onedrive;
    WebDavConfig webdav;
    LocalConfig local;
    HttpConfig http;
};

struct UploaderConfig {
    ::cloudup::logging::LoggingConfig logging;
    upload::RetryOptions retry;
    std::chrono::seconds token_refresh_margin{120};
    BackendConfig backend;

    [[nodiscard]] upload::SessionOptions session_options() const;
};

/**
 * @brief Parse a JSON configuration document
 *
 * Unknown keys are ignored. Malformed JSON, wrongly typed values, an unknown
 * backend type and missing required backend keys fail with Validation.
 */
Result<UploaderConfig> parse(const std::string& text);

Result<UploaderConfig> load_file(const std::filesystem::path& path);

} // namespace cloudup::config
