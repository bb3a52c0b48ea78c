#include "cloudup/backend/backend_factory.hpp"

#include "cloudup/auth/oauth_token_exchanger.hpp"
#include "cloudup/auth/token_exchanger.hpp"
#include "cloudup/auth/token_manager.hpp"
#include "cloudup/backend/local_backend.hpp"
#include "cloudup/backend/onedrive_backend.hpp"
#include "cloudup/backend/webdav_backend.hpp"

#include <spdlog/spdlog.h>

namespace cloudup::backend {

namespace {

std::shared_ptr<Backend> make_onedrive(const config::BackendConfig& config,
                                       std::shared_ptr<network::HttpTransport> transport) {
    const auto& od = config.onedrive;

    auth::OAuthTokenExchanger::Options oauth;
    oauth.token_url = onedrive_token_url(od.api);
    oauth.client_id = od.client_id;
    oauth.client_secret = od.client_secret;
    oauth.scopes = {"offline_access", "Files.ReadWrite.All"};
    oauth.timeout = config.http.request_timeout;

    auto exchanger = std::make_shared<auth::OAuthTokenExchanger>(transport, std::move(oauth));
    auto tokens = std::make_shared<auth::TokenManager>(std::move(exchanger), od.refresh_token);

    OneDriveBackend::Options options;
    options.api = od.api;
    options.root_folder = od.root_folder;
    options.chunk_size = od.chunk_size;
    options.request_timeout = config.http.request_timeout;
    options.abort_timeout = config.http.abort_timeout;
    return std::make_shared<OneDriveBackend>(std::move(transport), std::move(tokens), std::move(options));
}

std::shared_ptr<Backend> make_webdav(const config::BackendConfig& config,
                                     std::shared_ptr<network::HttpTransport> transport) {
    const auto& dav = config.webdav;

    std::shared_ptr<auth::TokenManager> tokens;
    if (!dav.username.empty()) {
        auto exchanger = std::make_shared<auth::StaticTokenExchanger>(
            auth::StaticTokenExchanger::basic(dav.username, dav.password));
        tokens = std::make_shared<auth::TokenManager>(std::move(exchanger), std::string());
    }

    WebDavBackend::Options options;
    options.base_url = dav.url;
    options.root = dav.root;
    options.replace_existing = dav.replace_existing;
    options.create_collections = dav.create_collections;
    options.request_timeout = config.http.request_timeout;
    options.abort_timeout = config.http.abort_timeout;
    return std::make_shared<WebDavBackend>(std::move(transport), std::move(tokens), std::move(options));
}

} // namespace

Result<std::shared_ptr<Backend>> make_backend(const config::BackendConfig& settings,
                                              std::shared_ptr<network::HttpTransport> transport) {
    using BackendPtr = std::shared_ptr<Backend>;

    if (settings.type == config::BackendType::Local) {
        spdlog::debug("Using local backend in {}", settings.local.folder);
        return Ok<BackendPtr>(std::make_shared<LocalBackend>(settings.local.folder, settings.local.chunk_size));
    }
    if (!transport) {
        return Err<BackendPtr>(Error::validation(std::string("The ") + config::to_string(settings.type) +
                                                 " backend needs an HTTP transport"));
    }
    if (settings.type == config::BackendType::OneDrive) {
        return Ok(make_onedrive(settings, std::move(transport)));
    }
    return Ok(make_webdav(settings, std::move(transport)));
}

} // namespace cloudup::backend
