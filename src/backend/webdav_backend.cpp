#include "cloudup/backend/webdav_backend.hpp"

#include "cloudup/network/url.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace cloudup::backend {

namespace {

Error status_error(const network::HttpResponse& response, const std::string& context) {
    return Error::from_http_status(response.status_code, context, response.retry_after());
}

std::string trim_slashes(std::string path) {
    const auto first = path.find_first_not_of('/');
    if (first == std::string::npos) {
        return {};
    }
    const auto last = path.find_last_not_of('/');
    return path.substr(first, last - first + 1);
}

} // namespace

WebDavBackend::WebDavBackend(std::shared_ptr<network::HttpTransport> transport,
                             std::shared_ptr<auth::TokenManager> tokens,
                             Options options)
    : transport_(std::move(transport)), tokens_(std::move(tokens)), options_(std::move(options)) {}

ChunkConstraints WebDavBackend::chunk_constraints(std::uint64_t total_length) const {
    return ChunkConstraints{1, std::max<std::uint64_t>(total_length, 1), 1};
}

std::string WebDavBackend::resource_url(const std::string& relative_path) const {
    std::string path = network::join_path(trim_slashes(options_.root), relative_path);
    return network::join_path(options_.base_url, network::percent_encode_path(path));
}

network::HttpRequest WebDavBackend::make_request(network::HttpMethod method,
                                                 std::string url,
                                                 const auth::Credential& credential) const {
    network::HttpRequest request;
    request.method = method;
    request.url = std::move(url);
    request.timeout = options_.request_timeout;
    if (!credential.access_token.empty()) {
        request.set_header("Authorization", credential.authorization_header());
    }
    return request;
}

Result<void> WebDavBackend::probe(const auth::Credential& credential) {
    auto request = make_request(network::HttpMethod::PROPFIND, resource_url(""), credential);
    request.set_header("Depth", "0");

    auto sent = transport_->send(request);
    if (sent.is_error()) {
        return Err<void>(sent.error());
    }
    if (sent.value().status_code != 207) {
        return Err<void>(status_error(sent.value(), "PROPFIND on WebDAV root failed"));
    }
    return Ok();
}

Result<void> WebDavBackend::make_collections(const std::string& relative_dir, const auth::Credential& credential) {
    // Walk down from the root so each MKCOL has an existing parent
    std::string prefix;
    std::size_t start = 0;
    while (start < relative_dir.size()) {
        auto slash = relative_dir.find('/', start);
        if (slash == std::string::npos) {
            slash = relative_dir.size();
        }
        prefix = network::join_path(prefix, relative_dir.substr(start, slash - start));
        start = slash + 1;

        auto sent = transport_->send(make_request(network::HttpMethod::MKCOL, resource_url(prefix) + "/", credential));
        if (sent.is_error()) {
            return Err<void>(sent.error());
        }
        const int status = sent.value().status_code;
        // 405: the collection already exists
        if (status != 201 && status != 405 && !sent.value().is_success()) {
            return Err<void>(status_error(sent.value(), "MKCOL " + prefix + " failed"));
        }
    }
    return Ok();
}

Result<SessionHandle> WebDavBackend::initiate(const upload::UploadTarget& target, const auth::Credential& credential) {
    const std::string relative = trim_slashes(target.remote_path);
    if (relative.empty() || target.remote_path.back() == '/') {
        return Err<SessionHandle>(Error::validation("Remote path has no file name: " + target.remote_path));
    }

    const auto slash = relative.find_last_of('/');
    if (options_.create_collections && slash != std::string::npos) {
        if (auto made = make_collections(relative.substr(0, slash), credential); made.is_error()) {
            return Err<SessionHandle>(made.error());
        }
    }

    SessionHandle handle;
    handle.location = resource_url(relative);
    handle.resource_path = relative;
    handle.total_length = target.total_length;
    handle.remote_allocated = true;

    if (options_.replace_existing) {
        auto request = make_request(network::HttpMethod::DELETE_METHOD, handle.location, credential);
        auto sent = transport_->send(request);
        // A missing resource is the normal case; the PUT reports real problems.
        if (sent.is_error()) {
            spdlog::debug("WebDAV DELETE before upload of {} failed: {}", relative, sent.error().describe());
        } else {
            spdlog::debug("WebDAV DELETE before upload of {} returned HTTP {}", relative, sent.value().status_code);
        }
    }
    return Ok(std::move(handle));
}

Result<ChunkResult> WebDavBackend::upload_chunk(const SessionHandle& handle,
                                                const upload::ChunkDescriptor& chunk,
                                                const std::vector<std::uint8_t>& bytes,
                                                const auth::Credential& credential) {
    if (chunk.offset != 0 || chunk.length != handle.total_length || bytes.size() != chunk.length) {
        return Err<ChunkResult>(Error::validation("WebDAV uploads the whole file in one PUT; got " +
                                                  std::to_string(chunk.length) + " bytes at offset " +
                                                  std::to_string(chunk.offset)));
    }

    auto request = make_request(network::HttpMethod::PUT, handle.location, credential);
    request.set_header("Content-Type", "application/octet-stream");
    request.body = bytes;

    auto sent = transport_->send(request);
    // A 4xx reply means the server refused the body; anything else may have left bytes behind
    const bool refused = sent.is_ok() && sent.value().status_code >= 400 && sent.value().status_code < 500;
    if (!refused) {
        std::lock_guard lock(written_mutex_);
        written_.insert(handle.location);
    }
    if (sent.is_error()) {
        return Err<ChunkResult>(sent.error());
    }
    if (!sent.value().is_success()) {
        return Err<ChunkResult>(status_error(sent.value(), "PUT " + handle.resource_path + " failed"));
    }
    return Ok(ChunkResult::completed(handle.location));
}

Result<std::string> WebDavBackend::finalize(const SessionHandle& handle, const auth::Credential&) {
    std::lock_guard lock(written_mutex_);
    written_.erase(handle.location);
    return Ok(std::string{});
}

void WebDavBackend::abort(const SessionHandle& handle, const auth::Credential& credential) {
    bool written = false;
    {
        std::lock_guard lock(written_mutex_);
        written = written_.erase(handle.location) > 0;
    }
    if (!options_.replace_existing && !written) {
        spdlog::debug("WebDAV abort of {}: nothing was written, keeping the existing resource",
                      handle.resource_path);
        return;
    }

    auto request = make_request(network::HttpMethod::DELETE_METHOD, handle.location, credential);
    request.timeout = options_.abort_timeout;

    auto sent = transport_->send(request);
    if (sent.is_error()) {
        spdlog::warn("Failed to delete partial WebDAV resource {}: {}", handle.resource_path,
                     sent.error().describe());
        return;
    }
    const int status = sent.value().status_code;
    if (!sent.value().is_success() && status != 404) {
        spdlog::warn("Deleting partial WebDAV resource {} returned HTTP {}", handle.resource_path, status);
    }
}

} // namespace cloudup::backend
