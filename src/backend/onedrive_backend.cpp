#include "cloudup/backend/onedrive_backend.hpp"

#include "cloudup/core/format.hpp"
#include "cloudup/network/url.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace cloudup::backend {

using json = nlohmann::json;

namespace {

std::optional<std::chrono::system_clock::time_point> parse_utc_timestamp(const std::string& text) {
    // e.g. 2024-05-01T09:21:55.523Z; fractional seconds are ignored
    std::tm tm{};
    std::istringstream in(text);
    in >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (in.fail()) {
        return std::nullopt;
    }
#ifdef _WIN32
    const std::time_t seconds = _mkgmtime(&tm);
#else
    const std::time_t seconds = timegm(&tm);
#endif
    if (seconds == static_cast<std::time_t>(-1)) {
        return std::nullopt;
    }
    return std::chrono::system_clock::from_time_t(seconds);
}

/// First byte of a "start-end" or "start-" range
std::optional<std::uint64_t> parse_range_start(const std::string& range) {
    const auto dash = range.find('-');
    const std::string start = range.substr(0, dash);
    if (start.empty() || start.size() > 19 || !std::all_of(start.begin(), start.end(), [](unsigned char c) { return std::isdigit(c); })) {
        return std::nullopt;
    }
    return std::stoull(start);
}

struct SplitPath {
    std::string parent;
    std::string name;
};

std::string parent_of(const std::string& folder) {
    const auto slash = folder.find_last_of('/');
    if (slash == std::string::npos || slash == 0) {
        return "/";
    }
    return folder.substr(0, slash);
}

Result<SplitPath> split_remote_path(const std::string& root_folder, const std::string& remote_path) {
    if (remote_path.empty()) {
        return Err<SplitPath>(Error::validation("Remote path is empty"));
    }
    if (remote_path.front() == '/') {
        return Err<SplitPath>(Error::validation("Remote path must be relative to the root folder: " + remote_path));
    }
    std::string root = root_folder.empty() || root_folder.front() != '/' ? "/" + root_folder : root_folder;
    const std::string full = network::join_path(root, remote_path);

    const auto slash = full.find_last_of('/');
    SplitPath split{parent_of(full), full.substr(slash + 1)};
    if (split.name.empty()) {
        return Err<SplitPath>(Error::validation("Remote path has no file name: " + remote_path));
    }
    return Ok(std::move(split));
}

std::optional<json> parse_json(const network::HttpResponse& response) {
    auto payload = json::parse(response.body_as_string(), nullptr, false);
    if (payload.is_discarded() || !payload.is_object()) {
        return std::nullopt;
    }
    return payload;
}

Result<std::string> item_id(const network::HttpResponse& response, const std::string& what) {
    auto payload = parse_json(response);
    if (!payload || !payload->contains("id") || !(*payload)["id"].is_string()) {
        return Err<std::string>(Error::protocol(what + ": response has no item id", response.status_code));
    }
    return Ok((*payload)["id"].get<std::string>());
}

Error status_error(const network::HttpResponse& response, const std::string& context) {
    return Error::from_http_status(response.status_code, context, response.retry_after());
}

} // namespace

const char* onedrive_token_url(OneDriveApi api) noexcept {
    switch (api) {
        case OneDriveApi::Common: return "https://login.microsoftonline.com/common/oauth2/v2.0/token";
        case OneDriveApi::Consumers: return "https://login.microsoftonline.com/consumers/oauth2/v2.0/token";
        case OneDriveApi::Organizations: return "https://login.microsoftonline.com/organizations/oauth2/v2.0/token";
        case OneDriveApi::China: return "https://login.chinacloudapi.cn/common/oauth2/v2.0/token";
    }
    return "https://login.microsoftonline.com/common/oauth2/v2.0/token";
}

const char* onedrive_graph_url(OneDriveApi api) noexcept {
    if (api == OneDriveApi::China) {
        return "https://microsoftgraph.chinacloudapi.cn/v1.0";
    }
    return "https://graph.microsoft.com/v1.0";
}

Result<OneDriveApi> parse_onedrive_api(const std::string& name) {
    if (name == "common") return Ok(OneDriveApi::Common);
    if (name == "consumers") return Ok(OneDriveApi::Consumers);
    if (name == "organizations") return Ok(OneDriveApi::Organizations);
    if (name == "china") return Ok(OneDriveApi::China);
    return Err<OneDriveApi>(Error::validation("Unknown OneDrive api '" + name +
                                              "' (expected common, consumers, organizations or china)"));
}

OneDriveBackend::OneDriveBackend(std::shared_ptr<network::HttpTransport> transport,
                                 std::shared_ptr<auth::TokenManager> tokens,
                                 Options options)
    : transport_(std::move(transport)),
      tokens_(std::move(tokens)),
      options_(std::move(options)),
      graph_url_(onedrive_graph_url(options_.api)) {}

std::uint64_t OneDriveBackend::fragment_size() const noexcept {
    const std::uint64_t aligned = options_.chunk_size - options_.chunk_size % kFragmentAlignment;
    return std::max(aligned, kFragmentAlignment);
}

ChunkConstraints OneDriveBackend::chunk_constraints(std::uint64_t total_length) const {
    if (total_length < options_.chunk_size) {
        // Simple upload: the whole file in one request
        return ChunkConstraints{1, std::max<std::uint64_t>(total_length, 1), 1};
    }
    return ChunkConstraints{1, fragment_size(), kFragmentAlignment};
}

network::HttpRequest OneDriveBackend::make_request(network::HttpMethod method,
                                                   std::string url,
                                                   const auth::Credential& credential) const {
    network::HttpRequest request;
    request.method = method;
    request.url = std::move(url);
    request.timeout = options_.request_timeout;
    request.set_header("Authorization", credential.authorization_header());
    request.set_header("Accept", "application/json");
    return request;
}

Result<std::string> OneDriveBackend::resolve_folder(const std::string& folder, const auth::Credential& credential) {
    const bool is_root = folder.empty() || folder == "/";
    const std::string url = is_root ? graph_url_ + "/me/drive/root"
                                    : graph_url_ + "/me/drive/root:" + network::percent_encode_path(folder);

    auto sent = transport_->send(make_request(network::HttpMethod::GET, url, credential));
    if (sent.is_error()) {
        return Err<std::string>(sent.error());
    }
    const auto& response = sent.value();
    if (response.status_code == 200) {
        return item_id(response, "Folder lookup for " + folder);
    }
    if (response.status_code == 404 && !is_root) {
        spdlog::debug("OneDrive folder {} does not exist, creating it", folder);
        return create_folder(folder, credential);
    }
    return Err<std::string>(status_error(response, "Folder lookup for " + folder + " failed"));
}

Result<std::string> OneDriveBackend::create_folder(const std::string& folder, const auth::Credential& credential) {
    auto parent_id = resolve_folder(parent_of(folder), credential);
    if (parent_id.is_error()) {
        return parent_id;
    }

    json body = {
        {"name", folder.substr(folder.find_last_of('/') + 1)},
        {"folder", json::object()},
        {"@microsoft.graph.conflictBehavior", "replace"},
    };
    auto request = make_request(network::HttpMethod::POST,
                                graph_url_ + "/me/drive/items/" + parent_id.value() + "/children", credential);
    request.set_header("Content-Type", "application/json");
    request.set_body(body.dump());

    auto sent = transport_->send(request);
    if (sent.is_error()) {
        return Err<std::string>(sent.error());
    }
    const auto& response = sent.value();
    if (response.status_code == 200 || response.status_code == 201) {
        return item_id(response, "Folder creation for " + folder);
    }
    return Err<std::string>(status_error(response, "Creating folder " + folder + " failed"));
}

Result<SessionHandle> OneDriveBackend::initiate(const upload::UploadTarget& target,
                                                const auth::Credential& credential) {
    if (target.total_length > kMaxFileSize) {
        return Err<SessionHandle>(Error::validation("The file " + target.remote_path + " is too large (" +
                                                    format_size(target.total_length) +
                                                    "). The maximum file size is 250 GB"));
    }

    auto split = split_remote_path(options_.root_folder, target.remote_path);
    if (split.is_error()) {
        return Err<SessionHandle>(split.error());
    }
    auto parent_id = resolve_folder(split.value().parent, credential);
    if (parent_id.is_error()) {
        return Err<SessionHandle>(parent_id.error());
    }

    const std::string item_path = graph_url_ + "/me/drive/items/" + parent_id.value() + ":/" +
                                  network::percent_encode_path(split.value().name) + ":";

    if (target.total_length < options_.chunk_size) {
        SessionHandle handle;
        handle.location = item_path + "/content";
        handle.resource_path = network::join_path(split.value().parent, split.value().name);
        handle.total_length = target.total_length;
        handle.remote_allocated = false;
        return Ok(std::move(handle));
    }
    return create_upload_session(parent_id.value(), split.value().name, target, credential);
}

Result<SessionHandle> OneDriveBackend::create_upload_session(const std::string& parent_id,
                                                             const std::string& file_name,
                                                             const upload::UploadTarget& target,
                                                             const auth::Credential& credential) {
    json body = {
        {"item", {{"@microsoft.graph.conflictBehavior", "replace"}}},
        {"deferCommit", false},
    };
    auto request = make_request(network::HttpMethod::POST,
                                graph_url_ + "/me/drive/items/" + parent_id + ":/" +
                                    network::percent_encode_path(file_name) + ":/createUploadSession",
                                credential);
    request.set_header("Content-Type", "application/json");
    request.set_body(body.dump());

    auto sent = transport_->send(request);
    if (sent.is_error()) {
        return Err<SessionHandle>(sent.error());
    }
    const auto& response = sent.value();
    if (response.status_code != 200) {
        return Err<SessionHandle>(status_error(response, "createUploadSession failed"));
    }

    auto payload = parse_json(response);
    if (!payload || !payload->contains("uploadUrl") || !(*payload)["uploadUrl"].is_string()) {
        return Err<SessionHandle>(Error::protocol("createUploadSession response has no uploadUrl", response.status_code));
    }

    SessionHandle handle;
    handle.location = (*payload)["uploadUrl"].get<std::string>();
    handle.resource_path = target.remote_path;
    handle.total_length = target.total_length;
    handle.remote_allocated = true;
    if (payload->contains("expirationDateTime") && (*payload)["expirationDateTime"].is_string()) {
        handle.expires_at = parse_utc_timestamp((*payload)["expirationDateTime"].get<std::string>());
    }
    if (handle.expires_at && *handle.expires_at < std::chrono::system_clock::now()) {
        return Err<SessionHandle>(Error::protocol("Upload session expired"));
    }

    spdlog::debug("OneDrive upload session opened for {}", target.remote_path);
    return Ok(std::move(handle));
}

Result<ChunkResult> OneDriveBackend::upload_chunk(const SessionHandle& handle,
                                                  const upload::ChunkDescriptor& chunk,
                                                  const std::vector<std::uint8_t>& bytes,
                                                  const auth::Credential& credential) {
    if (bytes.size() != chunk.length) {
        return Err<ChunkResult>(Error::validation("Chunk buffer holds " + std::to_string(bytes.size()) +
                                                  " bytes, descriptor says " + std::to_string(chunk.length)));
    }
    if (!handle.remote_allocated) {
        return put_simple(handle, bytes, credential);
    }
    return put_fragment(handle, chunk, bytes);
}

Result<ChunkResult> OneDriveBackend::put_simple(const SessionHandle& handle,
                                                const std::vector<std::uint8_t>& bytes,
                                                const auth::Credential& credential) {
    auto request = make_request(network::HttpMethod::PUT, handle.location, credential);
    request.set_header("Content-Type", "application/octet-stream");
    request.body = bytes;

    auto sent = transport_->send(request);
    if (sent.is_error()) {
        return Err<ChunkResult>(sent.error());
    }
    const auto& response = sent.value();
    if (response.status_code != 200 && response.status_code != 201) {
        return Err<ChunkResult>(status_error(response, "Upload of " + handle.resource_path + " failed"));
    }
    auto id = item_id(response, "Upload of " + handle.resource_path);
    if (id.is_error()) {
        return Err<ChunkResult>(id.error());
    }
    return Ok(ChunkResult::completed(id.value()));
}

Result<ChunkResult> OneDriveBackend::put_fragment(const SessionHandle& handle,
                                                  const upload::ChunkDescriptor& chunk,
                                                  const std::vector<std::uint8_t>& bytes) {
    if (handle.expires_at && *handle.expires_at < std::chrono::system_clock::now()) {
        return Err<ChunkResult>(Error::protocol("Upload session expired"));
    }

    // The upload URL is pre-authenticated; Graph rejects an Authorization header on it.
    network::HttpRequest request;
    request.method = network::HttpMethod::PUT;
    request.url = handle.location;
    request.timeout = options_.request_timeout;
    request.set_header("Content-Range", "bytes " + std::to_string(chunk.offset) + "-" +
                                            std::to_string(chunk.end() - 1) + "/" +
                                            std::to_string(handle.total_length));
    request.body = bytes;

    auto sent = transport_->send(request);
    if (sent.is_error()) {
        return Err<ChunkResult>(sent.error());
    }
    const auto& response = sent.value();

    if (response.status_code == 200 || response.status_code == 201) {
        auto id = item_id(response, "Upload session for " + handle.resource_path);
        if (id.is_error()) {
            return Err<ChunkResult>(id.error());
        }
        return Ok(ChunkResult::completed(id.value()));
    }

    if (response.status_code == 202) {
        auto payload = parse_json(response);
        if (!payload || !payload->contains("nextExpectedRanges") || !(*payload)["nextExpectedRanges"].is_array()) {
            return Err<ChunkResult>(Error::protocol("Fragment reply has no nextExpectedRanges", 202));
        }
        const auto& ranges = (*payload)["nextExpectedRanges"];
        if (ranges.empty() || !ranges[0].is_string()) {
            return Err<ChunkResult>(Error::protocol("Upload session accepted the fragment but expects nothing more", 202));
        }
        auto next = parse_range_start(ranges[0].get<std::string>());
        if (!next) {
            return Err<ChunkResult>(Error::protocol("Unreadable nextExpectedRanges entry " + ranges[0].dump(), 202));
        }
        if (*next >= chunk.end()) {
            if (chunk.is_final) {
                return Err<ChunkResult>(Error::protocol("Final fragment accepted but the item was not created", 202));
            }
            return Ok(ChunkResult::accepted_all());
        }
        if (*next > chunk.offset) {
            return Ok(ChunkResult::partial(ByteRange{chunk.offset, *next - chunk.offset}));
        }
        return Err<ChunkResult>(Error::protocol("Upload session expects bytes from " + std::to_string(*next) +
                                                ", fragment started at " + std::to_string(chunk.offset), 202));
    }

    if (response.status_code == 404) {
        return Err<ChunkResult>(Error::protocol("Upload session expired or was removed", 404));
    }
    return Err<ChunkResult>(status_error(response, "Fragment upload failed"));
}

Result<std::string> OneDriveBackend::finalize(const SessionHandle&, const auth::Credential&) {
    // deferCommit is false: the last fragment already committed the item
    return Ok(std::string{});
}

void OneDriveBackend::abort(const SessionHandle& handle, const auth::Credential&) {
    if (!handle.remote_allocated) {
        return;
    }

    network::HttpRequest request;
    request.method = network::HttpMethod::DELETE_METHOD;
    request.url = handle.location;
    request.timeout = options_.abort_timeout;

    auto sent = transport_->send(request);
    if (sent.is_error()) {
        spdlog::warn("Failed to delete OneDrive upload session for {}: {}; a partial upload may remain",
                     handle.resource_path, sent.error().describe());
        return;
    }
    if (!sent.value().is_success() && sent.value().status_code != 404) {
        spdlog::warn("Deleting OneDrive upload session for {} returned HTTP {}; a partial upload may remain",
                     handle.resource_path, sent.value().status_code);
        return;
    }
    spdlog::debug("OneDrive upload session for {} deleted", handle.resource_path);
}

} // namespace cloudup::backend
