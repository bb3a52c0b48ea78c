#include "cloudup/config/config.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace cloudup::config {

using json = nlohmann::json;

namespace {

std::string require_string(const json& section, const std::string& key, const std::string& where) {
    if (!section.contains(key) || !section[key].is_string() || section[key].get<std::string>().empty()) {
        throw std::invalid_argument(where + "." + key + " is required");
    }
    return section[key].get<std::string>();
}

// Read signed so that a negative value is rejected instead of wrapping
template<typename T>
T read_count(const json& section, const std::string& key, T fallback, const std::string& where) {
    if (!section.contains(key)) {
        return fallback;
    }
    const json& value = section[key];
    if (!value.is_number_integer()) {
        throw std::invalid_argument(where + "." + key + " must be an integer");
    }
    const auto number = value.get<std::int64_t>();
    if (number < 1) {
        throw std::invalid_argument(where + "." + key + " must be at least 1");
    }
    if (static_cast<std::uint64_t>(number) > std::numeric_limits<T>::max()) {
        throw std::invalid_argument(where + "." + key + " is too large");
    }
    return static_cast<T>(number);
}

const json& object_or_empty(const json& root, const std::string& key) {
    static const json empty = json::object();
    if (!root.contains(key)) {
        return empty;
    }
    if (!root[key].is_object()) {
        throw std::invalid_argument(key + " must be an object");
    }
    return root[key];
}

void read_logging(const json& root, logging::LoggingConfig& out) {
    const json& section = object_or_empty(root, "logging");
    out.level = section.value("level", out.level);
    out.pattern = section.value("pattern", out.pattern);
}

void read_retry(const json& root, upload::RetryOptions& out) {
    const json& section = object_or_empty(root, "retry");
    out.max_attempts = read_count(section, "max_attempts", out.max_attempts, "retry");
    out.base_delay = std::chrono::milliseconds(section.value("base_delay_ms", out.base_delay.count()));
    out.max_delay = std::chrono::milliseconds(section.value("max_delay_ms", out.max_delay.count()));
    out.jitter = section.value("jitter", out.jitter);

    if (out.base_delay.count() < 0 || out.max_delay < out.base_delay) {
        throw std::invalid_argument("retry delays must satisfy 0 <= base_delay_ms <= max_delay_ms");
    }
    if (out.jitter < 0.0 || out.jitter > 1.0) {
        throw std::invalid_argument("retry.jitter must be between 0 and 1");
    }
}

void read_http(const json& root, HttpConfig& out) {
    const json& section = object_or_empty(root, "http");
    out.request_timeout = std::chrono::milliseconds(section.value("request_timeout_ms", out.request_timeout.count()));
    out.abort_timeout = std::chrono::milliseconds(section.value("abort_timeout_ms", out.abort_timeout.count()));
    if (out.request_timeout.count() <= 0 || out.abort_timeout.count() <= 0) {
        throw std::invalid_argument("http timeouts must be positive");
    }
}

void read_onedrive(const json& section, OneDriveConfig& out) {
    auto api = backend::parse_onedrive_api(section.value("api", std::string("common")));
    if (api.is_error()) {
        throw std::invalid_argument(api.error().message);
    }
    out.api = api.value();
    out.client_id = require_string(section, "client_id", "backend");
    out.client_secret = section.value("client_secret", std::string());
    out.refresh_token = require_string(section, "refresh_token", "backend");
    out.root_folder = section.value("root_folder", out.root_folder);
    out.chunk_size = read_count(section, "chunk_size", out.chunk_size, "backend");

    if (out.root_folder.empty() || out.root_folder.front() != '/') {
        throw std::invalid_argument("backend.root_folder must be an absolute path");
    }
    if (out.chunk_size % backend::OneDriveBackend::kFragmentAlignment != 0) {
        throw std::invalid_argument("backend.chunk_size must be a positive multiple of 327680 (320 KiB)");
    }
}

void read_webdav(const json& section, WebDavConfig& out) {
    out.url = require_string(section, "url", "backend");
    out.username = section.value("username", std::string());
    out.password = section.value("password", std::string());
    out.root = section.value("root", std::string());
    out.replace_existing = section.value("replace_existing", out.replace_existing);
    out.create_collections = section.value("create_collections", out.create_collections);
}

void read_local(const json& section, LocalConfig& out) {
    out.folder = require_string(section, "folder", "backend");
    out.chunk_size = read_count(section, "chunk_size", out.chunk_size, "backend");
}

void read_backend(const json& root, BackendConfig& out) {
    if (!root.contains("backend") || !root["backend"].is_object()) {
        throw std::invalid_argument("backend section is required");
    }
    const json& section = root["backend"];
    const std::string type = require_string(section, "type", "backend");

    if (type == "onedrive") {
        out.type = BackendType::OneDrive;
        read_onedrive(section, out.onedrive);
    } else if (type == "webdav") {
        out.type = BackendType::WebDav;
        read_webdav(section, out.webdav);
    } else if (type == "local") {
        out.type = BackendType::Local;
        read_local(section, out.local);
    } else {
        throw std::invalid_argument("Unknown backend.type '" + type + "' (expected onedrive, webdav or local)");
    }
    read_http(root, out.http);
}

} // namespace

const char* to_string(BackendType type) noexcept {
    switch (type) {
        case BackendType::OneDrive: return "onedrive";
        case BackendType::WebDav: return "webdav";
        case BackendType::Local: return "local";
    }
    return "unknown";
}

upload::SessionOptions UploaderConfig::session_options() const {
    upload::SessionOptions options;
    options.retry = retry;
    options.token_margin = token_refresh_margin;
    return options;
}

Result<UploaderConfig> parse(const std::string& text) {
    try {
        const json root = json::parse(text);
        if (!root.is_object()) {
            return Err<UploaderConfig>(Error::validation("Configuration must be a JSON object"));
        }

        UploaderConfig config;
        read_logging(root, config.logging);
        read_retry(root, config.retry);
        config.token_refresh_margin =
            std::chrono::seconds(root.value("token_refresh_margin_s", config.token_refresh_margin.count()));
        if (config.token_refresh_margin.count() < 0) {
            return Err<UploaderConfig>(Error::validation("token_refresh_margin_s must not be negative"));
        }
        read_backend(root, config.backend);
        return Ok(std::move(config));
    } catch (const json::parse_error& e) {
        return Err<UploaderConfig>(Error::validation(std::string("Malformed configuration: ") + e.what()));
    } catch (const json::exception& e) {
        return Err<UploaderConfig>(Error::validation(std::string("Invalid configuration value: ") + e.what()));
    } catch (const std::invalid_argument& e) {
        return Err<UploaderConfig>(Error::validation(std::string("Invalid configuration: ") + e.what()));
    }
}

Result<UploaderConfig> load_file(const std::filesystem::path& path) {
    std::ifstream input(path);
    if (!input) {
        return Err<UploaderConfig>(Error::validation("Cannot open configuration file " + path.string()));
    }
    std::ostringstream contents;
    contents << input.rdbuf();
    return parse(contents.str());
}

} // namespace cloudup::config
