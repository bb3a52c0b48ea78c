#pragma once

#include "cloudup/backend/backend.hpp"
#include "cloudup/config/config.hpp"
#include "cloudup/network/http_transport.hpp"

#include <memory>

namespace cloudup::backend {

/**
 * @brief Build the configured backend together with its TokenManager
 *
 * OneDrive gets an OAuth refresh-token exchanger for the configured cloud,
 * WebDAV a static Basic credential. `transport` may be null for the local
 * backend only.
 */
Result<std::shared_ptr<Backend>> make_backend(const config::BackendConfig& config,
                                              std::shared_ptr<network::HttpTransport> transport);

} // namespace cloudup::backend
