#pragma once

#include "cloudup/backend/backend.hpp"

#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace cloudup::testing {

/**
 * In-memory Backend that records every call. Failures for initiate,
 * finalize and individual chunk attempts can be scripted; `on_chunk` runs
 * before each chunk call and may override its result.
 */
class StubBackend : public backend::Backend {
public:
    struct Call {
        std::string op;                       ///< initiate, chunk, finalize, abort
        std::optional<std::uint32_t> chunk;
        std::uint64_t offset = 0;
        std::uint64_t length = 0;
        std::string token;
    };

    using ChunkHook = std::function<std::optional<Result<backend::ChunkResult>>(const upload::ChunkDescriptor&, int)>;

    backend::ChunkConstraints constraints{1, 327680, 327680};
    std::shared_ptr<auth::TokenManager> tokens;
    bool allocates_remote = true;
    std::string resource_id = "resource-1";
    std::string finalize_id;
    ChunkHook on_chunk;

    void fail_initiate(Error error) { initiate_failures_.push_back(std::move(error)); }
    void fail_finalize(Error error) { finalize_failures_.push_back(std::move(error)); }

    /// Fail the next attempt of chunk `index` with `error`
    void fail_chunk(std::uint32_t index, Error error) { chunk_failures_.push_back({index, std::move(error)}); }

    std::string name() const override { return "stub"; }

    std::shared_ptr<auth::TokenManager> token_manager() const override { return tokens; }

    backend::ChunkConstraints chunk_constraints(std::uint64_t) const override { return constraints; }

    Result<backend::SessionHandle> initiate(const upload::UploadTarget& target,
                                            const auth::Credential& credential) override {
        record({"initiate", std::nullopt, 0, target.total_length, credential.access_token});
        if (!initiate_failures_.empty()) {
            Error error = initiate_failures_.front();
            initiate_failures_.pop_front();
            return Err<backend::SessionHandle>(std::move(error));
        }
        backend::SessionHandle handle;
        handle.location = "stub://" + target.remote_path;
        handle.resource_path = target.remote_path;
        handle.total_length = target.total_length;
        handle.remote_allocated = allocates_remote;
        return Ok(std::move(handle));
    }

    Result<backend::ChunkResult> upload_chunk(const backend::SessionHandle&,
                                              const upload::ChunkDescriptor& chunk,
                                              const std::vector<std::uint8_t>& bytes,
                                              const auth::Credential& credential) override {
        const int call_no = static_cast<int>(record({"chunk", chunk.index, chunk.offset, chunk.length,
                                                     credential.access_token}));
        if (bytes.size() != chunk.length) {
            return Err<backend::ChunkResult>(Error::validation("stub: buffer size mismatch"));
        }
        if (on_chunk) {
            if (auto overridden = on_chunk(chunk, call_no)) {
                return *overridden;
            }
        }
        for (auto it = chunk_failures_.begin(); it != chunk_failures_.end(); ++it) {
            if (it->first == chunk.index) {
                Error error = it->second;
                chunk_failures_.erase(it);
                return Err<backend::ChunkResult>(std::move(error));
            }
        }
        received_.insert(received_.end(), bytes.begin(), bytes.end());
        if (chunk.is_final) {
            return Ok(backend::ChunkResult::completed(resource_id));
        }
        return Ok(backend::ChunkResult::accepted_all());
    }

    Result<std::string> finalize(const backend::SessionHandle&, const auth::Credential& credential) override {
        record({"finalize", std::nullopt, 0, 0, credential.access_token});
        if (!finalize_failures_.empty()) {
            Error error = finalize_failures_.front();
            finalize_failures_.pop_front();
            return Err<std::string>(std::move(error));
        }
        return Ok(finalize_id);
    }

    void abort(const backend::SessionHandle&, const auth::Credential& credential) override {
        record({"abort", std::nullopt, 0, 0, credential.access_token});
    }

    std::vector<Call> calls() const {
        std::lock_guard lock(mutex_);
        return calls_;
    }

    /// Compact call log, e.g. {"initiate", "chunk 0", "chunk 1", "finalize"}
    std::vector<std::string> trace() const {
        std::vector<std::string> out;
        for (const auto& call : calls()) {
            out.push_back(call.chunk ? call.op + " " + std::to_string(*call.chunk) : call.op);
        }
        return out;
    }

    int count(const std::string& op) const {
        int n = 0;
        for (const auto& call : calls()) {
            n += call.op == op ? 1 : 0;
        }
        return n;
    }

    const std::vector<std::uint8_t>& received() const { return received_; }

private:
    std::size_t record(Call call) {
        std::lock_guard lock(mutex_);
        calls_.push_back(std::move(call));
        return calls_.size();
    }

    mutable std::mutex mutex_;
    std::vector<Call> calls_;
    std::deque<Error> initiate_failures_;
    std::deque<Error> finalize_failures_;
    std::deque<std::pair<std::uint32_t, Error>> chunk_failures_;
    std::vector<std::uint8_t> received_;
};

} // namespace cloudup::testing
