// Copyright (c) 2026 changcheng967. All rights reserved.

#include <reelsplit/core/curl_transfer_engine.hpp>
#include <reelsplit/core/config.hpp>
#include <reelsplit/core/log.hpp>
#include <reelsplit/disk/error.hpp>
#include <curl/curl.h>
#include <cerrno>
#include <cstdio>
#include <vector>

namespace reelsplit::core {

namespace {

struct WriteContext {
    std::FILE* file{nullptr};
    bool write_failed{false};
};

struct ProgressContext {
    std::atomic<bool>* stop_requested{nullptr};
    const TransferCallbacks* callbacks{nullptr};
    std::uint64_t* last_done{nullptr};
    std::uint64_t* last_total{nullptr};
    std::string callback_error;
};

std::size_t write_callback(char* ptr, std::size_t size, std::size_t nmemb, void* userdata) noexcept {
    auto* ctx = static_cast<WriteContext*>(userdata);
    std::size_t bytes = size * nmemb;
    if (std::fwrite(ptr, 1, bytes, ctx->file) != bytes) {
        ctx->write_failed = true;
        return 0;  // Aborts with CURLE_WRITE_ERROR
    }
    return bytes;
}

// Returning non-zero aborts the transfer
int progress_callback(void* userdata, curl_off_t dltotal, curl_off_t dlnow,
                      curl_off_t /*ultotal*/, curl_off_t /*ulnow*/) noexcept {
    auto* ctx = static_cast<ProgressContext*>(userdata);
    if (ctx->stop_requested->load(std::memory_order_acquire)) {
        return 1;
    }

    auto done = static_cast<std::uint64_t>(dlnow);
    auto total = static_cast<std::uint64_t>(dltotal);
    if (done == *ctx->last_done && total == *ctx->last_total) {
        return 0;
    }
    *ctx->last_done = done;
    *ctx->last_total = total;

    if (ctx->callbacks->on_progress) {
        try {
            ctx->callbacks->on_progress(done, total);
        } catch (const std::exception& e) {
            ctx->callback_error = e.what();
            return 1;
        }
    }
    return 0;
}

std::error_code map_curl_code(CURLcode code) noexcept {
    switch (code) {
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY:
            return make_error_code(EngineErrc::dns_error);
        case CURLE_OPERATION_TIMEDOUT:
            return make_error_code(EngineErrc::timeout);
        case CURLE_COULDNT_CONNECT:
            return make_error_code(EngineErrc::connection_failed);
        case CURLE_SSL_CONNECT_ERROR:
        case CURLE_PEER_FAILED_VERIFICATION:
        case CURLE_SSL_CERTPROBLEM:
        case CURLE_SSL_CIPHER:
        case CURLE_SSL_CACERT_BADFILE:
            return make_error_code(EngineErrc::ssl_error);
        case CURLE_RECV_ERROR:
        case CURLE_SEND_ERROR:
        case CURLE_PARTIAL_FILE:
        case CURLE_GOT_NOTHING:
            return make_error_code(EngineErrc::connection_lost);
        case CURLE_TOO_MANY_REDIRECTS:
            return make_error_code(EngineErrc::too_many_redirects);
        case CURLE_HTTP_RETURNED_ERROR:
            return make_error_code(EngineErrc::http_error);
        case CURLE_WRITE_ERROR:
            return make_error_code(disk::DiskErrc::write_error);
        case CURLE_UNSUPPORTED_PROTOCOL:
        case CURLE_URL_MALFORMAT:
            return make_error_code(EngineErrc::unsupported_scheme);
        case CURLE_ABORTED_BY_CALLBACK:
            return make_error_code(EngineErrc::cancelled);
        default:
            return make_error_code(EngineErrc::engine_failure);
    }
}

} // namespace

//=============================================================================
// CurlTransferEngine
//=============================================================================

CurlTransferEngine::CurlTransferEngine(TransferSettings settings)
    : settings_(std::move(settings)) {}

CurlTransferEngine::~CurlTransferEngine() {
    std::map<TransferHandle, std::unique_ptr<Transfer>> transfers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        transfers.swap(transfers_);
    }
    for (auto& [handle, transfer] : transfers) {
        transfer->stop_requested.store(true, std::memory_order_release);
    }
    for (auto& [handle, transfer] : transfers) {
        if (transfer->worker.joinable()) {
            transfer->worker.join();
        }
    }
}

void CurlTransferEngine::global_init() noexcept {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

void CurlTransferEngine::global_cleanup() noexcept {
    curl_global_cleanup();
}

std::expected<TransferHandle, EngineFailure>
CurlTransferEngine::start(const std::string& url, const std::filesystem::path& destination,
                          TransferCallbacks callbacks) {
    reap_finished();

    auto transfer = std::make_unique<Transfer>();
    transfer->url = url;
    transfer->destination = destination;
    transfer->callbacks = std::move(callbacks);
    auto* raw = transfer.get();

    std::lock_guard<std::mutex> lock(mutex_);
    TransferHandle handle = next_handle_++;
    raw->worker = std::jthread([this, raw] { run(*raw); });
    transfers_.emplace(handle, std::move(transfer));
    REELSPLIT_LOG_DEBUG("Transfer {} started: {}", handle, url);
    return handle;
}

void CurlTransferEngine::cancel(TransferHandle handle) noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = transfers_.find(handle);
    if (it == transfers_.end()) return;
    // Picked up by the next progress callback
    it->second->stop_requested.store(true, std::memory_order_release);
}

void CurlTransferEngine::run(Transfer& transfer) noexcept {
    auto fail = [&transfer](EngineFailure failure) {
        if (transfer.callbacks.on_error) {
            try {
                transfer.callbacks.on_error(std::move(failure));
            } catch (const std::exception& e) {
                REELSPLIT_LOG_ERROR("Transfer error callback threw: {}", e.what());
            }
        }
        transfer.finished.store(true, std::memory_order_release);
    };

    std::FILE* file = std::fopen(transfer.destination.c_str(), "wb");
    if (!file) {
        fail(EngineFailure{std::error_code(errno, std::generic_category()),
                           "Cannot open " + transfer.destination.string()});
        return;
    }

    CURL* curl = curl_easy_init();
    if (!curl) {
        std::fclose(file);
        fail(EngineFailure{make_error_code(EngineErrc::engine_failure), "curl_easy_init failed"});
        return;
    }

    WriteContext write_ctx{file};
    ProgressContext progress_ctx;
    progress_ctx.stop_requested = &transfer.stop_requested;
    progress_ctx.callbacks = &transfer.callbacks;
    progress_ctx.last_done = &transfer.last_done;
    progress_ctx.last_total = &transfer.last_total;

    curl_easy_setopt(curl, CURLOPT_URL, transfer.url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &write_ctx);
    curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, progress_callback);
    curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &progress_ctx);
    curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl, CURLOPT_FAILONERROR, 1L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, static_cast<long>(settings_.connect_timeout_sec));
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME, static_cast<long>(settings_.low_speed_timeout_sec));
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, 1L);

    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 2L);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, settings_.user_agent.c_str());

    if constexpr (FOLLOW_REDIRECTS) {
        curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(curl, CURLOPT_MAXREDIRS, static_cast<long>(MAX_REDIRECTS));
    }
    curl_easy_setopt(curl, CURLOPT_BUFFERSIZE, static_cast<long>(WRITE_BUFFER_SIZE));
    curl_easy_setopt(curl, CURLOPT_TCP_NODELAY, 1L);

    auto result = curl_easy_perform(curl);

    long http_code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);
    curl_easy_cleanup(curl);

    bool close_failed = std::fclose(file) != 0;

    if (result == CURLE_ABORTED_BY_CALLBACK) {
        if (!progress_ctx.callback_error.empty()) {
            fail(EngineFailure{make_error_code(EngineErrc::engine_failure), progress_ctx.callback_error});
        } else {
            fail(EngineFailure{make_error_code(EngineErrc::cancelled)});
        }
        return;
    }
    if (result == CURLE_HTTP_RETURNED_ERROR || (result == CURLE_OK && http_code >= 400)) {
        fail(EngineFailure{make_error_code(EngineErrc::http_error), {}, static_cast<std::int32_t>(http_code)});
        return;
    }
    if (result != CURLE_OK) {
        REELSPLIT_LOG_DEBUG("curl error {}: {}", static_cast<int>(result), curl_easy_strerror(result));
        fail(EngineFailure{map_curl_code(result), curl_easy_strerror(result)});
        return;
    }
    if (write_ctx.write_failed || close_failed) {
        fail(EngineFailure{make_error_code(disk::DiskErrc::write_error),
                           "Failed writing " + transfer.destination.string()});
        return;
    }

    if (transfer.callbacks.on_complete) {
        try {
            transfer.callbacks.on_complete();
        } catch (const std::exception& e) {
            REELSPLIT_LOG_ERROR("Transfer completion callback threw: {}", e.what());
        }
    }
    transfer.finished.store(true, std::memory_order_release);
}

void CurlTransferEngine::reap_finished() {
    std::vector<std::unique_ptr<Transfer>> done;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = transfers_.begin(); it != transfers_.end();) {
            if (it->second->finished.load(std::memory_order_acquire)) {
                done.push_back(std::move(it->second));
                it = transfers_.erase(it);
            } else {
                ++it;
            }
        }
    }
    // Joins outside the lock
    done.clear();
}

} // namespace reelsplit::core
