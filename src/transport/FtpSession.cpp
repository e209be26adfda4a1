#include "transport/FtpSession.hpp"
#include "config/Config.hpp"
#include "runtime/Credentials.hpp"
#include "sync/Error.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <fmt/format.h>

using namespace mcs::transport;
using namespace mcs::sync;
using namespace mcs::util;
using namespace mcs::log;

namespace {

// libcurl rejects receive buffers smaller than this.
constexpr size_t MIN_BUFFER_SIZE = 1024;

struct DownloadCtx {
    const ChunkSink* sink;
    std::exception_ptr* error;
};

struct UploadCtx {
    const ChunkSource* source;
    size_t chunk;
    std::exception_ptr* error;
};

}

namespace mcs::transport {

std::string trimReply(std::string line) {
    while (!line.empty() && (line.back() == '\r' || line.back() == '\n' || line.back() == ' ')) line.pop_back();
    return line;
}

std::optional<std::string> findReply(const std::vector<std::string>& replies, const std::string& code) {
    const auto prefix = code + " ";
    for (auto it = replies.rbegin(); it != replies.rend(); ++it)
        if (it->starts_with(prefix)) return trimReply(it->substr(prefix.size()));
    return std::nullopt;
}

}

FtpSession::FtpSession(const config::FtpConfig& ftp, const config::TransferConfig& transfer,
                       const runtime::Credentials& creds, const std::atomic<bool>& cancel)
    : baseUrl_(fmt::format("ftp://{}:{}/", ftp.host, ftp.port)),
      user_(creds.user),
      password_(creds.password),
      timeoutSeconds_(static_cast<long>(ftp.timeout_seconds)),
      bufferSize_(static_cast<long>(std::max<size_t>(transfer.chunk_size, MIN_BUFFER_SIZE))),
      cancel_(cancel) {
    if (ftp.host.empty()) throw ConnectionError("No FTP host configured");

    ensureCurlGlobalInit();
    curl_ = std::make_unique<CurlEasy>();

    prepare();
    curl_easy_setopt(*curl_, CURLOPT_URL, baseUrl_.c_str());
    curl_easy_setopt(*curl_, CURLOPT_NOBODY, 1L);

    if (const auto rc = perform(); rc != CURLE_OK) {
        if (rc == CURLE_ABORTED_BY_CALLBACK && cancel_) {
            curl_.reset();
            throw CancelledError();
        }
        const auto msg = fmt::format("Failed to connect to {}: {}", baseUrl_, curl_easy_strerror(rc));
        curl_.reset();
        throw ConnectionError(msg);
    }

    Registry::ftp()->info("[FtpSession] Connected to {} as {}", baseUrl_, user_);
}

FtpSession::~FtpSession() { close(); }

void FtpSession::close() {
    if (!curl_) return;
    curl_.reset();
    if (Registry::isInitialized()) Registry::ftp()->debug("[FtpSession] Closed session to {}", baseUrl_);
}

void FtpSession::prepare(const bool abortable) {
    if (!curl_) throw ConnectionError("FTP session is closed");

    curl_->reset();
    replies_.clear();
    callbackError_ = nullptr;
    abortable_ = abortable;

    curl_easy_setopt(*curl_, CURLOPT_USERNAME, user_.c_str());
    curl_easy_setopt(*curl_, CURLOPT_PASSWORD, password_.c_str());
    curl_easy_setopt(*curl_, CURLOPT_CONNECTTIMEOUT, timeoutSeconds_);
    curl_easy_setopt(*curl_, CURLOPT_SERVER_RESPONSE_TIMEOUT, timeoutSeconds_);
    curl_easy_setopt(*curl_, CURLOPT_FTP_FILEMETHOD, static_cast<long>(CURLFTPMETHOD_NOCWD));

    // A data connection that stalls below 1 B/s for the timeout is dropped.
    curl_easy_setopt(*curl_, CURLOPT_LOW_SPEED_LIMIT, 1L);
    curl_easy_setopt(*curl_, CURLOPT_LOW_SPEED_TIME, timeoutSeconds_);

    // Polled while curl waits on the socket, so a stalled transfer still sees the cancel flag.
    curl_easy_setopt(*curl_, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(*curl_, CURLOPT_XFERINFOFUNCTION,
                     +[](void* ud, curl_off_t, curl_off_t, curl_off_t, curl_off_t) -> int {
                         const auto* self = static_cast<const FtpSession*>(ud);
                         return self->abortable_ && self->cancel_ ? 1 : 0;
                     });
    curl_easy_setopt(*curl_, CURLOPT_XFERINFODATA, this);

    curl_easy_setopt(*curl_, CURLOPT_HEADERFUNCTION, +[](char* p, size_t s, size_t n, void* ud) -> size_t {
        static_cast<std::vector<std::string>*>(ud)->emplace_back(p, s * n);
        return s * n;
    });
    curl_easy_setopt(*curl_, CURLOPT_HEADERDATA, &replies_);
}

CURLcode FtpSession::perform() { return curl_easy_perform(*curl_); }

void FtpSession::throwIfCancelled(const CURLcode rc) const {
    if (rc == CURLE_ABORTED_BY_CALLBACK && cancel_) throw CancelledError();
}

void FtpSession::rethrowCallbackError() {
    if (!callbackError_) return;
    auto err = callbackError_;
    callbackError_ = nullptr;
    std::rethrow_exception(err);
}

std::string FtpSession::urlFor(const std::string& remotePath) const {
    std::string url = baseUrl_;
    size_t pos = 0;
    while (pos <= remotePath.size()) {
        const auto next = std::min(remotePath.find('/', pos), remotePath.size());
        const auto segment = remotePath.substr(pos, next - pos);
        char* escaped = curl_easy_escape(nullptr, segment.c_str(), static_cast<int>(segment.size()));
        if (!escaped) throw std::runtime_error("curl_easy_escape failed for " + remotePath);
        url += escaped;
        curl_free(escaped);
        if (next < remotePath.size()) url += '/';
        pos = next + 1;
    }
    return url;
}

std::string FtpSession::lastReplies() const {
    for (auto it = replies_.rbegin(); it != replies_.rend(); ++it)
        if (auto line = trimReply(*it); !line.empty()) return line;
    return {};
}

std::string FtpSession::query(const std::string& command, const std::string& expectedCode) {
    prepare();

    SList quote;
    quote.add(command);

    curl_easy_setopt(*curl_, CURLOPT_URL, baseUrl_.c_str());
    curl_easy_setopt(*curl_, CURLOPT_NOBODY, 1L);
    curl_easy_setopt(*curl_, CURLOPT_QUOTE, quote.get());

    Registry::ftp()->debug("[FtpSession] > {}", command);

    if (const auto rc = perform(); rc != CURLE_OK) {
        throwIfCancelled(rc);
        throw RemoteQueryError(fmt::format("{} failed: {} {}", command, curl_easy_strerror(rc), lastReplies()));
    }

    if (auto reply = findReply(replies_, expectedCode)) {
        Registry::ftp()->debug("[FtpSession] < {} {}", expectedCode, *reply);
        return *reply;
    }

    throw RemoteQueryError(fmt::format("{} failed: expected reply {}, got '{}'", command, expectedCode, lastReplies()));
}

void FtpSession::download(const std::string& remotePath, const ChunkSink& sink) {
    prepare();

    const auto url = urlFor(remotePath);
    DownloadCtx ctx{&sink, &callbackError_};

    curl_easy_setopt(*curl_, CURLOPT_URL, url.c_str());
    curl_easy_setopt(*curl_, CURLOPT_BUFFERSIZE, bufferSize_);
    curl_easy_setopt(*curl_, CURLOPT_WRITEFUNCTION, +[](char* p, size_t s, size_t n, void* ud) -> size_t {
        auto* c = static_cast<DownloadCtx*>(ud);
        try {
            (*c->sink)(p, s * n);
        } catch (...) {
            *c->error = std::current_exception();
            return 0;
        }
        return s * n;
    });
    curl_easy_setopt(*curl_, CURLOPT_WRITEDATA, &ctx);

    const auto rc = perform();
    rethrowCallbackError();
    throwIfCancelled(rc);

    if (rc != CURLE_OK)
        throw TransferError(fmt::format("Download of {} failed: {} {}", remotePath, curl_easy_strerror(rc), lastReplies()));
}

void FtpSession::upload(const std::string& remotePath, const ChunkSource& source, const uint64_t size) {
    // Uploads are not aborted once started.
    prepare(false);

    const auto url = urlFor(remotePath);
    UploadCtx ctx{&source, static_cast<size_t>(bufferSize_), &callbackError_};

    curl_easy_setopt(*curl_, CURLOPT_URL, url.c_str());
    curl_easy_setopt(*curl_, CURLOPT_UPLOAD, 1L);
    curl_easy_setopt(*curl_, CURLOPT_INFILESIZE_LARGE, static_cast<curl_off_t>(size));
    curl_easy_setopt(*curl_, CURLOPT_FTP_CREATE_MISSING_DIRS, static_cast<long>(CURLFTP_CREATE_DIR));
    curl_easy_setopt(*curl_, CURLOPT_READFUNCTION, +[](char* buf, size_t s, size_t n, void* ud) -> size_t {
        auto* c = static_cast<UploadCtx*>(ud);
        try {
            return (*c->source)(buf, std::min(s * n, c->chunk));
        } catch (...) {
            *c->error = std::current_exception();
            return CURL_READFUNC_ABORT;
        }
    });
    curl_easy_setopt(*curl_, CURLOPT_READDATA, &ctx);

    const auto rc = perform();
    rethrowCallbackError();

    if (rc != CURLE_OK)
        throw TransferError(fmt::format("Upload of {} failed: {} {}", remotePath, curl_easy_strerror(rc), lastReplies()));
}
