#pragma once

#include "transport/Session.hpp"
#include "util/curlWrappers.hpp"

#include <atomic>
#include <exception>
#include <optional>
#include <memory>
#include <string>
#include <vector>

namespace mcs::config {
struct FtpConfig;
struct TransferConfig;
}

namespace mcs::runtime {
struct Credentials;
}

namespace mcs::transport {

// Strips trailing CR/LF and spaces from a raw reply line.
[[nodiscard]] std::string trimReply(std::string line);

// Text of the last "<code> " line in a reply set, trimmed. Multi-line replies
// ("<code>-") and other codes are skipped.
[[nodiscard]] std::optional<std::string> findReply(const std::vector<std::string>& replies, const std::string& code);

// FTP session over a single libcurl easy handle. Reusing the handle keeps one
// control connection alive for every query and transfer of the run.
class FtpSession final : public Session {
public:
    // Logs in and probes the server. Throws ConnectionError on failure, or
    // CancelledError when the cancel flag is raised first.
    FtpSession(const config::FtpConfig& ftp, const config::TransferConfig& transfer,
               const runtime::Credentials& creds, const std::atomic<bool>& cancel);
    ~FtpSession() override;

    [[nodiscard]] std::string query(const std::string& command, const std::string& expectedCode) override;

    void download(const std::string& remotePath, const ChunkSink& sink) override;
    void upload(const std::string& remotePath, const ChunkSource& source, uint64_t size) override;

    void close() override;

private:
    std::unique_ptr<util::CurlEasy> curl_;
    std::string baseUrl_;
    std::string user_, password_;
    long timeoutSeconds_;
    long bufferSize_;
    const std::atomic<bool>& cancel_;
    bool abortable_ = true;

    // Captured by callbacks; rethrown once curl_easy_perform returns.
    std::exception_ptr callbackError_;
    std::vector<std::string> replies_;

    void prepare(bool abortable = true);
    CURLcode perform();
    void throwIfCancelled(CURLcode rc) const;
    [[nodiscard]] std::string urlFor(const std::string& remotePath) const;
    [[nodiscard]] std::string lastReplies() const;
    void rethrowCallbackError();
};

}
