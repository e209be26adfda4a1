#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

namespace mcs::transport {

// Receives each downloaded chunk in order.
using ChunkSink = std::function<void(const char* data, size_t len)>;

// Fills buf with at most max bytes and returns the count; 0 marks end of data.
using ChunkSource = std::function<size_t(char* buf, size_t max)>;

// One authenticated connection to the remote store.
class Session {
public:
    virtual ~Session() = default;

    // Sends a raw command and returns the reply text that follows expectedCode.
    // Throws RemoteQueryError when the server answers with any other code.
    [[nodiscard]] virtual std::string query(const std::string& command, const std::string& expectedCode) = 0;

    virtual void download(const std::string& remotePath, const ChunkSink& sink) = 0;
    virtual void upload(const std::string& remotePath, const ChunkSource& source, uint64_t size) = 0;

    virtual void close() = 0;
};

}
