#pragma once

#include <stdexcept>
#include <string>

namespace mcs::sync {

struct Error : std::runtime_error {
    using std::runtime_error::runtime_error;
};

struct MissingCredentialError final : Error {
    explicit MissingCredentialError(const std::string& userVar = "MCP2_USER",
                                    const std::string& passwordVar = "MCP2_PWD")
        : Error("MemCard PRO credentials missing. " + userVar + " and " + passwordVar +
                " need to be provided as environment variables") {}
};

struct InvalidTargetFormatError final : Error {
    explicit InvalidTargetFormatError(const std::string& identifier)
        : Error("Unsupported target format: '" + identifier +
                "'. Targets must follow <CardName>-<Channel>.<ext> with channel 1-8"),
          identifier(identifier) {}

    std::string identifier;
};

struct ConnectionError final : Error {
    using Error::Error;
};

struct RemoteQueryError final : Error {
    using Error::Error;
};

struct TransferError final : Error {
    using Error::Error;
};

struct CancelledError final : Error {
    CancelledError() : Error("Sync cancelled") {}
};

}
