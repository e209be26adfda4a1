#pragma once

#include <string>

namespace mcs::config {
struct FtpConfig;
}

namespace mcs::runtime {

struct Credentials {
    std::string user;
    std::string password;

    // Reads the variables named by cfg.user_env / cfg.password_env.
    // Throws MissingCredentialError if either is unset.
    [[nodiscard]] static Credentials fromEnvironment(const config::FtpConfig& cfg);
};

}
