#include "runtime/Credentials.hpp"
#include "config/Config.hpp"
#include "sync/Error.hpp"

#include <cstdlib>

using namespace mcs::runtime;

Credentials Credentials::fromEnvironment(const config::FtpConfig& cfg) {
    const char* user = std::getenv(cfg.user_env.c_str());
    const char* password = std::getenv(cfg.password_env.c_str());

    if (!user || !password) throw sync::MissingCredentialError(cfg.user_env, cfg.password_env);

    return {user, password};
}
