#include "sync/mapping/Strategy.hpp"
#include "sync/mapping/Structured.hpp"
#include "sync/mapping/Flat.hpp"
#include "config/Config.hpp"

#include <stdexcept>

namespace mcs::sync::mapping {

std::unique_ptr<Strategy> create(const config::Config& cfg) {
    switch (cfg.sync.naming) {
    case config::Naming::Structured:
        return std::make_unique<Structured>(cfg.remote.roots);
    case config::Naming::Flat: {
        const auto it = cfg.remote.roots.find(Structured::REMOTE_NATIVE_EXT);
        if (it == cfg.remote.roots.end())
            throw std::invalid_argument("Flat naming requires a remote root for 'mc2'");
        return std::make_unique<Flat>(it->second);
    }
    }
    throw std::invalid_argument("Unknown naming strategy");
}

}
