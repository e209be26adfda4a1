#include "sync/model/Target.hpp"
#include "sync/mapping/Strategy.hpp"
#include "util/files.hpp"

using namespace mcs::sync::model;

Target::Target(std::string identifier, const std::filesystem::path& localRoot, const mapping::Strategy& strategy)
    : id(std::move(identifier)),
      remote(strategy.toRemote(id)),
      local(strategy.toLocal(id, localRoot)) {
    util::ensureParentDirectories(local);
}
