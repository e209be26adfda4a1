#include "sync/mapping/Structured.hpp"
#include "sync/Error.hpp"

#include <cctype>
#include <regex>

using namespace mcs::sync::mapping;
using namespace mcs::sync;

namespace {

std::string lower(std::string s) {
    for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

const std::regex& identifierPattern() {
    static const std::regex re(R"(^([^/]+)-([1-8])\.([^./]+)$)");
    return re;
}

}

Structured::Structured(std::map<std::string, std::string> roots) : roots_(std::move(roots)) {
    if (roots_.empty()) throw std::invalid_argument("Structured mapping requires at least one remote root");
}

Structured::Parts Structured::parse(const std::string& id) const {
    std::smatch m;
    if (!std::regex_match(id, m, identifierPattern())) throw InvalidTargetFormatError(id);

    const auto it = roots_.find(lower(m[3].str()));
    if (it == roots_.end()) throw InvalidTargetFormatError(id);

    return {m[1].str(), static_cast<unsigned int>(std::stoul(m[2].str())), m[3].str(), it->second};
}

std::string Structured::toRemote(const std::string& id) const {
    const auto parts = parse(id);
    return parts.root + "/" + parts.card + "/" + id;
}

std::filesystem::path Structured::toLocal(const std::string& id, const std::filesystem::path& localRoot) const {
    const auto parts = parse(id);
    const auto ext = lower(parts.ext) == REMOTE_NATIVE_EXT ? std::string(LOCAL_NATIVE_EXT) : parts.ext;
    return localRoot / (parts.card + "-" + std::to_string(parts.channel) + "." + ext);
}
