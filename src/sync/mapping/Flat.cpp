#include "sync/mapping/Flat.hpp"
#include "sync/Error.hpp"

#include <regex>

using namespace mcs::sync::mapping;
using namespace mcs::sync;

Flat::Flat(std::string root) : root_(std::move(root)) {
    while (!root_.empty() && root_.back() == '/') root_.pop_back();
    if (root_.empty()) throw std::invalid_argument("Flat mapping requires a remote root");
}

void Flat::validate(const std::string& id) const {
    static const std::regex re(R"(^([^/]+)/([^/]+)-([1-8])\.mc2$)");
    if (!std::regex_match(id, re)) throw InvalidTargetFormatError(id);
}

std::string Flat::toRemote(const std::string& id) const {
    validate(id);
    return root_ + "/" + id;
}

std::filesystem::path Flat::toLocal(const std::string& id, const std::filesystem::path& localRoot) const {
    validate(id);
    const std::filesystem::path rel(id);
    const auto parent = rel.parent_path().filename().string();
    return localRoot / (parent + "_" + rel.stem().string() + ".bin");
}
