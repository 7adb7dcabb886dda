#include "duopane/ArchiveProvider.hpp"

#include <algorithm>
#include <cctype>

namespace duopane {

static std::string lowered(std::string s) {
    for (char &c : s)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

static bool endsWith(const std::string &s, const std::string &suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

void ArchiveRegistry::registerProvider(std::shared_ptr<ArchiveProvider> provider) {
    if (!provider)
        return;
    for (const auto &ext : provider->supportedExtensions()) {
        const std::string key = lowered(ext);
        auto it = std::find_if(byExt_.begin(), byExt_.end(),
                               [&](const auto &kv) { return kv.first == key; });
        if (it != byExt_.end())
            it->second = provider; // last registration wins
        else
            byExt_.emplace_back(key, provider);
    }
}

std::shared_ptr<ArchiveProvider>
ArchiveRegistry::providerFor(const std::string &path) const {
    const std::string name = lowered(path);
    std::shared_ptr<ArchiveProvider> best;
    std::size_t bestLen = 0;
    for (const auto &kv : byExt_) {
        if (kv.first.size() > bestLen && endsWith(name, kv.first)) {
            best = kv.second;
            bestLen = kv.first.size();
        }
    }
    return best;
}

std::vector<std::string> ArchiveRegistry::supportedExtensions() const {
    std::vector<std::string> out;
    out.reserve(byExt_.size());
    for (const auto &kv : byExt_)
        out.push_back(kv.first);
    std::sort(out.begin(), out.end());
    return out;
}

} // namespace duopane
