#include "duopane/SplitNaming.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <utility>

namespace fs = std::filesystem;

namespace duopane {

static bool allDigits(const std::string &s) {
    if (s.empty())
        return false;
    return std::all_of(s.begin(), s.end(), [](char c) {
        return std::isdigit(static_cast<unsigned char>(c)) != 0;
    });
}

std::string SplitNaming::partName(const std::string &baseName,
                                  std::uint64_t ordinal) const {
    std::string num = std::to_string(ordinal + static_cast<std::uint64_t>(
                                                   std::max(firstIndex, 0)));
    if (static_cast<int>(num.size()) < digits)
        num.insert(0, static_cast<std::size_t>(digits) - num.size(), '0');
    return baseName + (style == Style::PartPrefixed ? ".part" : ".") + num;
}

std::optional<ParsedPart> parsePartName(const std::string &fileName,
                                        const SplitNaming &naming) {
    const auto dot = fileName.rfind('.');
    if (dot == std::string::npos || dot == 0)
        return std::nullopt;
    std::string suffix = fileName.substr(dot + 1);
    if (naming.style == SplitNaming::Style::PartPrefixed) {
        if (suffix.compare(0, 4, "part") != 0)
            return std::nullopt;
        suffix.erase(0, 4);
    }
    if (!allDigits(suffix) || static_cast<int>(suffix.size()) < naming.digits)
        return std::nullopt;
    // Guard against overflow on absurd suffixes.
    if (suffix.size() > 18)
        return std::nullopt;
    ParsedPart p;
    p.baseName = fileName.substr(0, dot);
    p.number = std::stoull(suffix);
    return p;
}

bool orderParts(const std::vector<std::string> &parts, const SplitNaming &naming,
                std::vector<std::string> &ordered, std::string &baseName,
                std::string &err) {
    if (parts.empty()) {
        err = "No part files specified";
        return false;
    }
    std::vector<std::pair<std::uint64_t, std::string>> numbered;
    numbered.reserve(parts.size());
    std::string base;
    for (const auto &p : parts) {
        const std::string name = fs::path(p).filename().string();
        auto parsed = parsePartName(name, naming);
        if (!parsed) {
            err = "Not a part file: " + name;
            return false;
        }
        if (base.empty()) {
            base = parsed->baseName;
        } else if (parsed->baseName != base) {
            err = "Parts belong to different files: " + base + " and " +
                  parsed->baseName;
            return false;
        }
        numbered.emplace_back(parsed->number, p);
    }
    std::sort(numbered.begin(), numbered.end(),
              [](const auto &a, const auto &b) { return a.first < b.first; });
    std::uint64_t expected =
        static_cast<std::uint64_t>(std::max(naming.firstIndex, 0));
    for (const auto &n : numbered) {
        if (n.first != expected) {
            err = "Missing or duplicate part number " + std::to_string(expected) +
                  " for " + base;
            return false;
        }
        ++expected;
    }
    ordered.clear();
    for (auto &n : numbered)
        ordered.push_back(std::move(n.second));
    baseName = base;
    return true;
}

bool discoverParts(const std::string &anyPart, const SplitNaming &naming,
                   std::vector<std::string> &out, std::string &err) {
    const fs::path anchor(anyPart);
    auto parsed = parsePartName(anchor.filename().string(), naming);
    if (!parsed) {
        err = "Not a part file: " + anchor.filename().string();
        return false;
    }
    fs::path dir = anchor.parent_path();
    if (dir.empty())
        dir = ".";
    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec) {
        err = "Cannot list " + dir.string() + ": " + ec.message();
        return false;
    }
    out.clear();
    for (; it != fs::directory_iterator(); it.increment(ec)) {
        if (ec)
            break;
        std::error_code fec;
        if (!it->is_regular_file(fec))
            continue;
        auto p = parsePartName(it->path().filename().string(), naming);
        if (p && p->baseName == parsed->baseName)
            out.push_back(it->path().string());
    }
    if (ec) {
        err = "Cannot list " + dir.string() + ": " + ec.message();
        return false;
    }
    std::sort(out.begin(), out.end());
    return true;
}

} // namespace duopane
