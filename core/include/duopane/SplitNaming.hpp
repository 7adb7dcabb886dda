// Part-file naming shared by split and join. Both sides must agree on the
// convention for a round trip to work.
#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace duopane {

struct SplitNaming {
    // Numeric: "<name>.001"; PartPrefixed: "<name>.part001"
    enum class Style { Numeric, PartPrefixed } style = Style::Numeric;
    int digits = 3;     // zero padding width
    int firstIndex = 1; // number of the first part

    // Name of part `ordinal` (0-based) for a source file name.
    std::string partName(const std::string &baseName, std::uint64_t ordinal) const;
};

struct ParsedPart {
    std::string baseName; // original file name
    std::uint64_t number = 0;
};

// Parses "<base>.NNN" or "<base>.partNNN" (the suffix must be all digits with
// at least `naming.digits` of them). Returns nullopt for anything else.
std::optional<ParsedPart> parsePartName(const std::string &fileName,
                                        const SplitNaming &naming);

// Orders part paths by number and checks that they share one base name and
// run contiguously from naming.firstIndex. On success `ordered` holds the
// paths in join order and `baseName` the reconstructed file name.
bool orderParts(const std::vector<std::string> &parts, const SplitNaming &naming,
                std::vector<std::string> &ordered, std::string &baseName,
                std::string &err);

// Lists the sibling parts of `anyPart` in its directory (same base name).
bool discoverParts(const std::string &anyPart, const SplitNaming &naming,
                   std::vector<std::string> &out, std::string &err);

} // namespace duopane
