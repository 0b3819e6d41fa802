#include "gs1/scan/symbology.hpp"

#include <array>

namespace gs1::scan {
namespace {

constexpr std::array<std::string_view, kNumSymbologies> kSymbologyNames{
    "DataBarOmni",  "DataBarTruncated", "DataBarStacked", "DataBarStackedOmni",
    "DataBarLimited", "DataBarExpanded", "UPCA",          "UPCE",
    "EAN13",        "EAN8",             "GS1_128_CCA",    "GS1_128_CCC",
    "QR",           "DM",               "DotCode",
};

} // namespace

std::optional<Symbology> symbology_from_index(int index) noexcept {
    if (index < -1 || index >= static_cast<int>(kNumSymbologies)) {
        return std::nullopt;
    }
    return static_cast<Symbology>(index);
}

std::string_view symbology_name(Symbology sym) noexcept {
    const int index = static_cast<int>(sym);
    if (index < 0 || index >= static_cast<int>(kNumSymbologies)) {
        return "NONE";
    }
    return kSymbologyNames[static_cast<std::size_t>(index)];
}

} // namespace gs1::scan
