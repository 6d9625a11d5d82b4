#pragma once
#ifndef _SPECTRUM_H_BA6F69AD_9989_47DF_ADA7_63F9AFE86821
#define _SPECTRUM_H_BA6F69AD_9989_47DF_ADA7_63F9AFE86821
#include <array>
#include <string>
#include <ostream>
#include "color.hpp"
#include "hue.hpp"

namespace hues {

// The fixed catalogue of hues. Everything here is constant,
// so concurrent reads need no locking.
struct Spectrum {
    Spectrum() =delete;

    static constexpr Hue red{HueName::red};
    static constexpr Hue orange{HueName::orange};
    static constexpr Hue yellow{HueName::yellow};
    static constexpr Hue lime{HueName::lime};
    static constexpr Hue green{HueName::green};
    static constexpr Hue turquoise{HueName::turquoise};
    static constexpr Hue teal{HueName::teal};
    static constexpr Hue cyan{HueName::cyan};
    static constexpr Hue blue{HueName::blue};
    static constexpr Hue purple{HueName::purple};
    static constexpr Hue magenta{HueName::magenta};
    static constexpr Hue rose{HueName::rose};
    static constexpr Hue grey{HueName::grey};

    // Brightest, least saturated grey: Grey(5, 1)
    static Color white();
    // Darkest, most saturated grey: Grey(1, 9)
    static Color black();

    // All hues, the twelve wheel hues in wheel order then Grey
    static const std::array<Hue, N_HUES>& hues();
    static const Hue& get(HueName name);
    // By name, case-insensitive; throws FormatError if unknown
    static const Hue& get(const std::string& name);

    // Tables of every hue, one after another
    static std::string table();

    // Write the resolution table as JSON:
    // {"Red": {"1": [52, ...], ...}, ...}, populated levels only
    static std::ostream& export_json(std::ostream& os, bool pretty = false);
};

}  // namespace hues
#endif // ifndef _SPECTRUM_H_BA6F69AD_9989_47DF_ADA7_63F9AFE86821
