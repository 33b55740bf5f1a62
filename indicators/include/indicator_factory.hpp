#pragma once

#include "indicators.hpp"
#include <memory>

namespace indicators {

    // Create an indicator instance for a kind and (already defaulted) parameter set.
    // Returns nullptr for IndicatorKind::Unknown.
    // Throws std::invalid_argument when the parameters are not valid for the kind.
    std::unique_ptr<IIndicator> createIndicator(IndicatorKind kind, const IndicatorParams& params);

} // namespace indicators
