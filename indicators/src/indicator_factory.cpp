#include "indicator_factory.hpp"
#include "sma_indicator.hpp"
#include "ema_indicator.hpp"
#include "rsi_indicator.hpp"
#include "macd_indicator.hpp"
#include "bollinger_indicator.hpp"
#include "logging.hpp"

namespace indicators {

    std::unique_ptr<IIndicator> createIndicator(IndicatorKind kind, const IndicatorParams& params) {
        auto logger = core::logging::getLogger();
        logger->debug("Attempting to create indicator instance for: {}", kindToString(kind));

        switch (kind) {
            case IndicatorKind::Sma:
                logger->debug("Creating SmaIndicator({})", params.period);
                return std::make_unique<SmaIndicator>(params.period);
            case IndicatorKind::Ema:
                logger->debug("Creating EmaIndicator({})", params.period);
                return std::make_unique<EmaIndicator>(params.period);
            case IndicatorKind::Rsi:
                logger->debug("Creating RsiIndicator({})", params.period);
                return std::make_unique<RsiIndicator>(params.period);
            case IndicatorKind::Macd:
                logger->debug("Creating MacdIndicator({},{},{})",
                              params.fast_period, params.slow_period, params.signal_period);
                return std::make_unique<MacdIndicator>(params.fast_period, params.slow_period, params.signal_period);
            case IndicatorKind::Bollinger:
                logger->debug("Creating BollingerIndicator({},{})", params.period, params.std_dev);
                return std::make_unique<BollingerIndicator>(params.period, params.std_dev);
            case IndicatorKind::Unknown:
                break;
        }

        logger->error("Unknown indicator kind requested: {}", kindToString(kind));
        return nullptr;
    }

} // namespace indicators
