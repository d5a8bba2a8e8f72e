// include/tcrimer/data/upstream_collector.hpp
#pragma once

#include <string>
#include <vector>
#include "tcrimer/core/error.hpp"
#include "tcrimer/core/types.hpp"

namespace tcrimer {

/**
 * @brief Source of market data outside the relational store (exchange
 * feeds, files)
 *
 * Implementations may be slow or unreliable. The market data service always
 * reaches them through the cache and bounds each call with a timeout.
 */
class UpstreamCollector {
public:
    virtual ~UpstreamCollector() = default;

    /**
     * @brief Bars with start <= timestamp <= end, in any order
     * @return UPSTREAM_ERROR if the source cannot serve the request
     */
    virtual Result<std::vector<Bar>> fetch_series(const std::string& symbol, DataFrequency freq,
                                                  const Timestamp& start,
                                                  const Timestamp& end) = 0;

    virtual Result<Bar> fetch_latest(const std::string& symbol, DataFrequency freq) = 0;

    virtual std::string name() const = 0;
};

}  // namespace tcrimer
