/** @file
 *****************************************************************************

 Simulated market observed by the scenario's publishers

 The reference price drifts slowly, every publisher adds its own spread.
 Publishers read the same clock, so all current quotes of a round carry the
 same timestamp and pass the staleness check for any threshold. A stale
 publisher lags behind by twice the threshold.

 *****************************************************************************/

#ifndef PRICESNARK_PRICE_FEED_H
#define PRICESNARK_PRICE_FEED_H

#include <cmath>
#include <cstdint>
#include <cstddef>

static const uint64_t BASE_TIMESTAMP = 1700000000;

struct observation {
    uint64_t price;
    uint64_t confidence;
    uint64_t timestamp;
    uint64_t observed_online;
};

inline observation observe_market(size_t publisher_id, uint16_t round, bool stale, uint64_t timestamp_threshold)
{
    const double r = (double) round;
    const double reference = 100000.0 + 5000.0 * sin(2.0*M_PI / 40.0 * r);
    const double spread = 300.0 * sin(2.0*M_PI / 7.0 * r + (double) publisher_id);

    observation o;
    o.price = (uint64_t) (reference + spread + 50.0 * (double) publisher_id);
    o.confidence = 20 + 5 * publisher_id;
    o.timestamp = BASE_TIMESTAMP + 2 * (uint64_t) round;
    if (stale){
        const uint64_t lag = (timestamp_threshold > UINT64_MAX / 2) ? UINT64_MAX : 2 * timestamp_threshold;
        o.timestamp = (o.timestamp > lag) ? o.timestamp - lag : 0;
    }
    // publishers come online at different times, the circuit only range checks this
    o.observed_online = o.timestamp + (publisher_id % 2);
    return o;
}

#endif //PRICESNARK_PRICE_FEED_H
