// Fixed-size JSON report handed from the soil health task to whichever
// collaborator delivers recommendations (dashboard bridge, uplink, logger).
#ifndef RECOMMENDATION_REPORT_HPP
#define RECOMMENDATION_REPORT_HPP

#include <cstdint>

struct RecommendationReport {
    char payload[384];
};

#endif // RECOMMENDATION_REPORT_HPP
