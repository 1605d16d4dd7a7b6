#ifndef PARAM_H
#define PARAM_H

#include <cstdlib>
#include <string>
#include <limits>
#include <stdexcept>

// Support scan
#ifndef NR_THREADS
#define NR_THREADS 4
#endif

// 0 means no bound on the itemset length
#ifndef MAX_ITEMSET_LENGTH
#define MAX_ITEMSET_LENGTH 0
#endif

// Rule filters, off unless requested
#ifndef MIN_LIFT
#define MIN_LIFT (-std::numeric_limits<double>::infinity())
#endif
#ifndef MIN_LEVERAGE
#define MIN_LEVERAGE (-std::numeric_limits<double>::infinity())
#endif

// Run-time overrides, read from the environment
#define ENV_THREADS "APRIORI_THREADS"
#define ENV_MAX_LENGTH "APRIORI_MAX_LENGTH"
#define ENV_MIN_LIFT "APRIORI_MIN_LIFT"
#define ENV_MIN_LEVERAGE "APRIORI_MIN_LEVERAGE"

// A malformed override falls back to the compile-time default
inline int param_env_int(const char* name, int fallback) {
    const char* value = std::getenv(name);
    if (!value) {
        return fallback;
    }
    try {
        return std::stoi(value);
    } catch (const std::invalid_argument&) {
        return fallback;
    } catch (const std::out_of_range&) {
        return fallback;
    }
}

inline double param_env_double(const char* name, double fallback) {
    const char* value = std::getenv(name);
    if (!value) {
        return fallback;
    }
    try {
        return std::stod(value);
    } catch (const std::invalid_argument&) {
        return fallback;
    } catch (const std::out_of_range&) {
        return fallback;
    }
}

inline int param_threads() {
    int threads = param_env_int(ENV_THREADS, NR_THREADS);
    return threads > 0 ? threads : 1;
}

inline int param_max_length() {
    return param_env_int(ENV_MAX_LENGTH, MAX_ITEMSET_LENGTH);
}

inline double param_min_lift() {
    return param_env_double(ENV_MIN_LIFT, MIN_LIFT);
}

inline double param_min_leverage() {
    return param_env_double(ENV_MIN_LEVERAGE, MIN_LEVERAGE);
}

#endif
