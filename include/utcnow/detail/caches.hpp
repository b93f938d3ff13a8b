#pragma once

#include "utcnow/canonical.hpp"
#include "utcnow/detail/grammar.hpp"
#include "utcnow/detail/numeric.hpp"
#include "utcnow/utils/lru_cache.hpp"

#include <string>
#include <string_view>

namespace utcnow::detail {

/**
 * Process-wide memoization caches, one per cached function.
 *
 * Only successful results are stored, so a failing input is re-evaluated
 * (and fails again) on every call. The numeric cache records whether a text
 * was read as epoch seconds, and only once that text converted.
 */
struct Caches {
    utils::LruCache<std::string, bool> numeric{UTCNOW_CACHE_CAPACITY};
    utils::LruCache<std::string, ParsedFields> grammar{UTCNOW_CACHE_CAPACITY};
    utils::LruCache<std::string, CanonicalString> canonical{UTCNOW_CACHE_CAPACITY};
};

inline Caches& caches() {
    static Caches instance;
    return instance;
}

/// Memoized parse_fields()
inline Result<ParsedFields> cached_parse_fields(std::string_view text) {
    return caches().grammar.get_or_compute(std::string(text),
                                           [text] { return parse_fields(text); });
}

} // namespace utcnow::detail
