#pragma once

namespace sitewatch::crawler {

// Failure classification attached to every failed page fetch
enum class FailureType {
    TEMPORARY,      // Retry with exponential backoff
    RATE_LIMITED,   // Retry with longer delay (respect rate limits)
    PERMANENT,      // Don't retry (404, DNS doesn't exist, etc.)
    AUTHENTICATION, // 401/403/407 or a login wall; needs credentials, never retried
    UNKNOWN         // Retry with caution (limited attempts)
};

} // namespace sitewatch::crawler
