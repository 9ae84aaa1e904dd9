#ifndef FOUNDRY_SANITIZE_HPP
#define FOUNDRY_SANITIZE_HPP

#include <string>
#include <vector>

namespace foundry {

/** Replacement for a redacted bearer token or header value. */
#define FOUNDRY_REDACTED "[REDACTED]"

/** Replacement for a redacted JWT-shaped substring. */
#define FOUNDRY_REDACTED_JWT "[REDACTED_JWT]"

/** Maximum length of a message attached to an error. */
static const size_t MAX_ERROR_MESSAGE_LEN = 1000;

/**
 * Header names whose values are always redacted (lower-case).
 */
const std::vector<std::string>& default_sensitive_names();

/**
 * Redact secrets from text destined for a log record or error message.
 *
 * Three independent passes:
 *   - "Bearer <token>"          -> "Bearer [REDACTED]"
 *   - "eyJ<seg>.<seg>.<seg>"    -> "[REDACTED_JWT]"
 *   - "<name>: <value>" and "<name>=<value>" for known sensitive names
 *                               -> "<name>: [REDACTED]"
 *
 * extra_names extends the sensitive name list; it never replaces it.
 */
std::string sanitize(const std::string& text,
                     const std::vector<std::string>& extra_names = std::vector<std::string>());

/**
 * Truncate to MAX_ERROR_MESSAGE_LEN bytes, appending "... (truncated)".
 * The cut never splits a UTF-8 sequence.
 */
std::string truncate_message(const std::string& text);

/** sanitize() then truncate_message(), in that order. */
std::string sanitize_and_truncate(const std::string& text);

} // namespace foundry

#endif // FOUNDRY_SANITIZE_HPP
