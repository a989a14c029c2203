#ifndef LOGVEC_INGEST_NORMALIZER_H_
#define LOGVEC_INGEST_NORMALIZER_H_

#include <string>

namespace logvec {
namespace ingest {

/**
 * @brief Reduce a raw log line to its deduplication fingerprint.
 *
 * Removes the leading timestamp + hostname prefix (syslog "Nov 04 23:58:33 host"
 * or ISO-8601 "2024-11-04T23:58:33+0100 host"), bracketed PIDs ("sshd[812]"),
 * a trailing all-digit token, and collapses whitespace. The passes are repeated
 * until the text no longer changes, so normalize(normalize(x)) == normalize(x).
 *
 * Lines that normalize to nothing fall back to their whitespace-collapsed raw
 * text. Never throws; "" maps to "".
 */
std::string normalize(const std::string& raw);

/**
 * @brief Collapse whitespace runs to a single space and trim both ends
 */
std::string collapse_whitespace(const std::string& text);

/**
 * @brief True for empty or whitespace-only text
 */
bool is_blank(const std::string& text);

} // namespace ingest
} // namespace logvec

#endif // LOGVEC_INGEST_NORMALIZER_H_
