#include "foundry/sanitize.hpp"

#include <cctype>
#include <cstring>

namespace foundry {

// =============================================================================
// Character classes
// =============================================================================

static bool is_base64url(char c) {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
           (c >= '0' && c <= '9') || c == '-' || c == '_';
}

/** Characters that end a bearer token or header value. */
static bool is_value_delimiter(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0 ||
           c == '"' || c == '\'' || c == ',' || c == ';' ||
           c == '}' || c == ']' || c == ')' || c == '&';
}

/** Characters allowed in a header name. */
static bool is_name_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '-' || c == '_';
}

static char lower(char c) {
    return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
}

static bool iequals_at(const std::string& text, size_t pos, const std::string& word) {
    if (pos + word.size() > text.size()) return false;
    for (size_t i = 0; i < word.size(); ++i) {
        if (lower(text[pos + i]) != lower(word[i])) return false;
    }
    return true;
}

// =============================================================================
// Passes
// =============================================================================

/**
 * "Bearer <token>": the word must start a token (not be part of a larger
 * identifier) and be followed by at least one space or tab. A quote right
 * before the token is kept and the quoted value is redacted.
 */
static std::string redact_bearer(const std::string& text) {
    static const std::string WORD = "bearer";

    std::string out;
    out.reserve(text.size());

    size_t i = 0;
    while (i < text.size()) {
        if (iequals_at(text, i, WORD) &&
            (i == 0 || !is_name_char(text[i - 1]))) {
            size_t j = i + WORD.size();
            size_t ws = j;
            while (j < text.size() && (text[j] == ' ' || text[j] == '\t')) ++j;
            if (j > ws && j < text.size() && (text[j] == '"' || text[j] == '\'')) ++j;
            if (j > ws && j < text.size() && !is_value_delimiter(text[j])) {
                size_t end = j;
                while (end < text.size() && !is_value_delimiter(text[end])) ++end;
                out.append(text, i, j - i);
                out += FOUNDRY_REDACTED;
                i = end;
                continue;
            }
        }
        out += text[i];
        ++i;
    }
    return out;
}

/**
 * Three dot-separated base64url segments, the first starting with "eyJ"
 * (base64url of '{"'). A match may start anywhere, including right after
 * an identifier or a percent-encoded '=' ("token_eyJ...", "%3DeyJ...").
 */
static std::string redact_jwt(const std::string& text) {
    std::string out;
    out.reserve(text.size());

    size_t i = 0;
    while (i < text.size()) {
        if (text.compare(i, 3, "eyJ") == 0) {
            size_t j = i;
            int segments = 0;
            bool ok = true;
            while (segments < 3) {
                size_t start = j;
                while (j < text.size() && is_base64url(text[j])) ++j;
                if (j == start) { ok = false; break; }
                ++segments;
                if (segments < 3) {
                    if (j < text.size() && text[j] == '.') {
                        ++j;
                    } else {
                        ok = false;
                        break;
                    }
                }
            }
            if (ok) {
                out += FOUNDRY_REDACTED_JWT;
                i = j;
                continue;
            }
        }
        out += text[i];
        ++i;
    }
    return out;
}

/**
 * "<name>: <value>" or "<name>=<value>" (optionally with a quote around the
 * name, as in JSON) for each sensitive name, case-insensitive.
 */
static std::string redact_named_values(const std::string& text,
                                       const std::vector<std::string>& names) {
    std::string out;
    out.reserve(text.size());

    size_t i = 0;
    while (i < text.size()) {
        bool redacted = false;
        if (i == 0 || !is_name_char(text[i - 1])) {
            for (size_t n = 0; n < names.size() && !redacted; ++n) {
                const std::string& name = names[n];
                if (name.empty() || !iequals_at(text, i, name)) continue;

                size_t j = i + name.size();
                if (j < text.size() && is_name_char(text[j])) continue;

                /* optional closing quote of a JSON key */
                if (j < text.size() && (text[j] == '"' || text[j] == '\'')) ++j;
                while (j < text.size() && (text[j] == ' ' || text[j] == '\t')) ++j;
                if (j >= text.size() || (text[j] != ':' && text[j] != '=')) continue;
                ++j;
                while (j < text.size() && (text[j] == ' ' || text[j] == '\t')) ++j;

                /* optional opening quote of a JSON value */
                char quote = 0;
                if (j < text.size() && (text[j] == '"' || text[j] == '\'')) {
                    quote = text[j];
                    ++j;
                }

                size_t end = j;
                if (quote) {
                    while (end < text.size() && text[end] != quote) ++end;
                } else {
                    /* a header value runs to the end of the line */
                    while (end < text.size() && text[end] != '\n' && text[end] != '\r' &&
                           text[end] != ',' && text[end] != ';' && text[end] != '&' &&
                           text[end] != '}') {
                        ++end;
                    }
                }
                if (end == j) continue;

                out.append(text, i, j - i);
                out += FOUNDRY_REDACTED;
                i = end;
                redacted = true;
            }
        }
        if (!redacted) {
            out += text[i];
            ++i;
        }
    }
    return out;
}

// =============================================================================
// Public API
// =============================================================================

const std::vector<std::string>& default_sensitive_names() {
    static const char* const NAMES[] = {
        "authorization",
        "api-key",
        "x-api-key",
        "ocp-apim-subscription-key",
        "x-ms-token",
        "client_secret",
        "password"
    };
    static const std::vector<std::string> names(
        NAMES, NAMES + sizeof(NAMES) / sizeof(NAMES[0]));
    return names;
}

std::string sanitize(const std::string& text, const std::vector<std::string>& extra_names) {
    std::vector<std::string> names = default_sensitive_names();
    names.insert(names.end(), extra_names.begin(), extra_names.end());

    /* JWTs first so a bearer JWT collapses to a single marker */
    std::string out = redact_jwt(text);
    out = redact_named_values(out, names);
    out = redact_bearer(out);
    return out;
}

std::string truncate_message(const std::string& text) {
    if (text.size() <= MAX_ERROR_MESSAGE_LEN) {
        return text;
    }
    size_t cut = MAX_ERROR_MESSAGE_LEN;
    /* back off continuation bytes (10xxxxxx) */
    while (cut > 0 && (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80) {
        --cut;
    }
    return text.substr(0, cut) + "... (truncated)";
}

std::string sanitize_and_truncate(const std::string& text) {
    return truncate_message(sanitize(text));
}

} /* namespace foundry */
