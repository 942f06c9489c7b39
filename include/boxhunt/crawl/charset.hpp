#pragma once

#include <optional>
#include <string>
#include <vector>

namespace boxhunt::crawl {

// Encodings tried, in order, when neither the header nor the markup declares one
const std::vector<std::string>& fallback_encodings();

// "text/html; charset=GBK" -> "gbk"
std::optional<std::string> charset_from_content_type(const std::string& content_type);

/**
 * Looks for a charset= declaration (meta charset or http-equiv) in the
 * first `window` bytes of a document.
 */
std::optional<std::string> sniff_meta_charset(const std::string& bytes, size_t window = 2048);

/**
 * Strict conversion to UTF-8 via iconv. Returns nullopt when the charset
 * is unknown or the bytes are not valid in it.
 */
std::optional<std::string> convert_to_utf8(const std::string& bytes, const std::string& charset);

// Copies valid UTF-8 through, replacing each invalid byte with U+FFFD
std::string lossy_utf8(const std::string& bytes);

/**
 * Decodes an HTML body to UTF-8, trying in order: the Content-Type
 * charset, a sniffed meta charset, the fallback list, then lossy UTF-8.
 */
std::string decode_html(const std::string& bytes, const std::string& content_type);

}  // namespace boxhunt::crawl
