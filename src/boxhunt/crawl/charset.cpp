#include <boxhunt/crawl/charset.hpp>
#include <boxhunt/util/strings.hpp>

#include <iconv.h>

#include <algorithm>
#include <cerrno>
#include <cstdint>
#include <regex>

namespace boxhunt::crawl {

namespace {

// Owns an iconv descriptor
class IconvHandle {
public:
    IconvHandle(const char* to, const char* from) : cd_(iconv_open(to, from)) {}
    ~IconvHandle() {
        if (valid()) iconv_close(cd_);
    }

    IconvHandle(const IconvHandle&) = delete;
    IconvHandle& operator=(const IconvHandle&) = delete;

    bool valid() const { return cd_ != reinterpret_cast<iconv_t>(-1); }
    iconv_t get() const { return cd_; }

private:
    iconv_t cd_;
};

std::string strip_utf8_bom(const std::string& bytes) {
    if (bytes.size() >= 3 && static_cast<unsigned char>(bytes[0]) == 0xEF &&
        static_cast<unsigned char>(bytes[1]) == 0xBB &&
        static_cast<unsigned char>(bytes[2]) == 0xBF) {
        return bytes.substr(3);
    }
    return bytes;
}

std::optional<std::string> clean_charset_name(const std::string& raw) {
    std::string name = util::to_lower(util::trim(raw));
    while (!name.empty() && (name.back() == '"' || name.back() == '\'' || name.back() == ';')) {
        name.pop_back();
    }
    while (!name.empty() && (name.front() == '"' || name.front() == '\'')) {
        name.erase(0, 1);
    }
    if (name.empty()) {
        return std::nullopt;
    }
    // Browsers treat these labels as supersets
    if (name == "gb2312" || name == "gbk") return std::string("gb18030");
    if (name == "iso-8859-1" || name == "latin1" || name == "us-ascii") return std::string("windows-1252");
    return name;
}

// Length of the valid UTF-8 sequence starting at i, or 0
size_t utf8_sequence_length(const std::string& s, size_t i) {
    auto byte = [&](size_t k) { return static_cast<unsigned char>(s[k]); };
    unsigned char c = byte(i);
    if (c < 0x80) return 1;

    size_t len = 0;
    uint32_t min_cp = 0;
    uint32_t cp = 0;
    if ((c & 0xE0) == 0xC0) { len = 2; cp = c & 0x1F; min_cp = 0x80; }
    else if ((c & 0xF0) == 0xE0) { len = 3; cp = c & 0x0F; min_cp = 0x800; }
    else if ((c & 0xF8) == 0xF0) { len = 4; cp = c & 0x07; min_cp = 0x10000; }
    else return 0;

    if (i + len > s.size()) return 0;
    for (size_t k = 1; k < len; ++k) {
        unsigned char cc = byte(i + k);
        if ((cc & 0xC0) != 0x80) return 0;
        cp = (cp << 6) | (cc & 0x3F);
    }
    if (cp < min_cp || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) return 0;
    return len;
}

bool is_valid_utf8(const std::string& s) {
    for (size_t i = 0; i < s.size();) {
        size_t len = utf8_sequence_length(s, i);
        if (len == 0) return false;
        i += len;
    }
    return true;
}

}  // namespace

const std::vector<std::string>& fallback_encodings() {
    static const std::vector<std::string> encodings = {
        "utf-8", "gb18030", "big5", "shift_jis", "euc-kr", "windows-1252"};
    return encodings;
}

std::optional<std::string> charset_from_content_type(const std::string& content_type) {
    std::string lower = util::to_lower(content_type);
    size_t pos = lower.find("charset=");
    if (pos == std::string::npos) {
        return std::nullopt;
    }
    std::string value = lower.substr(pos + 8);
    size_t end = value.find_first_of("; ");
    if (end != std::string::npos) {
        value.erase(end);
    }
    return clean_charset_name(value);
}

std::optional<std::string> sniff_meta_charset(const std::string& bytes, size_t window) {
    static const std::regex pattern(R"(charset\s*=\s*["']?\s*([A-Za-z0-9_\-:.]+))",
                                    std::regex::icase);
    std::string head = bytes.substr(0, std::min(window, bytes.size()));
    std::smatch match;
    if (!std::regex_search(head, match, pattern)) {
        return std::nullopt;
    }
    return clean_charset_name(match[1].str());
}

std::optional<std::string> convert_to_utf8(const std::string& bytes, const std::string& charset) {
    std::string name = util::to_lower(charset);
    if (name == "utf-8" || name == "utf8") {
        std::string body = strip_utf8_bom(bytes);
        if (!is_valid_utf8(body)) return std::nullopt;
        return body;
    }

    IconvHandle cd("UTF-8", charset.c_str());
    if (!cd.valid()) {
        return std::nullopt;
    }

    std::string input = bytes;
    char* in_ptr = input.empty() ? nullptr : &input[0];
    size_t in_left = input.size();

    std::string output;
    std::vector<char> chunk(4096);

    while (in_left > 0) {
        char* out_ptr = chunk.data();
        size_t out_left = chunk.size();
        size_t rc = iconv(cd.get(), &in_ptr, &in_left, &out_ptr, &out_left);
        output.append(chunk.data(), chunk.size() - out_left);
        if (rc == static_cast<size_t>(-1)) {
            if (errno == E2BIG) continue;
            return std::nullopt;  // EILSEQ or truncated input
        }
    }

    // Flush shift state
    char* out_ptr = chunk.data();
    size_t out_left = chunk.size();
    iconv(cd.get(), nullptr, nullptr, &out_ptr, &out_left);
    output.append(chunk.data(), chunk.size() - out_left);
    return output;
}

std::string lossy_utf8(const std::string& bytes) {
    static const char replacement[] = "\xEF\xBF\xBD";
    std::string out;
    out.reserve(bytes.size());
    for (size_t i = 0; i < bytes.size();) {
        size_t len = utf8_sequence_length(bytes, i);
        if (len == 0) {
            out += replacement;
            ++i;
        } else {
            out.append(bytes, i, len);
            i += len;
        }
    }
    return out;
}

std::string decode_html(const std::string& bytes, const std::string& content_type) {
    std::vector<std::string> attempts;
    if (auto declared = charset_from_content_type(content_type)) {
        attempts.push_back(*declared);
    }
    if (auto sniffed = sniff_meta_charset(bytes)) {
        attempts.push_back(*sniffed);
    }
    for (const auto& enc : fallback_encodings()) {
        attempts.push_back(enc);
    }

    for (const auto& charset : attempts) {
        if (auto decoded = convert_to_utf8(bytes, charset)) {
            return *decoded;
        }
    }
    return lossy_utf8(strip_utf8_bom(bytes));
}

}  // namespace boxhunt::crawl
