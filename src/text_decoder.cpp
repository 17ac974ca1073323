#include "text_decoder.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <unordered_map>
#include <iconv.h>

namespace incfile {

// Spellings accepted on the command line that iconv does not know.
static const std::unordered_map<std::string, std::string> ENCODING_ALIASES = {
    {"utf_8", "UTF-8"},
    {"utf8", "UTF-8"},
    {"latin-1", "ISO-8859-1"},
    {"latin_1", "ISO-8859-1"},
    {"l1", "ISO-8859-1"},
    {"utf_16", "UTF-16"},
    {"ascii", "ASCII"},
    {"us-ascii", "ASCII"},
};

static std::string iconv_name(const std::optional<std::string>& encoding) {
    if (!encoding || encoding->empty()) {
        return "UTF-8";
    }
    std::string lower = *encoding;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    auto it = ENCODING_ALIASES.find(lower);
    if (it != ENCODING_ALIASES.end()) {
        return it->second;
    }
    return *encoding;
}

// Closes the conversion descriptor on scope exit.
struct IconvHandle {
    iconv_t cd;
    ~IconvHandle() { iconv_close(cd); }
};

std::string decode_text(const std::string& bytes, const std::optional<std::string>& encoding) {
    std::string from = iconv_name(encoding);
    iconv_t cd = iconv_open("UTF-8", from.c_str());
    if (cd == reinterpret_cast<iconv_t>(-1)) {
        throw DecodeError("unknown encoding: " + from);
    }
    IconvHandle handle{cd};

    std::string output;
    output.resize(bytes.size() + bytes.size() / 2 + 16);

    char* in = const_cast<char*>(bytes.data());
    size_t in_left = bytes.size();
    size_t written = 0;

    while (in_left > 0) {
        char* out = &output[written];
        size_t out_left = output.size() - written;
        size_t rc = iconv(handle.cd, &in, &in_left, &out, &out_left);
        written = output.size() - out_left;

        if (rc != static_cast<size_t>(-1)) {
            break;
        }
        if (errno == E2BIG) {
            output.resize(output.size() * 2);
            continue;
        }

        size_t offset = bytes.size() - in_left;
        if (errno == EILSEQ) {
            throw DecodeError("'" + from + "' codec can't decode byte at position " +
                              std::to_string(offset));
        }
        if (errno == EINVAL) {
            throw DecodeError("'" + from + "' codec found a truncated sequence at position " +
                              std::to_string(offset));
        }
        throw DecodeError("'" + from + "' conversion failed at position " + std::to_string(offset));
    }

    output.resize(written);
    return normalize_newlines(output);
}

std::string normalize_newlines(const std::string& text) {
    std::string result;
    result.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '\r') {
            result += '\n';
            if (i + 1 < text.size() && text[i + 1] == '\n') {
                ++i;
            }
        } else {
            result += text[i];
        }
    }
    return result;
}

} // namespace incfile
