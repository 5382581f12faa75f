#include "LineNormalizer.hpp"
#include <cctype>
#include <cstring>

std::vector<std::string> LineNormalizer::normalize(const std::string& text) {
    std::vector<std::string> fragments;
    appendLines(text, fragments);
    return fragments;
}

std::vector<std::string> LineNormalizer::normalize(const std::vector<std::optional<std::string>>& blobs) {
    std::vector<std::string> fragments;
    for (const auto& blob : blobs) {
        if (!blob) {
            continue;
        }
        appendLines(*blob, fragments);
    }
    return fragments;
}

// UTF-8 encodings of U+00A0 (no-break space) and U+3000 (ideographic space)
static const char* const WIDE_SPACES[] = {"\xC2\xA0", "\xE3\x80\x80"};

// Byte length of the whitespace sequence starting at pos, or 0
static size_t leadingSpaceAt(const std::string& value, size_t pos, size_t end) {
    if (std::isspace(static_cast<unsigned char>(value[pos]))) {
        return 1;
    }
    for (const char* space : WIDE_SPACES) {
        size_t len = std::strlen(space);
        if (end - pos >= len && value.compare(pos, len, space) == 0) {
            return len;
        }
    }
    return 0;
}

// Byte length of the whitespace sequence ending just before end, or 0
static size_t trailingSpaceAt(const std::string& value, size_t start, size_t end) {
    if (std::isspace(static_cast<unsigned char>(value[end - 1]))) {
        return 1;
    }
    for (const char* space : WIDE_SPACES) {
        size_t len = std::strlen(space);
        if (end - start >= len && value.compare(end - len, len, space) == 0) {
            return len;
        }
    }
    return 0;
}

std::string LineNormalizer::trim(const std::string& value) {
    size_t start = 0;
    size_t end = value.size();
    while (start < end) {
        size_t len = leadingSpaceAt(value, start, end);
        if (len == 0) {
            break;
        }
        start += len;
    }
    while (end > start) {
        size_t len = trailingSpaceAt(value, start, end);
        if (len == 0) {
            break;
        }
        end -= len;
    }
    return value.substr(start, end - start);
}

void LineNormalizer::appendLines(const std::string& text, std::vector<std::string>& out) {
    std::string line;
    for (size_t i = 0; i < text.size(); i++) {
        char c = text[i];
        if (c == '\r' || c == '\n') {
            // CRLF counts as a single boundary
            if (c == '\r' && i + 1 < text.size() && text[i + 1] == '\n') {
                i++;
            }
            std::string trimmed = trim(line);
            if (!trimmed.empty()) {
                out.push_back(trimmed);
            }
            line.clear();
            continue;
        }
        line += c;
    }

    std::string trimmed = trim(line);
    if (!trimmed.empty()) {
        out.push_back(trimmed);
    }
}
