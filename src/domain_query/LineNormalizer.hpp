#ifndef LINE_NORMALIZER_H
#define LINE_NORMALIZER_H

#include <string>
#include <vector>
#include <optional>

/**
 * Splits free-form text into base fragments.
 *
 * "\r\n", "\r" and "\n" all end a line. Every line is trimmed and blank lines
 * are dropped; the remaining fragments keep their input order and are not
 * deduplicated.
 */
class LineNormalizer {
public:
    static std::vector<std::string> normalize(const std::string& text);

    // Each blob is split on its own; absent blobs are skipped.
    static std::vector<std::string> normalize(const std::vector<std::optional<std::string>>& blobs);

    // Strips ASCII whitespace plus UTF-8 no-break and ideographic spaces.
    static std::string trim(const std::string& value);

private:
    static void appendLines(const std::string& text, std::vector<std::string>& out);
};

#endif // LINE_NORMALIZER_H
