/**
 * @file PrefixCodec.hpp
 * @brief Recognizes and formats the classification prefix embedded in a filename.
 *
 * A prefix is two or more repetitions of "one ASCII alphanumeric character
 * followed by one space" at the very start of the name, e.g. "A B C report.pdf".
 */

#pragma once
#include <optional>
#include <string>

namespace pdfcatalog::domain {

class PrefixCodec {
public:
    /**
     * @struct Split
     * @brief A filename cut into its prefix and the remaining base filename.
     */
    struct Split {
        std::string prefix;       ///< Trimmed prefix ("A B C"), empty for bare files.
        std::string baseFilename; ///< Remainder with leading whitespace trimmed.
    };

    /** @brief Minimum number of "char + space" pairs for a prefix to count. */
    static constexpr size_t kMinPairs = 2;

    /**
     * @brief Returns the matched prefix with trailing whitespace trimmed.
     * @return std::nullopt when the filename is bare.
     */
    static std::optional<std::string> parsePrefix(const std::string& filename);

    /** @brief True when the filename carries no recognized prefix. */
    static bool isBare(const std::string& filename);

    /** @brief Cuts a filename into prefix and base filename. */
    static Split splitFilename(const std::string& filename);

    /** @brief "A B C" -> "ABC". */
    static std::string prefixToCode(const std::string& prefix);

    /** @brief "ABC" -> "A B C " (a space after every character, trailing included). */
    static std::string formatPrefix(const std::string& code);

    /** @brief Prepends the formatted code directly to the filename. */
    static std::string applyTo(const std::string& code, const std::string& filename);

    /** @brief True when every character is ASCII alphanumeric and the code is non-empty. */
    static bool isValidCode(const std::string& code);

    static bool isAsciiAlnum(char c);
};

} // namespace pdfcatalog::domain
