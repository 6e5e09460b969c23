/**
 * @file PrefixCodec.cpp
 * @brief Implementation of PrefixCodec.
 */

#include "domain/PrefixCodec.hpp"
#include <algorithm>

namespace pdfcatalog::domain {

bool PrefixCodec::isAsciiAlnum(char c) {
    return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

std::optional<std::string> PrefixCodec::parsePrefix(const std::string& filename) {
    size_t pairs = 0;
    size_t pos = 0;
    while (pos + 1 < filename.size() && isAsciiAlnum(filename[pos]) && filename[pos + 1] == ' ') {
        ++pairs;
        pos += 2;
    }
    if (pairs < kMinPairs) {
        return std::nullopt;
    }
    // The matched run always ends with exactly one space.
    return filename.substr(0, pos - 1);
}

bool PrefixCodec::isBare(const std::string& filename) {
    return !parsePrefix(filename).has_value();
}

PrefixCodec::Split PrefixCodec::splitFilename(const std::string& filename) {
    Split split;
    auto prefix = parsePrefix(filename);
    if (!prefix) {
        split.baseFilename = filename;
        return split;
    }
    split.prefix = *prefix;
    std::string rest = filename.substr(prefix->size());
    size_t first = rest.find_first_not_of(" \t");
    split.baseFilename = (first == std::string::npos) ? std::string() : rest.substr(first);
    return split;
}

std::string PrefixCodec::prefixToCode(const std::string& prefix) {
    std::string code;
    code.reserve(prefix.size());
    std::copy_if(prefix.begin(), prefix.end(), std::back_inserter(code),
                 [](char c) { return c != ' ' && c != '\t'; });
    return code;
}

std::string PrefixCodec::formatPrefix(const std::string& code) {
    std::string out;
    out.reserve(code.size() * 2);
    for (char c : code) {
        out.push_back(c);
        out.push_back(' ');
    }
    return out;
}

std::string PrefixCodec::applyTo(const std::string& code, const std::string& filename) {
    return formatPrefix(code) + filename;
}

bool PrefixCodec::isValidCode(const std::string& code) {
    return !code.empty() && std::all_of(code.begin(), code.end(), isAsciiAlnum);
}

} // namespace pdfcatalog::domain
