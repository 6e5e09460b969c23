/**
 * @file Log.hpp
 * @brief Component-tagged console logging ("[Component] message").
 */

#pragma once
#include <string>

namespace pdfcatalog::infrastructure {

/**
 * @class Log
 * @brief Info lines go to stdout, warnings and errors to stderr.
 * Safe to call from the scan worker thread.
 */
class Log {
public:
    static void Info(const std::string& component, const std::string& message);
    static void Warn(const std::string& component, const std::string& message);
    static void Error(const std::string& component, const std::string& message);

    /** @brief Suppresses Info output (warnings and errors still print). */
    static void SetQuiet(bool quiet);
    static bool IsQuiet();
};

} // namespace pdfcatalog::infrastructure
