/**
 * @file Timestamp.hpp
 * @brief Local-time formatting shared by the catalog and the backup naming.
 */

#pragma once
#include <chrono>
#include <string>

namespace pdfcatalog::domain {

/** @brief Formats as "YYYY-MM-DD HH:MM:SS" in local time (catalog location stamps). */
std::string FormatTimestamp(std::chrono::system_clock::time_point tp);

/** @brief Formats as "YYYY-MM-DD_HH-MM-SS" in local time (backup file suffix). */
std::string FormatBackupStamp(std::chrono::system_clock::time_point tp);

} // namespace pdfcatalog::domain
