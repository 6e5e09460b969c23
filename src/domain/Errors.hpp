/**
 * @file Errors.hpp
 * @brief Exception hierarchy for catalog, classification and rename failures.
 */

#pragma once
#include <stdexcept>
#include <string>

namespace pdfcatalog::domain {

/**
 * @class CatalogError
 * @brief Base of every error surfaced by the catalog core.
 */
class CatalogError : public std::runtime_error {
public:
    explicit CatalogError(const std::string& message) : std::runtime_error(message) {}
};

/** @brief An expected document or file is missing. */
class NotFoundError : public CatalogError {
public:
    explicit NotFoundError(const std::string& message) : CatalogError(message) {}
};

/** @brief A document exists but is structurally invalid. */
class FormatError : public CatalogError {
public:
    explicit FormatError(const std::string& message) : CatalogError(message) {}
};

/** @brief The destination filename already exists. */
class ConflictError : public CatalogError {
public:
    explicit ConflictError(const std::string& message) : CatalogError(message) {}
};

/** @brief Input failed a classification code or filename rule. */
class ValidationError : public CatalogError {
public:
    explicit ValidationError(const std::string& message) : CatalogError(message) {}
};

/**
 * @brief A row-keyed operation referenced a bare-file listing that was
 * invalidated by a rename and has not been rebuilt.
 */
class StaleIndexError : public ValidationError {
public:
    explicit StaleIndexError(const std::string& message) : ValidationError(message) {}
};

/** @brief Permission or device failure while reading, copying or renaming. */
class IOError : public CatalogError {
public:
    explicit IOError(const std::string& message) : CatalogError(message) {}
};

} // namespace pdfcatalog::domain
