#pragma once

#include <stdexcept>
#include <string>

namespace tsfcal {
namespace core {

/**
 * Error taxonomy for calibration operations
 *
 * Every failure is scoped to a single fit/evaluate/apply call. Nothing here
 * is fatal to the process and previously computed models stay valid.
 *
 * - SchemaError: table does not match what the caller asked for (caller bug)
 * - InsufficientDataError: too few valid rows for the requested degree
 * - DegenerateDomainError: all valid X values identical
 * - UndefinedFitQualityError: zero-variance target, R² undefined
 * - ModelFormatError: serialized model record is malformed
 */
class CalibrationError : public std::runtime_error {
public:
	explicit CalibrationError(const std::string &message) : std::runtime_error(message) {
	}
};

class SchemaError : public CalibrationError {
public:
	explicit SchemaError(const std::string &message) : CalibrationError(message) {
	}
};

/// Requested column is not part of the table schema
class ColumnNotFoundError : public SchemaError {
public:
	explicit ColumnNotFoundError(const std::string &column_name)
	    : SchemaError("Column '" + column_name + "' not found in table"), column_name_(column_name) {
	}

	const std::string &ColumnName() const {
		return column_name_;
	}

private:
	std::string column_name_;
};

/// Column exists but holds a different type than the operation requires
class ColumnTypeError : public SchemaError {
public:
	explicit ColumnTypeError(const std::string &message) : SchemaError(message) {
	}
};

class DuplicateColumnError : public SchemaError {
public:
	explicit DuplicateColumnError(const std::string &column_name)
	    : SchemaError("Column '" + column_name + "' already exists in table") {
	}
};

class DuplicateKeyError : public SchemaError {
public:
	explicit DuplicateKeyError(const std::string &message) : SchemaError(message) {
	}
};

class InsufficientDataError : public CalibrationError {
public:
	explicit InsufficientDataError(const std::string &message) : CalibrationError(message) {
	}
};

class DegenerateDomainError : public CalibrationError {
public:
	explicit DegenerateDomainError(const std::string &message) : CalibrationError(message) {
	}
};

class UndefinedFitQualityError : public CalibrationError {
public:
	explicit UndefinedFitQualityError(const std::string &message) : CalibrationError(message) {
	}
};

class ModelFormatError : public CalibrationError {
public:
	explicit ModelFormatError(const std::string &message) : CalibrationError(message) {
	}
};

} // namespace core
} // namespace tsfcal
