#pragma once

#include "tsfcal/core/errors.hpp"
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace tsfcal {
namespace core {

enum class ColumnType : uint8_t { TEXT, NUMERIC, BOOLEAN };

std::string ColumnTypeName(ColumnType type);

/**
 * A single cell value handed to DataTable::AppendRow
 *
 * A default-constructed Value is NULL (absent). Typed values are created with
 * the named constructors, mirroring how DuckDB's Value is used at the
 * ingestion boundary.
 */
class Value {
public:
	Value() = default;

	static Value Numeric(double value);
	static Value Text(std::string value);
	static Value Boolean(bool value);
	static Value Null() {
		return Value();
	}

	bool IsNull() const {
		return is_null_;
	}
	ColumnType Type() const {
		return type_;
	}

	/// Typed accessors; throw ColumnTypeError on type mismatch or NULL
	double GetNumeric() const;
	const std::string &GetText() const;
	bool GetBoolean() const;

	bool operator==(const Value &other) const;
	bool operator!=(const Value &other) const {
		return !(*this == other);
	}

private:
	bool is_null_ = true;
	ColumnType type_ = ColumnType::NUMERIC;
	double numeric_ = 0.0;
	std::string text_;
	bool boolean_ = false;
};

struct ColumnDefinition {
	std::string name;
	ColumnType type;
};

/**
 * Typed column with a per-row validity mask
 *
 * Only the storage vector matching the column type is populated. Invalid rows
 * keep a placeholder in storage so row indices stay aligned.
 */
class Column {
public:
	Column(std::string name, ColumnType type);

	const std::string &Name() const {
		return name_;
	}
	ColumnType Type() const {
		return type_;
	}
	size_t Size() const {
		return validity_.size();
	}

	bool IsValid(size_t row) const;

	double GetNumeric(size_t row) const;
	const std::string &GetText(size_t row) const;
	bool GetBoolean(size_t row) const;

	/// Cell as a Value (NULL when invalid)
	Value GetValue(size_t row) const;

	void Append(const Value &value);
	void AppendNull();
	void AppendNumeric(double value);
	void AppendText(const std::string &value);
	void AppendBoolean(bool value);

	void Reserve(size_t capacity);

	bool operator==(const Column &other) const;

private:
	void CheckRow(size_t row) const;
	void CheckType(ColumnType expected) const;

	std::string name_;
	ColumnType type_;
	std::vector<bool> validity_;
	std::vector<double> numeric_;
	std::vector<std::string> text_;
	std::vector<bool> boolean_;
};

/**
 * In-memory tabular record set with named, typed columns
 *
 * Rows are appended during ingestion; source columns are never edited in
 * place afterwards. Column storage is shared between copies of a table and
 * cloned on the first write (copy-on-write), so copying a table and adding
 * columns to the copy is cheap and leaves the original untouched.
 *
 * Row order is preserved and defines output ordering of every derived table.
 */
class DataTable {
public:
	DataTable() = default;
	explicit DataTable(const std::vector<ColumnDefinition> &schema);

	size_t ColumnCount() const {
		return columns_.size();
	}
	size_t RowCount() const {
		return row_count_;
	}
	bool Empty() const {
		return row_count_ == 0;
	}

	std::vector<std::string> ColumnNames() const;
	std::vector<ColumnDefinition> Schema() const;

	bool HasColumn(const std::string &name) const;

	/**
	 * Resolve a column position by name
	 *
	 * @throws ColumnNotFoundError if the schema has no such column
	 */
	size_t ColumnIndex(const std::string &name) const;

	const Column &GetColumn(size_t index) const;
	const Column &GetColumn(const std::string &name) const;

	/**
	 * Append one row; values follow schema order
	 *
	 * @throws std::invalid_argument if the row arity differs from the schema
	 * @throws ColumnTypeError if a non-NULL value has the wrong type
	 */
	void AppendRow(const std::vector<Value> &row);
	void AppendRow(std::initializer_list<Value> row) {
		AppendRow(std::vector<Value>(row));
	}

	/**
	 * Add an empty column to a table that has no rows yet
	 *
	 * @throws DuplicateColumnError if the name is taken
	 * @throws std::logic_error if rows were already ingested
	 */
	void AddColumn(const ColumnDefinition &definition);

	/**
	 * Return a copy of this table with one extra, fully populated column
	 *
	 * @throws DuplicateColumnError if the name is taken
	 * @throws std::invalid_argument if the column length differs from RowCount()
	 */
	DataTable WithColumn(Column column) const;

	/// Copy of the rows selected by `row_indices`, in the given order
	DataTable SelectRows(const std::vector<size_t> &row_indices) const;

	/**
	 * Check that a text key column holds unique, non-NULL values
	 *
	 * @throws ColumnNotFoundError, ColumnTypeError, DuplicateKeyError
	 */
	void ValidateUniqueKey(const std::string &key_column) const;

	bool operator==(const DataTable &other) const;
	bool operator!=(const DataTable &other) const {
		return !(*this == other);
	}

private:
	Column &MutableColumn(size_t index);

	std::vector<std::shared_ptr<Column>> columns_;
	size_t row_count_ = 0;
};

} // namespace core
} // namespace tsfcal
