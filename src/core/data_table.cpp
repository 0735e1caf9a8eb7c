#include "tsfcal/core/data_table.hpp"
#include <cmath>
#include <stdexcept>
#include <unordered_set>
#include <utility>

namespace tsfcal {
namespace core {

std::string ColumnTypeName(ColumnType type) {
	switch (type) {
	case ColumnType::TEXT:
		return "TEXT";
	case ColumnType::NUMERIC:
		return "NUMERIC";
	case ColumnType::BOOLEAN:
		return "BOOLEAN";
	default:
		return "UNKNOWN";
	}
}

static bool SameNumeric(double a, double b) {
	return a == b || (std::isnan(a) && std::isnan(b));
}

// ============================================================================
// Value
// ============================================================================

Value Value::Numeric(double value) {
	Value result;
	result.is_null_ = false;
	result.type_ = ColumnType::NUMERIC;
	result.numeric_ = value;
	return result;
}

Value Value::Text(std::string value) {
	Value result;
	result.is_null_ = false;
	result.type_ = ColumnType::TEXT;
	result.text_ = std::move(value);
	return result;
}

Value Value::Boolean(bool value) {
	Value result;
	result.is_null_ = false;
	result.type_ = ColumnType::BOOLEAN;
	result.boolean_ = value;
	return result;
}

double Value::GetNumeric() const {
	if (is_null_ || type_ != ColumnType::NUMERIC) {
		throw ColumnTypeError("Value is not a non-NULL NUMERIC");
	}
	return numeric_;
}

const std::string &Value::GetText() const {
	if (is_null_ || type_ != ColumnType::TEXT) {
		throw ColumnTypeError("Value is not a non-NULL TEXT");
	}
	return text_;
}

bool Value::GetBoolean() const {
	if (is_null_ || type_ != ColumnType::BOOLEAN) {
		throw ColumnTypeError("Value is not a non-NULL BOOLEAN");
	}
	return boolean_;
}

bool Value::operator==(const Value &other) const {
	if (is_null_ || other.is_null_) {
		return is_null_ == other.is_null_;
	}
	if (type_ != other.type_) {
		return false;
	}
	switch (type_) {
	case ColumnType::NUMERIC:
		return SameNumeric(numeric_, other.numeric_);
	case ColumnType::TEXT:
		return text_ == other.text_;
	case ColumnType::BOOLEAN:
		return boolean_ == other.boolean_;
	default:
		return false;
	}
}

// ============================================================================
// Column
// ============================================================================

Column::Column(std::string name, ColumnType type) : name_(std::move(name)), type_(type) {
	if (name_.empty()) {
		throw std::invalid_argument("Column name must not be empty");
	}
}

void Column::CheckRow(size_t row) const {
	if (row >= validity_.size()) {
		throw std::out_of_range("Row " + std::to_string(row) + " out of range for column '" + name_ + "' (" +
		                        std::to_string(validity_.size()) + " rows)");
	}
}

void Column::CheckType(ColumnType expected) const {
	if (type_ != expected) {
		throw ColumnTypeError("Column '" + name_ + "' has type " + ColumnTypeName(type_) + ", expected " +
		                      ColumnTypeName(expected));
	}
}

bool Column::IsValid(size_t row) const {
	CheckRow(row);
	return validity_[row];
}

double Column::GetNumeric(size_t row) const {
	CheckType(ColumnType::NUMERIC);
	CheckRow(row);
	if (!validity_[row]) {
		throw ColumnTypeError("NULL value at row " + std::to_string(row) + " in column '" + name_ + "'");
	}
	return numeric_[row];
}

const std::string &Column::GetText(size_t row) const {
	CheckType(ColumnType::TEXT);
	CheckRow(row);
	if (!validity_[row]) {
		throw ColumnTypeError("NULL value at row " + std::to_string(row) + " in column '" + name_ + "'");
	}
	return text_[row];
}

bool Column::GetBoolean(size_t row) const {
	CheckType(ColumnType::BOOLEAN);
	CheckRow(row);
	if (!validity_[row]) {
		throw ColumnTypeError("NULL value at row " + std::to_string(row) + " in column '" + name_ + "'");
	}
	return boolean_[row];
}

Value Column::GetValue(size_t row) const {
	CheckRow(row);
	if (!validity_[row]) {
		return Value::Null();
	}
	switch (type_) {
	case ColumnType::NUMERIC:
		return Value::Numeric(numeric_[row]);
	case ColumnType::TEXT:
		return Value::Text(text_[row]);
	case ColumnType::BOOLEAN:
		return Value::Boolean(boolean_[row]);
	default:
		return Value::Null();
	}
}

void Column::Append(const Value &value) {
	if (value.IsNull()) {
		AppendNull();
		return;
	}
	if (value.Type() != type_) {
		throw ColumnTypeError("Cannot append " + ColumnTypeName(value.Type()) + " value to column '" + name_ +
		                      "' of type " + ColumnTypeName(type_));
	}
	switch (type_) {
	case ColumnType::NUMERIC:
		AppendNumeric(value.GetNumeric());
		break;
	case ColumnType::TEXT:
		AppendText(value.GetText());
		break;
	case ColumnType::BOOLEAN:
		AppendBoolean(value.GetBoolean());
		break;
	}
}

void Column::AppendNull() {
	validity_.push_back(false);
	switch (type_) {
	case ColumnType::NUMERIC:
		numeric_.push_back(0.0);
		break;
	case ColumnType::TEXT:
		text_.emplace_back();
		break;
	case ColumnType::BOOLEAN:
		boolean_.push_back(false);
		break;
	}
}

void Column::AppendNumeric(double value) {
	CheckType(ColumnType::NUMERIC);
	validity_.push_back(true);
	numeric_.push_back(value);
}

void Column::AppendText(const std::string &value) {
	CheckType(ColumnType::TEXT);
	validity_.push_back(true);
	text_.push_back(value);
}

void Column::AppendBoolean(bool value) {
	CheckType(ColumnType::BOOLEAN);
	validity_.push_back(true);
	boolean_.push_back(value);
}

void Column::Reserve(size_t capacity) {
	validity_.reserve(capacity);
	switch (type_) {
	case ColumnType::NUMERIC:
		numeric_.reserve(capacity);
		break;
	case ColumnType::TEXT:
		text_.reserve(capacity);
		break;
	case ColumnType::BOOLEAN:
		boolean_.reserve(capacity);
		break;
	}
}

bool Column::operator==(const Column &other) const {
	if (name_ != other.name_ || type_ != other.type_ || validity_ != other.validity_) {
		return false;
	}
	for (size_t row = 0; row < validity_.size(); row++) {
		if (!validity_[row]) {
			continue;
		}
		switch (type_) {
		case ColumnType::NUMERIC:
			if (!SameNumeric(numeric_[row], other.numeric_[row])) {
				return false;
			}
			break;
		case ColumnType::TEXT:
			if (text_[row] != other.text_[row]) {
				return false;
			}
			break;
		case ColumnType::BOOLEAN:
			if (boolean_[row] != other.boolean_[row]) {
				return false;
			}
			break;
		}
	}
	return true;
}

// ============================================================================
// DataTable
// ============================================================================

DataTable::DataTable(const std::vector<ColumnDefinition> &schema) {
	for (const auto &definition : schema) {
		AddColumn(definition);
	}
}

std::vector<std::string> DataTable::ColumnNames() const {
	std::vector<std::string> names;
	names.reserve(columns_.size());
	for (const auto &column : columns_) {
		names.push_back(column->Name());
	}
	return names;
}

std::vector<ColumnDefinition> DataTable::Schema() const {
	std::vector<ColumnDefinition> schema;
	schema.reserve(columns_.size());
	for (const auto &column : columns_) {
		schema.push_back({column->Name(), column->Type()});
	}
	return schema;
}

bool DataTable::HasColumn(const std::string &name) const {
	for (const auto &column : columns_) {
		if (column->Name() == name) {
			return true;
		}
	}
	return false;
}

size_t DataTable::ColumnIndex(const std::string &name) const {
	for (size_t i = 0; i < columns_.size(); i++) {
		if (columns_[i]->Name() == name) {
			return i;
		}
	}
	throw ColumnNotFoundError(name);
}

const Column &DataTable::GetColumn(size_t index) const {
	if (index >= columns_.size()) {
		throw std::out_of_range("Column index " + std::to_string(index) + " out of bounds (" +
		                        std::to_string(columns_.size()) + " columns)");
	}
	return *columns_[index];
}

const Column &DataTable::GetColumn(const std::string &name) const {
	return *columns_[ColumnIndex(name)];
}

Column &DataTable::MutableColumn(size_t index) {
	auto &column = columns_[index];
	// Shared with another table: clone before the first write
	if (column.use_count() > 1) {
		column = std::make_shared<Column>(*column);
	}
	return *column;
}

void DataTable::AppendRow(const std::vector<Value> &row) {
	if (row.size() != columns_.size()) {
		throw std::invalid_argument("Row has " + std::to_string(row.size()) + " values, schema has " +
		                            std::to_string(columns_.size()) + " columns");
	}
	// Type-check the whole row first so a rejected row leaves no partial append
	for (size_t i = 0; i < row.size(); i++) {
		if (!row[i].IsNull() && row[i].Type() != columns_[i]->Type()) {
			throw ColumnTypeError("Cannot append " + ColumnTypeName(row[i].Type()) + " value to column '" +
			                      columns_[i]->Name() + "' of type " + ColumnTypeName(columns_[i]->Type()));
		}
	}
	for (size_t i = 0; i < row.size(); i++) {
		MutableColumn(i).Append(row[i]);
	}
	row_count_++;
}

void DataTable::AddColumn(const ColumnDefinition &definition) {
	if (row_count_ > 0) {
		throw std::logic_error("Cannot add empty column '" + definition.name + "' to a table with " +
		                       std::to_string(row_count_) + " rows; use WithColumn");
	}
	if (HasColumn(definition.name)) {
		throw DuplicateColumnError(definition.name);
	}
	columns_.push_back(std::make_shared<Column>(definition.name, definition.type));
}

DataTable DataTable::WithColumn(Column column) const {
	if (HasColumn(column.Name())) {
		throw DuplicateColumnError(column.Name());
	}
	if (column.Size() != row_count_) {
		throw std::invalid_argument("Column '" + column.Name() + "' has " + std::to_string(column.Size()) +
		                            " rows, table has " + std::to_string(row_count_));
	}
	DataTable result(*this);
	result.columns_.push_back(std::make_shared<Column>(std::move(column)));
	return result;
}

DataTable DataTable::SelectRows(const std::vector<size_t> &row_indices) const {
	DataTable result(Schema());
	for (size_t c = 0; c < columns_.size(); c++) {
		result.columns_[c]->Reserve(row_indices.size());
	}
	for (size_t row : row_indices) {
		if (row >= row_count_) {
			throw std::out_of_range("Row " + std::to_string(row) + " out of range (" + std::to_string(row_count_) +
			                        " rows)");
		}
		for (size_t c = 0; c < columns_.size(); c++) {
			result.columns_[c]->Append(columns_[c]->GetValue(row));
		}
		result.row_count_++;
	}
	return result;
}

void DataTable::ValidateUniqueKey(const std::string &key_column) const {
	const Column &keys = GetColumn(key_column);
	if (keys.Type() != ColumnType::TEXT) {
		throw ColumnTypeError("Key column '" + key_column + "' must be TEXT, got " + ColumnTypeName(keys.Type()));
	}
	std::unordered_set<std::string> seen;
	for (size_t row = 0; row < row_count_; row++) {
		if (!keys.IsValid(row)) {
			throw DuplicateKeyError("NULL key at row " + std::to_string(row) + " in column '" + key_column + "'");
		}
		if (!seen.insert(keys.GetText(row)).second) {
			throw DuplicateKeyError("Duplicate key '" + keys.GetText(row) + "' in column '" + key_column + "'");
		}
	}
}

bool DataTable::operator==(const DataTable &other) const {
	if (row_count_ != other.row_count_ || columns_.size() != other.columns_.size()) {
		return false;
	}
	for (size_t i = 0; i < columns_.size(); i++) {
		if (columns_[i] != other.columns_[i] && !(*columns_[i] == *other.columns_[i])) {
			return false;
		}
	}
	return true;
}

} // namespace core
} // namespace tsfcal
