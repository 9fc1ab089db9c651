#include "table_io.hpp"

#include "occupancy-fact/core/errors.hpp"
#include "occupancy-fact/utils/logging.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <stdexcept>

namespace occupancy {

using occupancyfact::core::AttendanceEvent;
using occupancyfact::core::CapacitySnapshot;
using occupancyfact::core::CivilDate;
using occupancyfact::core::DateRow;
using occupancyfact::core::LineOfBusinessRow;
using occupancyfact::core::LocationRow;
using duckdb::idx_t;

namespace {

duckdb::Value DateValue(const CivilDate &date) {
	return duckdb::Value::DATE(date.year(), static_cast<int32_t>(date.month()), static_cast<int32_t>(date.day()));
}

duckdb::Value OptionalBigInt(const std::optional<int64_t> &value) {
	return value ? duckdb::Value::BIGINT(*value) : duckdb::Value(duckdb::LogicalType::BIGINT);
}

duckdb::Value OptionalDouble(const std::optional<double> &value) {
	return value ? duckdb::Value::DOUBLE(*value) : duckdb::Value(duckdb::LogicalType::DOUBLE);
}

duckdb::Value OptionalVarchar(const std::optional<std::string> &value) {
	return value ? duckdb::Value(*value) : duckdb::Value(duckdb::LogicalType::VARCHAR);
}

std::string Text(const duckdb::Value &value) {
	return value.IsNull() ? std::string() : value.ToString();
}

void PrepareParent(const std::string &path) {
	const auto parent = std::filesystem::path(path).parent_path();
	if (!parent.empty()) {
		std::filesystem::create_directories(parent);
	}
}

} // namespace

TableIO::TableIO() : db_(nullptr), connection_(db_) {
}

bool TableIO::FileExists(const std::string &path) {
	std::error_code ec;
	return std::filesystem::is_regular_file(path, ec);
}

std::string TableIO::QuoteLiteral(const std::string &text) {
	std::string quoted = "'";
	for (char c : text) {
		if (c == '\'') {
			quoted += '\'';
		}
		quoted += c;
	}
	quoted += '\'';
	return quoted;
}

duckdb::unique_ptr<duckdb::MaterializedQueryResult> TableIO::Query(const std::string &sql) {
	auto result = connection_.Query(sql);
	if (result->HasError()) {
		throw std::runtime_error("Query failed: " + result->GetError());
	}
	return result;
}

duckdb::unique_ptr<duckdb::MaterializedQueryResult> TableIO::ReadCsv(const std::string &path,
                                                                     const std::string &columns,
                                                                     const std::string &dataset) {
	if (!FileExists(path)) {
		throw occupancyfact::MissingInputError(dataset + " (" + path + ")");
	}
	auto result = Query("SELECT " + columns + " FROM read_csv_auto(" + QuoteLiteral(path) +
	                    ", header = true, all_varchar = true)");
	OCCUPANCY_DEBUG("Read {} rows of {} from {}", result->RowCount(), dataset, path);
	return result;
}

std::vector<DateRow> TableIO::ReadDateDimension(const std::string &path) {
	auto result = ReadCsv(path,
	                      "CAST(CAST(\"date\" AS TIMESTAMP) AS DATE)::VARCHAR AS date_text, "
	                      "CAST(date_key AS INTEGER) AS date_key",
	                      "date dimension");

	std::vector<DateRow> rows;
	rows.reserve(result->RowCount());
	for (idx_t i = 0; i < result->RowCount(); i++) {
		auto date_value = result->GetValue(0, i);
		auto key_value = result->GetValue(1, i);
		if (date_value.IsNull() || key_value.IsNull()) {
			throw occupancyfact::InconsistentKeyError("date dimension row " + std::to_string(i + 1) +
			                                          " has no date or date_key");
		}
		auto row = DateRow::fromDate(CivilDate::parse(date_value.ToString()));
		const auto key = key_value.GetValue<int32_t>();
		if (key != row.date_key) {
			throw occupancyfact::InconsistentKeyError("date_key " + std::to_string(key) + " does not match date " +
			                                          row.date.toString());
		}
		rows.push_back(row);
	}
	return rows;
}

std::vector<LocationRow> TableIO::ReadLocationDimension(const std::string &path) {
	auto result = ReadCsv(path, "CAST(location_key AS BIGINT), office_location", "location dimension");

	std::vector<LocationRow> rows;
	rows.reserve(result->RowCount());
	for (idx_t i = 0; i < result->RowCount(); i++) {
		auto key_value = result->GetValue(0, i);
		auto name_value = result->GetValue(1, i);
		if (key_value.IsNull() || name_value.IsNull()) {
			throw occupancyfact::InconsistentKeyError("location dimension row " + std::to_string(i + 1) +
			                                          " has no key or name");
		}
		rows.push_back(LocationRow {key_value.GetValue<int64_t>(), name_value.ToString()});
	}
	return rows;
}

std::vector<LineOfBusinessRow> TableIO::ReadLineOfBusinessDimension(const std::string &path) {
	auto result = ReadCsv(path, "CAST(lob_key AS BIGINT), line_of_business", "line of business dimension");

	std::vector<LineOfBusinessRow> rows;
	rows.reserve(result->RowCount());
	for (idx_t i = 0; i < result->RowCount(); i++) {
		auto key_value = result->GetValue(0, i);
		auto name_value = result->GetValue(1, i);
		if (key_value.IsNull() || name_value.IsNull()) {
			throw occupancyfact::InconsistentKeyError("line of business dimension row " + std::to_string(i + 1) +
			                                          " has no key or name");
		}
		rows.push_back(LineOfBusinessRow {key_value.GetValue<int64_t>(), name_value.ToString()});
	}
	return rows;
}

std::vector<AttendanceEvent> TableIO::ReadAttendance(const std::string &path) {
	auto result = ReadCsv(path,
	                      "CAST(TRY_CAST(logon_date AS TIMESTAMP) AS DATE)::VARCHAR, office_location, "
	                      "line_of_business",
	                      "attendance events");

	std::vector<AttendanceEvent> events;
	events.reserve(result->RowCount());
	idx_t skipped = 0;
	for (idx_t i = 0; i < result->RowCount(); i++) {
		auto date_value = result->GetValue(0, i);
		auto office_value = result->GetValue(1, i);
		if (date_value.IsNull() || office_value.IsNull()) {
			skipped++;
			continue;
		}
		events.push_back(AttendanceEvent {CivilDate::parse(date_value.ToString()), office_value.ToString(),
		                                  Text(result->GetValue(2, i))});
	}
	if (skipped > 0) {
		OCCUPANCY_WARN("Skipped {} attendance rows without a logon date or office", skipped);
	}
	return events;
}

std::vector<CapacitySnapshot> TableIO::ReadCapacity(const std::string &path) {
	// Desk counts may arrive as floating point text ("120.0").
	auto result = ReadCsv(path,
	                      "CAST(TRY_CAST(\"date\" AS TIMESTAMP) AS DATE)::VARCHAR, office_location, "
	                      "TRY_CAST(ROUND(TRY_CAST(deskcount AS DOUBLE)) AS BIGINT)",
	                      "capacity snapshots");

	std::vector<CapacitySnapshot> snapshots;
	snapshots.reserve(result->RowCount());
	idx_t skipped = 0;
	for (idx_t i = 0; i < result->RowCount(); i++) {
		auto date_value = result->GetValue(0, i);
		auto office_value = result->GetValue(1, i);
		if (date_value.IsNull() || office_value.IsNull()) {
			skipped++;
			continue;
		}
		CapacitySnapshot snapshot;
		snapshot.office_location = office_value.ToString();
		snapshot.effective_date = CivilDate::parse(date_value.ToString());
		auto capacity_value = result->GetValue(2, i);
		if (!capacity_value.IsNull()) {
			snapshot.capacity = capacity_value.GetValue<int64_t>();
		}
		snapshots.push_back(std::move(snapshot));
	}
	if (skipped > 0) {
		OCCUPANCY_WARN("Skipped {} capacity rows without a date or office", skipped);
	}
	return snapshots;
}

void TableIO::CopyToCsv(const std::string &source, const std::string &path) {
	PrepareParent(path);
	Query("COPY " + source + " TO " + QuoteLiteral(path) + " (HEADER, DELIMITER ',')");
}

void TableIO::WriteFactTable(const occupancyfact::facts::FactTable &table, const std::string &path) {
	const bool by_lob = table.byLineOfBusiness();
	Query(std::string("CREATE OR REPLACE TABLE fact_out (date_key INTEGER, location_key BIGINT, ") +
	      (by_lob ? "lob_key BIGINT, " : "") + "\"date\" DATE, office_location VARCHAR, " +
	      (by_lob ? "line_of_business VARCHAR, " : "") +
	      "\"year\" INTEGER, \"month\" INTEGER, is_weekend BOOLEAN, attendance_count BIGINT, deskcount BIGINT, "
	      "occupancy_rate DOUBLE, is_hybrid_day BOOLEAN)");

	{
		duckdb::Appender appender(connection_, "fact_out");
		for (const auto &row : table.rows) {
			appender.BeginRow();
			appender.Append<int32_t>(row.date_key);
			appender.Append<int64_t>(row.location_key);
			if (by_lob) {
				appender.Append(OptionalBigInt(row.lob_key));
			}
			appender.Append(DateValue(row.date));
			appender.Append(duckdb::Value(row.location_name));
			if (by_lob) {
				appender.Append(OptionalVarchar(row.lob_name));
			}
			appender.Append<int32_t>(row.year);
			appender.Append<int32_t>(static_cast<int32_t>(row.month));
			appender.Append<bool>(row.is_weekend);
			appender.Append<int64_t>(row.attendance_count);
			appender.Append(OptionalBigInt(row.capacity));
			appender.Append(OptionalDouble(row.occupancy_rate));
			appender.Append<bool>(row.is_hybrid_day);
			appender.EndRow();
		}
		appender.Close();
	}

	CopyToCsv("fact_out", path);
	Query("DROP TABLE fact_out");
	OCCUPANCY_INFO("Wrote {} rows to {}", table.size(), path);
}

void TableIO::WriteLocationSummary(const occupancyfact::quality::QualitySummary &summary, const std::string &path) {
	Query("CREATE OR REPLACE TABLE location_summary (office_location VARCHAR, \"rows\" BIGINT, "
	      "mean_occupancy_rate DOUBLE, unresolved_capacity_rows BIGINT, over_capacity_days BIGINT, position BIGINT)");
	{
		duckdb::Appender appender(connection_, "location_summary");
		int64_t position = 0;
		for (const auto &location : summary.by_location) {
			appender.BeginRow();
			appender.Append(duckdb::Value(location.office_location));
			appender.Append<int64_t>(static_cast<int64_t>(location.rows));
			appender.Append(OptionalDouble(location.mean_weekday_rate));
			appender.Append<int64_t>(static_cast<int64_t>(location.unresolved_capacity_rows));
			appender.Append<int64_t>(static_cast<int64_t>(location.over_capacity_days));
			appender.Append<int64_t>(position++);
			appender.EndRow();
		}
		appender.Close();
	}

	CopyToCsv("(SELECT office_location, \"rows\", ROUND(mean_occupancy_rate, 4) AS mean_occupancy_rate, "
	          "unresolved_capacity_rows, over_capacity_days FROM location_summary ORDER BY position)",
	          path);
	Query("DROP TABLE location_summary");
}

void TableIO::WriteOverCapacityDays(const occupancyfact::facts::FactTable &table,
                                    const occupancyfact::quality::QualitySummary &summary, const std::string &path) {
	const bool by_lob = table.byLineOfBusiness();
	Query(std::string("CREATE OR REPLACE TABLE over_capacity (\"date\" DATE, office_location VARCHAR, ") +
	      (by_lob ? "line_of_business VARCHAR, " : "") +
	      "attendance_count BIGINT, deskcount BIGINT, occupancy_rate DOUBLE)");
	{
		duckdb::Appender appender(connection_, "over_capacity");
		for (const auto index : summary.over_capacity_indices) {
			if (index >= table.rows.size()) {
				throw std::out_of_range("Over-capacity row " + std::to_string(index) + " is outside the fact table");
			}
			const auto &row = table.rows[index];
			appender.BeginRow();
			appender.Append(DateValue(row.date));
			appender.Append(duckdb::Value(row.location_name));
			if (by_lob) {
				appender.Append(OptionalVarchar(row.lob_name));
			}
			appender.Append<int64_t>(row.attendance_count);
			appender.Append(OptionalBigInt(row.capacity));
			appender.Append(OptionalDouble(row.occupancy_rate));
			appender.EndRow();
		}
		appender.Close();
	}

	CopyToCsv(std::string("(SELECT * FROM over_capacity ORDER BY office_location, \"date\"") +
	              (by_lob ? ", line_of_business" : "") + ")",
	          path);
	Query("DROP TABLE over_capacity");
}

} // namespace occupancy
