#pragma once

#include "duckdb.hpp"

#include "occupancy-fact/core/records.hpp"
#include "occupancy-fact/facts/fact_table.hpp"
#include "occupancy-fact/quality/data_quality.hpp"

#include <memory>
#include <string>
#include <vector>

namespace occupancy {

//! Reads the cleaned CSV inputs and writes the fact and report CSV files through an in-memory DuckDB database.
class TableIO {
public:
	TableIO();

	std::vector<occupancyfact::core::DateRow> ReadDateDimension(const std::string &path);
	std::vector<occupancyfact::core::LocationRow> ReadLocationDimension(const std::string &path);
	std::vector<occupancyfact::core::LineOfBusinessRow> ReadLineOfBusinessDimension(const std::string &path);
	std::vector<occupancyfact::core::AttendanceEvent> ReadAttendance(const std::string &path);
	std::vector<occupancyfact::core::CapacitySnapshot> ReadCapacity(const std::string &path);

	void WriteFactTable(const occupancyfact::facts::FactTable &table, const std::string &path);
	void WriteLocationSummary(const occupancyfact::quality::QualitySummary &summary, const std::string &path);
	//! Writes the over-capacity rows of table, ordered by office and date
	void WriteOverCapacityDays(const occupancyfact::facts::FactTable &table,
	                           const occupancyfact::quality::QualitySummary &summary, const std::string &path);

	static bool FileExists(const std::string &path);
	//! Quotes text as a SQL string literal
	static std::string QuoteLiteral(const std::string &text);

private:
	duckdb::unique_ptr<duckdb::MaterializedQueryResult> Query(const std::string &sql);
	duckdb::unique_ptr<duckdb::MaterializedQueryResult> ReadCsv(const std::string &path, const std::string &columns,
	                                                            const std::string &dataset);
	//! source is a table name or a parenthesized query
	void CopyToCsv(const std::string &source, const std::string &path);

	duckdb::DuckDB db_;
	duckdb::Connection connection_;
};

} // namespace occupancy
