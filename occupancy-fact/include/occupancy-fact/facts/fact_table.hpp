#pragma once

#include "occupancy-fact/core/calendar.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace occupancyfact::facts {

/**
 * @struct FactRow
 * @brief One day of one office (and line of business, for the per-LOB fact).
 */
struct FactRow {
	std::int32_t date_key = 0;
	std::int64_t location_key = 0;
	std::optional<std::int64_t> lob_key;
	core::CivilDate date;
	std::string location_name;
	std::optional<std::string> lob_name;
	int year = 0;
	unsigned month = 0;
	bool is_weekend = false;
	std::int64_t attendance_count = 0;
	std::optional<std::int64_t> capacity;
	std::optional<double> occupancy_rate;
	bool is_hybrid_day = false;
};

enum class FactVariant {
	PerLineOfBusiness,
	Aggregated
};

const char *factVariantName(FactVariant variant);

struct FactTable {
	FactVariant variant = FactVariant::Aggregated;
	std::vector<FactRow> rows;

	bool byLineOfBusiness() const {
		return variant == FactVariant::PerLineOfBusiness;
	}
	std::size_t size() const {
		return rows.size();
	}
	bool empty() const {
		return rows.empty();
	}
};

/// The two artifacts of a pipeline run.
struct FactTables {
	FactTable per_line_of_business;
	FactTable aggregated;
};

} // namespace occupancyfact::facts
