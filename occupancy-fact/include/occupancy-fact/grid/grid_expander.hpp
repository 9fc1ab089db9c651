#pragma once

#include "occupancy-fact/core/calendar.hpp"
#include "occupancy-fact/core/records.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace occupancyfact::grid {

/// One (date, location[, line of business]) combination of the fact key space.
struct GridCell {
	std::size_t date_index = 0;
	std::size_t location_index = 0;
	std::size_t lob_index = 0;
};

/**
 * @class FactGrid
 * @brief The exhaustive key space of a fact table: the cartesian product of
 * the date, location and (optionally) line-of-business dimensions.
 *
 * Dimensions are held in output order (dates ascending, locations and lines of
 * business by name), and cells are laid out date-major so that
 * @c cellIndex(d, l, b) addresses a cell without a lookup.
 */
class FactGrid {
public:
	FactGrid(std::vector<core::DateRow> dates, std::vector<core::LocationRow> locations,
	         std::optional<std::vector<core::LineOfBusinessRow>> lines_of_business);

	const std::vector<core::DateRow> &dates() const {
		return dates_;
	}
	const std::vector<core::LocationRow> &locations() const {
		return locations_;
	}
	const std::vector<core::LineOfBusinessRow> &linesOfBusiness() const {
		return lines_of_business_;
	}
	const std::vector<GridCell> &cells() const {
		return cells_;
	}

	bool byLineOfBusiness() const {
		return by_lob_;
	}

	/// Number of line-of-business slots per (date, location); 1 when aggregated.
	std::size_t lobSlots() const {
		return by_lob_ ? lines_of_business_.size() : 1;
	}

	std::size_t size() const {
		return cells_.size();
	}

	std::size_t cellIndex(std::size_t date_index, std::size_t location_index, std::size_t lob_index = 0) const {
		return (date_index * locations_.size() + location_index) * lobSlots() + lob_index;
	}

	std::optional<std::size_t> dateIndex(const core::CivilDate &date) const;
	std::optional<std::size_t> locationIndex(const std::string &office_location) const;
	std::optional<std::size_t> lobIndex(const std::string &line_of_business) const;

private:
	void indexDimensions();

	std::vector<core::DateRow> dates_;
	std::vector<core::LocationRow> locations_;
	std::vector<core::LineOfBusinessRow> lines_of_business_;
	bool by_lob_ = false;
	std::vector<GridCell> cells_;
	std::unordered_map<std::int64_t, std::size_t> date_lookup_;
	std::unordered_map<std::string, std::size_t> location_lookup_;
	std::unordered_map<std::string, std::size_t> lob_lookup_;
};

/**
 * @brief Expands the date and location dimensions into the aggregated grid.
 * @throws EmptyDimensionError If either dimension is empty.
 * @throws InconsistentKeyError If a dimension repeats a natural or surrogate key.
 */
FactGrid expandGrid(const std::vector<core::DateRow> &dates, const std::vector<core::LocationRow> &locations);

/// Per-line-of-business variant of expandGrid().
FactGrid expandGrid(const std::vector<core::DateRow> &dates, const std::vector<core::LocationRow> &locations,
                    const std::vector<core::LineOfBusinessRow> &lines_of_business);

} // namespace occupancyfact::grid
