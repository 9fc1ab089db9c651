#include "occupancy-fact/grid/grid_expander.hpp"

#include "occupancy-fact/core/errors.hpp"
#include "occupancy-fact/utils/logging.hpp"

#include <algorithm>
#include <unordered_set>
#include <utility>

namespace occupancyfact::grid {

namespace {

template <typename Row, typename NaturalKey, typename SurrogateKey>
void requireUniqueKeys(const std::vector<Row> &rows, const std::string &dimension, NaturalKey natural_key,
                       SurrogateKey surrogate_key) {
	std::unordered_set<std::string> natural_seen;
	std::unordered_set<std::int64_t> surrogate_seen;
	for (const auto &row : rows) {
		if (!natural_seen.insert(natural_key(row)).second) {
			throw InconsistentKeyError("dimension '" + dimension + "' repeats natural key '" + natural_key(row) + "'");
		}
		if (!surrogate_seen.insert(surrogate_key(row)).second) {
			throw InconsistentKeyError("dimension '" + dimension + "' repeats surrogate key " +
			                           std::to_string(surrogate_key(row)));
		}
	}
}

} // namespace

FactGrid::FactGrid(std::vector<core::DateRow> dates, std::vector<core::LocationRow> locations,
                   std::optional<std::vector<core::LineOfBusinessRow>> lines_of_business)
    : dates_(std::move(dates)), locations_(std::move(locations)), by_lob_(lines_of_business.has_value()) {
	if (dates_.empty()) {
		throw EmptyDimensionError("date");
	}
	if (locations_.empty()) {
		throw EmptyDimensionError("location");
	}
	if (by_lob_) {
		lines_of_business_ = std::move(*lines_of_business);
		if (lines_of_business_.empty()) {
			throw EmptyDimensionError("line of business");
		}
	}

	requireUniqueKeys(
	    dates_, "date", [](const core::DateRow &row) { return row.date.toString(); },
	    [](const core::DateRow &row) { return static_cast<std::int64_t>(row.date_key); });
	requireUniqueKeys(
	    locations_, "location", [](const core::LocationRow &row) { return row.office_location; },
	    [](const core::LocationRow &row) { return row.location_key; });
	requireUniqueKeys(
	    lines_of_business_, "line of business",
	    [](const core::LineOfBusinessRow &row) { return row.line_of_business; },
	    [](const core::LineOfBusinessRow &row) { return row.lob_key; });

	std::sort(dates_.begin(), dates_.end(), [](const core::DateRow &a, const core::DateRow &b) { return a.date < b.date; });
	std::sort(locations_.begin(), locations_.end(), [](const core::LocationRow &a, const core::LocationRow &b) {
		return a.office_location < b.office_location;
	});
	std::sort(lines_of_business_.begin(), lines_of_business_.end(),
	          [](const core::LineOfBusinessRow &a, const core::LineOfBusinessRow &b) {
		          return a.line_of_business < b.line_of_business;
	          });

	indexDimensions();

	const std::size_t slots = lobSlots();
	cells_.reserve(dates_.size() * locations_.size() * slots);
	for (std::size_t d = 0; d < dates_.size(); ++d) {
		for (std::size_t l = 0; l < locations_.size(); ++l) {
			for (std::size_t b = 0; b < slots; ++b) {
				cells_.push_back(GridCell{d, l, b});
			}
		}
	}
}

void FactGrid::indexDimensions() {
	date_lookup_.reserve(dates_.size());
	for (std::size_t i = 0; i < dates_.size(); ++i) {
		date_lookup_.emplace(dates_[i].date.serial(), i);
	}
	location_lookup_.reserve(locations_.size());
	for (std::size_t i = 0; i < locations_.size(); ++i) {
		location_lookup_.emplace(locations_[i].office_location, i);
	}
	lob_lookup_.reserve(lines_of_business_.size());
	for (std::size_t i = 0; i < lines_of_business_.size(); ++i) {
		lob_lookup_.emplace(lines_of_business_[i].line_of_business, i);
	}
}

std::optional<std::size_t> FactGrid::dateIndex(const core::CivilDate &date) const {
	const auto it = date_lookup_.find(date.serial());
	if (it == date_lookup_.end()) {
		return std::nullopt;
	}
	return it->second;
}

std::optional<std::size_t> FactGrid::locationIndex(const std::string &office_location) const {
	const auto it = location_lookup_.find(office_location);
	if (it == location_lookup_.end()) {
		return std::nullopt;
	}
	return it->second;
}

std::optional<std::size_t> FactGrid::lobIndex(const std::string &line_of_business) const {
	const auto it = lob_lookup_.find(line_of_business);
	if (it == lob_lookup_.end()) {
		return std::nullopt;
	}
	return it->second;
}

FactGrid expandGrid(const std::vector<core::DateRow> &dates, const std::vector<core::LocationRow> &locations) {
	FactGrid grid(dates, locations, std::nullopt);
	OCCUPANCY_INFO("Expanded grid: {} dates x {} locations = {} cells", grid.dates().size(),
	               grid.locations().size(), grid.size());
	return grid;
}

FactGrid expandGrid(const std::vector<core::DateRow> &dates, const std::vector<core::LocationRow> &locations,
                    const std::vector<core::LineOfBusinessRow> &lines_of_business) {
	FactGrid grid(dates, locations, lines_of_business);
	OCCUPANCY_INFO("Expanded grid: {} dates x {} locations x {} lines of business = {} cells", grid.dates().size(),
	               grid.locations().size(), grid.linesOfBusiness().size(), grid.size());
	return grid;
}

} // namespace occupancyfact::grid
