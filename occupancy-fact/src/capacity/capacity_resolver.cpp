#include "occupancy-fact/capacity/capacity_resolver.hpp"

#include "occupancy-fact/utils/logging.hpp"

#include <algorithm>
#include <stdexcept>

namespace occupancyfact::capacity {

void CapacityTimeline::apply(const core::CapacitySnapshot &snapshot) {
	if (last_effective_ && snapshot.effective_date < *last_effective_) {
		throw std::invalid_argument("Capacity snapshots must be applied in effective-date order.");
	}
	last_effective_ = snapshot.effective_date;
	if (snapshot.isValid()) {
		current_ = snapshot.capacity;
	}
}

CapacityResolution resolveCapacity(const grid::FactGrid &grid, const std::vector<core::CapacitySnapshot> &snapshots) {
	const auto &dates = grid.dates();
	const auto &locations = grid.locations();

	std::vector<std::vector<const core::CapacitySnapshot *>> by_location(locations.size());
	CapacityResolution resolution;
	for (const auto &snapshot : snapshots) {
		if (!snapshot.isValid()) {
			++resolution.invalid_snapshots;
		}
		const auto location_index = grid.locationIndex(snapshot.office_location);
		if (!location_index) {
			++resolution.ignored_snapshots;
			continue;
		}
		by_location[*location_index].push_back(&snapshot);
	}

	// Capacity per (date, location), date-major like the grid.
	std::vector<std::optional<std::int64_t>> resolved(dates.size() * locations.size());
	for (std::size_t l = 0; l < locations.size(); ++l) {
		auto &history = by_location[l];
		std::stable_sort(history.begin(), history.end(),
		                 [](const core::CapacitySnapshot *a, const core::CapacitySnapshot *b) {
			                 return a->effective_date < b->effective_date;
		                 });

		CapacityTimeline timeline;
		std::size_t next = 0;
		for (std::size_t d = 0; d < dates.size(); ++d) {
			while (next < history.size() && history[next]->effective_date <= dates[d].date) {
				timeline.apply(*history[next]);
				++next;
			}
			resolved[d * locations.size() + l] = timeline.current();
		}
		OCCUPANCY_DEBUG("Capacity for '{}': {} snapshots, final value {}", locations[l].office_location,
		                history.size(), timeline.isKnown() ? std::to_string(*timeline.current()) : "unknown");
	}

	resolution.capacity.reserve(grid.size());
	for (const auto &cell : grid.cells()) {
		const auto &value = resolved[cell.date_index * locations.size() + cell.location_index];
		resolution.capacity.push_back(value);
		if (value) {
			++resolution.resolved_cells;
		} else {
			++resolution.unresolved_cells;
		}
	}

	if (resolution.ignored_snapshots > 0) {
		OCCUPANCY_WARN("Ignored {} capacity snapshots for offices outside the location dimension",
		               resolution.ignored_snapshots);
	}
	OCCUPANCY_INFO("Capacity resolved on {} of {} cells", resolution.resolved_cells, grid.size());
	return resolution;
}

} // namespace occupancyfact::capacity
