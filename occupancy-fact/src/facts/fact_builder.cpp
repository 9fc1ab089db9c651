#include "occupancy-fact/facts/fact_builder.hpp"

#include "occupancy-fact/capacity/capacity_resolver.hpp"
#include "occupancy-fact/core/errors.hpp"
#include "occupancy-fact/facts/fact_assembler.hpp"
#include "occupancy-fact/facts/occupancy.hpp"
#include "occupancy-fact/grid/attendance_aggregator.hpp"
#include "occupancy-fact/grid/grid_expander.hpp"
#include "occupancy-fact/utils/logging.hpp"

#include <algorithm>
#include <iterator>
#include <stdexcept>
#include <utility>

namespace occupancyfact::facts {

FactBuilder::FactBuilder(FactBuildOptions options) : options_(std::move(options)) {
	options_.hybrid.validate();
	if (options_.horizon && options_.horizon->cutoff < options_.horizon->start) {
		throw std::invalid_argument("Horizon cutoff must not precede its start.");
	}
}

void FactBuilder::requireInputs(const FactInputs &inputs, FactVariant variant) const {
	if (!inputs.dates) {
		throw MissingInputError("date dimension");
	}
	if (!inputs.locations) {
		throw MissingInputError("location dimension");
	}
	if (variant == FactVariant::PerLineOfBusiness && !inputs.lines_of_business) {
		throw MissingInputError("line of business dimension");
	}
	if (!inputs.attendance) {
		throw MissingInputError("attendance events");
	}
	if (!inputs.capacity) {
		throw MissingInputError("capacity snapshots");
	}
}

core::Horizon FactBuilder::effectiveHorizon(const FactInputs &inputs) const {
	if (options_.horizon) {
		return *options_.horizon;
	}
	if (!inputs.attendance) {
		throw MissingInputError("attendance events");
	}
	if (!inputs.capacity) {
		throw MissingInputError("capacity snapshots");
	}
	return core::resolveHorizon(*inputs.attendance, *inputs.capacity, options_.horizon_policy);
}

FactTable FactBuilder::build(const FactInputs &inputs, FactVariant variant) const {
	requireInputs(inputs, variant);

	const auto horizon = effectiveHorizon(inputs);
	OCCUPANCY_INFO("Building {} fact over {} .. {} ({} days)", factVariantName(variant), horizon.start.toString(),
	               horizon.cutoff.toString(), horizon.days());

	const auto dates = core::restrictToHorizon(*inputs.dates, horizon);
	const auto fact_grid = variant == FactVariant::PerLineOfBusiness
	                           ? grid::expandGrid(dates, *inputs.locations, *inputs.lines_of_business)
	                           : grid::expandGrid(dates, *inputs.locations);

	std::vector<core::AttendanceEvent> in_horizon;
	in_horizon.reserve(inputs.attendance->size());
	std::copy_if(inputs.attendance->begin(), inputs.attendance->end(), std::back_inserter(in_horizon),
	             [&](const core::AttendanceEvent &event) { return horizon.contains(event.date); });
	if (in_horizon.size() != inputs.attendance->size()) {
		OCCUPANCY_DEBUG("Excluded {} attendance events outside the horizon",
		                inputs.attendance->size() - in_horizon.size());
	}

	const auto grain = variant == FactVariant::PerLineOfBusiness ? grid::AttendanceGrain::ByLineOfBusiness
	                                                             : grid::AttendanceGrain::AcrossLinesOfBusiness;
	const auto buckets = grid::aggregateAttendance(in_horizon, grain);
	auto filled = grid::fillAttendance(fact_grid, buckets, options_.unknown_keys);

	auto capacity = capacity::resolveCapacity(fact_grid, *inputs.capacity);
	auto rates = computeOccupancy(filled.attendance, capacity.capacity);

	const hybrid::HybridDayClassifier classifier(options_.hybrid);
	auto hybrid_days = classifier.classify(fact_grid, filled.attendance);

	DerivedColumns columns;
	columns.attendance = std::move(filled.attendance);
	columns.capacity = std::move(capacity.capacity);
	columns.occupancy_rate = std::move(rates);
	columns.is_hybrid_day = std::move(hybrid_days.cell_flags);
	return assembleFacts(fact_grid, columns);
}

FactTables FactBuilder::buildAll(const FactInputs &inputs) const {
	requireInputs(inputs, FactVariant::PerLineOfBusiness);
	FactTables tables;
	tables.per_line_of_business = build(inputs, FactVariant::PerLineOfBusiness);
	tables.aggregated = build(inputs, FactVariant::Aggregated);
	return tables;
}

} // namespace occupancyfact::facts
