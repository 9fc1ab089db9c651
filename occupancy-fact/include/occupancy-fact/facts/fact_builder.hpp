#pragma once

#include "occupancy-fact/core/horizon.hpp"
#include "occupancy-fact/core/records.hpp"
#include "occupancy-fact/facts/fact_table.hpp"
#include "occupancy-fact/grid/grid_filler.hpp"
#include "occupancy-fact/hybrid/hybrid_day_classifier.hpp"

#include <optional>
#include <vector>

namespace occupancyfact::facts {

/**
 * @struct FactInputs
 * @brief Cleaned, typed datasets handed to the engine. An absent dataset is
 * distinct from an empty one: absence is a MissingInput failure.
 */
struct FactInputs {
	std::optional<std::vector<core::DateRow>> dates;
	std::optional<std::vector<core::LocationRow>> locations;
	/// Required for the per-line-of-business variant only.
	std::optional<std::vector<core::LineOfBusinessRow>> lines_of_business;
	std::optional<std::vector<core::AttendanceEvent>> attendance;
	std::optional<std::vector<core::CapacitySnapshot>> capacity;
};

struct FactBuildOptions {
	/// Explicit horizon; when unset it is derived with @c horizon_policy.
	std::optional<core::Horizon> horizon;
	core::HorizonPolicy horizon_policy = core::HorizonPolicy::SnapshotCutoff;
	hybrid::HybridDayOptions hybrid;
	grid::UnknownKeyPolicy unknown_keys = grid::UnknownKeyPolicy::Error;
};

/**
 * @class FactBuilder
 * @brief Runs the engine stages in order: horizon, grid expansion, attendance
 * aggregation, zero-fill, capacity as-of join, occupancy, hybrid-day
 * classification and assembly.
 *
 * Every stage materializes fully before the next starts. A structural
 * violation aborts the build without producing a table.
 */
class FactBuilder {
public:
	explicit FactBuilder(FactBuildOptions options = {});

	/**
	 * @brief Builds one fact variant.
	 * @throws MissingInputError If a dataset the variant needs is absent.
	 * @throws EmptyDimensionError If a dimension is empty within the horizon.
	 * @throws InconsistentKeyError On a join-cardinality violation.
	 */
	FactTable build(const FactInputs &inputs, FactVariant variant) const;

	/// Builds both variants; nothing is returned unless both succeed.
	FactTables buildAll(const FactInputs &inputs) const;

	/// The horizon build() would use for @p inputs.
	core::Horizon effectiveHorizon(const FactInputs &inputs) const;

	const FactBuildOptions &options() const {
		return options_;
	}

private:
	void requireInputs(const FactInputs &inputs, FactVariant variant) const;

	FactBuildOptions options_;
};

} // namespace occupancyfact::facts
