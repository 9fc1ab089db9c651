#include "occupancy_pipeline.hpp"

#include "occupancy-fact/core/errors.hpp"
#include "occupancy-fact/quality/data_quality.hpp"
#include "occupancy-fact/utils/logging.hpp"

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <utility>

namespace occupancy {

using occupancyfact::core::CivilDate;
using occupancyfact::facts::FactBuilder;
using occupancyfact::facts::FactInputs;
using occupancyfact::facts::FactTable;
using occupancyfact::facts::FactVariant;

OccupancyPipeline::OccupancyPipeline(PipelineConfig config) : config_(std::move(config)) {
	config_.Validate();
}

std::vector<std::string> OccupancyPipeline::RequiredInputs() const {
	std::vector<std::string> required;
	if (!config_.synthesize_date_dimension) {
		required.push_back(InputLayout::DATE_DIMENSION);
	}
	required.push_back(InputLayout::LOCATION_DIMENSION);
	if (config_.Builds(FactVariant::PerLineOfBusiness)) {
		required.push_back(InputLayout::LOB_DIMENSION);
	}
	required.push_back(InputLayout::ATTENDANCE);
	required.push_back(InputLayout::CAPACITY);
	return required;
}

void OccupancyPipeline::CheckInputsPresent() const {
	std::string missing;
	for (const auto &relative : RequiredInputs()) {
		const auto path = config_.InputPath(relative.c_str());
		if (!TableIO::FileExists(path)) {
			missing += missing.empty() ? path : ", " + path;
		}
	}
	if (!missing.empty()) {
		throw occupancyfact::MissingInputError(missing);
	}
}

FactInputs OccupancyPipeline::LoadInputs(TableIO &io) const {
	FactInputs inputs;
	inputs.locations = io.ReadLocationDimension(config_.InputPath(InputLayout::LOCATION_DIMENSION));
	if (config_.Builds(FactVariant::PerLineOfBusiness)) {
		inputs.lines_of_business = io.ReadLineOfBusinessDimension(config_.InputPath(InputLayout::LOB_DIMENSION));
	}
	inputs.attendance = io.ReadAttendance(config_.InputPath(InputLayout::ATTENDANCE));
	inputs.capacity = io.ReadCapacity(config_.InputPath(InputLayout::CAPACITY));

	if (!config_.synthesize_date_dimension) {
		inputs.dates = io.ReadDateDimension(config_.InputPath(InputLayout::DATE_DIMENSION));
	} else {
		// Cover every observed date and the explicit horizon, if any.
		std::optional<CivilDate> first = config_.start;
		std::optional<CivilDate> last = config_.cutoff;
		auto widen = [&](const CivilDate &date) {
			if (!first || date < *first) {
				first = date;
			}
			if (!last || *last < date) {
				last = date;
			}
		};
		for (const auto &event : *inputs.attendance) {
			widen(event.date);
		}
		for (const auto &snapshot : *inputs.capacity) {
			widen(snapshot.effective_date);
		}
		inputs.dates.emplace();
		if (first && last) {
			*inputs.dates = occupancyfact::core::buildDateDimension(*first, *last);
		}
		OCCUPANCY_INFO("Synthesized a date dimension of {} days", inputs.dates->size());
	}

	OCCUPANCY_INFO("Loaded {} dates, {} locations, {} lines of business, {} attendance events, {} capacity snapshots",
	               inputs.dates->size(), inputs.locations->size(),
	               inputs.lines_of_business ? inputs.lines_of_business->size() : 0, inputs.attendance->size(),
	               inputs.capacity->size());
	return inputs;
}

PipelineResult OccupancyPipeline::Run() {
	CheckInputsPresent();

	TableIO io;
	const auto inputs = LoadInputs(io);

	PipelineResult result;
	if (config_.Builds(FactVariant::PerLineOfBusiness)) {
		const FactBuilder builder(config_.BuildOptions(FactVariant::PerLineOfBusiness));
		result.per_line_of_business = builder.build(inputs, FactVariant::PerLineOfBusiness);
	}
	if (config_.Builds(FactVariant::Aggregated)) {
		const FactBuilder builder(config_.BuildOptions(FactVariant::Aggregated));
		result.aggregated = builder.build(inputs, FactVariant::Aggregated);
	}

	if (result.per_line_of_business) {
		const auto path = config_.OutputPath(OutputLayout::LOB_FACT);
		io.WriteFactTable(*result.per_line_of_business, path);
		result.written_files.push_back(path);
	}
	if (result.aggregated) {
		const auto path = config_.OutputPath(OutputLayout::AGGREGATED_FACT);
		io.WriteFactTable(*result.aggregated, path);
		result.written_files.push_back(path);
	}
	if (config_.write_reports) {
		auto reports = WriteReports(io, inputs, result);
		result.written_files.insert(result.written_files.end(), reports.begin(), reports.end());
	}
	return result;
}

std::vector<std::string> OccupancyPipeline::WriteReports(TableIO &io, const FactInputs &inputs,
                                                         const PipelineResult &result) const {
	std::vector<std::string> lines;
	std::vector<std::string> written;

	for (const auto *table : {result.per_line_of_business ? &*result.per_line_of_business : nullptr,
	                          result.aggregated ? &*result.aggregated : nullptr}) {
		if (!table) {
			continue;
		}
		const auto summary = occupancyfact::quality::summarizeQuality(*table);
		for (auto &line : occupancyfact::quality::summaryLines(summary)) {
			OCCUPANCY_INFO("{}", line);
			lines.push_back(std::move(line));
		}
		lines.emplace_back();
	}

	const auto &events = *inputs.attendance;
	const auto &snapshots = *inputs.capacity;
	if (!events.empty() && !snapshots.empty()) {
		const auto latest_event = std::max_element(events.begin(), events.end(), [](const auto &a, const auto &b) {
			                          return a.date < b.date;
		                          })->date;
		const auto latest_snapshot =
		    std::max_element(snapshots.begin(), snapshots.end(), [](const auto &a, const auto &b) {
			    return a.effective_date < b.effective_date;
		    })->effective_date;
		lines.push_back(fmt::format("Latest occupancy: {}, latest deskcount: {}, gap: {} days",
		                            latest_event.toString(), latest_snapshot.toString(),
		                            latest_event.serial() - latest_snapshot.serial()));
	}

	const auto summary_path = config_.OutputPath(OutputLayout::VALIDATION_SUMMARY);
	std::filesystem::create_directories(std::filesystem::path(summary_path).parent_path());
	std::ofstream out(summary_path);
	if (!out) {
		throw std::runtime_error("Cannot write " + summary_path);
	}
	for (const auto &line : lines) {
		out << line << '\n';
	}
	out.close();
	written.push_back(summary_path);

	// Per-location figures come from the office-level fact when it is built.
	const FactTable &report_table = result.aggregated ? *result.aggregated : *result.per_line_of_business;
	const auto summary = occupancyfact::quality::summarizeQuality(report_table);

	const auto location_path = config_.OutputPath(OutputLayout::LOCATION_SUMMARY);
	io.WriteLocationSummary(summary, location_path);
	written.push_back(location_path);

	if (!summary.over_capacity_indices.empty()) {
		const auto over_capacity_path = config_.OutputPath(OutputLayout::OVER_CAPACITY_DAYS);
		io.WriteOverCapacityDays(report_table, summary, over_capacity_path);
		written.push_back(over_capacity_path);
		OCCUPANCY_WARN("{} {} fact rows exceed capacity", summary.over_capacity_rows,
		               occupancyfact::facts::factVariantName(report_table.variant));
	}
	return written;
}

} // namespace occupancy
