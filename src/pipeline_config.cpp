#include "pipeline_config.hpp"

#include "occupancy-fact/utils/logging.hpp"

#include <filesystem>
#include <sstream>
#include <stdexcept>

namespace occupancy {

using occupancyfact::core::CivilDate;
using occupancyfact::core::HorizonPolicy;
using occupancyfact::facts::FactVariant;

bool PipelineConfig::Builds(FactVariant variant) const {
	switch (variants) {
	case VariantSelection::Both:
		return true;
	case VariantSelection::PerLineOfBusiness:
		return variant == FactVariant::PerLineOfBusiness;
	case VariantSelection::Aggregated:
		return variant == FactVariant::Aggregated;
	}
	return false;
}

occupancyfact::facts::FactBuildOptions PipelineConfig::BuildOptions(FactVariant variant) const {
	occupancyfact::facts::FactBuildOptions options;
	if (start && cutoff) {
		options.horizon = occupancyfact::core::Horizon {*start, *cutoff};
	}
	options.horizon_policy =
	    variant == FactVariant::PerLineOfBusiness ? lob_horizon_policy : aggregated_horizon_policy;
	options.hybrid.anchor_days = anchor_days;
	options.hybrid.min_month_weekdays = min_month_weekdays;
	options.unknown_keys = unknown_keys;
	return options;
}

std::string PipelineConfig::InputPath(const char *relative) const {
	return (std::filesystem::path(data_root) / relative).string();
}

std::string PipelineConfig::OutputPath(const char *relative) const {
	return (std::filesystem::path(output_root) / relative).string();
}

void PipelineConfig::Validate() const {
	if (start.has_value() != cutoff.has_value()) {
		throw std::invalid_argument("--start and --cutoff must be given together");
	}
	if (start && *cutoff < *start) {
		throw std::invalid_argument("--cutoff " + cutoff->toString() + " precedes --start " + start->toString());
	}
	if (anchor_days == 0) {
		throw std::invalid_argument("--anchor-days must be positive");
	}
	if (min_month_weekdays == 0) {
		throw std::invalid_argument("--min-month-weekdays must be positive");
	}
	// Rejects unknown level names early.
	occupancyfact::utils::Logging::parseLevel(log_level);
}

HorizonPolicy ParseHorizonPolicy(const std::string &name) {
	if (name == "cutoff" || name == "snapshot-cutoff") {
		return HorizonPolicy::SnapshotCutoff;
	}
	if (name == "month-end" || name == "snapshot-month-end") {
		return HorizonPolicy::SnapshotMonthEnd;
	}
	throw std::invalid_argument("Unknown horizon policy '" + name + "' (expected cutoff or month-end)");
}

const char *HorizonPolicyName(HorizonPolicy policy) {
	switch (policy) {
	case HorizonPolicy::SnapshotCutoff:
		return "cutoff";
	case HorizonPolicy::SnapshotMonthEnd:
		return "month-end";
	}
	return "unknown";
}

static VariantSelection ParseVariantSelection(const std::string &name) {
	if (name == "both") {
		return VariantSelection::Both;
	}
	if (name == "lob" || name == "per-lob") {
		return VariantSelection::PerLineOfBusiness;
	}
	if (name == "aggregated") {
		return VariantSelection::Aggregated;
	}
	throw std::invalid_argument("Unknown fact variant '" + name + "' (expected both, lob or aggregated)");
}

static occupancyfact::grid::UnknownKeyPolicy ParseUnknownKeyPolicy(const std::string &name) {
	if (name == "error") {
		return occupancyfact::grid::UnknownKeyPolicy::Error;
	}
	if (name == "drop") {
		return occupancyfact::grid::UnknownKeyPolicy::Drop;
	}
	throw std::invalid_argument("Unknown key policy '" + name + "' (expected error or drop)");
}

static std::size_t ParseCount(const std::string &flag, const std::string &text) {
	std::size_t consumed = 0;
	long long value = 0;
	try {
		value = std::stoll(text, &consumed);
	} catch (const std::exception &) {
		throw std::invalid_argument(flag + " expects an integer, got '" + text + "'");
	}
	if (consumed != text.size() || value < 0) {
		throw std::invalid_argument(flag + " expects a non-negative integer, got '" + text + "'");
	}
	return static_cast<std::size_t>(value);
}

PipelineConfig ParsePipelineArguments(const std::vector<std::string> &args, const char *env_log_level) {
	PipelineConfig config;
	if (env_log_level && *env_log_level) {
		config.log_level = env_log_level;
	}

	for (std::size_t i = 0; i < args.size(); i++) {
		const auto &arg = args[i];
		auto next = [&]() -> const std::string & {
			if (i + 1 >= args.size()) {
				throw std::invalid_argument(arg + " requires a value");
			}
			return args[++i];
		};

		if (arg == "-h" || arg == "--help") {
			config.show_help = true;
		} else if (arg == "--data-root") {
			config.data_root = next();
		} else if (arg == "--out") {
			config.output_root = next();
		} else if (arg == "--variant") {
			config.variants = ParseVariantSelection(next());
		} else if (arg == "--horizon") {
			const auto policy = ParseHorizonPolicy(next());
			config.lob_horizon_policy = policy;
			config.aggregated_horizon_policy = policy;
		} else if (arg == "--lob-horizon") {
			config.lob_horizon_policy = ParseHorizonPolicy(next());
		} else if (arg == "--aggregated-horizon") {
			config.aggregated_horizon_policy = ParseHorizonPolicy(next());
		} else if (arg == "--start") {
			config.start = CivilDate::parse(next());
		} else if (arg == "--cutoff") {
			config.cutoff = CivilDate::parse(next());
		} else if (arg == "--unknown-keys") {
			config.unknown_keys = ParseUnknownKeyPolicy(next());
		} else if (arg == "--anchor-days") {
			config.anchor_days = ParseCount(arg, next());
		} else if (arg == "--min-month-weekdays") {
			config.min_month_weekdays = ParseCount(arg, next());
		} else if (arg == "--synthesize-date-dimension") {
			config.synthesize_date_dimension = true;
		} else if (arg == "--no-reports") {
			config.write_reports = false;
		} else if (arg == "--log-level") {
			config.log_level = next();
		} else {
			throw std::invalid_argument("Unknown argument '" + arg + "'");
		}
	}

	if (!config.show_help) {
		config.Validate();
	}
	return config;
}

std::string PipelineUsage(const std::string &program) {
	std::ostringstream out;
	out << "Usage: " << program << " [options]\n"
	    << "\n"
	    << "Builds the daily office occupancy facts from cleaned attendance and desk capacity data.\n"
	    << "\n"
	    << "Options:\n"
	    << "  --data-root DIR              directory holding dimensions/ and cleaned_data/ (default .)\n"
	    << "  --out DIR                    directory receiving facts/ and reports/ (default .)\n"
	    << "  --variant both|lob|aggregated\n"
	    << "                               fact variants to build (default both)\n"
	    << "  --horizon cutoff|month-end   horizon policy for both variants (default cutoff)\n"
	    << "  --lob-horizon POLICY         horizon policy for the per line of business fact\n"
	    << "  --aggregated-horizon POLICY  horizon policy for the aggregated fact\n"
	    << "  --start YYYY-MM-DD           explicit horizon start (requires --cutoff)\n"
	    << "  --cutoff YYYY-MM-DD          explicit horizon cutoff (requires --start)\n"
	    << "  --unknown-keys error|drop    attendance for offices or lines of business missing from the\n"
	    << "                               dimensions fails the run or is dropped (default error)\n"
	    << "  --anchor-days N              hybrid anchor days per office per ISO week (default 3)\n"
	    << "  --min-month-weekdays N       weekdays a month must contribute to an ISO week (default 3)\n"
	    << "  --synthesize-date-dimension  build the date dimension instead of reading DimDate.csv\n"
	    << "  --no-reports                 skip the data-quality reports\n"
	    << "  --log-level LEVEL            trace, debug, info, warn, error, critical or off\n"
	    << "                               (default info, or OCCUPANCY_LOG_LEVEL)\n"
	    << "  -h, --help                   show this message\n";
	return out.str();
}

} // namespace occupancy
