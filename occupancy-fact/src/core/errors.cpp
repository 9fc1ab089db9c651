#include "occupancy-fact/core/errors.hpp"

namespace occupancyfact {

const char *errorKindName(ErrorKind kind) {
	switch (kind) {
	case ErrorKind::MissingInput:
		return "MissingInput";
	case ErrorKind::EmptyDimension:
		return "EmptyDimension";
	case ErrorKind::InconsistentKey:
		return "InconsistentKey";
	}
	return "Unknown";
}

FactError::FactError(ErrorKind kind, const std::string &message)
    : std::runtime_error(std::string(errorKindName(kind)) + ": " + message), kind_(kind) {
}

MissingInputError::MissingInputError(const std::string &dataset)
    : FactError(ErrorKind::MissingInput, "required input '" + dataset + "' is absent") {
}

EmptyDimensionError::EmptyDimensionError(const std::string &dimension)
    : FactError(ErrorKind::EmptyDimension, "dimension '" + dimension + "' has no rows") {
}

InconsistentKeyError::InconsistentKeyError(const std::string &detail)
    : FactError(ErrorKind::InconsistentKey, detail) {
}

} // namespace occupancyfact
