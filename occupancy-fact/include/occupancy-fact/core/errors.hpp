#pragma once

#include <stdexcept>
#include <string>

namespace occupancyfact {

/// Structural failure categories raised by the fact engine.
enum class ErrorKind {
	MissingInput,
	EmptyDimension,
	InconsistentKey
};

const char *errorKindName(ErrorKind kind);

/**
 * @class FactError
 * @brief Base class for structural violations that abort a fact build.
 *
 * Expected data-quality conditions (unknown capacity, over-capacity days) are
 * never raised; they travel as nullable columns instead.
 */
class FactError : public std::runtime_error {
public:
	FactError(ErrorKind kind, const std::string &message);

	ErrorKind kind() const noexcept {
		return kind_;
	}

private:
	ErrorKind kind_;
};

class MissingInputError : public FactError {
public:
	explicit MissingInputError(const std::string &dataset);
};

class EmptyDimensionError : public FactError {
public:
	explicit EmptyDimensionError(const std::string &dimension);
};

class InconsistentKeyError : public FactError {
public:
	explicit InconsistentKeyError(const std::string &detail);
};

} // namespace occupancyfact
