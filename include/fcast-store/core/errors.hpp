#pragma once

#include <stdexcept>
#include <string>

namespace fcaststore::core {

/**
 * @class DataFormatError
 * @brief Thrown when user data violates a structural invariant that cannot be reconciled.
 *
 * Examples are timestamps with a non-uniform resolution or a payload whose
 * elements do not share a single shape.
 */
class DataFormatError : public std::runtime_error {
public:
	explicit DataFormatError(const std::string &message) : std::runtime_error(message) {
	}
};

/**
 * @class NotImplementedError
 * @brief Indicates that a feature is not implemented for the given data even though it could be.
 *
 * Use std::invalid_argument instead when the combination makes no sense at all.
 */
class NotImplementedError : public std::logic_error {
public:
	explicit NotImplementedError(const std::string &message) : std::logic_error(message) {
	}

	NotImplementedError(const std::string &feature, const std::string &data)
	    : std::logic_error(feature + " not currently implemented for " + data) {
	}
};

} // namespace fcaststore::core
