#pragma once

#include "fcast-store/core/series_data.hpp"
#include "fcast-store/core/windowed_store.hpp"

#include <functional>
#include <string>
#include <vector>

namespace fcaststore::core {

/**
 * @class NormalizationFactor
 * @brief Divisor applied to every payload value when a series is constructed.
 *
 * Either a fixed scalar or a policy that derives the divisor from the values
 * themselves (maximum() divides by the largest value). A plain double converts
 * implicitly to a constant factor. Polynomial coefficients are divided as a whole;
 * for curves only the y values are divided.
 */
class NormalizationFactor {
public:
	enum class Kind { Constant, Maximum, Policy };
	using PolicyFn = std::function<double(const std::vector<double> &)>;

	/**
	 * @throws std::invalid_argument If @p value is zero or not finite.
	 */
	NormalizationFactor(double value = 1.0);

	static NormalizationFactor constant(double value) {
		return NormalizationFactor(value);
	}

	static NormalizationFactor maximum();

	/**
	 * @brief Caller-defined divisor computed from the flattened payload values.
	 * @param name Label used in log and error messages.
	 */
	static NormalizationFactor policy(std::string name, PolicyFn fn);

	Kind kind() const {
		return kind_;
	}

	bool isIdentity() const {
		return kind_ == Kind::Constant && value_ == 1.0;
	}

	/// The scalar for a constant factor.
	double value() const {
		return value_;
	}

	std::string describe() const;

	/**
	 * @brief Resolves the divisor for the given flattened values.
	 * @throws std::invalid_argument If the resolved divisor is zero or not finite.
	 */
	double divisorFor(const std::vector<double> &values) const;

	/**
	 * @throws NotImplementedError For a derived factor over a non-constant payload.
	 */
	SeriesData apply(const SeriesData &data) const;
	RowStore apply(const RowStore &data) const;
	WindowData apply(const WindowData &data) const;

private:
	NormalizationFactor(Kind kind, std::string name, PolicyFn fn);

	double requireConstantDivisor(PayloadKind payload) const;

	Kind kind_ = Kind::Constant;
	double value_ = 1.0;
	std::string name_;
	PolicyFn fn_;
};

} // namespace fcaststore::core
