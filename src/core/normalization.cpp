#include "fcast-store/core/normalization.hpp"

#include "fcast-store/core/errors.hpp"
#include "fcast-store/utils/logging.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <type_traits>
#include <utility>

namespace fcaststore::core {

namespace {

void checkDivisor(double divisor, const std::string &label) {
	if (!std::isfinite(divisor) || divisor == 0.0) {
		throw std::invalid_argument("Normalization factor " + label + " resolved to an invalid divisor (" +
		                            std::to_string(divisor) + ").");
	}
}

template <typename Window>
void appendValues(const Window &window, std::vector<double> &out) {
	using Element = typename Window::value_type;
	for (const auto &element : window) {
		if constexpr (std::is_same_v<Element, double>) {
			out.push_back(element);
		} else if constexpr (std::is_same_v<Element, Row>) {
			out.insert(out.end(), element.begin(), element.end());
		}
	}
}

} // namespace

NormalizationFactor::NormalizationFactor(double value) : kind_(Kind::Constant), value_(value) {
	checkDivisor(value, "constant");
}

NormalizationFactor::NormalizationFactor(Kind kind, std::string name, PolicyFn fn)
    : kind_(kind), name_(std::move(name)), fn_(std::move(fn)) {
}

NormalizationFactor NormalizationFactor::maximum() {
	return NormalizationFactor(Kind::Maximum, "max", [](const std::vector<double> &values) {
		if (values.empty()) {
			throw std::invalid_argument("Cannot normalize by the maximum of an empty payload.");
		}
		return *std::max_element(values.begin(), values.end());
	});
}

NormalizationFactor NormalizationFactor::policy(std::string name, PolicyFn fn) {
	if (!fn) {
		throw std::invalid_argument("Normalization policy '" + name + "' has no function.");
	}
	return NormalizationFactor(Kind::Policy, std::move(name), std::move(fn));
}

std::string NormalizationFactor::describe() const {
	switch (kind_) {
	case Kind::Constant:
		return std::to_string(value_);
	case Kind::Maximum:
		return "max";
	case Kind::Policy:
		return "policy '" + name_ + "'";
	}
	return "unknown";
}

double NormalizationFactor::divisorFor(const std::vector<double> &values) const {
	const double divisor = kind_ == Kind::Constant ? value_ : fn_(values);
	checkDivisor(divisor, describe());
	return divisor;
}

double NormalizationFactor::requireConstantDivisor(PayloadKind payload) const {
	if (kind_ != Kind::Constant) {
		throw NotImplementedError("Normalization by " + describe(), toString(payload) + " payloads");
	}
	return value_;
}

SeriesData NormalizationFactor::apply(const SeriesData &data) const {
	if (isIdentity()) {
		return data;
	}
	return std::visit(
	    [this](const auto &store) -> SeriesData {
		    using Store = std::decay_t<decltype(store)>;
		    using Element = typename Store::element_type;
		    double divisor = 0.0;
		    if constexpr (std::is_same_v<Element, double>) {
			    std::vector<double> values;
			    for (const auto &entry : store) {
				    appendValues(entry.second, values);
			    }
			    divisor = divisorFor(values);
		    } else {
			    divisor = requireConstantDivisor(Store::kind());
		    }
		    FCAST_DEBUG("Normalizing {} payload of {} windows by {}.", toString(Store::kind()), store.count(),
		                divisor);
		    return store.transformed([divisor](const Element &element) { return scaleElement(element, divisor); });
	    },
	    data);
}

RowStore NormalizationFactor::apply(const RowStore &data) const {
	if (isIdentity()) {
		return data;
	}
	std::vector<double> values;
	for (const auto &entry : data) {
		appendValues(entry.second, values);
	}
	const double divisor = divisorFor(values);
	FCAST_DEBUG("Normalizing row payload of {} windows by {}.", data.count(), divisor);
	return data.transformed([divisor](const Row &row) { return scaleElement(row, divisor); });
}

WindowData NormalizationFactor::apply(const WindowData &data) const {
	if (isIdentity()) {
		return data;
	}
	return std::visit(
	    [this](const auto &window) -> WindowData {
		    using Element = typename std::decay_t<decltype(window)>::value_type;
		    double divisor = 0.0;
		    if constexpr (std::is_same_v<Element, double>) {
			    divisor = divisorFor(window);
		    } else {
			    divisor = requireConstantDivisor(PayloadTraits<Element>::kind);
		    }
		    std::vector<Element> scaled;
		    scaled.reserve(window.size());
		    for (const auto &element : window) {
			    scaled.push_back(scaleElement(element, divisor));
		    }
		    return scaled;
	    },
	    data);
}

} // namespace fcaststore::core
