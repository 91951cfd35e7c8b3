#include "fcast-store/core/array_shaping.hpp"

#include "fcast-store/core/errors.hpp"
#include "fcast-store/utils/logging.hpp"

#include <algorithm>
#include <functional>
#include <numeric>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <type_traits>

namespace fcaststore::core {

namespace {

std::size_t product(const DenseArray::Shape &shape) {
	return std::accumulate(shape.begin(), shape.end(), std::size_t{1}, std::multiplies<std::size_t>());
}

/// Records the first length seen for @p dimension and rejects any later mismatch.
void requireUniform(std::optional<std::size_t> &expected, std::size_t actual, const char *dimension,
                    const std::string &where) {
	if (!expected) {
		expected = actual;
		return;
	}
	if (*expected != actual) {
		throw std::invalid_argument(std::string("Inconsistent ") + dimension + ": " + where + " has " +
		                            std::to_string(actual) + ", expected " + std::to_string(*expected) +
		                            ". Only supported when every element has the same length.");
	}
}

std::string location(const TimePoint &start, std::size_t step) {
	return "window " + formatTimestamp(start) + " step " + std::to_string(step);
}

std::string location(std::size_t step) {
	return "step " + std::to_string(step);
}

std::size_t trailingLength(const double &) {
	return 1;
}
std::size_t trailingLength(const Polynomial &element) {
	return element.degree();
}
std::size_t trailingLength(const Row &element) {
	return element.size();
}

void writeTrailing(const double &element, double *out) {
	out[0] = element;
}
void writeTrailing(const Polynomial &element, double *out) {
	const auto &coefficients = element.coefficients();
	std::copy(coefficients.begin(), coefficients.end(), out);
}
void writeTrailing(const Row &element, double *out) {
	std::copy(element.begin(), element.end(), out);
}

template <typename Element>
std::size_t emptyWidth() {
	return std::is_same_v<Element, double> ? 1 : 0;
}

const char *dimensionName(PayloadKind kind) {
	return kind == PayloadKind::Polynomial ? "polynomial degree" : "row width";
}

// Constant, Polynomial and Row payloads all flatten to [horizon, (count,) components].
template <typename Element>
DenseArray shapeComponents(const std::vector<Element> &window) {
	std::optional<std::size_t> components;
	for (std::size_t r = 0; r < window.size(); ++r) {
		requireUniform(components, trailingLength(window[r]), dimensionName(PayloadTraits<Element>::kind),
		               location(r));
	}
	const std::size_t width = components.value_or(emptyWidth<Element>());
	DenseArray::Shape shape{window.size()};
	if constexpr (!std::is_same_v<Element, double>) {
		shape.push_back(width);
	}
	std::vector<double> values(window.size() * width);
	for (std::size_t r = 0; r < window.size(); ++r) {
		writeTrailing(window[r], values.data() + r * width);
	}
	return DenseArray(std::move(shape), std::move(values));
}

template <typename Element>
DenseArray shapeComponents(const WindowedStore<Element> &store) {
	const std::size_t horizon = store.horizon();
	const std::size_t count = store.count();

	std::optional<std::size_t> components;
	for (const auto &entry : store) {
		for (std::size_t r = 0; r < entry.second.size(); ++r) {
			requireUniform(components, trailingLength(entry.second[r]), dimensionName(PayloadTraits<Element>::kind),
			               location(entry.first, r));
		}
	}
	const std::size_t width = components.value_or(emptyWidth<Element>());

	DenseArray::Shape shape{horizon, count};
	if constexpr (!std::is_same_v<Element, double>) {
		shape.push_back(width);
	}
	std::vector<double> values(horizon * count * width);
	std::size_t c = 0;
	for (const auto &entry : store) {
		for (std::size_t r = 0; r < horizon; ++r) {
			writeTrailing(entry.second[r], values.data() + (r * count + c) * width);
		}
		++c;
	}
	return DenseArray(std::move(shape), std::move(values));
}

DenseArray shapeCurves(const std::vector<PiecewiseLinear> &window) {
	std::optional<std::size_t> n_points;
	for (std::size_t r = 0; r < window.size(); ++r) {
		requireUniform(n_points, window[r].pointCount(), "point count", location(r));
	}
	const std::size_t points = n_points.value_or(0);
	std::vector<double> values(window.size() * points * 2);
	for (std::size_t r = 0; r < window.size(); ++r) {
		for (std::size_t p = 0; p < points; ++p) {
			const auto &point = window[r].points()[p];
			values[(r * points + p) * 2] = point.x;
			values[(r * points + p) * 2 + 1] = point.y;
		}
	}
	return DenseArray({window.size(), points, 2}, std::move(values));
}

DenseArray shapeCurves(const PiecewiseLinearStore &store) {
	const std::size_t horizon = store.horizon();
	const std::size_t count = store.count();

	std::optional<std::size_t> n_points;
	for (const auto &entry : store) {
		for (std::size_t r = 0; r < entry.second.size(); ++r) {
			requireUniform(n_points, entry.second[r].pointCount(), "point count", location(entry.first, r));
		}
	}
	const std::size_t points = n_points.value_or(0);

	std::vector<double> values(horizon * count * points * 2);
	std::size_t c = 0;
	for (const auto &entry : store) {
		for (std::size_t r = 0; r < horizon; ++r) {
			const auto &curve = entry.second[r].points();
			for (std::size_t p = 0; p < points; ++p) {
				const auto base = ((r * count + c) * points + p) * 2;
				values[base] = curve[p].x;
				values[base + 1] = curve[p].y;
			}
		}
		++c;
	}
	return DenseArray({horizon, count, points, 2}, std::move(values));
}

} // namespace

DenseArray::DenseArray(Shape shape) : shape_(std::move(shape)), values_(product(shape_), 0.0) {
}

DenseArray::DenseArray(Shape shape, std::vector<double> values) : shape_(std::move(shape)), values_(std::move(values)) {
	if (values_.size() != product(shape_)) {
		throw std::invalid_argument("Dense array of shape " + shapeString() + " needs " +
		                            std::to_string(product(shape_)) + " values, got " +
		                            std::to_string(values_.size()) + ".");
	}
}

std::size_t DenseArray::offset(std::initializer_list<std::size_t> index) const {
	if (index.size() != shape_.size()) {
		throw std::out_of_range("Index of rank " + std::to_string(index.size()) + " used on an array of rank " +
		                        std::to_string(shape_.size()) + ".");
	}
	std::size_t flat = 0;
	std::size_t dim = 0;
	for (const auto i : index) {
		if (i >= shape_[dim]) {
			throw std::out_of_range("Index " + std::to_string(i) + " exceeds dimension " + std::to_string(dim) +
			                        " of shape " + shapeString() + ".");
		}
		flat = flat * shape_[dim] + i;
		++dim;
	}
	return flat;
}

double DenseArray::at(std::initializer_list<std::size_t> index) const {
	return values_[offset(index)];
}

double &DenseArray::at(std::initializer_list<std::size_t> index) {
	return values_[offset(index)];
}

DenseArray::MatrixView DenseArray::asMatrix() const {
	if (rank() != 2) {
		throw std::logic_error("Matrix view requires a rank-2 array, got shape " + shapeString() + ".");
	}
	return MatrixView(values_.data(), static_cast<Eigen::Index>(shape_[0]), static_cast<Eigen::Index>(shape_[1]));
}

std::string DenseArray::shapeString() const {
	std::ostringstream out;
	out << '[';
	for (std::size_t i = 0; i < shape_.size(); ++i) {
		if (i > 0) {
			out << ", ";
		}
		out << shape_[i];
	}
	out << ']';
	return out.str();
}

DenseArray shapeForStorage(const SeriesData &data) {
	auto array = std::visit(
	    [](const auto &store) -> DenseArray {
		    using Store = std::decay_t<decltype(store)>;
		    using Element = typename Store::element_type;
		    if constexpr (std::is_same_v<Element, double> || std::is_same_v<Element, Polynomial>) {
			    return shapeComponents(store);
		    } else if constexpr (std::is_same_v<Element, PiecewiseLinear>) {
			    return shapeCurves(store);
		    } else {
			    throw NotImplementedError("shapeForStorage", toString(Store::kind()) + " payloads");
		    }
	    },
	    data);
	FCAST_DEBUG("Shaped {} payload into array of shape {}.", toString(payloadKind(data)), array.shapeString());
	return array;
}

DenseArray shapeForStorage(const WindowData &window) {
	return std::visit(
	    [](const auto &elements) -> DenseArray {
		    using Element = typename std::decay_t<decltype(elements)>::value_type;
		    if constexpr (std::is_same_v<Element, double> || std::is_same_v<Element, Polynomial>) {
			    return shapeComponents(elements);
		    } else if constexpr (std::is_same_v<Element, PiecewiseLinear>) {
			    return shapeCurves(elements);
		    } else {
			    throw NotImplementedError("shapeForStorage", toString(PayloadTraits<Element>::kind) + " windows");
		    }
	    },
	    window);
}

DenseArray shapeForStorage(const RowStore &data) {
	auto array = shapeComponents(data);
	FCAST_DEBUG("Shaped row payload into array of shape {}.", array.shapeString());
	return array;
}

} // namespace fcaststore::core
