#pragma once

#include "fcast-store/core/series_data.hpp"
#include "fcast-store/core/windowed_store.hpp"

#include <Eigen/Dense>

#include <cstddef>
#include <initializer_list>
#include <string>
#include <vector>

namespace fcaststore::core {

/**
 * @class DenseArray
 * @brief Dense rectangular array of doubles in row-major (C) order.
 *
 * This is the hand-off format for binary persistence: the last index varies fastest.
 */
class DenseArray {
public:
	using Shape = std::vector<std::size_t>;
	using MatrixView = Eigen::Map<const Eigen::Matrix<double, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>>;

	DenseArray() = default;

	/// Zero-filled array of the given shape.
	explicit DenseArray(Shape shape);

	/**
	 * @throws std::invalid_argument If the number of values does not match the shape.
	 */
	DenseArray(Shape shape, std::vector<double> values);

	std::size_t rank() const {
		return shape_.size();
	}

	const Shape &shape() const {
		return shape_;
	}

	std::size_t size() const {
		return values_.size();
	}

	const std::vector<double> &values() const {
		return values_;
	}

	/**
	 * @throws std::out_of_range If the index count differs from the rank or an index is out of bounds.
	 */
	double at(std::initializer_list<std::size_t> index) const;
	double &at(std::initializer_list<std::size_t> index);

	/**
	 * @brief Eigen view over a rank-2 array; rows follow the first dimension.
	 * @throws std::logic_error If the array is not rank 2.
	 */
	MatrixView asMatrix() const;

	std::string shapeString() const;

	bool operator==(const DenseArray &other) const {
		return shape_ == other.shape_ && values_ == other.values_;
	}
	bool operator!=(const DenseArray &other) const {
		return !(*this == other);
	}

private:
	std::size_t offset(std::initializer_list<std::size_t> index) const;

	Shape shape_;
	std::vector<double> values_;
};

/**
 * @brief Shapes a full windowed store for persistence.
 *
 * | Payload         | Shape                           |
 * |-----------------|---------------------------------|
 * | Constant        | [horizon, count]                |
 * | Polynomial      | [horizon, count, degree]        |
 * | PiecewiseLinear | [horizon, count, n_points, 2]   |
 *
 * Window j of the store lands at index j of the second dimension.
 *
 * @throws std::invalid_argument If polynomial degrees or curve point counts differ.
 * @throws NotImplementedError For payload kinds without a storage layout.
 */
DenseArray shapeForStorage(const SeriesData &data);

/**
 * @brief Shapes a single window: [horizon], [horizon, degree] or [horizon, n_points, 2].
 */
DenseArray shapeForStorage(const WindowData &window);

/**
 * @brief Shapes a Probabilistic or Scenarios store as [horizon, count, n_components].
 * @throws std::invalid_argument If row widths differ.
 */
DenseArray shapeForStorage(const RowStore &data);

} // namespace fcaststore::core
