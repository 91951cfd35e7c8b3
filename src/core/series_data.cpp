#include "fcast-store/core/series_data.hpp"

#include <type_traits>

namespace fcaststore::core {

PayloadKind payloadKind(const SeriesData &data) {
	return std::visit([](const auto &store) { return std::decay_t<decltype(store)>::kind(); }, data);
}

PayloadKind payloadKind(const WindowData &data) {
	return std::visit(
	    [](const auto &window) {
		    using Element = typename std::decay_t<decltype(window)>::value_type;
		    return PayloadTraits<Element>::kind;
	    },
	    data);
}

std::size_t windowLength(const WindowData &data) {
	return std::visit([](const auto &window) { return window.size(); }, data);
}

} // namespace fcaststore::core
