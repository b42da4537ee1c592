#include "almanac/core/analysis_result.hpp"

namespace almanac::core {

std::string toString(DecompositionModel model) {
	switch (model) {
	case DecompositionModel::Additive:
		return "additive";
	case DecompositionModel::Multiplicative:
		return "multiplicative";
	}
	return "unknown";
}

} // namespace almanac::core
