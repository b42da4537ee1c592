#pragma once

#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

namespace almanac::core {

/**
 * @struct UnavailableSection
 * @brief Marks an analysis section that could not be produced, and why.
 */
struct UnavailableSection {
	std::string module;
	std::string reason;

	bool operator==(const UnavailableSection &other) const {
		return module == other.module && reason == other.reason;
	}
};

/**
 * @class ModuleResult
 * @brief Outcome of one analysis module: a value, or an UnavailableSection.
 */
template <typename T>
class ModuleResult {
public:
	ModuleResult(T value) : state_(std::move(value)) {
	}

	ModuleResult(UnavailableSection unavailable) : state_(std::move(unavailable)) {
	}

	static ModuleResult unavailable(std::string module, std::string reason) {
		return ModuleResult(UnavailableSection{std::move(module), std::move(reason)});
	}

	bool ok() const {
		return std::holds_alternative<T>(state_);
	}

	explicit operator bool() const {
		return ok();
	}

	const T &value() const {
		if (!ok()) {
			throw std::logic_error("ModuleResult holds no value: " + std::get<UnavailableSection>(state_).reason);
		}
		return std::get<T>(state_);
	}

	T &value() {
		if (!ok()) {
			throw std::logic_error("ModuleResult holds no value: " + std::get<UnavailableSection>(state_).reason);
		}
		return std::get<T>(state_);
	}

	const UnavailableSection &error() const {
		if (ok()) {
			throw std::logic_error("ModuleResult holds a value.");
		}
		return std::get<UnavailableSection>(state_);
	}

private:
	std::variant<T, UnavailableSection> state_;
};

} // namespace almanac::core
