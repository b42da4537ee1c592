#include "almanac/utils/logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <mutex>

namespace almanac::utils {

namespace {
std::mutex &loggerMutex() {
	static std::mutex mutex;
	return mutex;
}
} // namespace

std::shared_ptr<spdlog::logger> Logging::logger_;

void Logging::init(spdlog::level::level_enum level) {
	std::lock_guard<std::mutex> lock(loggerMutex());
	if (!logger_) {
		logger_ = spdlog::get("almanac");
		if (!logger_) {
			logger_ = spdlog::stdout_color_mt("almanac");
		}
	}
	logger_->set_level(level);
	logger_->flush_on(level);
}

std::shared_ptr<spdlog::logger> &Logging::getLogger() {
	if (!logger_) {
		init();
	}
	return logger_;
}

} // namespace almanac::utils
