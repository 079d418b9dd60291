#include "docblocks_warnings.hpp"

#include "duckdb/common/exception.hpp"

#include <spdlog/spdlog.h>

namespace duckdb {

LoggingWarningChannel::LoggingWarningChannel(bool warn_error_p) : warn_error(warn_error_p) {
}

void LoggingWarningChannel::WarnOrError(const string &message) {
	if (warn_error) {
		throw InvalidInputException(message);
	}
	spdlog::warn("{}", message);
}

} // namespace duckdb
