#pragma once

#include "duckdb.hpp"

namespace duckdb {

// Receives validation problems that are only fatal in strict mode.
class WarningChannel {
public:
	virtual ~WarningChannel() = default;

	virtual void WarnOrError(const string &message) = 0;
};

// Logs through spdlog, or throws InvalidInputException when warn_error is set.
class LoggingWarningChannel : public WarningChannel {
public:
	explicit LoggingWarningChannel(bool warn_error);

	void WarnOrError(const string &message) override;

private:
	bool warn_error;
};

} // namespace duckdb
