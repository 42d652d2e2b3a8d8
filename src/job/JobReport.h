#pragma once

#include "edit/EditTypes.h"
#include <nlohmann/json.hpp>
#include <string>

namespace job {

// JSON rendering of plans and execution results for --report and --plan-only
class JobReport {
public:
	static nlohmann::json planToJson(const edit::EditPlan& plan);
	static nlohmann::json resultToJson(const edit::ExecutionResult& result);
	static nlohmann::json toJson(const edit::EditPlan& plan, const edit::ExecutionResult* result);

	// Throws std::runtime_error if the file cannot be written
	static void write(const std::string& filename, const nlohmann::json& report);
};

} // namespace job
