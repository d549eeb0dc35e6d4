#ifndef OUTCOME_T
#define OUTCOME_T

#include <cstddef>
#include <string>
#include <variant>
#include <vector>

struct Selected {
	std::vector<size_t> indices    = {}; // ascending original indices
	std::vector<std::string> items = {};
};

struct Cancelled {};

using SelectionOutcome = std::variant<Selected, Cancelled>;

#endif
