#ifndef ITEM_T
#define ITEM_T

#include <cstddef>
#include <string>

struct Item {
	std::string text   = {};
	std::string folded = {}; // Util::to_lower(text), same byte length
	size_t index       = {}; // original insertion order
};

#endif
