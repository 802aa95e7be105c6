#include "tokenizer.h"

#include <vector>
#include <string>
#include <iterator>
#include <sstream>
#include <algorithm>

namespace aerodata
{

std::vector<std::string> tokenize(const std::string& body)
{
	std::vector<std::string> groups;

	std::istringstream in{body};
	std::istream_iterator<std::string> begin{in}, end;
	std::copy(begin, end, std::back_inserter(groups));

	// The last group may be padded with one or more "=" signs, remove those
	if (!groups.empty()) {
		std::string& lastGroup = groups.back();
		auto pos = lastGroup.find_last_not_of('=');
		if (pos == std::string::npos)
			groups.pop_back();
		else
			lastGroup.erase(pos + 1);
	}

	return groups;
}

}
