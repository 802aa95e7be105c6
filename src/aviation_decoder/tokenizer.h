#ifndef TOKENIZER_H
#define TOKENIZER_H

#include <string>
#include <vector>

namespace aerodata
{

/**
 * @brief Split a report body into its groups
 *
 * Any run of whitespace (including line breaks) separates two groups, no
 * group is ever empty. The "=" padding ending a report is removed from the
 * last group.
 *
 * @param body The report, without its NOAA timestamp line
 * @return The groups, in the order they appear in the report
 */
std::vector<std::string> tokenize(const std::string& body);

/**
 * @brief Rebuild a report, or part of it, from its groups, separated by
 * single spaces
 */
template<typename Iterator>
std::string join(Iterator begin, Iterator end)
{
	std::string result;
	for (auto it = begin ; it != end ; ++it) {
		if (!result.empty())
			result += ' ';
		result += *it;
	}
	return result;
}

inline std::string join(const std::vector<std::string>& groups)
{
	return join(groups.cbegin(), groups.cend());
}

}

#endif /* TOKENIZER_H */
