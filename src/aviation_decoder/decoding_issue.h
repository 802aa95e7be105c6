#ifndef DECODING_ISSUE_H
#define DECODING_ISSUE_H

#include <string>

namespace aerodata
{

struct DecodingIssue
{
	enum class Kind
	{
		/**
		 * A group matches no known grammar, the field it would carry
		 * is left unset
		 */
		MALFORMED_TOKEN,
		/**
		 * The TAF has no ddHH/ddHH validity group, the validity
		 * window is left unset
		 */
		MISSING_VALIDITY_GROUP,
		/**
		 * Not even a station code and a timestamp, no record is
		 * produced
		 */
		EMPTY_OR_TRUNCATED_BODY
	};

	Kind _kind;
	//! The offending group, if any
	std::string _group;
};

}

#endif /* DECODING_ISSUE_H */
