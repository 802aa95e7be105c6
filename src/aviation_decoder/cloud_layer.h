#ifndef CLOUD_LAYER_H
#define CLOUD_LAYER_H

#include <optional>

namespace aerodata
{

struct CloudLayer
{
	enum class Coverage
	{
		FEW, SCT, BKN, OVC,
		NSC, //!< no significant cloud
		NCD, //!< no cloud detected (automatic stations)
		CLR, SKC
	};

	Coverage _coverage;
	/**
	 * Height of the base of the layer, in feet, unset for the NSC, NCD,
	 * CLR and SKC indicators
	 */
	std::optional<int> _baseHeight;
	//! Cumulonimbus or towering cumulus
	bool _convective = false;
};

}

#endif /* CLOUD_LAYER_H */
