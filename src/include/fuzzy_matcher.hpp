#pragma once

#include <string>
#include <vector>

namespace redfish_catalog {

/**
 * Fuzzy Key Matcher
 *
 * Maps a property name declared by a schema onto the key a live payload
 * actually uses, tolerating casing and spelling drift between the two.
 *
 * Policy, first hit wins:
 * - the expected name itself, when it is a payload key
 * - a payload key equal to the expected name ignoring case
 * - the payload key with the highest similarity, if it reaches the threshold
 * - otherwise the expected name, unchanged
 *
 * Keys listed in the exclude list are never returned. Ties keep payload order.
 *
 * Usage:
 *   auto key = FuzzyMatcher::MatchKey("PropertyA", {"Name", "PropertyB"});
 *   // key == "PropertyB"
 */
class FuzzyMatcher {
public:
	static constexpr double DEFAULT_THRESHOLD = 0.70;

	/**
	 * Select the payload key that best matches a declared property name
	 *
	 * @param expected Declared property name
	 * @param payload_keys Keys of the payload object, in payload order
	 * @param exclude Keys that must never be returned
	 * @param threshold Minimum similarity in (0, 1] for a partial match
	 * @return The chosen payload key, or expected when nothing qualifies
	 */
	static std::string MatchKey(const std::string& expected,
	                            const std::vector<std::string>& payload_keys,
	                            const std::vector<std::string>& exclude = {},
	                            double threshold = DEFAULT_THRESHOLD);

	/**
	 * Normalized case-insensitive similarity
	 *
	 * 1 - LevenshteinDistance / max(length). Identical strings score 1.0,
	 * two empty strings score 1.0.
	 */
	static double Similarity(const std::string& lhs, const std::string& rhs);

	static size_t LevenshteinDistance(const std::string& lhs, const std::string& rhs);

private:
	static std::string ToLower(const std::string& value);
	static bool IsExcluded(const std::string& key, const std::vector<std::string>& exclude);
};

} // namespace redfish_catalog
