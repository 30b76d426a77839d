#include "fuzzy_matcher.hpp"
#include "rfcat_tracing.hpp"

#include <algorithm>
#include <cctype>

namespace redfish_catalog {

std::string FuzzyMatcher::ToLower(const std::string& value) {
	std::string lower = value;
	std::transform(lower.begin(), lower.end(), lower.begin(),
				   [](unsigned char c) { return std::tolower(c); });
	return lower;
}

bool FuzzyMatcher::IsExcluded(const std::string& key, const std::vector<std::string>& exclude) {
	return std::find(exclude.begin(), exclude.end(), key) != exclude.end();
}

size_t FuzzyMatcher::LevenshteinDistance(const std::string& lhs, const std::string& rhs) {
	if (lhs.empty()) {
		return rhs.size();
	}
	if (rhs.empty()) {
		return lhs.size();
	}

	// Two-row dynamic programming table
	std::vector<size_t> previous(rhs.size() + 1);
	std::vector<size_t> current(rhs.size() + 1);
	for (size_t j = 0; j <= rhs.size(); ++j) {
		previous[j] = j;
	}

	for (size_t i = 1; i <= lhs.size(); ++i) {
		current[0] = i;
		for (size_t j = 1; j <= rhs.size(); ++j) {
			size_t substitution = previous[j - 1] + (lhs[i - 1] == rhs[j - 1] ? 0 : 1);
			current[j] = std::min({previous[j] + 1, current[j - 1] + 1, substitution});
		}
		std::swap(previous, current);
	}

	return previous[rhs.size()];
}

double FuzzyMatcher::Similarity(const std::string& lhs, const std::string& rhs) {
	size_t longest = std::max(lhs.size(), rhs.size());
	if (longest == 0) {
		return 1.0;
	}

	auto distance = LevenshteinDistance(ToLower(lhs), ToLower(rhs));
	return 1.0 - static_cast<double>(distance) / static_cast<double>(longest);
}

std::string FuzzyMatcher::MatchKey(const std::string& expected,
								   const std::vector<std::string>& payload_keys,
								   const std::vector<std::string>& exclude,
								   double threshold) {
	// Exact key always wins
	if (std::find(payload_keys.begin(), payload_keys.end(), expected) != payload_keys.end()) {
		return expected;
	}

	auto expected_lower = ToLower(expected);
	for (const auto& key : payload_keys) {
		if (!IsExcluded(key, exclude) && ToLower(key) == expected_lower) {
			RFCAT_TRACE_DEBUG("FUZZY_MATCHER", "Matched '" + expected + "' to '" + key + "' ignoring case");
			return key;
		}
	}

	const std::string* best_key = nullptr;
	double best_score = 0.0;
	for (const auto& key : payload_keys) {
		if (IsExcluded(key, exclude)) {
			continue;
		}
		double score = Similarity(expected, key);
		if (score > best_score) {
			best_score = score;
			best_key = &key;
		}
	}

	if (best_key && best_score >= threshold) {
		RFCAT_TRACE_DEBUG("FUZZY_MATCHER", "Matched '" + expected + "' to '" + *best_key +
						  "' with similarity " + std::to_string(best_score));
		return *best_key;
	}

	return expected;
}

} // namespace redfish_catalog
