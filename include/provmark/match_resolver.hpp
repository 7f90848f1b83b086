#ifndef PROVMARK_MATCH_RESOLVER_HPP
#define PROVMARK_MATCH_RESOLVER_HPP

#include "perceptual.hpp"
#include "record_store.hpp"

#include <optional>
#include <string>
#include <vector>

namespace ProvMark {

    enum class MatchStatus {
        FOUND,             // exact content hash match
        HASH_MATCH,        // the named record has this content hash
        HASH_MISMATCH,     // the named record has a different content hash
        PERCEPTUAL_MATCH,  // visually similar candidates only
        NOT_FOUND
    };

    const char* to_string(MatchStatus status);

    /**
     * @throws ProvMark::MalformedInput for an unknown status name.
     */
    MatchStatus parse_match_status(const std::string& text);

    struct Match {
        ProvenanceRecord record;
        std::optional<int> distance;  // set for perceptual matches
    };

    struct MatchResult {
        MatchStatus status = MatchStatus::NOT_FOUND;
        std::vector<Match> matches;
    };

    /**
     * @brief Two-tier lookup: exact content hash first, perceptual hash second.
     *
     * A perceptual match only locates a candidate. Its signature still has
     * to be checked before the record is trusted.
     */
    class MatchResolver {
    public:
        // Below this many candidates distances are computed on the calling thread.
        static constexpr size_t PARALLEL_MIN_CANDIDATES = 512;

        explicit MatchResolver(const RecordStore& store, int similarity_threshold = DEFAULT_SIMILARITY_THRESHOLD);

        /**
         * @brief Resolves a fingerprint pair against the store.
         * @param content_hash 64 lowercase hex characters.
         * @param perceptual_hash Optional 16 lowercase hex characters.
         * @throws ProvMark::MalformedInput if either hash is malformed.
         */
        MatchResult resolve(const std::string& content_hash,
                            const std::optional<std::string>& perceptual_hash = std::nullopt) const;

        /**
         * @brief Keeps candidates within the threshold, closest first.
         *        Candidates without a comparable hash are dropped.
         */
        std::vector<Match> rank_perceptual(const std::string& perceptual_hash,
                                           std::vector<ProvenanceRecord> candidates) const;

        int similarity_threshold() const { return similarity_threshold_; }

    private:
        const RecordStore& store_;
        int similarity_threshold_;
    };

} // namespace ProvMark

#endif // PROVMARK_MATCH_RESOLVER_HPP
