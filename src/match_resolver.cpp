#include "provmark/match_resolver.hpp"

#include <algorithm>
#include <future>
#include <thread>

#include "provmark/errors.hpp"
#include "provmark/fingerprint.hpp"

namespace ProvMark {

namespace {

void compute_distances(const std::string& query, const std::vector<ProvenanceRecord>& candidates,
                       std::vector<std::optional<int>>& distances, size_t begin, size_t end) {
    for (size_t i = begin; i < end; ++i) {
        const auto& stored = candidates[i].perceptual_hash;
        distances[i] = stored ? PerceptualFingerprint::hamming_distance(query, *stored) : std::nullopt;
    }
}

} // namespace

const char* to_string(MatchStatus status) {
    switch (status) {
        case MatchStatus::FOUND:
            return "FOUND";
        case MatchStatus::HASH_MATCH:
            return "HASH_MATCH";
        case MatchStatus::HASH_MISMATCH:
            return "HASH_MISMATCH";
        case MatchStatus::PERCEPTUAL_MATCH:
            return "PERCEPTUAL_MATCH";
        case MatchStatus::NOT_FOUND:
            return "NOT_FOUND";
    }
    return "UNKNOWN";
}

MatchStatus parse_match_status(const std::string& text) {
    for (MatchStatus status : {MatchStatus::FOUND, MatchStatus::HASH_MATCH, MatchStatus::HASH_MISMATCH,
                               MatchStatus::PERCEPTUAL_MATCH, MatchStatus::NOT_FOUND}) {
        if (text == to_string(status)) {
            return status;
        }
    }
    throw MalformedInput("Unknown match status: " + text);
}

MatchResolver::MatchResolver(const RecordStore& store, int similarity_threshold)
    : store_(store), similarity_threshold_(similarity_threshold) {}

MatchResult MatchResolver::resolve(const std::string& content_hash,
                                   const std::optional<std::string>& perceptual_hash) const {
    if (!ContentFingerprint::is_valid(content_hash)) {
        throw MalformedInput("Content hash must be 64 lowercase hex characters.");
    }
    if (perceptual_hash && !PerceptualFingerprint::is_valid(*perceptual_hash)) {
        throw MalformedInput("Perceptual hash must be 16 lowercase hex characters.");
    }

    MatchResult result;

    // 1. Exact matches always win.
    std::vector<ProvenanceRecord> exact = store_.find_by_content_hash(content_hash);
    if (!exact.empty()) {
        result.status = MatchStatus::FOUND;
        for (auto& record : exact) {
            result.matches.push_back(Match{std::move(record), std::nullopt});
        }
        return result;
    }

    // 2. Perceptual fallback.
    if (perceptual_hash) {
        result.matches = rank_perceptual(*perceptual_hash, store_.find_all_with_perceptual_hash());
        if (!result.matches.empty()) {
            result.status = MatchStatus::PERCEPTUAL_MATCH;
            return result;
        }
    }

    result.status = MatchStatus::NOT_FOUND;
    return result;
}

std::vector<Match> MatchResolver::rank_perceptual(const std::string& perceptual_hash,
                                                  std::vector<ProvenanceRecord> candidates) const {
    std::vector<std::optional<int>> distances(candidates.size());

    const size_t workers = std::max(1u, std::thread::hardware_concurrency());
    if (candidates.size() < PARALLEL_MIN_CANDIDATES || workers == 1) {
        compute_distances(perceptual_hash, candidates, distances, 0, candidates.size());
    } else {
        // Each distance is independent; split the candidates into contiguous slices.
        const size_t slice = (candidates.size() + workers - 1) / workers;
        std::vector<std::future<void>> tasks;
        for (size_t begin = 0; begin < candidates.size(); begin += slice) {
            const size_t end = std::min(begin + slice, candidates.size());
            tasks.push_back(std::async(std::launch::async, compute_distances, std::cref(perceptual_hash),
                                       std::cref(candidates), std::ref(distances), begin, end));
        }
        for (auto& task : tasks) {
            task.get();
        }
    }

    std::vector<Match> matches;
    for (size_t i = 0; i < candidates.size(); ++i) {
        if (distances[i] && *distances[i] <= similarity_threshold_) {
            matches.push_back(Match{std::move(candidates[i]), distances[i]});
        }
    }
    std::stable_sort(matches.begin(), matches.end(),
                     [](const Match& a, const Match& b) { return *a.distance < *b.distance; });
    return matches;
}

} // namespace ProvMark
