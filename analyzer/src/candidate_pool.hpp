#pragma once

#include "types.hpp"
#include <chrono>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

using CandidateSnapshot = std::shared_ptr<const std::vector<BetCandidate>>;

struct CandidateBatch {
    std::vector<BetCandidate> candidates;
    std::size_t malformed = 0;
    std::chrono::system_clock::time_point fetched_at;
};

// Upstream odds and context fetcher
class CandidateSource {
public:
    virtual ~CandidateSource() = default;

    // Throws std::runtime_error when the whole batch is unavailable
    virtual CandidateBatch fetch() = 0;
};

// Reads the fetcher's cached snapshot: {"fetch_time": "...", "candidates": [...]}.
// Malformed records are logged and skipped.
class JsonFileCandidateSource : public CandidateSource {
public:
    explicit JsonFileCandidateSource(std::string path);

    CandidateBatch fetch() override;

    std::optional<std::filesystem::file_time_type> modified_time() const;
    const std::string& path() const { return path_; }

private:
    std::string path_;
};

// Latest candidate snapshot. Readers take a reference to one immutable
// snapshot; replace() never disturbs a run already holding the old one.
class CandidatePool {
public:
    CandidatePool();

    CandidateSnapshot snapshot() const;
    void replace(std::vector<BetCandidate> candidates, std::chrono::system_clock::time_point fetched_at);

    // Fetch and swap; returns the new snapshot size. The old snapshot stays on failure.
    std::size_t refresh(CandidateSource& source);

    bool loaded() const;
    std::chrono::system_clock::time_point fetched_at() const;

private:
    mutable std::mutex mutex_;
    CandidateSnapshot current_;
    std::chrono::system_clock::time_point fetched_at_;
    bool loaded_ = false;
};
