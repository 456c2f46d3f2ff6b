#include "candidate_pool.hpp"
#include "errors.hpp"
#include "json_schemas.hpp"
#include "util.hpp"
#include <fmt/format.h>
#include <fstream>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <system_error>

using json = nlohmann::json;

JsonFileCandidateSource::JsonFileCandidateSource(std::string path) : path_(std::move(path)) {}

CandidateBatch JsonFileCandidateSource::fetch() {
    std::ifstream in(path_);
    if (!in) {
        throw std::runtime_error(fmt::format("Cannot open candidate snapshot {}", path_));
    }

    json j;
    try {
        in >> j;
    } catch (const json::exception& e) {
        throw std::runtime_error(fmt::format("Malformed candidate snapshot {}: {}", path_, e.what()));
    }

    auto records = j.find("candidates");
    if (records == j.end() || !records->is_array()) {
        throw std::runtime_error(fmt::format("Candidate snapshot {} has no 'candidates' array", path_));
    }

    CandidateBatch batch;
    batch.fetched_at = std::chrono::system_clock::now();
    if (j.contains("fetch_time") && j["fetch_time"].is_string()) {
        try {
            batch.fetched_at = util::parse_iso8601(j["fetch_time"].get<std::string>());
        } catch (const std::invalid_argument& e) {
            spdlog::warn("Snapshot fetch_time unreadable, using load time: {}", e.what());
        }
    }

    batch.candidates.reserve(records->size());
    for (const auto& record : *records) {
        try {
            batch.candidates.push_back(candidate_from_json(record));
        } catch (const InvalidInputError& e) {
            ++batch.malformed;
            spdlog::warn("Skipping snapshot record: {}", e.what());
        }
    }

    spdlog::info("Loaded {} candidates from {} ({} malformed)", batch.candidates.size(), path_, batch.malformed);
    return batch;
}

std::optional<std::filesystem::file_time_type> JsonFileCandidateSource::modified_time() const {
    std::error_code ec;
    auto time = std::filesystem::last_write_time(path_, ec);
    if (ec) {
        return std::nullopt;
    }
    return time;
}

CandidatePool::CandidatePool()
    : current_(std::make_shared<std::vector<BetCandidate>>()) {}

CandidateSnapshot CandidatePool::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_;
}

void CandidatePool::replace(std::vector<BetCandidate> candidates, std::chrono::system_clock::time_point fetched_at) {
    auto next = std::make_shared<std::vector<BetCandidate>>(std::move(candidates));
    std::lock_guard<std::mutex> lock(mutex_);
    current_ = std::move(next);
    fetched_at_ = fetched_at;
    loaded_ = true;
}

std::size_t CandidatePool::refresh(CandidateSource& source) {
    auto batch = source.fetch();
    std::size_t count = batch.candidates.size();
    replace(std::move(batch.candidates), batch.fetched_at);
    return count;
}

bool CandidatePool::loaded() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return loaded_;
}

std::chrono::system_clock::time_point CandidatePool::fetched_at() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return fetched_at_;
}
