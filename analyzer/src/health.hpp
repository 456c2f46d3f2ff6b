#pragma once

#include "config.hpp"
#include "candidate_pool.hpp"
#include "pipeline.hpp"
#include <memory>

// GET /health with snapshot state and the last pipeline run
class HealthServer {
public:
    HealthServer(const Config& config, const CandidatePool& pool, const Pipeline& pipeline);
    ~HealthServer();

    void start();
    void stop();

private:
    class Impl;
    std::unique_ptr<Impl> pImpl_;
};
