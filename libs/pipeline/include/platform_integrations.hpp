// Copyright 2025 Preference Collector Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/// @file platform_integrations.hpp
/// @brief Domain-specific adapters that feed platform events into a Collector
///
/// Each integration owns a Collector bound to its domain and turns a
/// platform's "user picked one of two answers" event into a submission,
/// wrapping the raw input in the platform's prompt template.

#include "collector.hpp"

#include <memory>
#include <string>

namespace prefcol::pipeline {

/// Defense world-model scene analysis (domain "defense_wm")
class OrbIntegration {
public:
    explicit OrbIntegration(std::shared_ptr<RemoteClient> client,
                            const CollectorConfig& config = {});

    bool on_scene_comparison(const std::string& query,
                             const std::string& scene_a,
                             const std::string& scene_b,
                             ChosenSide chosen,
                             const std::string& user_id,
                             const std::string& scene_type = "3d_reconstruction");

    Collector& collector() { return collector_; }

private:
    Collector collector_;
};

/// Procurement analysis and proposal drafting (domain "procurement")
class AureonIntegration {
public:
    explicit AureonIntegration(std::shared_ptr<RemoteClient> client,
                               const CollectorConfig& config = {});

    bool on_rfp_analysis(const std::string& rfp_section,
                         const std::string& analysis_a,
                         const std::string& analysis_b,
                         ChosenSide chosen,
                         const std::string& user_id,
                         const std::string& category = "rfp_analysis");

    bool on_proposal_draft(const std::string& requirement,
                           const std::string& draft_a,
                           const std::string& draft_b,
                           ChosenSide chosen,
                           const std::string& user_id);

    Collector& collector() { return collector_; }

private:
    Collector collector_;
};

/// Halal compliance ingredient checks (domain "halal")
class CiviumIntegration {
public:
    explicit CiviumIntegration(std::shared_ptr<RemoteClient> client,
                               const CollectorConfig& config = {});

    bool on_ingredient_check(const std::string& ingredient,
                             const std::string& assessment_a,
                             const std::string& assessment_b,
                             ChosenSide chosen,
                             const std::string& user_id);

    Collector& collector() { return collector_; }

private:
    Collector collector_;
};

}  // namespace prefcol::pipeline
