// Copyright 2025 Preference Collector Contributors
// SPDX-License-Identifier: Apache-2.0

#include "platform_integrations.hpp"

namespace prefcol::pipeline {

OrbIntegration::OrbIntegration(std::shared_ptr<RemoteClient> client,
                               const CollectorConfig& config)
    : collector_("defense_wm", std::move(client), config) {
}

bool OrbIntegration::on_scene_comparison(const std::string& query,
                                         const std::string& scene_a,
                                         const std::string& scene_b,
                                         ChosenSide chosen,
                                         const std::string& user_id,
                                         const std::string& scene_type) {
    return collector_.submit(query, scene_a, scene_b, chosen, user_id, scene_type);
}

AureonIntegration::AureonIntegration(std::shared_ptr<RemoteClient> client,
                                     const CollectorConfig& config)
    : collector_("procurement", std::move(client), config) {
}

bool AureonIntegration::on_rfp_analysis(const std::string& rfp_section,
                                        const std::string& analysis_a,
                                        const std::string& analysis_b,
                                        ChosenSide chosen,
                                        const std::string& user_id,
                                        const std::string& category) {
    return collector_.submit("Analyze this RFP section:\n\n" + rfp_section,
                             analysis_a, analysis_b, chosen, user_id, category);
}

bool AureonIntegration::on_proposal_draft(const std::string& requirement,
                                          const std::string& draft_a,
                                          const std::string& draft_b,
                                          ChosenSide chosen,
                                          const std::string& user_id) {
    return collector_.submit("Draft proposal section for:\n\n" + requirement,
                             draft_a, draft_b, chosen, user_id, "proposal_writing");
}

CiviumIntegration::CiviumIntegration(std::shared_ptr<RemoteClient> client,
                                     const CollectorConfig& config)
    : collector_("halal", std::move(client), config) {
}

bool CiviumIntegration::on_ingredient_check(const std::string& ingredient,
                                            const std::string& assessment_a,
                                            const std::string& assessment_b,
                                            ChosenSide chosen,
                                            const std::string& user_id) {
    return collector_.submit("Assess halal status of ingredient: " + ingredient,
                             assessment_a, assessment_b, chosen, user_id,
                             "ingredient_analysis");
}

}  // namespace prefcol::pipeline
