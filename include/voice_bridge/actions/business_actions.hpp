#pragma once

#include <string>

#include "voice_bridge/actions/registry.hpp"
#include "voice_bridge/actions/services.hpp"

namespace voice_bridge {
namespace actions {

struct BusinessActionSettings {
    std::string portal_base_url;
    std::string review_url;
    std::string brand_name = "Resolve My Claim";
};

// Registers schedule_callback, send_portal_link, send_review_link,
// send_document_link, check_user_details, check_claim_details and
// check_requirements. The directory and sender must outlive the registry.
void register_business_actions(ActionRegistry& registry,
                               CustomerDirectory& directory,
                               MessageSender& sender,
                               const BusinessActionSettings& settings);

std::string make_portal_link(const std::string& base_url,
                             const std::string& link_type,
                             const std::string& user_id);

}
}
