#include "voice_bridge/actions/business_actions.hpp"

#include <map>
#include <sstream>

#include "voice_bridge/logging.hpp"
#include "voice_bridge/utils/phone.hpp"

namespace voice_bridge::actions {

namespace {

using nlohmann::json;

constexpr size_t kPortalTokenBytes = 32;

ParameterSpec delivery_method_param() {
    return ParameterSpec{"string", "How to send the link", {"sms", "email"}};
}

ParameterSpec claim_reference_param(const std::string& description) {
    return ParameterSpec{"string", description, {}};
}

std::string greeting_for(const std::string& first_name) {
    return first_name.empty() ? "Hello" : "Hi " + first_name;
}

// Lookups made only to personalise a reply must not fail the action.
logging::CallLog call_log(const ActionContext& context) {
    return logging::CallLog(context.call_sid, context.stream_sid);
}

CustomerRecord lookup_quietly(CustomerDirectory& directory,
                              const ActionContext& context,
                              const std::string& action) {
    if (context.caller_phone.empty()) {
        return CustomerRecord{};
    }
    try {
        return directory.find_customer_by_phone(context.caller_phone);
    } catch (const std::exception& ex) {
        call_log(context).warn(
            "Customer lookup failed",
            {kv("action", action),
             kv("error", ex.what())});
        return CustomerRecord{};
    }
}

DeliveryResult deliver(MessageSender& sender,
                       const std::string& method,
                       const std::string& phone,
                       const std::string& body) {
    if (method == "email") {
        return DeliveryResult{false, "", "Email sending not available in voice service yet"};
    }
    if (phone.empty()) {
        return DeliveryResult{false, "", "No caller phone number available"};
    }
    return sender.send_sms(utils::format_e164(phone), body);
}

json delivery_failure(const std::string& method, const DeliveryResult& delivery,
                      json data) {
    data["delivery_method"] = method;
    data["delivery_failed"] = true;
    return json{
        {"success", false},
        {"message", "I couldn't send that via " + method +
                        " right now. You can call back later or we can try another way."},
        {"error", delivery.error},
        {"data", std::move(data)}};
}

std::string describe_status(const std::string& status) {
    static const std::map<std::string, std::string> descriptions{
        {"pending", "pending review"},
        {"under_review", "currently under review"},
        {"approved", "approved for compensation"},
        {"rejected", "unfortunately been rejected"},
        {"paid", "completed with payment made"},
        {"escalated", "escalated for further review"}};
    const auto it = descriptions.find(status);
    return it == descriptions.end() ? status : it->second;
}

json schedule_callback(CustomerDirectory& directory, MessageSender& sender,
                       const BusinessActionSettings& settings,
                       const ActionContext& context, const json& params) {
    const auto preferred_time = params.at("preferred_time").get<std::string>();
    const auto reason = params.value("reason", std::string("General inquiry"));

    auto customer = lookup_quietly(directory, context, "schedule_callback");
    CallbackRequest request;
    request.call_sid = context.call_sid;
    request.phone_number = context.caller_phone;
    request.customer_id = customer.found ? std::optional<std::string>(customer.id)
                                         : context.customer_id;
    request.preferred_time = preferred_time;
    request.reason = reason;
    const auto record = directory.schedule_callback(request);

    bool confirmation_sent = false;
    if (!context.caller_phone.empty()) {
        std::ostringstream body;
        body << greeting_for(customer.first_name) << ",\n\n"
             << "Your callback has been scheduled for " << preferred_time << ".\n\n"
             << "Reason: " << reason << "\n\n"
             << "We'll call you at this number. Thanks!\n\n"
             << settings.brand_name;
        const auto delivery = deliver(sender, "sms", context.caller_phone, body.str());
        confirmation_sent = delivery.success;
        if (!delivery.success) {
            call_log(context).warn(
                "Callback confirmation SMS failed",
                {kv("error", delivery.error)});
        }
    }

    return json{
        {"success", true},
        {"message", "I've scheduled a callback for " + preferred_time + "."},
        {"data",
         {{"callback_id", record.id},
          {"scheduled_for", record.scheduled_for.empty() ? preferred_time
                                                         : record.scheduled_for},
          {"reason", reason},
          {"confirmation_sent", confirmation_sent}}}};
}

json send_portal_link(CustomerDirectory& directory, MessageSender& sender,
                      const BusinessActionSettings& settings,
                      const ActionContext& context, const json& params) {
    const auto method = params.at("method").get<std::string>();
    const auto link_type = params.value("link_type", std::string("claims"));

    const auto customer = lookup_quietly(directory, context, "send_portal_link");
    if (!customer.found) {
        return json{
            {"success", false},
            {"message", "I couldn't find your account in our system. You may need to "
                        "register first or provide additional verification."},
            {"error", "customer not found"},
            {"data", {{"user_found", false}, {"suggested_action", "register_or_verify"}}}};
    }

    const auto portal_url = make_portal_link(settings.portal_base_url, link_type, customer.id);
    std::ostringstream body;
    body << greeting_for(customer.first_name) << ",\n\n"
         << "Here's your secure portal link: " << portal_url << "\n\n"
         << "This link expires in 24 hours for security.\n\n"
         << settings.brand_name;
    const auto delivery = deliver(sender, method, context.caller_phone, body.str());
    if (!delivery.success) {
        return delivery_failure(method, delivery, {{"customer_name", customer.full_name}});
    }
    return json{
        {"success", true},
        {"message", "I've sent you a secure portal link via " + method +
                        ". It will expire in 24 hours."},
        {"data",
         {{"portal_url", portal_url},
          {"delivery_method", method},
          {"message_id", delivery.provider_message_id},
          {"customer_name", customer.full_name},
          {"expires_in_hours", 24}}}};
}

json send_review_link(CustomerDirectory& directory, MessageSender& sender,
                      const BusinessActionSettings& settings,
                      const ActionContext& context, const json& params) {
    const auto method = params.at("method").get<std::string>();
    const auto customer = lookup_quietly(directory, context, "send_review_link");

    std::ostringstream body;
    body << greeting_for(customer.first_name) << ",\n\n"
         << "Thank you for using " << settings.brand_name
         << "! We'd love your feedback:\n\n"
         << settings.review_url << "\n\n"
         << "Your review helps others understand our service.\n\nThanks!";
    const auto delivery = deliver(sender, method, context.caller_phone, body.str());
    if (!delivery.success) {
        return delivery_failure(method, delivery, json::object());
    }
    return json{
        {"success", true},
        {"message", "Thank you! I've sent you our review link via " + method + "."},
        {"data",
         {{"delivery_method", method},
          {"message_id", delivery.provider_message_id},
          {"review_url", settings.review_url}}}};
}

json send_document_link(CustomerDirectory& directory, MessageSender& sender,
                        const BusinessActionSettings& settings,
                        const ActionContext& context, const json& params) {
    const auto method = params.at("method").get<std::string>();
    const auto document_type = params.value("document_type", std::string("required documents"));

    const auto customer = lookup_quietly(directory, context, "send_document_link");
    if (!customer.found) {
        return json{
            {"success", false},
            {"message", "I need to verify your account before I can send you a document "
                        "upload link."},
            {"error", "customer not found"},
            {"data", {{"user_found", false}, {"suggested_action", "verify_account"}}}};
    }

    const auto upload_url = make_portal_link(settings.portal_base_url, "documents", customer.id);
    std::ostringstream body;
    body << greeting_for(customer.first_name) << ",\n\n"
         << "Please upload your " << document_type << " using this secure link:\n\n"
         << upload_url << "\n\n"
         << "This link expires in 48 hours.\n\n"
         << settings.brand_name;
    const auto delivery = deliver(sender, method, context.caller_phone, body.str());
    if (!delivery.success) {
        return delivery_failure(method, delivery, {{"customer_name", customer.full_name}});
    }
    return json{
        {"success", true},
        {"message", "I've sent you a secure upload link for your " + document_type + " via " +
                        method + "."},
        {"data",
         {{"upload_url", upload_url},
          {"document_type", document_type},
          {"delivery_method", method},
          {"message_id", delivery.provider_message_id}}}};
}

json check_user_details(CustomerDirectory& directory, const ActionContext& context,
                        const json& params) {
    const auto phone = params.at("phone_number").get<std::string>();
    const auto customer = directory.find_customer_by_phone(phone);
    if (!customer.found) {
        return json{
            {"success", true},
            {"message", "I couldn't find an account with that phone number in our system."},
            {"data",
             {{"user_found", false},
              {"phone_searched", utils::mask_phone_number(phone)}}}};
    }

    std::ostringstream message;
    message << "Hello " << (customer.full_name.empty() ? "there" : customer.full_name)
            << "! I found your account.";
    if (customer.claim_count == 0) {
        message << " You don't currently have any claims in our system.";
    } else if (customer.claim_count == 1) {
        message << " You have 1 claim with us.";
    } else {
        message << " You have " << customer.claim_count << " claims with us.";
    }

    json data{
        {"user_found", true},
        {"user_id", customer.id},
        {"customer_name", customer.full_name},
        {"first_name", customer.first_name},
        {"claim_count", customer.claim_count}};

    if (params.contains("claim_reference")) {
        const auto reference = params.at("claim_reference").get<std::string>();
        try {
            const auto claim = directory.get_claim(reference);
            if (claim.found) {
                message << " I can see your claim " << claim.reference << " with "
                        << claim.lender << ". The status is currently " << claim.status
                        << ".";
                data["claim"] = {{"reference", claim.reference},
                                 {"status", claim.status},
                                 {"lender", claim.lender}};
            }
        } catch (const std::exception& ex) {
            call_log(context).warn(
                "Claim lookup failed",
                {kv("error", ex.what())});
        }
    }

    return json{{"success", true}, {"message", message.str()}, {"data", std::move(data)}};
}

json check_claim_details(CustomerDirectory& directory, const json& params) {
    const auto reference = params.at("claim_reference").get<std::string>();
    const auto claim = directory.get_claim(reference);
    if (!claim.found) {
        return json{
            {"success", true},
            {"message", "I couldn't find a claim with reference " + reference + "."},
            {"data", {{"claim_found", false}, {"reference_searched", reference}}}};
    }

    const auto description = describe_status(claim.status);
    std::ostringstream message;
    message << "I found your claim " << claim.reference << ". This is your claim against "
            << claim.lender << ". The current status is " << description << ".";
    if (claim.amount) {
        message << " The estimated compensation amount is " << *claim.amount << " pounds.";
    }

    json data{
        {"claim_found", true},
        {"reference", claim.reference},
        {"status", claim.status},
        {"status_description", description},
        {"lender", claim.lender}};
    if (claim.amount) {
        data["estimated_amount"] = *claim.amount;
    }
    return json{{"success", true}, {"message", message.str()}, {"data", std::move(data)}};
}

json check_requirements(CustomerDirectory& directory, const json& params) {
    const auto reference = params.at("claim_reference").get<std::string>();
    const auto requirements = directory.get_open_requirements(reference);

    std::ostringstream message;
    if (requirements.empty()) {
        message << "There are no outstanding requirements on claim " << reference << ".";
    } else {
        message << "Claim " << reference << " still needs: ";
        for (size_t i = 0; i < requirements.size(); ++i) {
            if (i > 0) {
                message << (i + 1 == requirements.size() ? " and " : ", ");
            }
            message << requirements[i];
        }
        message << ".";
    }
    return json{
        {"success", true},
        {"message", message.str()},
        {"data",
         {{"reference", reference},
          {"requirements", requirements},
          {"outstanding_count", requirements.size()}}}};
}

}

std::string make_portal_link(const std::string& base_url,
                             const std::string& link_type,
                             const std::string& user_id) {
    static const std::map<std::string, std::string> paths{
        {"claims", "/claims"},
        {"documents", "/upload"},
        {"upload", "/upload"},
        {"status", "/status"},
        {"portal", "/claims"}};
    const auto it = paths.find(link_type);
    const auto& path = it == paths.end() ? paths.at("claims") : it->second;
    return base_url + path + "?token=" + utils::random_hex(kPortalTokenBytes) +
           "&user=" + user_id;
}

void register_business_actions(ActionRegistry& registry,
                               CustomerDirectory& directory,
                               MessageSender& sender,
                               const BusinessActionSettings& settings) {
    registry.register_action(
        "schedule_callback",
        ActionSpec{
            "Schedule a callback for the customer at their preferred time",
            {"preferred_time"},
            {"reason"},
            {{"preferred_time",
              ParameterSpec{"string",
                            "When the customer wants to be called back "
                            "(e.g. \"tomorrow at 2pm\", \"Monday morning\")",
                            {}}},
             {"reason", ParameterSpec{"string", "Why they need a callback", {}}}}},
        [&directory, &sender, settings](const ActionContext& context, const json& params) {
            return schedule_callback(directory, sender, settings, context, params);
        });

    registry.register_action(
        "send_portal_link",
        ActionSpec{
            "Send a secure portal access link via SMS or email",
            {"method"},
            {"link_type"},
            {{"method", delivery_method_param()},
             {"link_type",
              ParameterSpec{"string", "Type of portal access",
                            {"claims", "documents", "status"}}}}},
        [&directory, &sender, settings](const ActionContext& context, const json& params) {
            return send_portal_link(directory, sender, settings, context, params);
        });

    registry.register_action(
        "send_review_link",
        ActionSpec{
            "Send a review link to satisfied customers",
            {"method"},
            {},
            {{"method", delivery_method_param()}}},
        [&directory, &sender, settings](const ActionContext& context, const json& params) {
            return send_review_link(directory, sender, settings, context, params);
        });

    registry.register_action(
        "send_document_link",
        ActionSpec{
            "Send a secure document upload link",
            {"method"},
            {"document_type"},
            {{"method", delivery_method_param()},
             {"document_type",
              ParameterSpec{"string", "Which documents the customer should upload", {}}}}},
        [&directory, &sender, settings](const ActionContext& context, const json& params) {
            return send_document_link(directory, sender, settings, context, params);
        });

    registry.register_action(
        "check_user_details",
        ActionSpec{
            "Look up customer information and claims status",
            {"phone_number"},
            {"claim_reference"},
            {{"phone_number",
              ParameterSpec{"string", "Customer phone number to lookup", {}}},
             {"claim_reference",
              claim_reference_param("Optional claim reference for context")}}},
        [&directory](const ActionContext& context, const json& params) {
            return check_user_details(directory, context, params);
        });

    registry.register_action(
        "check_claim_details",
        ActionSpec{
            "Get detailed information about a specific claim",
            {"claim_reference"},
            {},
            {{"claim_reference", claim_reference_param("The claim reference number")}}},
        [&directory](const ActionContext&, const json& params) {
            return check_claim_details(directory, params);
        });

    registry.register_action(
        "check_requirements",
        ActionSpec{
            "List the outstanding requirements on a claim",
            {"claim_reference"},
            {},
            {{"claim_reference", claim_reference_param("The claim reference number")}}},
        [&directory](const ActionContext&, const json& params) {
            return check_requirements(directory, params);
        });
}

}
