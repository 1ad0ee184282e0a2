#include "call_relay/backend/twilio_client.hpp"

#include <utility>

#include "call_relay/logging.hpp"
#include "call_relay/utils/http.hpp"

namespace call_relay {

TwilioClient::TwilioClient(std::shared_ptr<BackendClient> client,
                           std::string account_sid,
                           std::string from_number)
    : client_(std::move(client)),
      account_sid_(std::move(account_sid)),
      from_number_(std::move(from_number)) {}

std::shared_ptr<TwilioClient> TwilioClient::from_config(const Config& config) {
    BackendRequestOptions options;
    options.request_timeout = std::chrono::seconds(static_cast<int>(config.backend_request_timeout));
    options.connect_timeout = std::chrono::seconds(static_cast<int>(config.backend_connect_timeout));
    options.sock_read_timeout = options.request_timeout;
    auto client = std::make_shared<BackendClient>(
        config.twilio_api_url,
        httplib::Headers{httplib::make_basic_authentication_header(config.twilio_account_sid,
                                                                   config.twilio_auth_token)},
        options);
    return std::make_shared<TwilioClient>(std::move(client), config.twilio_account_sid,
                                          config.twilio_from_number);
}

std::string TwilioClient::create_call(const std::string& to, const std::string& webhook_url) {
    const auto path = "/2010-04-01/Accounts/" + utils::url_encode(account_sid_) + "/Calls.json";
    const auto response = client_->post_form(path, build_call_form(to, webhook_url));
    const auto sid = response.value("sid", "");
    if (sid.empty()) {
        throw BackendError("Call creation response has no sid");
    }
    logging::info(
        "Outbound call placed",
        {kv("call_sid", sid),
         kv("to", to),
         kv("status", response.value("status", ""))});
    return sid;
}

utils::QueryParams TwilioClient::build_call_form(const std::string& to,
                                                 const std::string& webhook_url) const {
    return {
        {"To", to},
        {"From", from_number_},
        {"Url", webhook_url},
        {"Method", "POST"},
    };
}

}
