#pragma once

#include <memory>
#include <string>

#include "call_relay/backend/client.hpp"
#include "call_relay/config.hpp"

namespace call_relay {

// Places outbound calls through the carrier's REST API.
class TwilioClient {
public:
    TwilioClient(std::shared_ptr<BackendClient> client,
                 std::string account_sid,
                 std::string from_number);

    static std::shared_ptr<TwilioClient> from_config(const Config& config);

    // Returns the carrier call SID.
    std::string create_call(const std::string& to, const std::string& webhook_url);

    utils::QueryParams build_call_form(const std::string& to,
                                       const std::string& webhook_url) const;

private:
    std::shared_ptr<BackendClient> client_;
    std::string account_sid_;
    std::string from_number_;
};

}
