#pragma once

#include "CheckinProtocol.hpp"

#include <string>

struct TlsSettings {
    bool enabled = false;
    std::string certPath;
    std::string keyPath;
    std::string caPath;
    bool verifyPeer = true;
    bool verifyHost = false;
};

class CheckinClient {
public:
    explicit CheckinClient(std::string baseUrl, TlsSettings tlsSettings = {}, std::string apiKey = {});

    // One check-in round trip. False on transport failure or an unreadable
    // reply; an empty reply is a success with an Empty delivery.
    bool Checkin(const CheckinRequest& request, Delivery& outDelivery);

private:
    std::string baseUrl_;
    TlsSettings tlsSettings_;
    std::string apiKey_;
};
