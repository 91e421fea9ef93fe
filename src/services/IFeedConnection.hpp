#pragma once

#include "domain/events/FeedMessage.hpp"

#include <functional>
#include <string>

namespace obr::services {

class IFeedConnection {
public:
    using MessageCallback = std::function<void(const obr::domain::FeedMessage&)>;
    using MalformedCallback = std::function<void(const std::string& reason)>;

    virtual void set_on_message(MessageCallback callback) = 0;
    virtual void set_on_malformed(MalformedCallback callback) = 0;
    virtual void subscribe(const std::string& symbol) = 0;
    virtual void start() = 0;
    virtual void stop() = 0;
    virtual ~IFeedConnection() = default;
};

} // namespace obr::services
