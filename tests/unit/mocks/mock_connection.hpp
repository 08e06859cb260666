#pragma once
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <optional>
#include <string>
#include <vector>

#include "connection/i_connection.hpp"

namespace comserver::tests {

using namespace comserver;
using namespace testing;
using ReceiveOptions = connection::ReceiveOptions;
using ReceiveRecord = connection::ReceiveRecord;
using OptionalRecord = std::optional<ReceiveRecord>;
using OptionalString = std::optional<std::string>;

class MockConnection : public connection::IConnection {
public:
    MOCK_METHOD(bool, send, (const std::string &), (override));
    MOCK_METHOD(OptionalRecord, receive_str, (std::size_t, const ReceiveOptions &), (override));
    MOCK_METHOD(std::vector<ReceiveRecord>, get_all_rcv_str, (const ReceiveOptions &), (override));
    MOCK_METHOD(OptionalString, get, (const ReceiveOptions &), (override));
    MOCK_METHOD(OptionalString, get_first_response, (const std::string &, const ReceiveOptions &), (override));
    MOCK_METHOD(bool, wait_for_response, (const std::string &, const ReceiveOptions &), (override));
    MOCK_METHOD(bool, send_for_response, (const std::string &, const std::string &, const ReceiveOptions &),
                (override));
};

// Matches ReceiveOptions{read_until, strip}
MATCHER_P2(OptionsAre, read_until, strip, "") {
    return arg.read_until == read_until && arg.strip == strip;
}

}  // namespace comserver::tests
