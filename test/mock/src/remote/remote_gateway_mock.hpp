#ifndef CALCFLOW_REMOTE_GATEWAY_MOCK_HPP
#define CALCFLOW_REMOTE_GATEWAY_MOCK_HPP

#include <gmock/gmock.h>

#include "remote/remote_gateway.hpp"

namespace calcflow::remote {
  struct RemoteGatewayMock : public RemoteGateway {
    MOCK_METHOD1(MakeDirectory, outcome::result<void>(const std::string &));

    MOCK_METHOD2(Upload,
                 outcome::result<void>(std::string_view, const std::string &));

    MOCK_METHOD1(Submit, outcome::result<std::string>(const std::string &));

    MOCK_METHOD1(Poll,
                 outcome::result<primitives::RemoteStatus>(const std::string &));

    MOCK_METHOD1(Forget, void(const std::string &));

    MOCK_METHOD2(List,
                 outcome::result<std::vector<RemoteEntry>>(
                     const std::string &, const std::vector<std::string> &));

    MOCK_METHOD1(Download, outcome::result<std::string>(const std::string &));
  };
}  // namespace calcflow::remote

#endif  // CALCFLOW_REMOTE_GATEWAY_MOCK_HPP
