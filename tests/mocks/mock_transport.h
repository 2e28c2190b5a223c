#pragma once

#include "transport/transport_client.hpp"
#include <gmock/gmock.h>

class MockTransport : public nbdatatools::TransportClient {
public:
  MOCK_METHOD(std::future<nbdatatools::FetchResult>, fetchRange,
              (uint64_t offset, uint64_t length), (override));
  MOCK_METHOD(std::future<uint64_t>, size, (), (override));
  MOCK_METHOD(bool, supportsRangeRequests, (), (override));
  MOCK_METHOD(std::string, source, (), (const, override));
  MOCK_METHOD(void, close, (), (override));
};
