#pragma once
#include "ScoreStore.hpp"
#include <gmock/gmock.h>
#include <optional>
#include <string>

class MockStore : public KeyValueStore {
public:
    MOCK_METHOD(std::optional<std::string>, get, (const std::string& key), (override));
    MOCK_METHOD(bool, set, (const std::string& key, const std::string& value), (override));
};
