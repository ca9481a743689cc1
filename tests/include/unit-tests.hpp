#pragma once

#include <gtest/gtest.h>

#include "web3_call_codec.hpp"

namespace wcc::tests
{
    class UnitTest : public ::testing::Test
    {
        protected:
            void SetUp() override
            {
                spdlog::set_level(spdlog::level::warn);
            }
    };
}
