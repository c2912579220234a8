#include "test_base64.hpp"
#include "test_credentials.hpp"
#include "test_netrc.hpp"
#include "test_request.hpp"
#include "test_url.hpp"

#include <latch/curl/global_curl_context.hpp>

#include <gtest/gtest.h>

int main(int argc, char** argv)
{
    Latch::Curl::GlobalCurlContext curlContext;

    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
