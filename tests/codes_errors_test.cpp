#include <gtest/gtest.h>

#include "common/codes.hpp"
#include "common/errors.hpp"

namespace rock {

/* ----------------------------------------------------------------------------
 * Codes
 * --------------------------------------------------------------------------*/

TEST(Codes, classification)
{
    ASSERT_TRUE(is_success(2000));
    ASSERT_TRUE(is_success(2999));
    ASSERT_FALSE(is_success(4000));

    ASSERT_TRUE(is_client_error(4000));
    ASSERT_TRUE(is_server_error(5001));
    ASSERT_TRUE(is_command_error(6000));

    ASSERT_TRUE(is_error(4000));
    ASSERT_TRUE(is_error(6999));
    ASSERT_FALSE(is_error(2000));
}

/* ----------------------------------------------------------------------------
 * Error messages
 * --------------------------------------------------------------------------*/

TEST(RockErrors, notStartedNamesOperation)
{
    NotStartedError e("execute command");

    ASSERT_EQ(e.operation(), "execute command");
    ASSERT_STREQ(e.what(), "Sandbox not started: cannot execute command");
}

TEST(RockErrors, startTimeoutMessage)
{
    StartTimeoutError e("sb-1", 180);

    ASSERT_EQ(e.timeout_seconds(), 180);
    ASSERT_STREQ(e.what(), "Failed to start sandbox sb-1 within 180s");
}

TEST(RockErrors, remoteCallCarriesOperationAndUrl)
{
    RemoteCallError e("stop sandbox", "http://host/stop", "HTTP 502: bad gateway");

    ASSERT_EQ(e.operation(), "stop sandbox");
    ASSERT_EQ(e.url(), "http://host/stop");
    ASSERT_EQ(e.detail(), "HTTP 502: bad gateway");
    ASSERT_STREQ(e.what(), "Failed to stop sandbox (http://host/stop): HTTP 502: bad gateway");
    ASSERT_EQ(e.code(), 0);
}

TEST(RockErrors, invalidParameterIsBadRequest)
{
    InvalidParameterError e("size must be >= 0");

    ASSERT_EQ(e.code(), 4000);
}

/* ----------------------------------------------------------------------------
 * raise_for_code
 * --------------------------------------------------------------------------*/

TEST(raiseForCode, successAndUnknownReturn)
{
    ASSERT_NO_THROW(raise_for_code(0, "op", "url", "detail"));
    ASSERT_NO_THROW(raise_for_code(2000, "op", "url", "detail"));
}

TEST(raiseForCode, mapsRanges)
{
    ASSERT_THROW(raise_for_code(4001, "op", "url", "detail"), BadRequestError);
    ASSERT_THROW(raise_for_code(5000, "op", "url", "detail"), InternalServerError);
    ASSERT_THROW(raise_for_code(6002, "op", "url", "detail"), CommandError);
    ASSERT_THROW(raise_for_code(7000, "op", "url", "detail"), RemoteCallError);
}

TEST(raiseForCode, keepsCode)
{
    try {
        raise_for_code(5003, "run in session", "http://host/run_in_session", "boom");
        FAIL() << "expected InternalServerError";
    } catch (const InternalServerError& e) {
        ASSERT_EQ(e.code(), 5003);
        ASSERT_EQ(e.operation(), "run in session");
    }
}

} // namespace rock
