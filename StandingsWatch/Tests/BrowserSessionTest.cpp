#include <gtest/gtest.h>

#include <filesystem>

#include "Browser/AuthStore.h"
#include "Browser/WebDriverSession.h"
#include "Database/Configuration.h"
#include "Utility/Errors.h"
#include "TestSupport.h"

TEST(AuthStoreTest, SavesAndLoadsOpaqueState)
{
    testsupport::TempDir dir;
    AuthStore store(dir.file("nested/auth_state.json"));
    EXPECT_FALSE(store.exists());

    std::string state;
    EXPECT_FALSE(store.load(state));

    ASSERT_TRUE(store.save("{\"version\":1,\"cookies\":[]}"));
    EXPECT_TRUE(store.exists());
    EXPECT_FALSE(std::filesystem::exists(dir.file("nested/auth_state.json.tmp")));

    ASSERT_TRUE(store.load(state));
    EXPECT_EQ("{\"version\":1,\"cookies\":[]}", state);
}

TEST(WebDriverSessionTest, OptionsComeFromConfiguration)
{
    Configuration config;
    config.importText("", "webdriver.url = http://localhost:4444/\nwebdriver.headless = true\n");
    WebDriverSession::Options options = WebDriverSession::Options::LoadFrom(config);
    EXPECT_EQ("http://localhost:4444", options.driverUrl);
    EXPECT_TRUE(options.headless);
}

TEST(WebDriverSessionTest, CommandsBeforeOpenAreFatal)
{
    WebDriverSession session(WebDriverSession::Options{});
    EXPECT_FALSE(session.isOpen());
    EXPECT_THROW(session.navigate("https://example.test/"), SessionFatal);
    EXPECT_THROW(session.reload(), SessionFatal);
    EXPECT_NO_THROW(session.close());
    EXPECT_NO_THROW(session.close());
}

TEST(WebDriverSessionTest, UnreachableDriverIsFatal)
{
    WebDriverSession::Options options;
    options.driverUrl = "http://127.0.0.1:1";
    WebDriverSession session(options);
    EXPECT_THROW(session.open(), SessionFatal);
    EXPECT_FALSE(session.isOpen());
}

TEST(WebDriverSessionTest, DeadBrowserErrorsAreFatal)
{
    EXPECT_TRUE(WebDriverSession::isFatalError("invalid session id", ""));
    EXPECT_TRUE(WebDriverSession::isFatalError("no such window", "target window already closed"));
    EXPECT_TRUE(WebDriverSession::isFatalError("unknown error", "chrome not reachable"));
    EXPECT_TRUE(WebDriverSession::isFatalError("unknown error",
        "unknown error: cannot determine loading status\nfrom disconnected: Unable to receive message from renderer"));

    EXPECT_FALSE(WebDriverSession::isFatalError("unknown error", "cannot read property 'x' of null"));
    EXPECT_FALSE(WebDriverSession::isFatalError("timeout", "script timeout"));
    EXPECT_FALSE(WebDriverSession::isFatalError("no such element", "chrome not reachable"));
}
