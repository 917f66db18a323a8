#include <cstdlib>
#include "common/exceptions.hpp"
#include "config.hpp"
#include "env.hpp"
#include "gtest/gtest.h"
#include "server/config.hpp"

using namespace std;
using namespace grader;

class ConfigTest : public ::testing::Test {
};

TEST_F(ConfigTest, LoadEnvironmentTest) {
    auto timeout = IMAGE_BUILD_TIMEOUT;
    auto nproc = IMAGE_BUILD_NPROC_LIMIT;
    auto memory = IMAGE_BUILD_MEMORY_LIMIT;

    setenv("IMAGE_BUILD_TIMEOUT", "120", 1);
    setenv("IMAGE_BUILD_NPROC_LIMIT", "500", 1);
    setenv("IMAGE_BUILD_MEMORY_LIMIT", "2g", 1);
    load_environment();
    EXPECT_EQ(IMAGE_BUILD_TIMEOUT, chrono::seconds(120));
    EXPECT_EQ(IMAGE_BUILD_NPROC_LIMIT, 500);
    EXPECT_EQ(IMAGE_BUILD_MEMORY_LIMIT, "2g");

    setenv("IMAGE_BUILD_TIMEOUT", "ten minutes", 1);
    EXPECT_THROW(load_environment(), configuration_error);
    setenv("IMAGE_BUILD_TIMEOUT", "0", 1);
    EXPECT_THROW(load_environment(), configuration_error);

    unsetenv("IMAGE_BUILD_TIMEOUT");
    unsetenv("IMAGE_BUILD_NPROC_LIMIT");
    unsetenv("IMAGE_BUILD_MEMORY_LIMIT");
    IMAGE_BUILD_TIMEOUT = timeout;
    IMAGE_BUILD_NPROC_LIMIT = nproc;
    IMAGE_BUILD_MEMORY_LIMIT = memory;
}

TEST_F(ConfigTest, WorkerConfigTest) {
    auto j = nlohmann::json::parse(R"({
        "amqp": {"hostname": "mq", "port": 5673, "exchange": "builds", "queue": "build_sandbox_image"},
        "database": {"host": "db", "user": "grader", "password": "secret", "database": "autograder"},
        "registry": {"host": "registry"}
    })");
    auto config = j.get<server::worker_config>();
    ASSERT_TRUE(config.build_queue);
    EXPECT_EQ(config.build_queue->hostname, "mq");
    EXPECT_EQ(config.build_queue->port, 5673);
    EXPECT_EQ(config.build_queue->exchange_type, "direct");
    EXPECT_EQ(config.build_queue->routing_key, "");
    EXPECT_EQ(config.db.database, "autograder");
    ASSERT_TRUE(config.image_registry);
    EXPECT_EQ(config.image_registry->host, "registry");
    EXPECT_EQ(config.image_registry->port, 5001);
}

TEST_F(ConfigTest, MissingDatabaseTest) {
    auto j = nlohmann::json::parse(R"({"amqp": {"hostname": "mq", "exchange": "builds", "queue": "q"}})");
    EXPECT_THROW(j.get<server::worker_config>(), nlohmann::json::exception);
}
