#include "build/build_task_store.hpp"
#include "common/exceptions.hpp"
#include "common/retry.hpp"
#include "gtest/gtest.h"

using namespace std;
using namespace grader;

class BuildTaskStoreTest : public ::testing::Test {
protected:
    memory_build_task_store store;

    int add_task(optional<int> image_id = {}) {
        build_task task;
        task.course_id = 1;
        task.build_dir = "/tmp/build";
        task.output_filename = "/tmp/build/output";
        task.image_id = image_id;
        return store.add(task);
    }
};

TEST_F(BuildTaskStoreTest, StateMachineTest) {
    EXPECT_TRUE(can_transition(build_status::queued, build_status::in_progress));
    EXPECT_TRUE(can_transition(build_status::queued, build_status::cancelled));
    EXPECT_FALSE(can_transition(build_status::queued, build_status::done));
    EXPECT_FALSE(can_transition(build_status::queued, build_status::failed));

    for (auto to : {build_status::done, build_status::failed, build_status::image_invalid,
                    build_status::internal_error, build_status::cancelled})
        EXPECT_TRUE(can_transition(build_status::in_progress, to));
    EXPECT_FALSE(can_transition(build_status::in_progress, build_status::queued));

    for (auto from : {build_status::done, build_status::failed, build_status::image_invalid,
                      build_status::internal_error, build_status::cancelled}) {
        EXPECT_TRUE(is_terminal(from));
        EXPECT_FALSE(can_transition(from, build_status::in_progress));
        EXPECT_FALSE(can_transition(from, build_status::cancelled));
    }
    EXPECT_FALSE(is_terminal(build_status::queued));
    EXPECT_FALSE(is_terminal(build_status::in_progress));
}

TEST_F(BuildTaskStoreTest, StatusNameTest) {
    EXPECT_EQ(status_name(build_status::image_invalid), "image_invalid");
    EXPECT_EQ(build_status_from_string("in_progress"), build_status::in_progress);
    EXPECT_THROW(build_status_from_string("running"), invalid_argument);
}

TEST_F(BuildTaskStoreTest, TransitionTest) {
    int id = add_task();
    EXPECT_TRUE(transition(store, id, build_status::in_progress));
    EXPECT_TRUE(transition(store, id, build_status::failed, [](build_task &task) {
        task.return_code = 1;
    }));
    auto task = store.load(id);
    EXPECT_EQ(task.status, build_status::failed);
    EXPECT_EQ(task.return_code, 1);
}

TEST_F(BuildTaskStoreTest, CancelledTaskIsNotOverwrittenTest) {
    int id = add_task();
    EXPECT_TRUE(transition(store, id, build_status::in_progress));
    EXPECT_TRUE(request_cancellation(store, id));

    // 仍在运行的构建完成后的写入不能覆盖取消
    EXPECT_FALSE(transition(store, id, build_status::failed, [](build_task &task) {
        task.internal_error_msg = "stale";
    }));
    EXPECT_FALSE(store.finish(id, "tag"));
    auto task = store.load(id);
    EXPECT_EQ(task.status, build_status::cancelled);
    EXPECT_EQ(task.internal_error_msg, "");
    EXPECT_EQ(store.image_count(), 0u);
}

TEST_F(BuildTaskStoreTest, CancelFinishedTaskTest) {
    int id = add_task();
    transition(store, id, build_status::in_progress);
    EXPECT_TRUE(store.finish(id, "tag"));
    EXPECT_FALSE(request_cancellation(store, id));
    EXPECT_EQ(store.load(id).status, build_status::done);
}

TEST_F(BuildTaskStoreTest, FinishCreatesImageTest) {
    int id = add_task();
    transition(store, id, build_status::in_progress);
    EXPECT_TRUE(store.finish(id, "registry:5001/build1_resultabc"));

    auto task = store.load(id);
    EXPECT_EQ(task.status, build_status::done);
    ASSERT_TRUE(task.image_id);
    auto image = store.load_image(*task.image_id);
    ASSERT_TRUE(image);
    EXPECT_EQ(image->tag, "registry:5001/build1_resultabc");
    EXPECT_EQ(image->course_id, 1);
    EXPECT_EQ(image->display_name.rfind("New Image ", 0), 0u);
}

TEST_F(BuildTaskStoreTest, FinishUpdatesExistingImageTest) {
    sandbox_image existing;
    existing.course_id = 1;
    existing.display_name = "Course Image";
    existing.tag = "old";
    int image_id = store.add_image(existing);
    int id = add_task(image_id);
    transition(store, id, build_status::in_progress);

    EXPECT_TRUE(store.finish(id, "new"));
    auto image = store.load_image(image_id);
    EXPECT_EQ(image->tag, "new");
    EXPECT_EQ(image->display_name, "Course Image");
    EXPECT_EQ(store.image_count(), 1u);
}

TEST_F(BuildTaskStoreTest, MissingTaskTest) {
    EXPECT_THROW(store.load(100), internal_error);
    EXPECT_FALSE(store.load_image(100));
}

TEST_F(BuildTaskStoreTest, RetryOnTransientTest) {
    int attempts = 0;
    int value = retry_on_transient([&] {
        if (++attempts < 3) throw database_error("Deadlock found when trying to get lock");
        return 7;
    }, 5, chrono::milliseconds(1));
    EXPECT_EQ(value, 7);
    EXPECT_EQ(attempts, 3);

    attempts = 0;
    EXPECT_THROW(retry_on_transient([&] {
        ++attempts;
        throw database_error("Lost connection");
    }, 3, chrono::milliseconds(1)), database_error);
    EXPECT_EQ(attempts, 3);

    attempts = 0;
    EXPECT_THROW(retry_on_transient([&] {
        ++attempts;
        throw configuration_error("bad");
    }, 3, chrono::milliseconds(1)), configuration_error);
    EXPECT_EQ(attempts, 1);
}
