#include "build/build_task_store.hpp"
#include <glog/logging.h>
#include "common/exceptions.hpp"
#include "common/retry.hpp"
#include "common/utils.hpp"

namespace grader {
using namespace std;

build_task_store::~build_task_store() {}

bool transition(build_task_store &store, int task_id, build_status to,
                const function<void(build_task &)> &extra) {
    bool applied = false;
    retry_on_transient([&] {
        applied = false;
        store.update(task_id, [&](build_task &task) {
            if (!can_transition(task.status, to)) {
                LOG(INFO) << "Build task " << task_id << " cannot transition from "
                          << status_name(task.status) << " to " << status_name(to);
                return false;
            }
            task.status = to;
            if (extra) extra(task);
            applied = true;
            return true;
        });
    });
    if (applied)
        LOG(INFO) << "Build task " << task_id << " is now " << status_name(to);
    return applied;
}

bool request_cancellation(build_task_store &store, int task_id) {
    return transition(store, task_id, build_status::cancelled);
}

int memory_build_task_store::add(build_task task) {
    scoped_lock guard(mut);
    task.id = next_task_id++;
    tasks[task.id] = task;
    return task.id;
}

int memory_build_task_store::add_image(sandbox_image image) {
    scoped_lock guard(mut);
    image.id = next_image_id++;
    images[image.id] = image;
    return image.id;
}

build_task memory_build_task_store::load(int task_id) {
    scoped_lock guard(mut);
    auto it = tasks.find(task_id);
    if (it == tasks.end())
        throw internal_error("Build task " + to_string(task_id) + " does not exist");
    return it->second;
}

build_task memory_build_task_store::update(int task_id, const function<bool(build_task &)> &mutator) {
    scoped_lock guard(mut);
    auto it = tasks.find(task_id);
    if (it == tasks.end())
        throw internal_error("Build task " + to_string(task_id) + " does not exist");
    build_task task = it->second;
    if (mutator(task)) it->second = task;
    return it->second;
}

bool memory_build_task_store::finish(int task_id, const string &tag) {
    scoped_lock guard(mut);
    auto it = tasks.find(task_id);
    if (it == tasks.end())
        throw internal_error("Build task " + to_string(task_id) + " does not exist");
    build_task &task = it->second;
    if (!can_transition(task.status, build_status::done))
        return false;

    if (task.image_id) {
        auto image = images.find(*task.image_id);
        if (image == images.end())
            throw internal_error("Sandbox image " + to_string(*task.image_id) + " does not exist");
        image->second.tag = tag;
    } else {
        sandbox_image image;
        image.id = next_image_id++;
        image.course_id = task.course_id;
        image.display_name = "New Image " + random_hex();
        image.tag = tag;
        images[image.id] = image;
        task.image_id = image.id;
    }
    task.status = build_status::done;
    return true;
}

optional<sandbox_image> memory_build_task_store::load_image(int image_id) {
    scoped_lock guard(mut);
    auto it = images.find(image_id);
    if (it == images.end()) return {};
    return it->second;
}

size_t memory_build_task_store::image_count() {
    scoped_lock guard(mut);
    return images.size();
}

}  // namespace grader
