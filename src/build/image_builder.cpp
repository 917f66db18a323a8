#include "build/image_builder.hpp"
#include <glog/logging.h>
#include "common/exceptions.hpp"

namespace grader {
using namespace std;

image_builder::image_builder(container_runtime &runtime, filesystem::path build_dir,
                             filesystem::path output_file, string tag,
                             concurrent_queue<build_event> &events, chrono::milliseconds timeout)
    : runtime(runtime), build_dir(move(build_dir)), output_file(move(output_file)),
      image_tag(move(tag)), events(events), timeout(timeout) {}

image_builder::~image_builder() {
    if (worker.joinable()) {
        kill();
        worker.join();
    }
}

void image_builder::start() {
    worker = thread([this] { run(); });
}

void image_builder::join() {
    if (worker.joinable()) worker.join();
}

const string &image_builder::tag() const {
    return image_tag;
}

void image_builder::cancel() {
    scoped_lock guard(mut);
    if (cancelled) return;
    cancelled = true;
    if (process) {
        LOG(INFO) << "Terminating build of " << image_tag;
        process->terminate();
    }
}

void image_builder::kill() {
    scoped_lock guard(mut);
    if (process) {
        LOG(WARNING) << "Killing build of " << image_tag;
        process->kill();
    }
}

void image_builder::run() {
    try {
        build();
    } catch (std::exception &ex) {
        string diagnostic = describe_exception(ex);
        LOG(ERROR) << "Build of " << image_tag << " failed: " << diagnostic;
        events.push(build_failed{diagnostic});
    }
}

void image_builder::build() {
    subprocess *running;
    {
        scoped_lock guard(mut);
        if (cancelled) {
            events.push(build_completed{{}, false, true});
            return;
        }
        process = runtime.spawn_build(build_dir, image_tag, output_file);
        running = process.get();
    }

    build_completed completed;
    completed.return_code = running->wait_for(timeout);
    if (!completed.return_code) {
        LOG(WARNING) << "Build of " << image_tag << " timed out";
        completed.timed_out = true;
        running->kill();
        completed.return_code = running->wait();
    }

    {
        scoped_lock guard(mut);
        completed.cancelled = cancelled;
    }
    events.push(completed);
}

}  // namespace grader
