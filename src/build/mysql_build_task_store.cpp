#include "build/mysql_build_task_store.hpp"
#include <glog/logging.h>
#include <tuple>
#include "common/defer.hpp"
#include "common/exceptions.hpp"
#include "common/utils.hpp"

namespace grader {
using namespace std;
using namespace ormpp;

mysql_build_task_store::mysql_build_task_store(const server::database &dbcfg)
    : dbcfg(dbcfg) {
    connect();
}

void mysql_build_task_store::connect() {
    LOG(INFO) << "MySQL: connecting to " << dbcfg.host << "/" << dbcfg.database;
    if (!db.connect(dbcfg.host.c_str(), dbcfg.user.c_str(), dbcfg.password.c_str(), dbcfg.database.c_str()))
        throw database_error("Unable to connect to database " + dbcfg.host + "/" + dbcfg.database);
}

void mysql_build_task_store::commit() {
    if (!db.commit())
        throw database_error("Unable to commit transaction: " + db.get_last_error());
}

template <typename Func>
auto mysql_build_task_store::transaction(Func &&func) -> decltype(func()) {
    scoped_lock guard(mut);
    try {
        if (!db.ping()) connect();
        if (!db.begin())
            throw database_error("Unable to begin transaction: " + db.get_last_error());
        scoped_guard rollback([this] { db.rollback(); });
        if constexpr (is_void_v<decltype(func())>) {
            func();
            commit();
            rollback.dismiss();
        } else {
            auto result = func();
            commit();
            rollback.dismiss();
            return result;
        }
    } catch (std::runtime_error &ex) {
        // ormpp 通过 runtime_error 报告 MySQL 的错误
        throw database_error(string("MySQL: ") + ex.what());
    }
}

build_task mysql_build_task_store::select_task(int task_id, bool for_update) {
    string sql =
        "SELECT id, course_id, build_dir, output_filename, status, "
        "IFNULL(return_code, 0), return_code IS NULL, timed_out, "
        "validation_error_msg, internal_error_msg, IFNULL(image_id, 0), image_id IS NULL "
        "FROM build_tasks WHERE id=?";
    if (for_update) sql += " FOR UPDATE";

    auto rows = db.query<tuple<int, int, string, string, string, int, int, int, string, string, int, int>>(sql.c_str(), task_id);
    if (rows.empty())
        throw internal_error("Build task " + to_string(task_id) + " does not exist");

    auto &[id, course_id, build_dir, output_filename, status, return_code, return_code_null,
           timed_out, validation_error_msg, internal_error_msg, image_id, image_id_null] = rows[0];
    build_task task;
    task.id = id;
    task.course_id = course_id;
    task.build_dir = build_dir;
    task.output_filename = output_filename;
    task.status = build_status_from_string(status);
    if (!return_code_null) task.return_code = return_code;
    task.timed_out = timed_out;
    task.validation_error_msg = validation_error_msg;
    task.internal_error_msg = internal_error_msg;
    if (!image_id_null) task.image_id = image_id;
    return task;
}

void mysql_build_task_store::save_task(const build_task &task) {
    if (task.return_code)
        db.execute("UPDATE build_tasks SET return_code=? WHERE id=?", *task.return_code, task.id);
    else
        db.execute("UPDATE build_tasks SET return_code=NULL WHERE id=?", task.id);

    if (task.image_id)
        db.execute("UPDATE build_tasks SET image_id=? WHERE id=?", *task.image_id, task.id);

    db.execute("UPDATE build_tasks SET status=?, timed_out=?, validation_error_msg=?, internal_error_msg=? WHERE id=?",
               status_name(task.status), (int)task.timed_out, task.validation_error_msg, task.internal_error_msg, task.id);
}

build_task mysql_build_task_store::load(int task_id) {
    return transaction([&] { return select_task(task_id, false); });
}

build_task mysql_build_task_store::update(int task_id, const function<bool(build_task &)> &mutator) {
    return transaction([&] {
        build_task task = select_task(task_id, true);
        if (mutator(task)) save_task(task);
        return task;
    });
}

bool mysql_build_task_store::finish(int task_id, const string &tag) {
    return transaction([&] {
        build_task task = select_task(task_id, true);
        if (!can_transition(task.status, build_status::done))
            return false;

        if (task.image_id) {
            auto rows = db.query<tuple<int>>("SELECT id FROM sandbox_images WHERE id=? FOR UPDATE", *task.image_id);
            if (rows.empty())
                throw internal_error("Sandbox image " + to_string(*task.image_id) + " does not exist");
            db.execute("UPDATE sandbox_images SET tag=? WHERE id=?", tag, *task.image_id);
        } else {
            db.execute("INSERT INTO sandbox_images (course_id, display_name, tag) VALUES (?, ?, ?)",
                       task.course_id, "New Image " + random_hex(), tag);
            auto rows = db.query<tuple<int>>("SELECT LAST_INSERT_ID()");
            if (rows.empty())
                throw database_error("Unable to create sandbox image");
            task.image_id = get<0>(rows[0]);
        }
        task.status = build_status::done;
        save_task(task);
        return true;
    });
}

optional<sandbox_image> mysql_build_task_store::load_image(int image_id) {
    return transaction([&]() -> optional<sandbox_image> {
        auto rows = db.query<tuple<int, int, string, string>>(
            "SELECT id, course_id, display_name, tag FROM sandbox_images WHERE id=?", image_id);
        if (rows.empty()) return {};
        sandbox_image image;
        tie(image.id, image.course_id, image.display_name, image.tag) = rows[0];
        return image;
    });
}

}  // namespace grader
