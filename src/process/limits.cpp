#include "process/limits.hpp"
#include <sys/resource.h>
#include "common/exceptions.hpp"
#include "config.hpp"

namespace grader {
using namespace std;

resource_limits default_resource_limits() {
    resource_limits limits;
    limits.max_num_processes = DEFAULT_PROCESS_LIMIT;
    limits.max_stack_size = DEFAULT_STACK_SIZE_LIMIT;
    limits.max_virtual_memory = DEFAULT_VIRTUAL_MEM_LIMIT;
    return limits;
}

resource_limits merge_limits(const resource_limits &base, const resource_limits &overrides) {
    resource_limits result = base;
    if (overrides.max_num_processes) result.max_num_processes = overrides.max_num_processes;
    if (overrides.max_stack_size) result.max_stack_size = overrides.max_stack_size;
    if (overrides.max_virtual_memory) result.max_virtual_memory = overrides.max_virtual_memory;
    return result;
}

void validate_resource_limits(const resource_limits &limits) {
    if (limits.max_num_processes &&
        (*limits.max_num_processes < 0 || *limits.max_num_processes > MAX_PROCESS_LIMIT))
        throw configuration_error("max_num_processes must be between 0 and " + to_string(MAX_PROCESS_LIMIT));
    if (limits.max_stack_size &&
        (*limits.max_stack_size <= 0 || *limits.max_stack_size > MAX_STACK_SIZE_LIMIT))
        throw configuration_error("max_stack_size must be between 1 and " + to_string(MAX_STACK_SIZE_LIMIT));
    if (limits.max_virtual_memory &&
        (*limits.max_virtual_memory <= 0 || *limits.max_virtual_memory > MAX_VIRTUAL_MEM_LIMIT))
        throw configuration_error("max_virtual_memory must be between 1 and " + to_string(MAX_VIRTUAL_MEM_LIMIT));
}

static bool set_rlimit(int resource, rlim_t value) noexcept {
    struct rlimit lim;
    lim.rlim_cur = value;
    lim.rlim_max = value;
    return setrlimit(resource, &lim) == 0;
}

bool apply_rlimits(const resource_limits &limits, bool apply_process_limit) noexcept {
    bool ok = true;
    if (limits.max_stack_size)
        ok &= set_rlimit(RLIMIT_STACK, *limits.max_stack_size);
    if (limits.max_virtual_memory)
        ok &= set_rlimit(RLIMIT_AS, *limits.max_virtual_memory);
    if (apply_process_limit && limits.max_num_processes)
        ok &= set_rlimit(RLIMIT_NPROC, *limits.max_num_processes + 1);
    return ok;
}

}  // namespace grader
