#pragma once

#include <functional>

namespace msgstore::services {

class IExecutor {
public:
    using Task = std::function<void()>;

    // Queues task for later execution; never runs it inline. Returns false
    // once the executor no longer accepts work, the task is then dropped.
    virtual bool execute(Task task) = 0;
    virtual ~IExecutor() = default;
};

} // namespace msgstore::services
