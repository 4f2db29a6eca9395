#include "mcptools/tools/tool.hpp"

#include "mcptools/exceptions.hpp"

#include <condition_variable>
#include <future>
#include <memory>
#include <mutex>
#include <thread>

namespace mcptools::tools
{

namespace
{

// Never destroyed: a handler abandoned by a timeout may finish after main returns.
struct Workers
{
    std::mutex mutex;
    std::condition_variable done;
    std::size_t running{0};
};

Workers& workers()
{
    static auto* w = new Workers;
    return *w;
}

} // namespace

ToolResult Tool::invoke(const Json& input, bool enforce_timeout) const
{
    if (!fn_)
        throw Error("tool '" + name_ + "' has no handler");
    if (!enforce_timeout || timeout_.count() <= 0)
        return fn_(input);

    auto task = std::make_shared<std::packaged_task<ToolResult()>>(
        [fn = fn_, input]() { return fn(input); });
    auto result = task->get_future();
    auto& w = workers();
    {
        std::lock_guard<std::mutex> lock(w.mutex);
        ++w.running;
    }
    std::thread(
        [task, &w]()
        {
            (*task)();
            std::lock_guard<std::mutex> lock(w.mutex);
            --w.running;
            w.done.notify_all();
        })
        .detach();

    if (result.wait_for(timeout_) == std::future_status::timeout)
        throw ToolTimeoutError("tool '" + name_ + "' timed out after " +
                               std::to_string(timeout_.count()) + " ms");
    return result.get();
}

std::size_t drain_handlers(std::chrono::milliseconds grace)
{
    auto& w = workers();
    std::unique_lock<std::mutex> lock(w.mutex);
    w.done.wait_for(lock, grace, [&w] { return w.running == 0; });
    return w.running;
}

} // namespace mcptools::tools
