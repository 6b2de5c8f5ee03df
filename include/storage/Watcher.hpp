#pragma once

#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace efsw { class FileWatcher; }

namespace mg::storage {

struct WatchOptions {
    bool recursive = true;
    bool ignoreInitial = true;  // false: report existing files through onAdd before onReady
};

// Callbacks run on the watcher's own thread. Unset callbacks are skipped.
struct WatchEvents {
    std::function<void()> onReady;
    std::function<void(const std::string&)> onAdd;
    std::function<void(const std::string&)> onChange;
    std::function<void(const std::string&)> onUnlink;
    std::function<void(const std::string&)> onError;
};

class WatchListener;

// Stops the watch on close() or destruction.
class WatchHandle {
public:
    WatchHandle(std::unique_ptr<efsw::FileWatcher> watcher, std::unique_ptr<WatchListener> listener);
    ~WatchHandle();

    WatchHandle(const WatchHandle&) = delete;
    WatchHandle& operator=(const WatchHandle&) = delete;
    WatchHandle(WatchHandle&&) noexcept;
    WatchHandle& operator=(WatchHandle&&) noexcept;

    void close();
    [[nodiscard]] bool active() const { return watcher_ != nullptr; }

private:
    std::unique_ptr<efsw::FileWatcher> watcher_;
    std::unique_ptr<WatchListener> listener_;
};

// Paths that cannot be watched are reported through onError; the rest are still watched.
[[nodiscard]] WatchHandle watch(const std::vector<std::string>& paths, const WatchOptions& options, WatchEvents events);

}
