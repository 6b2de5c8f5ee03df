#include "storage/Watcher.hpp"
#include "storage/Walker.hpp"
#include "log/Registry.hpp"

#include <efsw/efsw.hpp>
#include <filesystem>

namespace mg::storage {

namespace {

std::string join(const std::string& dir, const std::string& filename) {
    std::string full = dir;
    if (!full.empty() && full.back() != '/') full += '/';
    full += filename;
    return full;
}

}

class WatchListener final : public efsw::FileWatchListener {
public:
    explicit WatchListener(WatchEvents events) : events_(std::move(events)) {}

    void handleFileAction(efsw::WatchID, const std::string& dir, const std::string& filename,
                          efsw::Action action, std::string oldFilename) override {
        try {
            switch (action) {
                case efsw::Actions::Add:
                    emit(events_.onAdd, join(dir, filename));
                    break;
                case efsw::Actions::Delete:
                    emit(events_.onUnlink, join(dir, filename));
                    break;
                case efsw::Actions::Modified:
                    emit(events_.onChange, join(dir, filename));
                    break;
                case efsw::Actions::Moved:
                    if (!oldFilename.empty()) emit(events_.onUnlink, join(dir, oldFilename));
                    emit(events_.onAdd, join(dir, filename));
                    break;
                default:
                    return;
            }
        } catch (const std::exception& e) {
            log::Registry::scan()->error("[Watcher] Event handler for {} threw: {}", join(dir, filename), e.what());
        }
    }

    void ready() const { if (events_.onReady) events_.onReady(); }
    void error(const std::string& msg) const { if (events_.onError) events_.onError(msg); }
    void initial(const std::string& path) const { emit(events_.onAdd, path); }

private:
    WatchEvents events_;

    static void emit(const std::function<void(const std::string&)>& fn, const std::string& path) {
        if (fn) fn(path);
    }
};

WatchHandle::WatchHandle(std::unique_ptr<efsw::FileWatcher> watcher, std::unique_ptr<WatchListener> listener)
    : watcher_(std::move(watcher)), listener_(std::move(listener)) {}

WatchHandle::~WatchHandle() { close(); }

WatchHandle::WatchHandle(WatchHandle&&) noexcept = default;

WatchHandle& WatchHandle::operator=(WatchHandle&& other) noexcept {
    if (this != &other) {
        close();
        watcher_ = std::move(other.watcher_);
        listener_ = std::move(other.listener_);
    }
    return *this;
}

void WatchHandle::close() {
    // the watcher thread references the listener, so it goes first
    watcher_.reset();
    listener_.reset();
}

WatchHandle watch(const std::vector<std::string>& paths, const WatchOptions& options, WatchEvents events) {
    auto watcher = std::make_unique<efsw::FileWatcher>();
    auto listener = std::make_unique<WatchListener>(std::move(events));

    std::vector<std::string> watched;
    for (const auto& path : paths) {
        const efsw::WatchID id = watcher->addWatch(path, listener.get(), options.recursive);
        if (id < 0) {
            const auto msg = "Failed to watch " + path + ": " + efsw::Errors::Log::getLastErrorLog();
            log::Registry::scan()->error("[Watcher] {}", msg);
            listener->error(msg);
            continue;
        }
        watched.push_back(path);
        log::Registry::scan()->debug("[Watcher] Watching {} (id {})", path, id);
    }

    watcher->watch();

    if (!options.ignoreInitial) {
        Walker walker({.roots = watched, .includeHidden = true});
        while (auto batch = walker.next())
            for (const auto& p : *batch) listener->initial(p);
    }

    listener->ready();

    return {std::move(watcher), std::move(listener)};
}

}
