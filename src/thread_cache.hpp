#ifndef THREAD_CACHE_HPP
#define THREAD_CACHE_HPP

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <unordered_set>

// One lazily built T per (owner, thread). A destroyed owner bumps a generation counter;
// each thread drops the entries of dead owners on its next lookup after the bump.
template <typename T>
class ThreadCache {
public:
    ThreadCache() : id(registry().add()) {}
    ~ThreadCache() { registry().remove(id); }

    ThreadCache(const ThreadCache&) = delete;
    ThreadCache& operator=(const ThreadCache&) = delete;

    // make() returns std::unique_ptr<T>; it runs at most once per thread
    template <typename Factory>
    T& get(Factory make) const {
        prune();
        auto& slot = threadSlots().entries[id];
        if (!slot) {
            slot = make();
        }
        return *slot;
    }

    // Entries currently held by the calling thread, across all owners
    static std::size_t threadEntryCount() {
        prune();
        return threadSlots().entries.size();
    }

private:
    struct Registry {
        std::mutex mutex;
        std::unordered_set<std::uint64_t> live;
        std::uint64_t next_id = 1;
        std::atomic<std::uint64_t> generation{0};

        std::uint64_t add() {
            std::lock_guard<std::mutex> lock(mutex);
            std::uint64_t assigned = next_id++;
            live.insert(assigned);
            return assigned;
        }

        void remove(std::uint64_t owner) {
            {
                std::lock_guard<std::mutex> lock(mutex);
                live.erase(owner);
            }
            generation.fetch_add(1);
        }
    };

    struct Slots {
        std::uint64_t seen_generation = 0;
        std::unordered_map<std::uint64_t, std::unique_ptr<T>> entries;
    };

    std::uint64_t id;

    static Registry& registry() {
        static Registry instance;
        return instance;
    }

    static Slots& threadSlots() {
        thread_local Slots slots;
        return slots;
    }

    static void prune() {
        Slots& slots = threadSlots();
        std::uint64_t generation = registry().generation.load();
        if (generation == slots.seen_generation) {
            return;
        }

        std::lock_guard<std::mutex> lock(registry().mutex);
        for (auto it = slots.entries.begin(); it != slots.entries.end();) {
            if (registry().live.count(it->first) == 0) {
                it = slots.entries.erase(it);
            } else {
                ++it;
            }
        }
        slots.seen_generation = generation;
    }
};

#endif // THREAD_CACHE_HPP
