#pragma once
#include <string>
#include <vector>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <unordered_map>
#include <mutex>
#include <algorithm>
#include "logger.hpp"

#ifdef PROF_ENABLED

class Profiler {
public:
    struct Entry {
        std::string name;
        std::uint64_t count = 0;
        long double totalNs = 0;
        long double minNs = 0;
        long double maxNs = 0;

        long double avgNs() const { return totalNs / (count ? count : 1); }
    };

    class ScopeGuard {
    public:
        ScopeGuard(Profiler* p, std::string n)
            : prof_(p), name_(std::move(n)),
              t0_(std::chrono::steady_clock::now()) {}
        ~ScopeGuard() {
            if (!prof_) return;
            auto t1 = std::chrono::steady_clock::now();
            prof_->record(name_, std::chrono::duration<long double, std::nano>(t1 - t0_).count());
        }
    private:
        Profiler* prof_;
        std::string name_;
        std::chrono::steady_clock::time_point t0_;
    };

    void record(const std::string& n, long double ns) {
        std::lock_guard<std::mutex> lk(m_);
        auto &e = map_[n];
        if (e.count == 0) {
            e.name = n;
            e.minNs = e.maxNs = ns;
        } else {
            e.minNs = std::min(e.minNs, ns);
            e.maxNs = std::max(e.maxNs, ns);
        }
        e.totalNs += ns;
        ++e.count;
    }

    std::vector<Entry> summary() const {
        std::lock_guard<std::mutex> lk(m_);
        std::vector<Entry> out;
        out.reserve(map_.size());
        for (auto &kv : map_) out.push_back(kv.second);
        std::sort(out.begin(), out.end(),
                  [](auto& a, auto& b){ return a.name < b.name; });
        return out;
    }

    void reset() {
        std::lock_guard<std::mutex> lk(m_);
        map_.clear();
    }

    // One info line per section, times in microseconds.
    void dump(Logger* log) const {
        auto rows = summary();
        if (rows.empty()) return;
        LOG_INFO(log, "---- profile: section count avg(us) min(us) max(us) ----");
        for (auto &e : rows) {
            char buf[160];
            std::snprintf(buf, sizeof(buf), "%-28s %10llu %10.3Lf %10.3Lf %10.3Lf",
                          e.name.c_str(), static_cast<unsigned long long>(e.count),
                          e.avgNs() / 1000.0L, e.minNs / 1000.0L, e.maxNs / 1000.0L);
            LOG_INFO(log, "{}", buf);
        }
    }

private:
    mutable std::mutex m_;
    std::unordered_map<std::string, Entry> map_;
};

#define PROF_CONCAT_INNER(a,b) a##b
#define PROF_CONCAT(a,b) PROF_CONCAT_INNER(a,b)

// Null-safe; the guard lives until the end of the enclosing scope.
#define PROF_SCOPE(PTR, NAME) \
    ::Profiler::ScopeGuard PROF_CONCAT(_prof_guard_, __LINE__){(PTR), ((PTR) ? std::string(NAME) : std::string())}

#else   // PROF_ENABLED not defined

class Profiler {
public:
    struct Entry { std::string name; std::uint64_t count=0; long double totalNs=0,minNs=0,maxNs=0; };
    class ScopeGuard { public: ScopeGuard(Profiler*, std::string) {} };
    void record(const std::string&, long double) {}
    std::vector<Entry> summary() const { return {}; }
    void reset() {}
    void dump(Logger*) const {}
};

#define PROF_SCOPE(PTR, NAME) do{ (void)(PTR); }while(0)

#endif
