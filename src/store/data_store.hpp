#pragma once
#include "../core/model.hpp"
#include <algorithm>
#include <cstddef>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <vector>

/**
 * @brief Station, settings and machine-state records shared with the control surface
 *
 * The store is the single source of truth; the scheduler re-reads it every
 * iteration. Mutations of a station or of the machine record are
 * read-modify-write operations done atomically by the store, so a verdict
 * applied by the scheduler cannot clobber a concurrent operator change to
 * the same record.
 */
class IDataStore {
public:
    using StationUpdate = std::function<void(Station&)>;
    using MachineUpdate = std::function<void(MachineRecord&)>;

    virtual ~IDataStore() = default;

    /// All stations in ascending id order
    virtual std::vector<Station> stations() const = 0;
    virtual std::optional<Station> station(int id) const = 0;
    virtual std::optional<SystemSettings> settings() const = 0;
    virtual std::optional<MachineRecord> machine() const = 0;

    /**
     * @brief Atomically modify one station
     * @return false if the station does not exist
     */
    virtual bool update_station(int id, const StationUpdate& update) = 0;

    /**
     * @brief Atomically modify the machine record
     * @return false if there is no machine record
     */
    virtual bool update_machine(const MachineUpdate& update) = 0;

    virtual void put_settings(const SystemSettings& settings) = 0;

    virtual void append_history(const HistoryRecord& record) = 0;

    /// Most recent history records, newest last
    virtual std::vector<HistoryRecord> history(std::size_t max_records) const = 0;
};

/**
 * @brief Thread-safe in-memory store
 *
 * Each record kind can be absent, which is how the scheduler's tolerance of
 * missing settings and state is exercised. The history log is bounded and
 * drops its oldest entries first.
 */
class MemoryDataStore : public IDataStore {
private:
    mutable std::mutex mutex_;
    std::map<int, Station> stations_;
    std::optional<SystemSettings> settings_;
    std::optional<MachineRecord> machine_;
    std::deque<HistoryRecord> history_;
    std::size_t history_capacity_;

public:
    explicit MemoryDataStore(std::size_t history_capacity = 10000)
        : history_capacity_(history_capacity) {}

    /**
     * @brief Populate a fresh rig: stations 1..n disabled, default settings, machine off
     */
    void seed_defaults(int station_count) {
        std::lock_guard<std::mutex> lock(mutex_);
        stations_.clear();
        for (int id = 1; id <= station_count; ++id) {
            Station s;
            s.id = id;
            stations_[id] = s;
        }
        settings_ = SystemSettings{};
        machine_ = MachineRecord{};
        history_.clear();
    }

    void put_station(const Station& station) {
        std::lock_guard<std::mutex> lock(mutex_);
        stations_[station.id] = station;
    }

    void put_machine(const MachineRecord& record) {
        std::lock_guard<std::mutex> lock(mutex_);
        machine_ = record;
    }

    void clear_settings() {
        std::lock_guard<std::mutex> lock(mutex_);
        settings_.reset();
    }

    void clear_machine() {
        std::lock_guard<std::mutex> lock(mutex_);
        machine_.reset();
    }

    std::vector<Station> stations() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<Station> out;
        out.reserve(stations_.size());
        for (const auto& kv : stations_) {
            out.push_back(kv.second);
        }
        return out;
    }

    std::optional<Station> station(int id) const override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = stations_.find(id);
        if (it == stations_.end()) return std::nullopt;
        return it->second;
    }

    std::optional<SystemSettings> settings() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return settings_;
    }

    std::optional<MachineRecord> machine() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return machine_;
    }

    bool update_station(int id, const StationUpdate& update) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = stations_.find(id);
        if (it == stations_.end()) return false;
        update(it->second);
        it->second.id = id;
        return true;
    }

    bool update_machine(const MachineUpdate& update) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!machine_) return false;
        update(*machine_);
        return true;
    }

    void put_settings(const SystemSettings& settings) override {
        std::lock_guard<std::mutex> lock(mutex_);
        settings_ = settings;
    }

    void append_history(const HistoryRecord& record) override {
        std::lock_guard<std::mutex> lock(mutex_);
        history_.push_back(record);
        while (history_.size() > history_capacity_) {
            history_.pop_front();
        }
    }

    std::vector<HistoryRecord> history(std::size_t max_records) const override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::size_t n = std::min(max_records, history_.size());
        return std::vector<HistoryRecord>(history_.end() - static_cast<std::ptrdiff_t>(n), history_.end());
    }
};
