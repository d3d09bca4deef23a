/**
 * @file remember_entities.cpp
 * @brief Remember-entities store backends
 */

#include "tessera/sharding/remember_entities.h"
#include "tessera/core/record_codec.h"
#include <spdlog/spdlog.h>
#include <filesystem>
#include <fstream>
#include <map>
#include <mutex>
#include <vector>

namespace tessera::sharding {

namespace {

// ============================================================================
// Memory Store
// ============================================================================

class MemoryRememberEntitiesStore : public IRememberEntitiesStore {
public:
    ShardingResult load(const ShardKey& shard, std::set<EntityKey>& entities) const override {
        std::lock_guard<std::mutex> lock(mutex_);
        entities.clear();
        auto it = shards_.find(shard);
        if (it != shards_.end()) {
            entities = it->second;
        }
        return ShardingResult::Success;
    }

    ShardingResult add(const ShardKey& shard, const EntityKey& entity) override {
        std::lock_guard<std::mutex> lock(mutex_);
        shards_[shard].insert(entity);
        return ShardingResult::Success;
    }

    ShardingResult remove(const ShardKey& shard, const EntityKey& entity) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = shards_.find(shard);
        if (it != shards_.end()) {
            it->second.erase(entity);
            if (it->second.empty()) {
                shards_.erase(it);
            }
        }
        return ShardingResult::Success;
    }

private:
    std::map<ShardKey, std::set<EntityKey>> shards_;
    mutable std::mutex mutex_;
};

// ============================================================================
// File Store
// ============================================================================

struct RememberRecord {
    bool added{true};
    ShardKey shard;
    EntityKey entity;
};

/**
 * @brief One "+"/"-" record per line; the state of a shard is the fold
 */
class FileRememberEntitiesStore : public IRememberEntitiesStore {
public:
    explicit FileRememberEntitiesStore(std::string path) : path_(std::move(path)) {
        std::filesystem::path parent = std::filesystem::path(path_).parent_path();
        if (!parent.empty()) {
            std::error_code ec;
            std::filesystem::create_directories(parent, ec);
        }

        std::vector<RememberRecord> records;
        bool torn = false;
        if (!read_all(records, torn)) {
            SPDLOG_ERROR("remember store: cannot read {}", path_);
            usable_ = false;
        } else if (torn) {
            SPDLOG_WARN("remember store: dropping torn record at end of {}", path_);
            usable_ = rewrite(records);
        }
    }

    ShardingResult load(const ShardKey& shard, std::set<EntityKey>& entities) const override {
        std::lock_guard<std::mutex> lock(mutex_);
        entities.clear();
        if (!usable_) {
            return ShardingResult::StorageError;
        }

        std::vector<RememberRecord> records;
        bool torn = false;
        if (!read_all(records, torn) || torn) {
            return ShardingResult::StorageError;
        }
        for (const auto& record : records) {
            if (record.shard != shard) {
                continue;
            }
            if (record.added) {
                entities.insert(record.entity);
            } else {
                entities.erase(record.entity);
            }
        }
        return ShardingResult::Success;
    }

    ShardingResult add(const ShardKey& shard, const EntityKey& entity) override {
        return append(RememberRecord{true, shard, entity});
    }

    ShardingResult remove(const ShardKey& shard, const EntityKey& entity) override {
        return append(RememberRecord{false, shard, entity});
    }

private:
    static void write_record(std::ostream& out, const RememberRecord& record) {
        out << (record.added ? '+' : '-') << ' ';
        core::write_field(out, record.shard);
        core::write_field(out, record.entity);
        out << '\n';
    }

    ShardingResult append(const RememberRecord& record) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!usable_) {
            return ShardingResult::StorageError;
        }

        std::ofstream out(path_, std::ios::app);
        if (!out.is_open()) {
            return ShardingResult::StorageError;
        }
        write_record(out, record);
        out.flush();
        return out.good() ? ShardingResult::Success : ShardingResult::StorageError;
    }

    bool read_all(std::vector<RememberRecord>& records, bool& torn) const {
        if (!std::filesystem::exists(path_)) {
            return true;
        }

        std::ifstream in(path_);
        if (!in.is_open()) {
            return false;
        }

        for (;;) {
            in >> std::ws;
            if (in.eof()) {
                break;
            }
            RememberRecord record;
            char op = 0;
            if (!in.get(op) || (op != '+' && op != '-') ||
                !core::read_field(in, record.shard) || !core::read_field(in, record.entity)) {
                torn = true;
                break;
            }
            record.added = (op == '+');
            records.push_back(std::move(record));
        }
        return true;
    }

    bool rewrite(const std::vector<RememberRecord>& records) {
        std::string tmp_path = path_ + ".tmp";
        {
            std::ofstream out(tmp_path, std::ios::trunc);
            if (!out.is_open()) {
                return false;
            }
            for (const auto& record : records) {
                write_record(out, record);
            }
            out.flush();
            if (!out.good()) {
                return false;
            }
        }

        std::error_code ec;
        std::filesystem::rename(tmp_path, path_, ec);
        return !ec;
    }

    std::string path_;
    bool usable_{true};
    mutable std::mutex mutex_;
};

} // anonymous namespace

// ============================================================================
// Factory Functions
// ============================================================================

std::shared_ptr<IRememberEntitiesStore> create_memory_remember_store() {
    return std::make_shared<MemoryRememberEntitiesStore>();
}

std::shared_ptr<IRememberEntitiesStore> create_file_remember_store(const std::string& path) {
    return std::make_shared<FileRememberEntitiesStore>(path);
}

std::shared_ptr<IRememberEntitiesStore> create_remember_store(const config::ShardingSettings& settings) {
    if (!settings.remember_entities) {
        return nullptr;
    }
    switch (settings.remember_entities_store) {
        case config::RememberEntitiesStoreKind::File:
            return create_file_remember_store(settings.remember_entities_path);
        case config::RememberEntitiesStoreKind::Memory:
        default:
            return create_memory_remember_store();
    }
}

} // namespace tessera::sharding
