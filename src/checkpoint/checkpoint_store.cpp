// src/checkpoint/checkpoint_store.cpp
#include "codeflow/checkpoint/checkpoint_store.h"
#include "codeflow/common/utils.h"
#include "codeflow/core/errors.h"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace codeflow {

namespace fs = std::filesystem;

void to_json(nlohmann::json& j, const Checkpoint& checkpoint) {
    j = nlohmann::json{
        {"sequence", checkpoint.sequence},
        {"lastStep", checkpoint.last_step},
        {"nextStep", checkpoint.next_step},
        {"state", checkpoint.state},
    };
}

void from_json(const nlohmann::json& j, Checkpoint& checkpoint) {
    j.at("sequence").get_to(checkpoint.sequence);
    j.at("lastStep").get_to(checkpoint.last_step);
    j.at("nextStep").get_to(checkpoint.next_step);
    j.at("state").get_to(checkpoint.state);
}

namespace {

void check_sequence(const std::string& run_id, uint64_t stored, uint64_t incoming) {
    if (incoming <= stored) {
        throw CheckpointError("Stale checkpoint for run " + run_id + ": sequence " +
                              std::to_string(incoming) + " after " + std::to_string(stored));
    }
}

} // namespace

// ————————————————————————
// MemoryCheckpointStore
// ————————————————————————

void MemoryCheckpointStore::save(const std::string& run_id, const Checkpoint& checkpoint) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (auto it = checkpoints_.find(run_id); it != checkpoints_.end()) {
        check_sequence(run_id, it->second.sequence, checkpoint.sequence);
        it->second = checkpoint;
        return;
    }
    checkpoints_.emplace(run_id, checkpoint);
}

std::optional<Checkpoint> MemoryCheckpointStore::load(const std::string& run_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = checkpoints_.find(run_id);
    if (it == checkpoints_.end()) return std::nullopt;
    return it->second;
}

bool MemoryCheckpointStore::remove(const std::string& run_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return checkpoints_.erase(run_id) > 0;
}

std::vector<std::string> MemoryCheckpointStore::list() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> ids;
    ids.reserve(checkpoints_.size());
    for (const auto& [id, _] : checkpoints_) ids.push_back(id);
    std::sort(ids.begin(), ids.end());
    return ids;
}

// ————————————————————————
// FileCheckpointStore
// ————————————————————————

FileCheckpointStore::FileCheckpointStore(std::string directory) : directory_(std::move(directory)) {
    std::error_code ec;
    fs::create_directories(directory_, ec);
    if (ec) {
        throw CheckpointError("Cannot create checkpoint directory " + directory_ + ": " + ec.message());
    }
}

std::shared_ptr<std::mutex> FileCheckpointStore::lock_for(const std::string& run_id) const {
    std::lock_guard<std::mutex> lock(locks_mutex_);
    auto& slot = run_locks_[run_id];
    if (!slot) slot = std::make_shared<std::mutex>();
    return slot;
}

void FileCheckpointStore::release_lock(const std::string& run_id, std::shared_ptr<std::mutex>& run_lock) const {
    std::lock_guard<std::mutex> lock(locks_mutex_);
    auto it = run_locks_.find(run_id);
    // 表中一份 + 调用方一份：没有其他操作在等待
    if (it != run_locks_.end() && it->second == run_lock && run_lock.use_count() == 2) {
        run_locks_.erase(it);
    }
    run_lock.reset();
}

template <typename Fn>
auto FileCheckpointStore::with_run_lock(const std::string& run_id, Fn&& fn) const {
    auto run_lock = lock_for(run_id);
    struct Release {
        const FileCheckpointStore* store;
        const std::string& id;
        std::shared_ptr<std::mutex>& lock;
        ~Release() { store->release_lock(id, lock); }
    } release{this, run_id, run_lock};
    std::lock_guard<std::mutex> guard(*run_lock);
    return fn();
}

size_t FileCheckpointStore::lock_count() const {
    std::lock_guard<std::mutex> lock(locks_mutex_);
    return run_locks_.size();
}

std::string FileCheckpointStore::path_for(const std::string& run_id) const {
    if (!is_valid_run_id(run_id)) {
        throw CheckpointError("Invalid run id: '" + run_id + "'");
    }
    return (fs::path(directory_) / (run_id + ".json")).string();
}

std::optional<Checkpoint> FileCheckpointStore::read_file(const std::string& run_id) const {
    const std::string path = path_for(run_id);
    std::ifstream file(path);
    if (!file.is_open()) {
        return std::nullopt;
    }
    try {
        nlohmann::json j;
        file >> j;
        return j.get<Checkpoint>();
    } catch (const std::exception& e) {
        throw CheckpointError("Corrupt checkpoint " + path + ": " + e.what());
    }
}

void FileCheckpointStore::save(const std::string& run_id, const Checkpoint& checkpoint) {
    const std::string path = path_for(run_id);
    with_run_lock(run_id, [&] {
        if (auto existing = read_file(run_id)) {
            check_sequence(run_id, existing->sequence, checkpoint.sequence);
        }

        const std::string tmp_path = path + ".tmp";
        {
            std::ofstream out(tmp_path, std::ios::trunc);
            if (!out.is_open()) {
                throw CheckpointError("Cannot write checkpoint " + tmp_path);
            }
            out << nlohmann::json(checkpoint).dump(2);
            out.flush();
            if (!out) {
                throw CheckpointError("Failed writing checkpoint " + tmp_path);
            }
        }

        std::error_code ec;
        fs::rename(tmp_path, path, ec);
        if (ec) {
            fs::remove(tmp_path, ec);
            throw CheckpointError("Cannot replace checkpoint " + path);
        }
    });
}

std::optional<Checkpoint> FileCheckpointStore::load(const std::string& run_id) const {
    return with_run_lock(run_id, [&] { return read_file(run_id); });
}

bool FileCheckpointStore::remove(const std::string& run_id) {
    const std::string path = path_for(run_id);
    return with_run_lock(run_id, [&] {
        std::error_code ec;
        return fs::remove(path, ec);
    });
}

std::vector<std::string> FileCheckpointStore::list() const {
    std::vector<std::string> ids;
    std::error_code ec;
    for (const auto& entry : fs::directory_iterator(directory_, ec)) {
        if (!entry.is_regular_file()) continue;
        const fs::path& p = entry.path();
        if (p.extension() == ".json") {
            ids.push_back(p.stem().string());
        }
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

} // namespace codeflow
