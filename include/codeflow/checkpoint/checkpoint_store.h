#ifndef CODEFLOW_CHECKPOINT_CHECKPOINT_STORE_H
#define CODEFLOW_CHECKPOINT_CHECKPOINT_STORE_H

#include "codeflow/core/types.h"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace codeflow {

// Snapshot taken after a step completed. next_step is where resume continues;
// kTerminal means the run finished.
struct Checkpoint {
    uint64_t sequence = 0;
    StepName last_step;
    StepName next_step;
    WorkflowState state;

    bool finished() const { return next_step == kTerminal; }
    bool operator==(const Checkpoint&) const = default;
};

void to_json(nlohmann::json& j, const Checkpoint& checkpoint);
void from_json(const nlohmann::json& j, Checkpoint& checkpoint);

// Keyed by run id. Implementations are safe for concurrent use; saves for the
// same run id must carry strictly increasing sequence numbers.
class CheckpointStore {
public:
    virtual ~CheckpointStore() = default;

    // Throws CheckpointError on a stale sequence or a write failure.
    virtual void save(const std::string& run_id, const Checkpoint& checkpoint) = 0;

    // nullopt when the run has no checkpoint.
    virtual std::optional<Checkpoint> load(const std::string& run_id) const = 0;

    virtual bool remove(const std::string& run_id) = 0;

    virtual std::vector<std::string> list() const = 0;
};

class MemoryCheckpointStore : public CheckpointStore {
public:
    void save(const std::string& run_id, const Checkpoint& checkpoint) override;
    std::optional<Checkpoint> load(const std::string& run_id) const override;
    bool remove(const std::string& run_id) override;
    std::vector<std::string> list() const override;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, Checkpoint> checkpoints_;
};

// One <run_id>.json per run under `directory`, replaced atomically on save.
class FileCheckpointStore : public CheckpointStore {
public:
    explicit FileCheckpointStore(std::string directory);

    void save(const std::string& run_id, const Checkpoint& checkpoint) override;
    std::optional<Checkpoint> load(const std::string& run_id) const override;
    bool remove(const std::string& run_id) override;
    std::vector<std::string> list() const override;

    const std::string& directory() const { return directory_; }

    // Runs with a save, load or remove in progress. Idle runs hold no lock.
    size_t lock_count() const;

private:
    std::string directory_;
    mutable std::mutex locks_mutex_;
    mutable std::unordered_map<std::string, std::shared_ptr<std::mutex>> run_locks_;

    std::shared_ptr<std::mutex> lock_for(const std::string& run_id) const;
    void release_lock(const std::string& run_id, std::shared_ptr<std::mutex>& run_lock) const;
    template <typename Fn>
    auto with_run_lock(const std::string& run_id, Fn&& fn) const;
    std::string path_for(const std::string& run_id) const;
    std::optional<Checkpoint> read_file(const std::string& run_id) const;
};

} // namespace codeflow

#endif // CODEFLOW_CHECKPOINT_CHECKPOINT_STORE_H
