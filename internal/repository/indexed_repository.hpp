#pragma once

#include <google/protobuf/field_mask.pb.h>
#include <google/protobuf/util/field_mask_util.h>

#include <algorithm>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

#include "internal/lock/resource_lock_manager.hpp"
#include "internal/storage/common/path_utils.hpp"
#include "internal/storage/virtual_store.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace signage::repository {

struct ReconcileReport {
  size_t                   ghosts_pruned   = 0;
  size_t                   orphans_indexed = 0;
  std::vector<std::string> invalid_details;
};

/*
  Detail + index persistence for one entity family.

  On-disk layout:

      <dir>/index.json          {"entries": [...]} summaries, listing order
      <dir>/<entity>-<id>.json  full record

  Lock keys:

      <entity>-<id>   held for update/delete of that id
      <dir>-create    held for create
      <dir>-index     held for every index read-modify-write

  The index lock is always taken inside an entity/create lock, never the
  other way round.

  Traits supplies:
    Item, IndexEntry, IndexFile   protobuf types
    kEntity, kDirectory           names
    Validate(Item)                defaults + strict validation
    ValidateIndexEntry(IndexEntry)
    ToIndexEntry(Item)
    SortIndex(std::vector<IndexEntry>&)
*/
template <typename Traits>
class IndexedRepository {
 public:
  using Item       = typename Traits::Item;
  using IndexEntry = typename Traits::IndexEntry;
  using IndexFile  = typename Traits::IndexFile;

  IndexedRepository(storage::VirtualStorePtr store, lock::ResourceLockManagerPtr locks) : store_(std::move(store)), locks_(std::move(locks)) {
  }

  virtual ~IndexedRepository() = default;

  // ------------------------------------------------------------------
  // Reads
  // ------------------------------------------------------------------
  /*
    Display read, no lock. An absent or invalid index is replaced by an
    empty one (under the index lock) and listed as empty.
  */
  std::vector<IndexEntry> ListIndex() {
    util::TimePoint modified_at;
    auto            entries = TryReadIndex(&modified_at);
    if (entries) {
      locks_->RecordReadTimestamp(IndexPath(), modified_at);
      return std::move(*entries);
    }
    return locks_->WithLock(IndexLockKey(), [this] { return LoadIndexLocked(); });
  }

  /*
    Absent detail → std::nullopt, and the id is remembered so the next
    index rewrite can drop a ghost entry for it.
  */
  std::optional<Item> GetById(const std::string& id) {
    ValidateId(id);

    util::TimePoint modified_at;
    auto            raw = store_->ReadRecord<Item>(DetailPath(id), &modified_at);
    if (!raw) {
      MarkSuspectedGhost(id);
      return std::nullopt;
    }

    auto item = Traits::Validate(*raw);
    locks_->RecordReadTimestamp(DetailPath(id), modified_at);
    return item;
  }

  // ------------------------------------------------------------------
  // Mutations
  // ------------------------------------------------------------------
  /*
    id, createdAt and updatedAt of payload are ignored; a fresh id and
    the current time are assigned.
  */
  Item Create(const Item& payload) {
    return locks_->WithLock(CreateLockKey(), [&] {
      Item item = payload;
      AssignNewIdentity(&item);
      return InsertLocked(std::move(item));
    });
  }

  /*
    Replaces the fields named by mask with their values in patch and
    re-validates the whole merged record.
  */
  Item Update(const std::string& id, const Item& patch, const google::protobuf::FieldMask& mask) {
    ValidateId(id);
    return locks_->WithLock(EntityLockKey(id), [&] {
      auto current = ReadDetailLocked(id);
      if (!current) {
        throw util::NotFound(std::string(Traits::kEntity) + " not found: " + id);
      }
      return ReplaceLocked(MergePatch(*current, patch, mask));
    });
  }

  void Delete(const std::string& id) {
    ValidateId(id);
    locks_->WithLock(EntityLockKey(id), [&] {
      auto current = ReadDetailLocked(id);
      if (!current) {
        throw util::NotFound(std::string(Traits::kEntity) + " not found: " + id);
      }
      RemoveLocked(*current);
    });
  }

  /*
    Recovery pass: drops index entries without a detail file and indexes
    detail files missing from the index. Invalid details are reported,
    not indexed.
  */
  ReconcileReport Reconcile() {
    return locks_->WithLock(IndexLockKey(), [this] {
      ReconcileReport report;
      auto            entries = LoadIndexLocked();

      std::unordered_set<std::string> detail_ids;
      for (const auto& name : store_->ListChildren(Traits::kDirectory)) {
        auto id = IdFromDetailName(name);
        if (id) detail_ids.insert(std::move(*id));
      }

      const auto before = entries.size();
      entries.erase(std::remove_if(entries.begin(), entries.end(), [&](const IndexEntry& entry) { return detail_ids.count(entry.id()) == 0; }),
                    entries.end());
      report.ghosts_pruned = before - entries.size();

      std::unordered_set<std::string> indexed;
      for (const auto& entry : entries) {
        indexed.insert(entry.id());
      }

      std::vector<std::string> orphans(detail_ids.begin(), detail_ids.end());
      std::sort(orphans.begin(), orphans.end());
      for (const auto& id : orphans) {
        if (indexed.count(id)) continue;
        try {
          auto raw = store_->ReadRecord<Item>(DetailPath(id));
          if (!raw) continue;
          entries.push_back(Traits::ToIndexEntry(Traits::Validate(*raw)));
          ++report.orphans_indexed;
        } catch (const util::ValidationError&) {
          report.invalid_details.push_back(id);
        } catch (const util::CorruptRecord&) {
          report.invalid_details.push_back(id);
        }
      }

      Traits::SortIndex(entries);
      WriteIndexLocked(entries);
      ClearSuspectedGhosts();
      return report;
    });
  }

  // ------------------------------------------------------------------
  // Naming
  // ------------------------------------------------------------------
  std::string IndexPath() const {
    return std::string(Traits::kDirectory) + "/index.json";
  }

  std::string DetailPath(const std::string& id) const {
    return std::string(Traits::kDirectory) + "/" + Traits::kEntity + "-" + id + ".json";
  }

  std::string EntityLockKey(const std::string& id) const {
    return std::string(Traits::kEntity) + "-" + id;
  }

  std::string CreateLockKey() const {
    return std::string(Traits::kDirectory) + "-create";
  }

  std::string IndexLockKey() const {
    return std::string(Traits::kDirectory) + "-index";
  }

 protected:
  // ------------------------------------------------------------------
  // Hooks
  // ------------------------------------------------------------------
  // Cross-record checks on a validated record before it is written.
  virtual void ValidateForWrite(const Item&) {
  }

  // Files owned by a record, removed before its detail.
  virtual void RemoveAssets(const Item&) {
  }

  // ------------------------------------------------------------------
  // Helpers for callers already holding the entity or create lock
  // ------------------------------------------------------------------
  static void ValidateId(const std::string& id) {
    if (id.empty()) {
      throw util::ValidationError("id", "must not be empty");
    }
    try {
      storage::common::ValidatePath(id);
    } catch (const std::invalid_argument&) {
      throw util::ValidationError("id", "invalid id " + id);
    }
    if (id.find('/') != std::string::npos) {
      throw util::ValidationError("id", "invalid id " + id);
    }
  }

  void AssignNewIdentity(Item* item) {
    auto id = util::NewId();
    if (store_->Exists(DetailPath(id))) {
      throw util::AlreadyExists(std::string(Traits::kEntity) + " id collision: " + id);
    }
    const auto now = util::ToProto(util::Now());
    item->set_id(id);
    *item->mutable_created_at() = now;
    *item->mutable_updated_at() = now;
  }

  // Non-locking internal read used inside a critical section.
  std::optional<Item> ReadDetailLocked(const std::string& id) {
    auto raw = store_->ReadRecord<Item>(DetailPath(id));
    if (!raw) {
      return std::nullopt;
    }
    return Traits::Validate(*raw);
  }

  Item MergePatch(const Item& current, const Item& patch, const google::protobuf::FieldMask& mask) const {
    using google::protobuf::util::FieldMaskUtil;

    if (mask.paths_size() == 0) {
      throw util::ValidationError("updateMask", "must name at least one field");
    }
    if (!FieldMaskUtil::IsValidFieldMask<Item>(mask)) {
      throw util::ValidationError("updateMask", "unknown field in " + FieldMaskUtil::ToString(mask));
    }
    for (const auto& path : mask.paths()) {
      const auto top = path.substr(0, path.find('.'));
      if (top == "id" || top == "created_at" || top == "updated_at") {
        throw util::ValidationError(top, "cannot be updated");
      }
    }

    Item                              merged = current;
    FieldMaskUtil::MergeOptions       options;
    options.set_replace_message_fields(true);
    options.set_replace_repeated_fields(true);
    FieldMaskUtil::MergeMessageTo(patch, mask, options, &merged);
    return merged;
  }

  Item InsertLocked(Item item) {
    auto validated = Traits::Validate(item);
    ValidateForWrite(validated);

    store_->WriteRecord(DetailPath(validated.id()), validated);
    auto entry = Traits::ToIndexEntry(validated);
    RewriteIndex([&](std::vector<IndexEntry>& entries) { Upsert(entries, entry); });
    return validated;
  }

  // Stamps updatedAt, validates, writes detail then index.
  Item ReplaceLocked(Item next) {
    *next.mutable_updated_at() = util::ToProto(util::Now());

    auto validated = Traits::Validate(next);
    ValidateForWrite(validated);

    store_->WriteRecord(DetailPath(validated.id()), validated);
    auto entry = Traits::ToIndexEntry(validated);
    RewriteIndex([&](std::vector<IndexEntry>& entries) { Upsert(entries, entry); });
    return validated;
  }

  void RemoveLocked(const Item& current) {
    RemoveAssets(current);

    const auto path   = DetailPath(current.id());
    auto       result = store_->DeleteRecord(path);
    if (!result && !result.IsNotFound()) {
      throw util::StoreError("delete " + path + ": " + result.message);
    }

    RewriteIndex([&](std::vector<IndexEntry>& entries) {
      entries.erase(std::remove_if(entries.begin(), entries.end(), [&](const IndexEntry& entry) { return entry.id() == current.id(); }),
                    entries.end());
    });
    locks_->ClearTimestamp(path);
  }

  storage::VirtualStorePtr     store_;
  lock::ResourceLockManagerPtr locks_;

 private:
  static void Upsert(std::vector<IndexEntry>& entries, const IndexEntry& entry) {
    for (auto& existing : entries) {
      if (existing.id() == entry.id()) {
        existing = entry;
        return;
      }
    }
    entries.push_back(entry);
  }

  std::optional<std::string> IdFromDetailName(const std::string& name) const {
    const auto prefix = std::string(Traits::kEntity) + "-";
    const std::string suffix = ".json";
    if (name.size() <= prefix.size() + suffix.size()) return std::nullopt;
    if (name.compare(0, prefix.size(), prefix) != 0) return std::nullopt;
    if (name.compare(name.size() - suffix.size(), suffix.size(), suffix) != 0) return std::nullopt;
    return name.substr(prefix.size(), name.size() - prefix.size() - suffix.size());
  }

  /*
    Valid index entries, or std::nullopt when the index is absent,
    unparseable or fails validation.
  */
  std::optional<std::vector<IndexEntry>> TryReadIndex(util::TimePoint* modified_at) {
    std::optional<IndexFile> file;
    try {
      file = store_->ReadRecord<IndexFile>(IndexPath(), modified_at);
    } catch (const util::CorruptRecord&) {
      return std::nullopt;
    }
    if (!file) {
      return std::nullopt;
    }

    std::vector<IndexEntry> entries;
    entries.reserve(file->entries_size());
    try {
      for (const auto& entry : file->entries()) {
        entries.push_back(Traits::ValidateIndexEntry(entry));
      }
    } catch (const util::ValidationError&) {
      return std::nullopt;
    }
    return entries;
  }

  // Caller holds the index lock.
  std::vector<IndexEntry> LoadIndexLocked() {
    util::TimePoint modified_at;
    auto            entries = TryReadIndex(&modified_at);
    if (entries) {
      locks_->RecordReadTimestamp(IndexPath(), modified_at);
      return std::move(*entries);
    }
    WriteIndexLocked({});
    return {};
  }

  void WriteIndexLocked(const std::vector<IndexEntry>& entries) {
    IndexFile file;
    for (const auto& entry : entries) {
      *file.add_entries() = entry;
    }
    store_->WriteRecord(IndexPath(), file);
  }

  void RewriteIndex(const std::function<void(std::vector<IndexEntry>&)>& mutate) {
    locks_->WithLock(IndexLockKey(), [&] {
      auto entries = LoadIndexLocked();
      mutate(entries);
      PruneGhosts(entries);
      Traits::SortIndex(entries);
      WriteIndexLocked(entries);
    });
  }

  void PruneGhosts(std::vector<IndexEntry>& entries) {
    std::unordered_set<std::string> suspected;
    {
      std::lock_guard<std::mutex> lock(ghosts_mutex_);
      suspected.swap(suspected_ghosts_);
    }
    if (suspected.empty()) return;

    entries.erase(std::remove_if(entries.begin(), entries.end(),
                                 [&](const IndexEntry& entry) { return suspected.count(entry.id()) > 0 && !store_->Exists(DetailPath(entry.id())); }),
                  entries.end());
  }

  void MarkSuspectedGhost(const std::string& id) {
    std::lock_guard<std::mutex> lock(ghosts_mutex_);
    suspected_ghosts_.insert(id);
  }

  void ClearSuspectedGhosts() {
    std::lock_guard<std::mutex> lock(ghosts_mutex_);
    suspected_ghosts_.clear();
  }

  std::mutex                      ghosts_mutex_;
  std::unordered_set<std::string> suspected_ghosts_;
};

} // namespace signage::repository
