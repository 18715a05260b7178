#pragma once

#include <functional>
#include <utility>
#include <vector>

#include "internal/repository/indexed_repository.hpp"
#include "internal/schema/layout_schema.hpp"
#include "signage/store/v1.hpp"

namespace signage::repository {

struct LayoutTraits {
  using Item       = signage::store::v1::Layout;
  using IndexEntry = signage::store::v1::LayoutIndexEntry;
  using IndexFile  = signage::store::v1::LayoutIndex;

  static constexpr const char* kEntity    = "layout";
  static constexpr const char* kDirectory = "layouts";

  static Item Validate(const Item& raw) {
    return schema::ValidateLayout(raw);
  }
  static IndexEntry ValidateIndexEntry(const IndexEntry& raw) {
    return schema::ValidateLayoutIndexEntry(raw);
  }
  static IndexEntry ToIndexEntry(const Item& item) {
    return schema::ToLayoutIndexEntry(item);
  }
  // insertion order
  static void SortIndex(std::vector<IndexEntry>&) {
  }
};

/*
  The region check runs on every validated layout before it is written,
  inside the layout's lock. It throws to refuse the write, e.g. when a
  playlist still assigns a region the new layout drops.
*/
class LayoutRepository : public IndexedRepository<LayoutTraits> {
 public:
  using RegionCheck = std::function<void(const signage::store::v1::Layout&)>;

  using IndexedRepository::IndexedRepository;

  void SetRegionCheck(RegionCheck check) {
    region_check_ = std::move(check);
  }

 protected:
  void ValidateForWrite(const signage::store::v1::Layout& layout) override {
    if (region_check_) {
      region_check_(layout);
    }
  }

 private:
  RegionCheck region_check_;
};

using LayoutRepositoryPtr = std::shared_ptr<LayoutRepository>;

} // namespace signage::repository
