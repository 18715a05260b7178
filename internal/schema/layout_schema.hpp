#pragma once

#include "signage/store/v1.hpp"

namespace signage::schema {

inline constexpr int kMaxRegions = 4;

/*
  Regions stored before z-ordering existed have no zIndex; they get
  their position in the region list.
*/
signage::store::v1::Layout ValidateLayout(const signage::store::v1::Layout& raw);

signage::store::v1::LayoutIndexEntry ValidateLayoutIndexEntry(const signage::store::v1::LayoutIndexEntry& raw);

signage::store::v1::LayoutIndexEntry ToLayoutIndexEntry(const signage::store::v1::Layout& layout);

} // namespace signage::schema
