#pragma once

#include "signage/store/v1/content.pb.h"
#include "signage/store/v1/layout.pb.h"
#include "signage/store/v1/playlist.pb.h"
#include "signage/store/v1/schedule.pb.h"
