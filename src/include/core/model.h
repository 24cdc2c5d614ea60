#pragma once

#include "model/feedback.h"
#include "model/manifest.h"
#include "model/progress_snapshot.h"
#include "model/run_phase.h"
#include "model/transfer_item.h"
