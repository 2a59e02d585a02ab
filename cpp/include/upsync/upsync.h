#pragma once

/// @file upsync.h
/// Umbrella header: include this to get the full upsync C++ API.

#include "error.h"
#include "types.h"
#include "paths.h"
#include "config.h"
#include "version.h"
#include "repo.h"
#include "comparator.h"
#include "dirty_guard.h"
#include "backup.h"
#include "overwrite.h"
#include "executor.h"
#include "updater.h"
#include "reporter.h"
#include "log.h"
