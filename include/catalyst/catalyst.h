// catalyst/catalyst.h
#ifndef CATALYST_CATALYST_H
#define CATALYST_CATALYST_H

#include "core/types/atom.h"
#include "core/types/context.h"
#include "core/types/value_cell.h"
#include "modules/props/props_bag.h"
#include "modules/executor/stage_executor.h"
#include "modules/scheduler/session_controller.h"
#include "modules/trace/trace_exporter.h"
#include "common/config/session_config.h"
#include "common/atoms/launch.h"
#include "common/atoms/resource_atom.h"

#endif // CATALYST_CATALYST_H
