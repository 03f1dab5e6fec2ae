#pragma once

#include "src/logging.h"

#include "src/grid_config.h"
#include "src/grid_item.h"
#include "src/geometry.h"
#include "src/layout_result.h"
#include "src/free_cell.h"
#include "src/placement.h"
#include "src/resize.h"
#include "src/validator.h"
#include "src/layout_engine.h"
#include "src/component_catalog.h"
