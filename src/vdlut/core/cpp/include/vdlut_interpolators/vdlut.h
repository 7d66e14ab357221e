#pragma once

#include "lut_error.h"
#include "search_index.h"
#include "axis.h"
#include "lookup_observer.h"
#include "table1d.h"
#include "table2d.h"
#include "table3d.h"
