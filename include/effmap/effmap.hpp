#pragma once

#include "effmap/area_ratio.hpp"
#include "effmap/config.hpp"
#include "effmap/envelope.hpp"
#include "effmap/grid.hpp"
#include "effmap/ingest.hpp"
#include "effmap/interpolate.hpp"
#include "effmap/io_csv.hpp"
#include "effmap/io_json.hpp"
#include "effmap/normalize.hpp"
#include "effmap/session.hpp"
#include "effmap/types.hpp"
