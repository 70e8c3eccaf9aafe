#pragma once

#include "hexfire/aggregator.hpp"
#include "hexfire/cli.hpp"
#include "hexfire/coverage.hpp"
#include "hexfire/crs.hpp"
#include "hexfire/emitter.hpp"
#include "hexfire/hexgrid.hpp"
#include "hexfire/log.hpp"
#include "hexfire/options.hpp"
#include "hexfire/parser.hpp"
#include "hexfire/pipeline.hpp"
#include "hexfire/source.hpp"
#include "hexfire/stats.hpp"
#include "hexfire/timestamp.hpp"
#include "hexfire/types.hpp"
#include "hexfire/writter.hpp"

namespace hf = hexfire;
