#pragma once

#include "timepuff/engine/modules/alt_epoch_converter.h"
#include "timepuff/engine/modules/datetime_format_parser.h"
#include "timepuff/engine/modules/instant_converter.h"
#include "timepuff/engine/modules/timezone_resolver.h"
