#pragma once

#include <cowl/core/Cow.h>
#include <cowl/core/serialize.h>
#include <cowl/fmt_support.h>
#include <cowl/support/logging.h>
