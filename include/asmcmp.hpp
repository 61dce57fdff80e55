#pragma once

#include "asmcmp/cli.hpp"
#include "asmcmp/config.hpp"
#include "asmcmp/extraction.hpp"
#include "asmcmp/format.hpp"
#include "asmcmp/process.hpp"
#include "asmcmp/target.hpp"
#include "asmcmp/utils.hpp"
