#pragma once

#include "stagecraft/assign.hpp"     // IWYU pragma: export
#include "stagecraft/condition.hpp"  // IWYU pragma: export
#include "stagecraft/config.hpp"     // IWYU pragma: export
#include "stagecraft/decorators.hpp" // IWYU pragma: export
#include "stagecraft/errors.hpp"     // IWYU pragma: export
#include "stagecraft/executor.hpp"   // IWYU pragma: export
#include "stagecraft/limiter.hpp"    // IWYU pragma: export
#include "stagecraft/log.hpp"        // IWYU pragma: export
#include "stagecraft/mapper.hpp"     // IWYU pragma: export
#include "stagecraft/parallel.hpp"   // IWYU pragma: export
#include "stagecraft/router.hpp"     // IWYU pragma: export
#include "stagecraft/runtime.hpp"    // IWYU pragma: export
#include "stagecraft/sequence.hpp"   // IWYU pragma: export
#include "stagecraft/stage.hpp"      // IWYU pragma: export
#include "stagecraft/stream.hpp"     // IWYU pragma: export
#include "stagecraft/timing.hpp"     // IWYU pragma: export
#include "stagecraft/value.hpp"      // IWYU pragma: export
