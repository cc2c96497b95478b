#ifndef DETFP_HPP
#define DETFP_HPP

#include "detfp/core/bits.hpp"
#include "detfp/core/enums.hpp"
#include "detfp/core/exceptions.hpp"
#include "detfp/core/float.hpp"
#include "detfp/core/format.hpp"
#include "detfp/core/nan_policy.hpp"
#include "detfp/core/target.hpp"
#include "detfp/engine/default_engine.hpp"
#include "detfp/engine/engine.hpp"
#include "detfp/kernel/kernel.hpp"
#include "detfp/kernel/softfloat_kernel.hpp"

#endif // DETFP_HPP
