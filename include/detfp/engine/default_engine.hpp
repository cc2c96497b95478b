#ifndef DETFP_ENGINE_DEFAULT_ENGINE_HPP
#define DETFP_ENGINE_DEFAULT_ENGINE_HPP

#include "detfp/core/target.hpp"
#include "detfp/engine/engine.hpp"

namespace detfp {

// The engine for the target this build was configured for.
using DefaultEngine = Engine<ActivePolicy>;

} // namespace detfp

#endif // DETFP_ENGINE_DEFAULT_ENGINE_HPP
