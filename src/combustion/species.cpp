#include "flue/combustion/species.hpp"
#include "flue/core/constants.hpp"

namespace flue::combustion {

auto air_molecular_weight() noexcept -> double {
  return constants::air::o2_mole_fraction * molecular_weight(Species::O2) +
         constants::air::n2_mole_fraction * molecular_weight(Species::N2);
}

} // namespace flue::combustion
