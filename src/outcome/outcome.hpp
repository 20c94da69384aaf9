#ifndef BLOCKWATCH_OUTCOME_HPP
#define BLOCKWATCH_OUTCOME_HPP

#include <libp2p/outcome/outcome.hpp>

namespace outcome {
  using libp2p::outcome::result;
  using libp2p::outcome::success;
  using libp2p::outcome::failure;
}

#endif  // BLOCKWATCH_OUTCOME_HPP
