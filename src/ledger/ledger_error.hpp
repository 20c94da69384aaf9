#ifndef BLOCKWATCH_LEDGER_ERROR_HPP
#define BLOCKWATCH_LEDGER_ERROR_HPP

#include "outcome/outcome.hpp"

namespace blockwatch::ledger
{
    enum class LedgerError
    {
        LEDGER_NOT_FOUND = 1, ///< ledger root directory does not exist
    };
} // namespace blockwatch::ledger

OUTCOME_HPP_DECLARE_ERROR_2( blockwatch::ledger, LedgerError );

#endif // BLOCKWATCH_LEDGER_ERROR_HPP
