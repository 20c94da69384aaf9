#include "ledger/ledger_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY_3( blockwatch::ledger, LedgerError, e )
{
    using E = blockwatch::ledger::LedgerError;
    switch ( e )
    {
        case E::LEDGER_NOT_FOUND:
            return "Ledger directory not found";
    }
    return "Unknown error";
}
