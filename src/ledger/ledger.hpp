#ifndef BLOCKWATCH_LEDGER_HPP
#define BLOCKWATCH_LEDGER_HPP

#include "outcome/outcome.hpp"
#include "primitives/common.hpp"

namespace blockwatch::ledger
{
    /**
     * Local authoritative view of the chain height
     */
    class Ledger
    {
    public:
        virtual ~Ledger() = default;

        /**
         * @return number of blocks the ledger holds, i.e. index of the next
         * block it will produce
         */
        virtual outcome::result<primitives::BlockIndex> numBlocks() const = 0;
    };
} // namespace blockwatch::ledger

#endif // BLOCKWATCH_LEDGER_HPP
