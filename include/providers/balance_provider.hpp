#pragma once

#include <optional>
#include "common/types.hpp"

namespace fundarb {

// Free collateral per venue, in USD
class BalanceProvider {
public:
    virtual ~BalanceProvider() = default;

    virtual std::optional<Notional> balance(Exchange exchange) = 0;
};

} // namespace fundarb
