#pragma once

#include "btsgate/Gateway/GatewayService.hpp"
#include "btsgate/Gateway/GatewayServiceProvider.hpp"

namespace Btsgate
{
    using Gateway = GatewayServiceProvider< GatewayService >;
} // namespace Btsgate
