#pragma once

#include "btsgate/Http/HttpServer/HttpServerService.hpp"
#include "btsgate/Http/HttpServer/HttpServerServiceProvider.hpp"

namespace Btsgate
{
namespace Http
{
    using HttpServer = HttpServerServiceProvider< HttpServerService >;
} // namespace Http
} // namespace Btsgate
