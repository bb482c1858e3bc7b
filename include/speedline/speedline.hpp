#pragma once

#include "speedline/logger.hpp"
#include "speedline/version.hpp"

#include "speedline/core/config.hpp"
#include "speedline/core/download_generator.hpp"
#include "speedline/core/upload_accountant.hpp"

#include "speedline/net/server.hpp"

#ifdef SPEEDLINE_WITH_MONITORING
    #include "speedline/monitoring/health_check.hpp"
    #include "speedline/monitoring/transfer_metrics.hpp"
#endif
