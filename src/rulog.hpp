#ifndef _REVUSB_RULOG_
#define _REVUSB_RULOG_

#include "pchheader.hpp"

/**
 * Logging bootstrap. All code logs through the plog LOG_* macros.
 * Until init() runs, plog has no logger instance and those macros are no-ops.
 */
namespace rulog
{
    void init();

} // namespace rulog

#endif
