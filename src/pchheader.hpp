#ifndef _REVUSB_PCHHEADER_
#define _REVUSB_PCHHEADER_

// Enable boost strack trace.
#define BOOST_STACKTRACE_USE_BACKTRACE

#include <algorithm>
#include <array>
#include <atomic>
#include <boost/stacktrace.hpp>
#include <chrono>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <dirent.h>
#include <fcntl.h>
#include <ftw.h>
#include <functional>
#include <iomanip>
#include <iostream>
#include <jsoncons/json.hpp>
#include <libgen.h>
#include <limits.h>
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <plog/Log.h>
#include <plog/Appenders/ConsoleAppender.h>
#include <plog/Appenders/RollingFileAppender.h>
#include <poll.h>
#include <set>
#include <shared_mutex>
#include <signal.h>
#include <sodium.h>
#include <sstream>
#include <stdlib.h>
#include <string>
#include <string_view>
#include <sys/prctl.h>
#include <sys/stat.h>
#include <sys/statvfs.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#endif
