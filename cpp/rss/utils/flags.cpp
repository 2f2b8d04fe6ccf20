#include <gflags/gflags.h>

// Used in utils/Exceptions.cpp
DEFINE_bool(
    rss_exception_include_location,
    true,
    "Append the function, file and line of the throw site to the message"
    " returned by RssException::what()");

// Used in client/RetryUtils.cpp
DEFINE_int32(
    rss_client_min_retry_interval_ms,
    1,
    "Lower bound in milliseconds for the sleep between two attempts to connect"
    " to a server group, applied when the configured interval is smaller");
