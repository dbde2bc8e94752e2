#pragma once
#include <string>

namespace rsb {

class BrowserService;
class EventLoop;

// Start a blocking HTTP server for the browser API and serve webRoot at "/".
// Handlers hop onto `loop` for every coordinator access.
// apiKey: if empty, auth is disabled.
void run_http_server(EventLoop& loop,
                     BrowserService& browser,
                     const std::string& webRoot,
                     int port,
                     const std::string& apiKey);

} // namespace rsb
