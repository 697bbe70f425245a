#pragma once

#include <string>
#include <string_view>

namespace scopecam::streaming {

// One frame consumer. Identity is the sink object itself.
//
// `Send` may be called from the run loop thread and must not call back into
// the engine. A false return marks the client as gone; the engine prunes it.
class IClientSink {
public:
  virtual ~IClientSink() = default;

  virtual bool Send(std::string_view message, std::string& error) = 0;
};

} // namespace scopecam::streaming
