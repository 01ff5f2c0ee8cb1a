#ifndef SCOPE_DEVICE_H
#define SCOPE_DEVICE_H

#include <functional>
#include <string>

#include "scope/Frame.h"

namespace scope {

// Transport-side collaborator. Implementations report I/O failures by throwing
// std::exception subclasses; the frame handler runs on a thread the
// implementation owns. Input the transport could not turn into a frame goes to
// the drop handler instead, on the same thread.
class IDevice {
public:
    using FrameHandler = std::function<void(const Frame&)>;
    using DropHandler = std::function<void(const std::string& why)>;

    virtual ~IDevice() = default;

    virtual void connect() = 0;
    virtual void disconnect() = 0;
    virtual bool is_connected() const = 0;

    virtual void start_streaming() = 0;
    virtual void stop_streaming() = 0;

    virtual double sampling_rate() const = 0;
    virtual void set_sampling_rate(double hz) = 0;

    virtual void set_frame_handler(FrameHandler handler) = 0;
    virtual void set_drop_handler(DropHandler handler) = 0;
};

}

#endif
