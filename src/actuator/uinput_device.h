#ifndef ROUNDWATCH_ACTUATOR_UINPUT_DEVICE_H_
#define ROUNDWATCH_ACTUATOR_UINPUT_DEVICE_H_

#include <string>

#include "actuator/input_device.h"
#include "common/scoped_fd.h"

namespace Roundwatch {

/// Destination of raw input events. Emit throws ActuatorError.
class InputEventSink {
public:
	virtual ~InputEventSink() = default;
	virtual void Emit(int type, int code, int value) = 0;
};

/**
 * Event sequences behind the device primitives. A key or button pressed by a
 * sequence is released again if a later event fails, then the error is rethrown.
 */
void EmitKeyPress(InputEventSink& sink, int code);
void EmitSelectAll(InputEventSink& sink);
void EmitClick(InputEventSink& sink, const Point& point);

/**
 * Virtual absolute-pointer and keyboard device created through /dev/uinput.
 * The pointer axes span the configured screen size so that region centers can
 * be used as click targets directly. Needs write access to the uinput node.
 */
class UinputDevice : public InputDevice, private InputEventSink {
public:
	/// Throws ActuatorError if the device cannot be opened or created.
	UinputDevice(const std::string& path, int screen_width, int screen_height);
	~UinputDevice();

	UinputDevice(const UinputDevice&) = delete;
	UinputDevice& operator=(const UinputDevice&) = delete;

	void Click(const Point& point) override;
	void SelectAll() override;
	void TypeKey(char key) override;
	std::string name() const override { return "uinput"; }

private:
	void Emit(int type, int code, int value) override;
	void Ioctl(unsigned long request, int arg, const char* what);

	ScopedFd fd_;
	std::string path_;
	int screen_width_;
	int screen_height_;
	bool created_ = false;
};

/// Linux key code for a stake character, or -1 if the device cannot type it.
int KeyCodeFor(char key);

} // namespace Roundwatch

#endif // ROUNDWATCH_ACTUATOR_UINPUT_DEVICE_H_
