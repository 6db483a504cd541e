#include "uinput_device.h"

#include <fcntl.h>
#include <string.h>
#include <errno.h>
#include <sys/ioctl.h>
#include <linux/uinput.h>
#include <glog/logging.h>

#include "common/errors.h"

namespace Roundwatch {

namespace {

constexpr char kDeviceName[] = "roundwatch-virtual-input";

std::string ErrnoText() {
	return std::string(strerror(errno));
}

void Sync(InputEventSink& sink) {
	sink.Emit(EV_SYN, SYN_REPORT, 0);
}

// The caller rethrows the first failure, a failed release is only logged.
void ReleaseAfterFailure(InputEventSink& sink, int code) {
	try {
		sink.Emit(EV_KEY, code, 0);
		Sync(sink);
	} catch (const ActuatorError& e) {
		LOG(ERROR) << "[UinputDevice]: Key " << code << " may still be held: " << e.what();
	}
}

} // namespace

void EmitKeyPress(InputEventSink& sink, int code) {
	sink.Emit(EV_KEY, code, 1);
	try {
		Sync(sink);
		sink.Emit(EV_KEY, code, 0);
		Sync(sink);
	} catch (const ActuatorError&) {
		ReleaseAfterFailure(sink, code);
		throw;
	}
}

void EmitSelectAll(InputEventSink& sink) {
	sink.Emit(EV_KEY, KEY_LEFTCTRL, 1);
	try {
		Sync(sink);
		EmitKeyPress(sink, KEY_A);
		sink.Emit(EV_KEY, KEY_LEFTCTRL, 0);
		Sync(sink);
	} catch (const ActuatorError&) {
		ReleaseAfterFailure(sink, KEY_LEFTCTRL);
		throw;
	}
}

void EmitClick(InputEventSink& sink, const Point& point) {
	sink.Emit(EV_ABS, ABS_X, point.x);
	sink.Emit(EV_ABS, ABS_Y, point.y);
	Sync(sink);
	EmitKeyPress(sink, BTN_LEFT);
}

int KeyCodeFor(char key) {
	switch (key) {
		case '0': return KEY_0;
		case '1': return KEY_1;
		case '2': return KEY_2;
		case '3': return KEY_3;
		case '4': return KEY_4;
		case '5': return KEY_5;
		case '6': return KEY_6;
		case '7': return KEY_7;
		case '8': return KEY_8;
		case '9': return KEY_9;
		case '.': return KEY_DOT;
		default: return -1;
	}
}

UinputDevice::UinputDevice(const std::string& path, int screen_width, int screen_height):
	path_(path),
	screen_width_(screen_width),
	screen_height_(screen_height){
	if (screen_width_ <= 0 || screen_height_ <= 0) {
		throw ActuatorError("Invalid screen size for uinput device");
	}

	fd_ = ScopedFd(::open(path_.c_str(), O_WRONLY | O_NONBLOCK));
	if (!fd_.valid()) {
		throw ActuatorError("Cannot open " + path_ + ": " + ErrnoText());
	}

	Ioctl(UI_SET_EVBIT, EV_KEY, "UI_SET_EVBIT EV_KEY");
	Ioctl(UI_SET_EVBIT, EV_ABS, "UI_SET_EVBIT EV_ABS");
	Ioctl(UI_SET_EVBIT, EV_SYN, "UI_SET_EVBIT EV_SYN");
	Ioctl(UI_SET_KEYBIT, BTN_LEFT, "UI_SET_KEYBIT BTN_LEFT");
	Ioctl(UI_SET_KEYBIT, KEY_LEFTCTRL, "UI_SET_KEYBIT KEY_LEFTCTRL");
	Ioctl(UI_SET_KEYBIT, KEY_A, "UI_SET_KEYBIT KEY_A");
	for (char key : std::string("0123456789.")) {
		Ioctl(UI_SET_KEYBIT, KeyCodeFor(key), "UI_SET_KEYBIT");
	}
	Ioctl(UI_SET_ABSBIT, ABS_X, "UI_SET_ABSBIT ABS_X");
	Ioctl(UI_SET_ABSBIT, ABS_Y, "UI_SET_ABSBIT ABS_Y");

	struct uinput_abs_setup abs_setup;
	memset(&abs_setup, 0, sizeof(abs_setup));
	abs_setup.code = ABS_X;
	abs_setup.absinfo.minimum = 0;
	abs_setup.absinfo.maximum = screen_width_ - 1;
	if (ioctl(fd_.get(), UI_ABS_SETUP, &abs_setup) < 0) {
		throw ActuatorError("UI_ABS_SETUP ABS_X failed: " + ErrnoText());
	}
	abs_setup.code = ABS_Y;
	abs_setup.absinfo.maximum = screen_height_ - 1;
	if (ioctl(fd_.get(), UI_ABS_SETUP, &abs_setup) < 0) {
		throw ActuatorError("UI_ABS_SETUP ABS_Y failed: " + ErrnoText());
	}

	struct uinput_setup setup;
	memset(&setup, 0, sizeof(setup));
	setup.id.bustype = BUS_VIRTUAL;
	setup.id.vendor = 0x1209;
	setup.id.product = 0x0001;
	strncpy(setup.name, kDeviceName, UINPUT_MAX_NAME_SIZE - 1);
	if (ioctl(fd_.get(), UI_DEV_SETUP, &setup) < 0) {
		throw ActuatorError("UI_DEV_SETUP failed: " + ErrnoText());
	}
	if (ioctl(fd_.get(), UI_DEV_CREATE) < 0) {
		throw ActuatorError("UI_DEV_CREATE failed: " + ErrnoText());
	}
	created_ = true;
	LOG(INFO) << "[UinputDevice]: Created " << kDeviceName << " on " << path_ << " ("
		<< screen_width_ << "x" << screen_height_ << ")";
}

UinputDevice::~UinputDevice() {
	if (created_ && ioctl(fd_.get(), UI_DEV_DESTROY) < 0) {
		LOG(ERROR) << "[UinputDevice]: UI_DEV_DESTROY failed: " << ErrnoText();
	}
}

void UinputDevice::Click(const Point& point) {
	if (point.x < 0 || point.y < 0 || point.x >= screen_width_ || point.y >= screen_height_) {
		throw ActuatorError("Click target (" + std::to_string(point.x) + "," + std::to_string(point.y) +
				") is off screen");
	}
	EmitClick(*this, point);
}

void UinputDevice::SelectAll() {
	EmitSelectAll(*this);
}

void UinputDevice::TypeKey(char key) {
	int code = KeyCodeFor(key);
	if (code < 0) {
		throw ActuatorError(std::string("Cannot type '") + key + "'");
	}
	EmitKeyPress(*this, code);
}

void UinputDevice::Emit(int type, int code, int value) {
	struct input_event ev;
	memset(&ev, 0, sizeof(ev));
	ev.type = type;
	ev.code = code;
	ev.value = value;
	ssize_t written = ::write(fd_.get(), &ev, sizeof(ev));
	if (written != static_cast<ssize_t>(sizeof(ev))) {
		throw ActuatorError("uinput write failed: " + ErrnoText());
	}
}

void UinputDevice::Ioctl(unsigned long request, int arg, const char* what) {
	if (ioctl(fd_.get(), request, arg) < 0) {
		throw ActuatorError(std::string(what) + " failed: " + ErrnoText());
	}
}

} // namespace Roundwatch
